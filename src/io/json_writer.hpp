#ifndef REISIM_IO_JSON_WRITER_HPP
#define REISIM_IO_JSON_WRITER_HPP

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include "../sensitivity.hpp"
#include "../simulation.hpp"

namespace reisim {
namespace io {

// Response documents keep insertion order so sections read top to bottom.
// Undefined statistics are written as null.
nlohmann::ordered_json simulation_result_to_json(const SimulationResult& result);
nlohmann::ordered_json sensitivity_result_to_json(const SensitivityResult& result);

// "p5", "var_2.5", "ci_90": level formatted without trailing zeros
std::string level_key(const std::string& prefix, double level);

// Write SimulationResult to JSON format
void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  bool pretty_print = true);

// Write SimulationResult to JSON file
void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  bool pretty_print = true);

void write_sensitivity_result_json(std::ostream& os, const SensitivityResult& result,
                                   bool pretty_print = true);

void write_sensitivity_result_json(const std::string& filepath, const SensitivityResult& result,
                                   bool pretty_print = true);

} // namespace io
} // namespace reisim

#endif // REISIM_IO_JSON_WRITER_HPP
