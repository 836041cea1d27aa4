#pragma once

#include <rxml/rule.hpp>
#include <rxml/run_metadata.hpp>

#include <nlohmann/json.hpp>

#include <ostream>

namespace rxml::cli {

  constexpr int exit_success = 0;
  constexpr int exit_usage = 1;
  constexpr int exit_io = 2;
  constexpr int exit_parse = 3;
  constexpr int exit_mapping = 4;

  void
  print_usage(std::ostream& os, const std::string& program);

  // Turns argv into a configuration object:
  //   {"input": str, "output": [str], "metadata": str, "batch-base": str,
  //    "verbose": bool, "help": bool, "version": bool}
  // Throws std::invalid_argument on malformed arguments.
  nlohmann::json
  parse_args(int argc, char* argv[]);

  // Runs one mapping (or one batch) as described by `config`.
  int
  run(const nlohmann::json& config, const rule_set& rules,
      const run_metadata& metadata, const std::string& program = "rxml");

  // Entry point for mapping executables that bundle their rules.
  int
  main(int argc, char* argv[], const rule_set& rules,
       const run_metadata& metadata = {});

} // namespace rxml::cli
