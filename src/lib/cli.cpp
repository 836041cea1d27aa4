#include <rxml/cli.hpp>
#include <rxml/element.hpp>
#include <rxml/engine.hpp>
#include <rxml/errors.hpp>
#include <rxml/expat_reader.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef RXML_VERSION
#define RXML_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;

namespace rxml::cli {

  namespace {

    std::string
    read_file(const std::string& path) {
      std::ifstream in(path, std::ios::binary);
      if (!in) { throw std::runtime_error("cannot open file: " + path); }
      std::ostringstream ss;
      ss << in.rdbuf();
      return ss.str();
    }

    void
    write_file(const std::string& path, const document& doc,
               const writer_options& options) {
      auto parent = fs::path(path).parent_path();
      if (!parent.empty()) { fs::create_directories(parent); }
      std::ofstream out(path, std::ios::binary);
      if (!out) { throw std::runtime_error("cannot write file: " + path); }
      write_document(doc, out, options);
    }

    int
    run_single(const std::string& program, const document& source,
               const std::string& input, const std::vector<std::string>& outputs,
               const rule_set& rules, const run_metadata& meta,
               const writer_options& options) {
      if (outputs.size() > 1) {
        std::cerr << program << ": exactly one output expected without -b\n";
        return exit_usage;
      }

      document target;
      try {
        target = rxml::run(source, rules, meta, input);
      } catch (const error& e) {
        std::cerr << program << ": " << e.what() << "\n";
        return exit_mapping;
      }

      try {
        if (outputs.empty()) {
          write_document(target, std::cout, options);
        } else {
          write_file(outputs.front(), target, options);
        }
      } catch (const std::exception& e) {
        std::cerr << program << ": " << e.what() << "\n";
        return exit_io;
      }
      return exit_success;
    }

    int
    run_batch_files(const std::string& program, const document& source,
                    const std::string& input, const std::string& base,
                    const std::vector<std::string>& outputs,
                    const rule_set& rules, const run_metadata& meta,
                    const writer_options& options) {
      std::vector<document> targets;
      try {
        targets = rxml::run_batch(source, rules, meta, base, input);
      } catch (const error& e) {
        std::cerr << program << ": " << e.what() << "\n";
        return exit_mapping;
      }

      if (targets.size() > outputs.size()) {
        std::cerr << program << ": " << targets.size()
                  << " documents produced, but only " << outputs.size()
                  << " output file(s) given\n";
        return exit_usage;
      }
      if (targets.size() < outputs.size()) {
        spdlog::warn("number of output files was {}; expected {}",
                     outputs.size(), targets.size());
      }

      try {
        for (std::size_t i = 0; i < targets.size(); ++i) {
          write_file(outputs[i], targets[i], options);
        }
      } catch (const std::exception& e) {
        std::cerr << program << ": " << e.what() << "\n";
        return exit_io;
      }
      return exit_success;
    }

  } // namespace

  void
  print_usage(std::ostream& os, const std::string& program) {
    os << "Usage: " << program << " [options] <input.xml>\n"
       << "\n"
       << "Options:\n"
       << "  -o <file>         Output file (default: stdout); repeat once per\n"
       << "                    document in batch mode\n"
       << "  -m <file>         Run metadata (namespaces, required paths,\n"
       << "                    encoding)\n"
       << "  -b <path>         Batch mode: one output per element at <path>\n"
       << "  -v, --verbose     Debug logging\n"
       << "  -h, --help        Show this help message\n"
       << "  --version         Show version information\n";
  }

  nlohmann::json
  parse_args(int argc, char* argv[]) {
    nlohmann::json config = {{"output", nlohmann::json::array()},
                             {"verbose", false},
                             {"help", false},
                             {"version", false}};

    auto value_of = [&](int& i, const std::string& flag) -> std::string {
      if (i + 1 >= argc) {
        throw std::invalid_argument(flag + " requires an argument");
      }
      return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "-h" || arg == "--help") {
        config["help"] = true;
        return config;
      }
      if (arg == "--version") {
        config["version"] = true;
        return config;
      }
      if (arg == "-v" || arg == "--verbose") {
        config["verbose"] = true;
        continue;
      }
      if (arg == "-o") {
        config["output"].push_back(value_of(i, arg));
        continue;
      }
      if (arg == "-m") {
        config["metadata"] = value_of(i, arg);
        continue;
      }
      if (arg == "-b") {
        config["batch-base"] = value_of(i, arg);
        continue;
      }
      if (arg.size() > 1 && arg[0] == '-') {
        throw std::invalid_argument("unknown option: " + arg);
      }
      if (config.contains("input")) {
        throw std::invalid_argument("more than one input file: " + arg);
      }
      config["input"] = arg;
    }

    return config;
  }

  int
  run(const nlohmann::json& config, const rule_set& rules,
      const run_metadata& metadata, const std::string& program) {
    if (config.value("help", false)) {
      print_usage(std::cerr, program);
      return exit_success;
    }
    if (config.value("version", false)) {
      std::cerr << program << " " << RXML_VERSION << "\n";
      return exit_success;
    }

    // stdout may carry the mapped document.
    if (!spdlog::get("rxml")) {
      spdlog::set_default_logger(spdlog::stderr_color_mt("rxml"));
    }
    spdlog::set_level(config.value("verbose", false) ? spdlog::level::debug
                                                     : spdlog::level::info);

    std::string input = config.value("input", "");
    if (input.empty()) {
      std::cerr << program << ": no input file\n";
      print_usage(std::cerr, program);
      return exit_usage;
    }

    std::vector<std::string> outputs;
    if (config.contains("output") && config["output"].is_array()) {
      for (const auto& o : config["output"])
        outputs.push_back(o.get<std::string>());
    }

    run_metadata meta = metadata;
    std::string metadata_file = config.value("metadata", "");
    if (!metadata_file.empty()) {
      std::string xml;
      try {
        xml = read_file(metadata_file);
      } catch (const std::exception& e) {
        std::cerr << program << ": " << e.what() << "\n";
        return exit_io;
      }
      try {
        expat_reader reader(xml);
        meta.merge(run_metadata::load(reader));
      } catch (const std::exception& e) {
        std::cerr << program << ": error loading metadata " << metadata_file
                  << ": " << e.what() << "\n";
        return exit_parse;
      }
    }

    writer_options options;
    try {
      options.charset = charset_from_name(meta.output_encoding);
    } catch (const std::invalid_argument& e) {
      std::cerr << program << ": " << e.what() << "\n";
      return exit_parse;
    }

    std::string text;
    try {
      text = read_file(input);
    } catch (const std::exception& e) {
      std::cerr << program << ": " << e.what() << "\n";
      return exit_io;
    }

    document source;
    try {
      source = parse_document(text);
    } catch (const std::exception& e) {
      std::cerr << program << ": error reading " << input << ": " << e.what()
                << "\n";
      return exit_parse;
    }

    std::string base = config.value("batch-base", "");
    if (base.empty()) {
      return run_single(program, source, input, outputs, rules, meta, options);
    }
    return run_batch_files(program, source, input, base, outputs, rules, meta,
                           options);
  }

  int
  main(int argc, char* argv[], const rule_set& rules,
       const run_metadata& metadata) {
    std::string program =
        argc > 0 ? fs::path(argv[0]).filename().string() : "rxml";

    nlohmann::json config;
    try {
      config = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
      std::cerr << program << ": " << e.what() << "\n";
      return exit_usage;
    }
    return run(config, rules, metadata, program);
  }

} // namespace rxml::cli
