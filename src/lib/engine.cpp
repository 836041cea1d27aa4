#include <rxml/engine.hpp>
#include <rxml/errors.hpp>
#include <rxml/required.hpp>
#include <rxml/validator.hpp>

#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <type_traits>
#include <variant>

namespace rxml {

  namespace {

    const resolved_path&
    cached(std::unordered_map<std::string, resolved_path>& cache,
           const std::string& path, const namespace_table& table) {
      auto it = cache.find(path);
      if (it == cache.end()) {
        it = cache.emplace(path, resolve_path(path, table)).first;
      }
      return it->second;
    }

    void
    require_rules(const rule_set& rules) {
      if (rules.empty()) {
        throw definition_error("expected at least one rule definition");
      }
    }

  } // namespace

  const resolved_path&
  executor::source_path(const std::string& path) {
    return cached(source_paths_, path, input_);
  }

  const resolved_path&
  executor::destination_path(const std::string& path) {
    return cached(destination_paths_, path, output_);
  }

  std::vector<std::string>
  executor::read_arguments(const rule& r, const element* source,
                           const source_context* bases) {
    std::vector<std::string> args;
    args.reserve(r.metadata->sources.size());
    for (const auto& src : r.metadata->sources) {
      const auto& path = source_path(src);
      args.push_back(bases == nullptr ? read_source(source, path)
                                      : read_base_source(source, path, *bases));
    }
    spdlog::debug("applying {} with arguments [{}]", r.name,
                  fmt::join(args, ", "));
    return args;
  }

  void
  executor::run_basic(const rule& r, const element* source, document& target) {
    spdlog::info("applying {}", r.name);
    auto output = r.implementation(read_arguments(r, source, nullptr));
    if (!output) { return; }
    write_destination(target, destination_path(r.metadata->destinations[0]),
                      *output);
  }

  void
  executor::run_leaf(const rule& r, const element* source, document& target,
                     const source_context& source_bases,
                     const destination_context& destination_bases) {
    spdlog::info("applying {}", r.name);
    auto output = r.implementation(read_arguments(r, source, &source_bases));
    if (!output) { return; }
    write_base_destination(target,
                           destination_path(r.metadata->destinations[0]),
                           *output, destination_bases);
  }

  void
  executor::run_iteration(const iteration_node& node, const element* source,
                          document& target, const source_context& source_bases,
                          const destination_context& destination_bases) {
    const auto& src_base = source_path(node.base.source_base);
    const auto& dst_base = destination_path(node.base.destination_base);

    auto matches = read_ambiguous_elements(source, src_base, source_bases);
    spdlog::debug("iterating {} match(es) of {}", matches.size(),
                  src_base.text);

    for (const element* match : matches) {
      source_context inner_source = source_bases;
      inner_source.push_back(match);

      destination_context inner_destination = destination_bases;
      inner_destination.push_back(
          &write_new_ambiguous_element(target, dst_base, destination_bases));

      for (const auto& child : node.children) {
        run_node(child, source, target, inner_source, inner_destination);
      }
    }
  }

  void
  executor::run_node(const program_node& node, const element* source,
                     document& target, const source_context& source_bases,
                     const destination_context& destination_bases) {
    std::visit(
        [&](const auto& n) {
          using T = std::decay_t<decltype(n)>;
          if constexpr (std::is_same_v<T, basic_rule>) {
            run_basic(*n.definition, source, target);
          } else if constexpr (std::is_same_v<T, iteration_node>) {
            run_iteration(n, source, target, source_bases, destination_bases);
          } else {
            run_leaf(*n.definition, source, target, source_bases,
                     destination_bases);
          }
        },
        node);
  }

  document
  executor::execute(const element* source_root) {
    if (state_ != run_state::pending) {
      throw std::logic_error("executor: a run can only be executed once");
    }
    state_ = run_state::executing;

    document target;
    try {
      for (const auto& node : program_.nodes) {
        run_node(node, source_root, target, {}, {});
      }
    } catch (...) {
      state_ = run_state::failed;
      throw;
    }

    state_ = run_state::done;
    return target;
  }

  document
  apply_rules(const element* source_root, const rule_set& rules,
              const namespace_table& input, const namespace_table& output) {
    validate_rules(rules);
    auto program = classify(rules);
    executor exec(program, input, output);
    return exec.execute(source_root);
  }

  document
  run(const document& source, const rule_set& rules, const run_metadata& meta,
      const std::string& filename) {
    require_rules(rules);
    validate_rules(rules);
    auto program = classify(rules);

    namespace_table input(meta.input_namespaces);
    namespace_table output(meta.output_namespaces);

    check_required(source.root(), meta.input_required, meta.input_nonempty,
                   input, filename);
    executor exec(program, input, output);
    auto target = exec.execute(source.root());
    check_required(target.root(), meta.output_required, meta.output_nonempty,
                   output);
    return target;
  }

  std::vector<document>
  run_batch(const document& source, const rule_set& rules,
            const run_metadata& meta, std::string_view base_path,
            const std::string& filename) {
    require_rules(rules);
    validate_rules(rules);
    auto program = classify(rules);

    namespace_table input(meta.input_namespaces);
    namespace_table output(meta.output_namespaces);

    auto matches = read_ambiguous_elements(
        source.root(), resolve_path(base_path, input), source_context{});
    spdlog::info("batch base {} matched {} element(s)", base_path,
                 matches.size());

    std::vector<document> targets;
    for (const element* match : matches) {
      check_required(match, meta.input_required, meta.input_nonempty, input,
                     filename);

      executor exec(program, input, output);
      auto target = exec.execute(match);

      check_required(target.root(), meta.output_required, meta.output_nonempty,
                     output);
      targets.push_back(std::move(target));
    }
    return targets;
  }

} // namespace rxml
