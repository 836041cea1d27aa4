#pragma once

#include <rxml/accessors.hpp>
#include <rxml/classifier.hpp>
#include <rxml/element.hpp>
#include <rxml/namespaces.hpp>
#include <rxml/rule.hpp>
#include <rxml/run_metadata.hpp>

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rxml {

  enum class run_state {
    pending,
    executing,
    done,
    failed,
  };

  // Applies one classified program to one source tree. The destination
  // document is owned by the executor until execute() hands it out; an
  // error leaves the executor failed and yields no document.
  class executor {
    const classified_program& program_;
    const namespace_table& input_;
    const namespace_table& output_;
    run_state state_ = run_state::pending;
    std::unordered_map<std::string, resolved_path> source_paths_;
    std::unordered_map<std::string, resolved_path> destination_paths_;

    const resolved_path&
    source_path(const std::string& path);

    const resolved_path&
    destination_path(const std::string& path);

    std::vector<std::string>
    read_arguments(const rule& r, const element* source,
                   const source_context* bases);

    void
    run_node(const program_node& node, const element* source, document& target,
             const source_context& source_bases,
             const destination_context& destination_bases);

    void
    run_basic(const rule& r, const element* source, document& target);

    void
    run_iteration(const iteration_node& node, const element* source,
                  document& target, const source_context& source_bases,
                  const destination_context& destination_bases);

    void
    run_leaf(const rule& r, const element* source, document& target,
             const source_context& source_bases,
             const destination_context& destination_bases);

  public:
    executor(const classified_program& program, const namespace_table& input,
             const namespace_table& output)
        : program_(program), input_(input), output_(output) {}

    // Throws std::logic_error unless the executor is pending.
    document
    execute(const element* source_root);

    run_state
    state() const {
      return state_;
    }
  };

  // Validates, classifies and executes `rules` against the tree below
  // `source_root`.
  document
  apply_rules(const element* source_root, const rule_set& rules,
              const namespace_table& input, const namespace_table& output);

  // Single-document entry point: input checks, mapping, output checks.
  document
  run(const document& source, const rule_set& rules, const run_metadata& meta,
      const std::string& filename = {});

  // One destination document per element matched by `base_path`, each
  // match serving as the source root of its own run, in document order.
  std::vector<document>
  run_batch(const document& source, const rule_set& rules,
            const run_metadata& meta, std::string_view base_path,
            const std::string& filename = {});

} // namespace rxml
