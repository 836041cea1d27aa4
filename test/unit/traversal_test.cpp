#include <rxml/element.hpp>
#include <rxml/traversal.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace rxml;

namespace {

  // Records every decision and returns the local name it stopped at.
  class recording_policy final
      : public traversal_policy<const element, std::string> {
  public:
    std::vector<std::string> calls;
    bool create = false;
    std::size_t pick = 0;

    const element*
    on_missing_root(const qname& name) override {
      calls.push_back("missing_root " + name.str());
      return nullptr;
    }

    const element*
    on_ambiguous(const std::vector<const element*>& candidates) override {
      calls.push_back("ambiguous " + std::to_string(candidates.size()));
      return candidates.at(pick);
    }

    const element*
    on_missing_child(const qname& name, const element&) override {
      calls.push_back("missing_child " + name.str());
      return nullptr;
    }

    std::string
    on_finish(const element& node,
              const std::optional<qname>& attribute) override {
      calls.push_back("finish");
      return node.name().local_name() + (attribute ? "@" + attribute->str() : "");
    }
  };

  resolved_path
  path_of(const std::string& text) {
    return resolve_path(text, namespace_table{});
  }

  const std::string tree = "<a><b><c>1</c></b><b><c>2</c></b><d/></a>";

} // namespace

TEST_CASE("traverse: unique steps reach the end", "[traversal]") {
  const auto doc = parse_document(tree);
  recording_policy policy;

  auto result = traverse(doc.root(), path_of("/a/d/@x"), policy);
  REQUIRE(result);
  CHECK(*result == "d@x");
  CHECK(policy.calls == std::vector<std::string>{"finish"});
}

TEST_CASE("traverse: repeated siblings ask the policy", "[traversal]") {
  const auto doc = parse_document(tree);
  recording_policy policy;
  policy.pick = 1;

  auto result = traverse(doc.root(), path_of("/a/b/c"), policy);
  REQUIRE(result);
  CHECK(*result == "c");
  CHECK(policy.calls == std::vector<std::string>{"ambiguous 2", "finish"});
}

TEST_CASE("traverse: missing child aborts when the policy says so",
          "[traversal]") {
  const auto doc = parse_document(tree);
  recording_policy policy;

  CHECK_FALSE(traverse(doc.root(), path_of("/a/x/y"), policy));
  CHECK(policy.calls == std::vector<std::string>{"missing_child x"});
}

TEST_CASE("traverse: root mismatch yields nothing", "[traversal]") {
  const auto doc = parse_document(tree);
  recording_policy policy;

  CHECK_FALSE(traverse(doc.root(), path_of("/z/b"), policy));
  CHECK(policy.calls.empty());
}

TEST_CASE("traverse: missing root is reported", "[traversal]") {
  recording_policy policy;
  const element* none = nullptr;

  CHECK_FALSE(traverse(none, path_of("/a"), policy));
  CHECK(policy.calls == std::vector<std::string>{"missing_root a"});
}

TEST_CASE("traverse: empty path finishes at the root", "[traversal]") {
  const auto doc = parse_document(tree);
  recording_policy policy;

  auto result = traverse(doc.root(), path_of("/"), policy);
  REQUIRE(result);
  CHECK(*result == "a");
}
