#include <rxml/errors.hpp>
#include <rxml/namespaces.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace rxml;

namespace {

  const std::string u0 = "http://example.org/ns0";
  const std::string u1 = "http://example.org/ns1";

  std::size_t
  count_prefix(const namespace_table& table, const std::string& prefix) {
    auto b = table.bindings();
    return static_cast<std::size_t>(
        std::count_if(b.begin(), b.end(), [&prefix](const auto& binding) {
          return binding.prefix == prefix;
        }));
  }

} // namespace

TEST_CASE("namespace table always binds xml", "[namespaces]") {
  namespace_table table;
  auto bindings = table.bindings();
  REQUIRE(bindings.size() == 1);
  CHECK(bindings[0].scope == "/");
  CHECK(bindings[0].prefix == "xml");
  CHECK(bindings[0].uri == xml_namespace_uri);
}

TEST_CASE("namespace table drops xmlns and forces xml uri", "[namespaces]") {
  namespace_table table({{"/", "xmlns", "urn:bad"}, {"/", "xml", "urn:other"}});

  CHECK(count_prefix(table, "xmlns") == 0);
  REQUIRE(count_prefix(table, "xml") == 1);
  for (const auto& b : table.bindings()) {
    if (b.prefix == "xml") { CHECK(b.uri == xml_namespace_uri); }
  }
}

TEST_CASE("scoped binding applies below its scope only", "[namespaces]") {
  namespace_table table({{"/a", "ns0", u0}});

  auto inside = table.resolve(parse_path("/a/b").segments());
  CHECK(inside.at("ns0") == u0);
  CHECK(inside.at("xml") == xml_namespace_uri);

  auto outside = table.resolve(parse_path("/c").segments());
  CHECK(outside.count("ns0") == 0);
}

TEST_CASE("later binding overrides earlier one", "[namespaces]") {
  namespace_table table({{"/", "ns0", u0}, {"/a", "ns0", u1}});

  CHECK(table.resolve(parse_path("/a/b").segments()).at("ns0") == u1);
  CHECK(table.resolve(parse_path("/b").segments()).at("ns0") == u0);
}

TEST_CASE("resolve_path qualifies every step", "[namespaces]") {
  namespace_table table({{"/a", "ns0", u0}});

  auto p = resolve_path("ns0:a/ns0:b", table);
  REQUIRE(p.elements.size() == 2);
  CHECK(p.elements[0] == qname{u0, "a"});
  CHECK(p.elements[1] == qname{u0, "b"});
  CHECK(p.text == "/ns0:a/ns0:b");
}

TEST_CASE("unprefixed scope matches steps by local name", "[namespaces]") {
  namespace_table table({{"/a", "ns0", u0}});

  CHECK(table.resolve(parse_path("/ns0:a").segments()).at("ns0") == u0);
  CHECK(table.resolve(parse_path("/x:a/b").segments()).at("ns0") == u0);
  CHECK(table.resolve(parse_path("/ns0:ab").segments()).count("ns0") == 0);
}

TEST_CASE("prefixed scope requires the same prefix", "[namespaces]") {
  namespace_table table({{"/", "doc", u1}, {"/doc:doc", "ns0", u0}});

  CHECK(table.resolve(parse_path("/doc:doc/x").segments()).at("ns0") == u0);
  CHECK(table.resolve(parse_path("/doc").segments()).count("ns0") == 0);
  CHECK(table.resolve(parse_path("/other:doc").segments()).count("ns0") == 0);

  auto p = resolve_path("/doc:doc/ns0:x", table);
  CHECK(p.elements[0] == qname{u1, "doc"});
  CHECK(p.elements[1] == qname{u0, "x"});
}

TEST_CASE("resolve_path with unknown prefix throws", "[namespaces]") {
  namespace_table table;
  CHECK_THROWS_AS(resolve_path("/p:a", table), unknown_namespace_error);
  CHECK_THROWS_AS(resolve_path("/p:a", table), path_error);
}

TEST_CASE("default namespace qualifies elements but not attributes",
          "[namespaces]") {
  namespace_table table({{"/", "", u0}});

  auto p = resolve_path("/a/b/@id", table);
  CHECK(p.elements[0] == qname{u0, "a"});
  CHECK(p.elements[1] == qname{u0, "b"});
  REQUIRE(p.attribute);
  CHECK(*p.attribute == qname{"id"});
}

TEST_CASE("xml prefix resolves without declaration", "[namespaces]") {
  namespace_table table;
  auto p = resolve_path("/a/@xml:lang", table);
  REQUIRE(p.attribute);
  CHECK(*p.attribute == qname{xml_namespace_uri, "lang"});
}

TEST_CASE("resolved path parent", "[namespaces]") {
  namespace_table table;
  auto p = resolve_path("/a/b/@x", table);
  auto parent = p.parent();
  CHECK(parent.elements.size() == 1);
  CHECK_FALSE(parent.attribute);
  CHECK(parent.text == "/a");
  CHECK(resolve_path("/a", table).parent().text == "/");
}
