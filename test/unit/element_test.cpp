#include <rxml/element.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace rxml;

namespace {

  const writer_options compact{output_charset::utf8, false, false};

} // namespace

TEST_CASE("element: parse builds the tree", "[element]") {
  auto doc = parse_document(R"(<a x="1"><b>one</b><b>two</b><c/></a>)");

  REQUIRE_FALSE(doc.empty());
  const element* root = doc.root();
  CHECK(root->name() == qname{"a"});
  REQUIRE(root->find_attribute(qname{"x"}) != nullptr);
  CHECK(*root->find_attribute(qname{"x"}) == "1");
  CHECK(root->find_attribute(qname{"y"}) == nullptr);

  REQUIRE(root->children().size() == 3);
  auto bs = root->children_named(qname{"b"});
  REQUIRE(bs.size() == 2);
  CHECK(bs[0]->text() == "one");
  CHECK(bs[1]->text() == "two");
}

TEST_CASE("element: text stops at the first child", "[element]") {
  auto doc = parse_document("<p>Hello <b>world</b>!</p>");
  CHECK(doc.root()->text() == "Hello ");
}

TEST_CASE("element: built tree serializes compactly", "[element]") {
  document doc;
  auto& root = doc.create_root(qname{"out"});
  root.set_attribute(qname{"id"}, "7");
  root.append_child(qname{"item"}).set_text("a & b");
  root.append_child(qname{"item"});

  CHECK(to_string(doc, compact) ==
        R"(<out id="7"><item>a &amp; b</item><item/></out>)");
}

TEST_CASE("element: default output has declaration and indentation",
          "[element]") {
  document doc;
  doc.create_root(qname{"out"}).append_child(qname{"v"}).set_text("1");

  CHECK(to_string(doc) ==
        "<?xml version='1.0' encoding='UTF-8'?>\n<out>\n  <v>1</v>\n</out>\n");
}

TEST_CASE("element: set_attribute replaces", "[element]") {
  element e{qname{"e"}};
  e.set_attribute(qname{"a"}, "1");
  e.set_attribute(qname{"a"}, "2");
  REQUIRE(e.attributes().size() == 1);
  CHECK(e.attributes()[0].value == "2");
}

TEST_CASE("element: declared namespaces are written once", "[element]") {
  document doc;
  auto& root = doc.create_root(qname{"urn:a", "root"});
  root.declare_namespace("a", "urn:a");
  auto& child = root.append_child(qname{"urn:a", "child"});
  child.declare_namespace("a", "urn:a");

  CHECK(to_string(doc, compact) ==
        R"(<a:root xmlns:a="urn:a"><a:child/></a:root>)");
}

TEST_CASE("element: xml and xmlns are never declared", "[element]") {
  element e{qname{"e"}};
  e.declare_namespace("xml", "http://www.w3.org/XML/1998/namespace");
  e.declare_namespace("xmlns", "http://www.w3.org/2000/xmlns/");
  CHECK(e.namespaces().empty());
}

TEST_CASE("element: undeclared namespace gets a generated prefix",
          "[element]") {
  document doc;
  doc.create_root(qname{"urn:x", "root"});

  CHECK(to_string(doc, compact) == R"(<ns0:root xmlns:ns0="urn:x"/>)");
}

TEST_CASE("element: unqualified child below a default namespace",
          "[element]") {
  document doc;
  auto& root = doc.create_root(qname{"urn:d", "root"});
  root.declare_namespace("", "urn:d");
  root.append_child(qname{"plain"});

  CHECK(to_string(doc, compact) ==
        R"(<root xmlns="urn:d"><plain xmlns=""/></root>)");
}

TEST_CASE("element: namespaced document round trip", "[element]") {
  const std::string xml =
      R"(<p:root xmlns:p="urn:p"><p:item p:k="v">t</p:item></p:root>)";
  CHECK(to_string(parse_document(xml), compact) == xml);
}

TEST_CASE("element: document errors", "[element]") {
  document doc;
  CHECK_THROWS_AS(to_string(doc), std::runtime_error);

  doc.create_root(qname{"r"});
  CHECK_THROWS_AS(doc.create_root(qname{"s"}), std::logic_error);
  CHECK_THROWS_AS(parse_document("<a><b></a>"), std::runtime_error);
}
