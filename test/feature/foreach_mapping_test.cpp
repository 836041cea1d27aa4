#include <rxml/engine.hpp>
#include <rxml/errors.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace rxml;

namespace {

  using foreach_list = std::vector<std::vector<std::string>>;

  const writer_options compact{output_charset::utf8, false, false};

  std::string
  map_document(const std::string& xml, const rule_set& rules) {
    return to_string(run(parse_document(xml), rules, {}), compact);
  }

  rule_metadata
  repeated(std::vector<std::string> sources, std::string destination,
           foreach_list foreach) {
    return {std::move(sources), {std::move(destination)}, std::move(foreach),
            std::nullopt};
  }

  std::optional<std::string>
  copy(const std::vector<std::string>& args) {
    return args.at(0);
  }

  const std::string three_elements =
      "<xml><element><child>A</child></element>"
      "<element><child>B</child></element>"
      "<element><child>C</child></element></xml>";

} // namespace

TEST_CASE("foreach: one destination element per source element",
          "[foreach]") {
  rule_set rules;
  rules.add("ruleMessages",
            repeated({"/xml/element/child"}, "/doc/message/text",
                     {{"/xml/element", "/doc/message"}}),
            copy);

  CHECK(map_document(three_elements, rules) ==
        "<doc><message><text>A</text></message>"
        "<message><text>B</text></message>"
        "<message><text>C</text></message></doc>");
}

TEST_CASE("foreach: implementation sees each repetition", "[foreach]") {
  rule_set rules;
  rules.add("ruleSuffix",
            repeated({"/xml/element/child"}, "/doc/message/text",
                     {{"/xml/element", "/doc/message"}}),
            [](const std::vector<std::string>& args) { return args[0] + "2"; });

  CHECK(map_document(three_elements, rules) ==
        "<doc><message><text>A2</text></message>"
        "<message><text>B2</text></message>"
        "<message><text>C2</text></message></doc>");
}

TEST_CASE("foreach: destination equal to its base", "[foreach]") {
  rule_set rules;
  rules.add("ruleNumbers",
            repeated({"/xml/element/child"}, "/doc/number",
                     {{"/xml/element", "/doc/number"}}),
            copy);

  CHECK(map_document(three_elements, rules) ==
        "<doc><number>A</number><number>B</number><number>C</number></doc>");
}

TEST_CASE("foreach: several sources within one repetition", "[foreach]") {
  rule_set rules;
  rules.add("ruleCompute",
            repeated({"/xml/operation/param1", "/xml/operation/param2",
                      "/xml/operation/opcode"},
                     "/doc/computed", {{"/xml/operation", "/doc/computed"}}),
            [](const std::vector<std::string>& args) {
              const auto& opcode = args[2];
              if (opcode == "ADD") {
                return std::to_string(std::stoi(args[0]) + std::stoi(args[1]));
              }
              if (opcode == "CONCAT") { return args[0] + args[1]; }
              return std::string("ERROR");
            });

  CHECK(map_document(
            "<xml>"
            "<operation><opcode>ADD</opcode><param1>1</param1>"
            "<param2>2</param2></operation>"
            "<operation><opcode>CONCAT</opcode><param1>1</param1>"
            "<param2>2</param2></operation>"
            "<operation><opcode>NOP</opcode></operation>"
            "</xml>",
            rules) ==
        "<doc><computed>3</computed><computed>12</computed>"
        "<computed>ERROR</computed></doc>");
}

TEST_CASE("foreach: deeply nested paths below the bases", "[foreach]") {
  rule_set rules;
  rules.add("ruleNested",
            repeated({"/xml/base/a/very/nested/source/element/@attr"},
                     "/doc/dst/that/yrev/detsen/ecruos/tnemele/@rtta",
                     {{"/xml/base", "/doc/dst"}}),
            [](const std::vector<std::string>& args) {
              return " " + args[0] + " ";
            });

  CHECK(map_document(
            "<xml>"
            R"(<base><a><very><nested><source><element attr="x"/>)"
            "</source></nested></very></a></base>"
            "<base/>"
            "</xml>",
            rules) ==
        "<doc>"
        R"(<dst><that><yrev><detsen><ecruos><tnemele rtta=" x "/>)"
        "</ecruos></detsen></yrev></that></dst>"
        R"(<dst><that><yrev><detsen><ecruos><tnemele rtta="  "/>)"
        "</ecruos></detsen></yrev></that></dst>"
        "</doc>");
}

TEST_CASE("foreach: nested repetitions", "[foreach]") {
  const foreach_list article{{"/html/body/article", "/doc/section"}};
  const foreach_list items{{"/html/body/article", "/doc/section"},
                           {"/html/body/article/ul/li",
                            "/doc/section/text/list/item"}};

  rule_set rules;
  rules.add("ruleCharset",
            repeated({"/html/head/meta/@charset"}, "/doc/section/@charset",
                     article),
            copy);
  rules.add("ruleLanguage",
            repeated({"/html/body/article/lang"}, "/doc/section/@language",
                     article),
            copy);
  rules.add("ruleParagraph",
            repeated({"/html/body/article/p", "/html/body/article/h1"},
                     "/doc/section/text/paragraph", article),
            [](const std::vector<std::string>& args) {
              return args[1] + ": " + args[0];
            });
  rules.add("ruleParagraphStyle",
            repeated({}, "/doc/section/text/paragraph/@style", article),
            [](const std::vector<std::string>&) {
              return std::string("text-indent:5px");
            });
  rules.add("ruleItems",
            repeated({"/html/body/article/ul/li"},
                     "/doc/section/text/list/item", items),
            copy);

  const std::string html =
      R"(<html><head><meta charset="utf-8"/></head><body>)"
      "<article><lang>en</lang><h1>One</h1><p>first</p>"
      "<ul><li>a</li><li>b</li></ul></article>"
      "<article><lang>de</lang><h1>Two</h1><p>second</p>"
      "<ul><li>c</li></ul></article>"
      "</body></html>";

  CHECK(map_document(html, rules) ==
        "<doc>"
        R"(<section charset="utf-8" language="en"><text>)"
        R"(<paragraph style="text-indent:5px">One: first</paragraph>)"
        "<list><item>a</item><item>b</item></list></text></section>"
        R"(<section charset="utf-8" language="de"><text>)"
        R"(<paragraph style="text-indent:5px">Two: second</paragraph>)"
        "<list><item>c</item></list></text></section>"
        "</doc>");
}

TEST_CASE("foreach: basic and repeated rules together", "[foreach]") {
  rule_set rules;
  rules.add("ruleTitle", {{"/xml/@name"}, {"/doc/title"}, std::nullopt, 1},
            copy);
  rules.add("ruleMessages",
            repeated({"/xml/element/child"}, "/doc/message",
                     {{"/xml/element", "/doc/message"}}),
            copy);

  CHECK(map_document(R"(<xml name="list"><element><child>A</child></element>)"
                     "<element><child>B</child></element></xml>",
                     rules) ==
        "<doc><title>list</title><message>A</message>"
        "<message>B</message></doc>");
}

TEST_CASE("foreach: no matching source elements", "[foreach]") {
  rule_set rules;
  rules.add("ruleTitle", {{}, {"/doc/title"}, std::nullopt, std::nullopt},
            [](const std::vector<std::string>&) { return std::string("t"); });
  rules.add("ruleMessages",
            repeated({"/xml/element/child"}, "/doc/message",
                     {{"/xml/element", "/doc/message"}}),
            copy);

  CHECK(map_document("<xml/>", rules) == "<doc><title>t</title></doc>");
}

TEST_CASE("foreach: root-level base maps the root once", "[foreach]") {
  rule_set rules;
  rules.add("ruleRoot",
            repeated({"/xml/a"}, "/doc/a", {{"/xml", "/doc"}}), copy);

  CHECK(map_document("<xml><a>1</a></xml>", rules) == "<doc><a>1</a></doc>");
}

TEST_CASE("foreach: bases that do not nest are rejected before running",
          "[foreach]") {
  rule_set rules;
  rules.add("ruleBroken",
            repeated({"/x/a/v"}, "/doc/b",
                     {{"/x/a", "/doc/a"}, {"/y/b", "/doc/b"}}),
            copy);

  CHECK_THROWS_AS(map_document("<x><a><v>1</v></a></x>", rules),
                  foreach_nesting_error);
}

TEST_CASE("foreach: relative and absolute spellings of one base nest",
          "[foreach]") {
  rule_set rules;
  rules.add("ruleInner",
            repeated({"/r/a/b"}, "/o/x/y",
                     {{"r/a", "/o/x"}, {"/r/a/b", "/o/x/y"}}),
            copy);

  CHECK(map_document("<r><a><b>1</b></a><a><b>2</b></a></r>", rules) ==
        "<o><x><y>1</y></x><x><y>2</y></x></o>");
}
