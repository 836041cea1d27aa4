#include <rxml/engine.hpp>
#include <rxml/errors.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace rxml;

namespace {

  const writer_options compact{output_charset::utf8, false, false};

  const std::string orders =
      R"(<orders><order id="1"><item>apple</item><item>pear</item></order>)"
      R"(<order id="2"><item>plum</item></order></orders>)";

  rule_set
  order_rules() {
    rule_set rules;
    rules.add("ruleId", {{"/order/@id"}, {"/invoice/@number"}, std::nullopt,
                         std::nullopt},
              [](const std::vector<std::string>& args) { return args[0]; });
    rules.add("ruleLines",
              {{"/order/item"},
               {"/invoice/line"},
               std::vector<std::vector<std::string>>{
                   {"/order/item", "/invoice/line"}},
               std::nullopt},
              [](const std::vector<std::string>& args) { return args[0]; });
    return rules;
  }

} // namespace

TEST_CASE("batch: one document per matched element", "[batch]") {
  auto source = parse_document(orders);
  auto targets = run_batch(source, order_rules(), {}, "/orders/order");

  REQUIRE(targets.size() == 2);
  CHECK(to_string(targets[0], compact) ==
        R"(<invoice number="1"><line>apple</line><line>pear</line></invoice>)");
  CHECK(to_string(targets[1], compact) ==
        R"(<invoice number="2"><line>plum</line></invoice>)");
}

TEST_CASE("batch: no match yields no documents", "[batch]") {
  auto source = parse_document(orders);
  CHECK(run_batch(source, order_rules(), {}, "/orders/none").empty());
}

TEST_CASE("batch: requirements apply to every document", "[batch]") {
  auto source = parse_document(
      R"(<orders><order id="1"/><order><item>x</item></order></orders>)");

  run_metadata meta;
  meta.input_required = {"/order/@id"};

  CHECK_THROWS_AS(run_batch(source, order_rules(), meta, "/orders/order"),
                  required_path_error);
}

TEST_CASE("batch: base path must name elements", "[batch]") {
  auto source = parse_document(orders);
  CHECK_THROWS_AS(run_batch(source, order_rules(), {}, "/orders/order/@id"),
                  path_kind_error);
  CHECK_THROWS_AS(run_batch(source, rule_set{}, {}, "/orders/order"),
                  definition_error);
}
