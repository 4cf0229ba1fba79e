/**
 * @file propagation_test.cpp
 * @brief Unit tests for option inheritance across schemas and references
 */

#include <gtest/gtest.h>

#include "fixedwidth/definition.hpp"
#include "test_utils.hpp"

namespace fixedwidth {
namespace {

std::string format_with(const Schema &schema, const Record &record) {
  std::string line;
  auto status = schema.format(record, &line);
  EXPECT_TRUE(status.ok()) << status.to_string();
  return line;
}

Value nested(std::initializer_list<Record::Entry> entries) {
  return Value(Record(entries));
}

TEST(PropagationTest, DefinitionOptionsReachColumns) {
  auto definition = test::make_definition("layout", {{"align", Value("left")}});
  ASSERT_TRUE(definition->add_schema("row", [](Schema &s) {
    auto st = s.add_column("a", 4);
    if (st.ok()) st = s.add_column("b", 4, {{"align", Value("right")}});
    return st;
  }).ok());

  Schema *row = definition->schema("row");
  EXPECT_EQ(row->options().origin("align"), OptionOrigin::INHERITED);
  EXPECT_EQ(format_with(*row, Record{{"a", Value("x")}, {"b", Value("y")}}), "x      y");
}

TEST(PropagationTest, SchemaExplicitBeatsDefinition) {
  auto definition = test::make_definition("layout", {{"align", Value("left")}});
  ASSERT_TRUE(definition->add_schema("row", test::column_builder("a", 3), {{"align", Value("right")}}).ok());

  EXPECT_EQ(format_with(*definition->schema("row"), Record{{"a", Value("x")}}), "  x");
}

TEST(PropagationTest, DeepestExplicitWins) {
  auto definition = test::make_definition();
  ASSERT_TRUE(definition->add_schema("outer", [](Schema &s) {
    auto st = s.add_column("a", 3);
    if (st.ok()) {
      st = s.add_nested_schema("body", [](Schema &b) {
        auto inner = b.add_column("b", 3);
        if (inner.ok()) inner = b.add_column("c", 3, {{"padding", Value("#")}});
        return inner;
      }, {{"padding", Value("0")}});
    }
    return st;
  }, {{"padding", Value("*")}}).ok());

  Record record{{"a", Value("1")}, {"body", nested({{"b", Value("2")}, {"c", Value("3")}})}};
  EXPECT_EQ(format_with(*definition->schema("outer"), record), "**1002##3");
}

TEST(PropagationTest, ReferenceOptionsBeatResolvingSchema) {
  auto definition = test::make_definition();
  ASSERT_TRUE(definition->add_schema("inner", test::column_builder("v", 3)).ok());
  ASSERT_TRUE(definition->add_schema("other", test::column_builder("w", 3)).ok());
  ASSERT_TRUE(definition->add_schema("outer", [](Schema &s) {
    auto st = s.add_reference("payload", "inner", {{"padding", Value("0")}});
    if (st.ok()) st = s.add_reference("other");
    return st;
  }, {{"padding", Value("*")}}).ok());

  Record record{{"payload", nested({{"v", Value("7")}})}, {"other", nested({{"w", Value("8")}})}};
  EXPECT_EQ(format_with(*definition->schema("outer"), record), "007**8");

  EXPECT_EQ(definition->schema("other")->options().get("padding").as_string(), "*");
}

TEST(PropagationTest, TargetExplicitOptionsWin) {
  auto definition = test::make_definition();
  ASSERT_TRUE(definition->add_schema("inner", test::column_builder("v", 3, {{"padding", Value("#")}})).ok());
  ASSERT_TRUE(definition->add_schema("outer", [](Schema &s) {
    return s.add_reference("payload", "inner", {{"padding", Value("0")}});
  }).ok());

  EXPECT_EQ(format_with(*definition->schema("outer"), Record{{"payload", nested({{"v", Value("7")}})}}),
            "##7");
}

TEST(PropagationTest, TargetExplicitOptionalSurvivesReference) {
  auto definition = test::make_definition();
  Schema *target = nullptr;
  ASSERT_TRUE(definition->add_schema("inner", test::column_builder("v", 3), {{"optional", Value(true)}},
                                     &target).ok());
  ASSERT_TRUE(definition->add_schema("outer", [](Schema &s) {
    return s.add_reference("payload", "inner", {{"optional", Value(false)}});
  }).ok());

  ResolvedField field;
  ASSERT_TRUE(definition->schema("outer")->lookup("payload", &field).ok());
  ASSERT_EQ(field.schema, target);
  EXPECT_TRUE(target->optional());
  EXPECT_EQ(target->options().origin("optional"), OptionOrigin::EXPLICIT);
}

TEST(PropagationTest, UnresolvedReferenceQueuesOptions) {
  auto definition = test::make_definition();
  ASSERT_TRUE(definition->add_schema("inner", test::column_builder("v", 3)).ok());
  ASSERT_TRUE(definition->add_schema("outer", [](Schema &s) {
    return s.add_nested_schema("mid", [](Schema &m) { return m.add_reference("payload", "inner"); });
  }).ok());

  Schema *outer = definition->schema("outer");
  Schema *mid = nullptr;
  ASSERT_TRUE(outer->find_schema("mid", &mid).ok());
  const Reference *payload = mid->entry("payload")->reference();

  ASSERT_TRUE(outer->propagate({{"padding", Value("_")}}).ok());
  EXPECT_FALSE(payload->is_resolved());
  ASSERT_EQ(payload->pending().size(), 1);

  Record record{{"mid", nested({{"payload", nested({{"v", Value("7")}})}})}};
  EXPECT_EQ(format_with(*outer, record), "__7");
  EXPECT_TRUE(payload->is_resolved());
  EXPECT_TRUE(payload->pending().empty());
}

TEST(PropagationTest, ResolvedTargetsReceiveLaterPropagation) {
  auto definition = test::make_definition();
  ASSERT_TRUE(definition->add_schema("inner", test::column_builder("v", 3)).ok());
  ASSERT_TRUE(definition->add_schema("outer", [](Schema &s) {
    return s.add_reference("payload", "inner");
  }).ok());

  Schema *outer = definition->schema("outer");
  ASSERT_TRUE(outer->validate().ok());
  ASSERT_TRUE(outer->propagate({{"nil_blank", Value(true)}}).ok());

  Record record;
  ASSERT_TRUE(outer->parse("   ", &record).ok());
  EXPECT_TRUE(record["payload"].as_record()["v"].is_null());
}

TEST(PropagationTest, PropagationIsIdempotent) {
  auto schema = test::make_schema("row");
  ASSERT_TRUE(schema->add_column("a", 3).ok());

  OptionMap options{{"padding", Value("0")}};
  ASSERT_TRUE(schema->propagate(options).ok());
  OptionTable after_once = schema->options();
  ASSERT_TRUE(schema->propagate(options).ok());

  EXPECT_EQ(schema->options(), after_once);
  EXPECT_EQ(format_with(*schema, Record{{"a", Value("7")}}), "007");
}

TEST(PropagationTest, PropagationRejectsInvalidValues) {
  auto schema = test::make_schema("row");
  ASSERT_TRUE(schema->add_column("a", 3).ok());
  EXPECT_TRUE(schema->propagate({{"align", Value("middle")}}).is_config_error());
}

TEST(PropagationTest, SharedTargetKeepsFirstResolution) {
  auto definition = test::make_definition();
  ASSERT_TRUE(definition->add_schema("inner", test::column_builder("v", 3)).ok());
  ASSERT_TRUE(definition->add_schema("stars", [](Schema &s) { return s.add_reference("inner"); },
                                     {{"padding", Value("*")}}).ok());
  ASSERT_TRUE(definition->add_schema("dashes", [](Schema &s) { return s.add_reference("inner"); },
                                     {{"padding", Value("-")}}).ok());

  Record record{{"inner", nested({{"v", Value("1")}})}};
  EXPECT_EQ(format_with(*definition->schema("stars"), record), "**1");
  EXPECT_EQ(format_with(*definition->schema("dashes"), record), "**1");
}

} // namespace
} // namespace fixedwidth
