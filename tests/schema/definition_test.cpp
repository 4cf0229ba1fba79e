/**
 * @file definition_test.cpp
 * @brief Unit tests for Definition
 */

#include <gtest/gtest.h>

#include "fixedwidth/definition.hpp"
#include "test_utils.hpp"

namespace fixedwidth {
namespace {

class DefinitionTest : public ::testing::Test {
protected:
  void SetUp() override {
    definition_ = test::make_definition("bank");
    ASSERT_NE(definition_, nullptr);
  }

  /// header (H...) and detail (D...) layouts selected by their first character
  void add_record_types() {
    Schema *header = nullptr;
    ASSERT_TRUE(definition_->add_schema("header", test::header_builder(), {}, &header).ok());
    header->set_trap([](std::string_view line) { return line.starts_with("H"); });

    Schema *detail = nullptr;
    ASSERT_TRUE(definition_->add_schema("detail", [](Schema &s) {
      auto st = s.add_column("kind", 1);
      if (st.ok()) st = s.add_column("amount", 6, {{"type", Value("integer")}});
      return st;
    }, {}, &detail).ok());
    detail->set_trap([](std::string_view line) { return line.starts_with("D"); });
  }

  std::unique_ptr<Definition> definition_;
};

TEST_F(DefinitionTest, Create) {
  EXPECT_EQ(definition_->name(), "bank");
  EXPECT_TRUE(definition_->schema_names().empty());
  EXPECT_NE(definition_->options(), nullptr);

  std::unique_ptr<Definition> other;
  EXPECT_TRUE(Definition::create("bad name", {}, &other).is_config_error());
  EXPECT_TRUE(Definition::create("x", {{"align", Value("middle")}}, &other).is_config_error());
  EXPECT_TRUE(Definition::create("x", {{"colour", Value("red")}}, &other).is_config_error());
  EXPECT_EQ(other, nullptr);
}

TEST_F(DefinitionTest, AddSchema) {
  Schema *schema = nullptr;
  ASSERT_TRUE(definition_->add_schema("header", test::header_builder(), {}, &schema).ok());
  ASSERT_NE(schema, nullptr);
  EXPECT_EQ(schema->catalog(), definition_.get());
  EXPECT_EQ(schema->parent(), nullptr);
  EXPECT_EQ(definition_->schema("header"), schema);
  EXPECT_EQ(definition_->schema("unknown"), nullptr);

  auto candidates = definition_->lookup_by_name("header");
  ASSERT_EQ(candidates.size(), 1);
  EXPECT_EQ(candidates[0], schema);
  EXPECT_TRUE(definition_->lookup_by_name("unknown").empty());
}

TEST_F(DefinitionTest, DuplicateSchemaRejected) {
  ASSERT_TRUE(definition_->add_schema("header", test::header_builder()).ok());
  EXPECT_TRUE(definition_->add_schema("header", test::header_builder()).is_duplicate_name());
  EXPECT_EQ(definition_->schema_names().size(), 1);
}

TEST_F(DefinitionTest, DuplicateDetectedAfterNameNormalization) {
  ASSERT_TRUE(definition_->add_schema("header", test::header_builder()).ok());

  bool built = false;
  auto status = definition_->add_schema(" header ", [&built](Schema &s) {
    built = true;
    return s.add_column("x", 1);
  });
  EXPECT_TRUE(status.is_duplicate_name()) << status.to_string();
  EXPECT_FALSE(built);
  EXPECT_EQ(definition_->schema_names(), (std::vector<std::string>{"header"}));
  EXPECT_EQ(definition_->lookup_by_name("header").size(), 1);
}

TEST_F(DefinitionTest, EmptyBuilderAllowed) {
  ASSERT_TRUE(definition_->add_schema("empty", Schema::Builder()).ok());
  EXPECT_EQ(test::length_of(*definition_->schema("empty")), 0);
}

TEST_F(DefinitionTest, FailedBuilderRegistersNothing) {
  auto status = definition_->add_schema("broken", [](Schema &s) {
    return s.add_column("spacer_7", 1);
  });
  EXPECT_TRUE(status.is_config_error());
  EXPECT_EQ(definition_->schema("broken"), nullptr);

  EXPECT_TRUE(definition_->add_schema("repeat_me", Schema::Builder()).is_config_error());
}

TEST_F(DefinitionTest, SchemaNamesInDeclarationOrder) {
  ASSERT_TRUE(definition_->add_schema("trailer", Schema::Builder()).ok());
  ASSERT_TRUE(definition_->add_schema("header", Schema::Builder()).ok());
  ASSERT_TRUE(definition_->add_schema("detail", Schema::Builder()).ok());

  EXPECT_EQ(definition_->schema_names(),
            (std::vector<std::string>{"trailer", "header", "detail"}));
}

TEST_F(DefinitionTest, MatchSchema) {
  add_record_types();

  const Schema *schema = nullptr;
  ASSERT_TRUE(definition_->match_schema("HA1 DEAD", &schema).ok());
  EXPECT_EQ(schema->name(), "header");

  ASSERT_TRUE(definition_->match_schema("D    42", &schema).ok());
  EXPECT_EQ(schema->name(), "detail");

  EXPECT_TRUE(definition_->match_schema("X", &schema).is_not_found());
  EXPECT_TRUE(definition_->match_schema("D this line is far too long", &schema).is_not_found());
}

TEST_F(DefinitionTest, FirstMatchingSchemaWins) {
  ASSERT_TRUE(definition_->add_schema("wide", test::column_builder("a", 10)).ok());
  ASSERT_TRUE(definition_->add_schema("narrow", test::column_builder("a", 2)).ok());

  const Schema *schema = nullptr;
  ASSERT_TRUE(definition_->match_schema("ab", &schema).ok());
  EXPECT_EQ(schema->name(), "wide");
}

TEST_F(DefinitionTest, ParseLine) {
  add_record_types();

  Record record;
  std::string name;
  ASSERT_TRUE(definition_->parse_line("D    42", &record, &name).ok());
  EXPECT_EQ(name, "detail");
  EXPECT_EQ(record["amount"], Value(int64_t{42}));

  ASSERT_TRUE(definition_->parse_line("HA1 DEAD", &record).ok());
  EXPECT_EQ(record["id"], Value("HA1"));
  EXPECT_EQ(record["code"], Value("DEAD"));

  EXPECT_TRUE(definition_->parse_line("Z", &record, &name).is_not_found());
}

TEST_F(DefinitionTest, ErrorsAreDeduplicated) {
  ASSERT_TRUE(definition_->add_schema("a", [](Schema &s) { return s.add_reference("c"); }).ok());
  ASSERT_TRUE(definition_->add_schema("b", [](Schema &s) { return s.add_reference("c"); }).ok());
  ASSERT_TRUE(definition_->add_schema("c", [](Schema &s) { return s.add_reference("missing"); }).ok());

  auto errors = definition_->errors();
  ASSERT_EQ(errors.size(), 1);
  EXPECT_TRUE(errors[0].is_schema_error());

  auto status = definition_->validate();
  EXPECT_TRUE(status.is_schema_error());
  EXPECT_EQ(status.message(), errors[0].message());
}

TEST_F(DefinitionTest, ValidateSummarizesSeveralErrors) {
  ASSERT_TRUE(definition_->add_schema("a", [](Schema &s) { return s.add_reference("gone"); }).ok());
  ASSERT_TRUE(definition_->add_schema("b", [](Schema &s) { return s.add_reference("lost"); }).ok());

  EXPECT_EQ(definition_->errors().size(), 2);
  auto status = definition_->validate();
  EXPECT_TRUE(status.is_schema_error());
  EXPECT_NE(status.message().find("(and 1 more)"), std::string_view::npos);
}

TEST_F(DefinitionTest, ValidateSucceedsForResolvableLayout) {
  ASSERT_TRUE(definition_->add_schema("money", test::column_builder("cents", 8)).ok());
  ASSERT_TRUE(definition_->add_schema("detail", [](Schema &s) {
    auto st = s.add_column("kind", 1);
    if (st.ok()) st = s.add_reference("amount", "money");
    return st;
  }).ok());

  EXPECT_TRUE(definition_->errors().empty());
  EXPECT_TRUE(definition_->validate().ok());
  EXPECT_TRUE(definition_->schema("detail")->entry("amount")->reference()->is_resolved());
}

} // namespace
} // namespace fixedwidth
