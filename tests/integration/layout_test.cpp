/**
 * @file layout_test.cpp
 * @brief End-to-end tests over a multi-record file layout
 */

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include <fixedwidth/fixedwidth.hpp>

#include "test_utils.hpp"

namespace fixedwidth {
namespace {

/**
 * Statement layout:
 *   header  H + bank(6, left) + filler(1) + date(8)
 *   detail  D + account(6, '0'-padded integer) + money + memo(10, left, truncated)
 *   trailer T + count(4, '0'-padded integer) + money
 * where money is a shared schema: currency(3) + cents(9, '0'-padded integer).
 */
class LayoutTest : public ::testing::Test {
protected:
  void SetUp() override {
    definition_ = test::make_definition("statement");
    ASSERT_NE(definition_, nullptr);

    Schema *money = nullptr;
    ASSERT_TRUE(definition_->add_schema("money", [](Schema &s) {
      auto st = s.add_column("currency", 3);
      if (st.ok()) st = s.add_column("cents", 9, {{"type", Value("integer")}, {"padding", Value("0")}});
      return st;
    }, {}, &money).ok());
    // Only reachable through references, never a record type of its own
    money->set_trap([](std::string_view) { return false; });

    Schema *header = nullptr;
    ASSERT_TRUE(definition_->add_schema("header", [](Schema &s) {
      auto st = s.add_column("kind", 1);
      if (st.ok()) st = s.add_column("bank", 6, {{"align", Value("left")}});
      if (st.ok()) st = s.add_filler(1);
      if (st.ok()) st = s.add_column("date", 8);
      return st;
    }, {}, &header).ok());
    header->set_trap([](std::string_view line) { return line.starts_with("H"); });

    Schema *detail = nullptr;
    ASSERT_TRUE(definition_->add_schema("detail", [](Schema &s) {
      auto st = s.add_column("kind", 1);
      if (st.ok())
        st = s.add_column("account", 6, {{"type", Value("integer")}, {"padding", Value("0")}});
      if (st.ok()) st = s.add_reference("amount", "money");
      if (st.ok())
        st = s.add_column("memo", 10, {{"align", Value("left")}, {"truncate", Value(true)}});
      return st;
    }, {}, &detail).ok());
    detail->set_trap([](std::string_view line) { return line.starts_with("D"); });

    Schema *trailer = nullptr;
    ASSERT_TRUE(definition_->add_schema("trailer", [](Schema &s) {
      auto st = s.add_column("kind", 1);
      if (st.ok())
        st = s.add_column("count", 4, {{"type", Value("integer")}, {"padding", Value("0")}});
      if (st.ok()) st = s.add_reference("total", "money");
      return st;
    }, {}, &trailer).ok());
    trailer->set_trap([](std::string_view line) { return line.starts_with("T"); });

    ASSERT_TRUE(definition_->validate().ok());
  }

  std::unique_ptr<Definition> definition_;
};

TEST_F(LayoutTest, Lengths) {
  EXPECT_EQ(test::length_of(*definition_->schema("money")), 12);
  EXPECT_EQ(test::length_of(*definition_->schema("header")), 16);
  EXPECT_EQ(test::length_of(*definition_->schema("detail")), 29);
  EXPECT_EQ(test::length_of(*definition_->schema("trailer")), 17);
}

TEST_F(LayoutTest, ParseStatement) {
  const std::string text =
      "HACME   20240131\n"
      "D000042EUR000012550Rent      \n"
      "D000107EUR000000999Caf\xC3\xA9\n"
      "T0002EUR000013549\n";

  std::istringstream input(text);
  std::string line;
  std::vector<std::pair<std::string, Record>> parsed;
  while (std::getline(input, line)) {
    Record record;
    std::string schema_name;
    auto status = definition_->parse_line(line, &record, &schema_name);
    ASSERT_TRUE(status.ok()) << status.to_string() << " for '" << line << "'";
    parsed.emplace_back(schema_name, record);
  }

  ASSERT_EQ(parsed.size(), 4);
  EXPECT_EQ(parsed[0].first, "header");
  EXPECT_EQ(parsed[0].second["bank"], Value("ACME"));
  EXPECT_EQ(parsed[0].second["date"], Value("20240131"));

  EXPECT_EQ(parsed[1].first, "detail");
  EXPECT_EQ(parsed[1].second["account"], Value(int64_t{42}));
  const Record &amount = parsed[1].second["amount"].as_record();
  EXPECT_EQ(amount["currency"], Value("EUR"));
  EXPECT_EQ(amount["cents"], Value(int64_t{12550}));
  EXPECT_EQ(parsed[1].second["memo"], Value("Rent"));

  EXPECT_EQ(parsed[2].second["memo"], Value("Caf\xC3\xA9"));

  EXPECT_EQ(parsed[3].first, "trailer");
  EXPECT_EQ(parsed[3].second["count"], Value(int64_t{2}));
  EXPECT_EQ(parsed[3].second["total"].as_record()["cents"], Value(int64_t{13549}));
}

TEST_F(LayoutTest, FormatStatement) {
  Record detail{{"kind", Value("D")},
                {"account", Value(int64_t{42})},
                {"amount", Value(Record{{"currency", Value("EUR")}, {"cents", Value(int64_t{12550})}})},
                {"memo", Value("Monthly rent payment")}};

  std::string line;
  ASSERT_TRUE(definition_->schema("detail")->format(detail, &line).ok());
  EXPECT_EQ(line, "D000042EUR000012550Monthly re");
}

TEST_F(LayoutTest, RoundTripEveryRecordType) {
  const std::vector<std::string> lines = {
      "HACME   20240131",
      "D000042EUR000012550Rent      ",
      "D000107EUR000000999Caf\xC3\xA9      ",
      "T0002EUR000013549",
  };

  for (const auto &original : lines) {
    Record record;
    std::string schema_name;
    ASSERT_TRUE(definition_->parse_line(original, &record, &schema_name).ok()) << original;

    std::string formatted;
    ASSERT_TRUE(definition_->schema(schema_name)->format(record, &formatted).ok()) << original;
    EXPECT_EQ(formatted, original);
  }
}

TEST_F(LayoutTest, UnknownRecordType) {
  Record record;
  EXPECT_TRUE(definition_->parse_line("X123", &record).is_not_found());
}

TEST_F(LayoutTest, SharedSchemaResolvedOnce) {
  ResolvedField detail_amount;
  ResolvedField trailer_total;
  ASSERT_TRUE(definition_->schema("detail")->lookup("amount", &detail_amount).ok());
  ASSERT_TRUE(definition_->schema("trailer")->lookup("total", &trailer_total).ok());
  EXPECT_EQ(detail_amount.schema, trailer_total.schema);
  EXPECT_EQ(detail_amount.schema, definition_->schema("money"));
}

TEST_F(LayoutTest, ReferencedSchemaGrowthUpdatesLength) {
  Schema *money = definition_->schema("money");
  ASSERT_EQ(test::length_of(*definition_->schema("detail")), 29);

  ASSERT_TRUE(money->add_column("rate", 2).ok());
  EXPECT_EQ(test::length_of(*money), 14);
  EXPECT_EQ(test::length_of(*definition_->schema("detail")), 31);
  EXPECT_EQ(test::length_of(*definition_->schema("trailer")), 19);
}

TEST_F(LayoutTest, VersionInfo) {
  EXPECT_STREQ(version(), "0.1.0");
  EXPECT_EQ(version_major(), 0);
  EXPECT_EQ(version_minor(), 1);
}

} // namespace
} // namespace fixedwidth
