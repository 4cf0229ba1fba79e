#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <fixedwidth/fixedwidth.hpp>

namespace fixedwidth::bench {

/// Detail record layout with a referenced money block and a grouped address
inline Status make_definition(std::unique_ptr<Definition> *out) {
    std::unique_ptr<Definition> definition;
    auto status = Definition::create("bench", {}, &definition);
    if (!status.ok()) return status;

    status = definition->add_schema("money", [](Schema &s) {
        auto st = s.add_column("currency", 3);
        if (st.ok()) st = s.add_column("cents", 9, {{"type", Value("integer")}, {"padding", Value("0")}});
        return st;
    });
    if (!status.ok()) return status;

    status = definition->add_schema("detail", [](Schema &s) {
        auto st = s.add_column("kind", 1);
        if (st.ok()) st = s.add_column("account", 8, {{"type", Value("integer")}, {"padding", Value("0")}});
        if (st.ok()) st = s.add_reference("amount", "money");
        if (st.ok()) st = s.add_column("street", 20, {{"group", Value("address")}, {"align", Value("left")}});
        if (st.ok()) st = s.add_column("city", 12, {{"group", Value("address")}, {"align", Value("left")}});
        if (st.ok()) st = s.add_filler(2);
        if (st.ok()) st = s.add_column("memo", 16, {{"align", Value("left")}, {"truncate", Value(true)}});
        return st;
    });
    if (!status.ok()) return status;

    status = definition->validate();
    if (!status.ok()) return status;

    *out = std::move(definition);
    return Status::Ok();
}

/// Deterministic detail records
inline std::vector<Record> make_records(int64_t count) {
    std::mt19937_64 rng(42);
    std::uniform_int_distribution<int64_t> cents(0, 999999999);
    std::vector<Record> records;
    records.reserve(static_cast<size_t>(count));
    for (int64_t i = 0; i < count; ++i) {
        records.push_back(Record{
            {"kind", Value("D")},
            {"account", Value(i)},
            {"amount", Value(Record{{"currency", Value("EUR")}, {"cents", Value(cents(rng))}})},
            {"address", Value(Record{{"street", Value("Rue de la Paix " + std::to_string(i % 100))},
                                     {"city", Value("Paris")}})},
            {"memo", Value("Payment reference " + std::to_string(i))},
        });
    }
    return records;
}

}  // namespace fixedwidth::bench
