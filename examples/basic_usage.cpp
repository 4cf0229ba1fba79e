/**
 * @file basic_usage.cpp
 * @brief Basic usage example for fixedwidth
 */

#include <iostream>

#include <fixedwidth/fixedwidth.hpp>

int main() {
    std::cout << "fixedwidth v" << fixedwidth::version() << "\n\n";

    std::unique_ptr<fixedwidth::Definition> definition;
    auto status = fixedwidth::Definition::create("statement", {}, &definition);
    if (!status.ok()) {
        std::cerr << "Error: " << status.to_string() << std::endl;
        return 1;
    }

    // A shared money block, referenced by the detail layout
    status = definition->add_schema("money", [](fixedwidth::Schema& s) {
        auto st = s.add_column("currency", 3);
        if (st.ok()) {
            st = s.add_column("cents", 9, {{"type", fixedwidth::Value("integer")},
                                           {"padding", fixedwidth::Value("0")}});
        }
        return st;
    });

    fixedwidth::Schema* detail = nullptr;
    if (status.ok()) {
        status = definition->add_schema("detail", [](fixedwidth::Schema& s) {
            auto st = s.add_column("kind", 1);
            if (st.ok()) st = s.add_column("account", 6, {{"padding", fixedwidth::Value("0")}});
            if (st.ok()) st = s.add_reference("amount", "money");
            if (st.ok()) st = s.add_filler(1);
            if (st.ok()) st = s.add_column("memo", 10, {{"align", fixedwidth::Value("left")}});
            return st;
        }, {}, &detail);
    }
    if (status.ok()) {
        detail->set_trap([](std::string_view line) { return line.starts_with("D"); });
        definition->schema("money")->set_trap([](std::string_view) { return false; });
        status = definition->validate();
    }
    if (!status.ok()) {
        std::cerr << "Error: " << status.to_string() << std::endl;
        return 1;
    }

    size_t length = 0;
    status = detail->length(&length);
    if (!status.ok()) {
        std::cerr << "Error: " << status.to_string() << std::endl;
        return 1;
    }
    std::cout << "Detail records are " << length << " characters wide\n";

    // Format a record
    fixedwidth::Record record{
        {"kind", fixedwidth::Value("D")},
        {"account", fixedwidth::Value("42")},
        {"amount", fixedwidth::Value(fixedwidth::Record{
                       {"currency", fixedwidth::Value("EUR")},
                       {"cents", fixedwidth::Value(int64_t{12550})}})},
        {"memo", fixedwidth::Value("Rent")},
    };

    std::string line;
    status = detail->format(record, &line);
    if (!status.ok()) {
        std::cerr << "Error: " << status.to_string() << std::endl;
        return 1;
    }
    std::cout << "Formatted: [" << line << "]\n";

    // Parse it back, letting the definition pick the layout
    fixedwidth::Record parsed;
    std::string schema_name;
    status = definition->parse_line(line, &parsed, &schema_name);
    if (!status.ok()) {
        std::cerr << "Error: " << status.to_string() << std::endl;
        return 1;
    }
    std::cout << "Parsed as " << schema_name << ": " << parsed.to_string() << "\n";

    return 0;
}
