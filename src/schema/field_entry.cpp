/**
 * @file field_entry.cpp
 * @brief FieldEntry and Reference implementation
 */

#include "fixedwidth/field_entry.hpp"

#include "fixedwidth/schema.hpp"

namespace fixedwidth {

// ─────────────────────────────────────────────────────────────────────────────
// Reference
// ─────────────────────────────────────────────────────────────────────────────

Reference::Reference(ReferenceSpec spec) : spec_(std::move(spec)) {
    if (spec_.store_name.empty()) {
        spec_.store_name = spec_.schema_name;
    }
}

std::vector<OptionMap> Reference::bind(Schema* target) {
    state_ = ResolutionState::RESOLVED;
    target_ = target;
    failure_.clear();
    std::vector<OptionMap> queued;
    queued.swap(pending_);
    return queued;
}

void Reference::fail(std::string reason) {
    state_ = ResolutionState::FAILED;
    failure_ = std::move(reason);
}

void Reference::enqueue(const OptionMap& options) {
    for (const auto& queued : pending_) {
        if (queued == options) {
            return;
        }
    }
    pending_.push_back(options);
}

// ─────────────────────────────────────────────────────────────────────────────
// FieldEntry
// ─────────────────────────────────────────────────────────────────────────────

FieldEntry::FieldEntry(std::unique_ptr<FieldCodec> codec) : entry_(std::move(codec)) {}

FieldEntry::FieldEntry(std::unique_ptr<Schema> schema) : entry_(std::move(schema)) {}

FieldEntry::FieldEntry(std::unique_ptr<Reference> reference)
    : entry_(std::move(reference)) {}

FieldEntry::~FieldEntry() = default;

FieldEntry::FieldEntry(FieldEntry&&) noexcept = default;

FieldEntry& FieldEntry::operator=(FieldEntry&&) noexcept = default;

FieldKind FieldEntry::kind() const noexcept {
    return static_cast<FieldKind>(entry_.index());
}

FieldCodec* FieldEntry::codec() const noexcept {
    auto* p = std::get_if<std::unique_ptr<FieldCodec>>(&entry_);
    return p ? p->get() : nullptr;
}

Schema* FieldEntry::schema() const noexcept {
    auto* p = std::get_if<std::unique_ptr<Schema>>(&entry_);
    return p ? p->get() : nullptr;
}

Reference* FieldEntry::reference() const noexcept {
    auto* p = std::get_if<std::unique_ptr<Reference>>(&entry_);
    return p ? p->get() : nullptr;
}

}  // namespace fixedwidth
