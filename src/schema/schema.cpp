/**
 * @file schema.cpp
 * @brief Schema implementation: setup, resolution, propagation, traversal
 */

#include "fixedwidth/schema.hpp"

#include <algorithm>
#include <atomic>
#include <iterator>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/status.hpp"
#include "common/utf8.hpp"

namespace fixedwidth {

namespace {

/// Bumped whenever any schema gains a field. A cached length may depend on
/// nested and referenced schemas, so it is only trusted for one generation.
std::atomic<uint64_t> g_layout_generation{1};

/// Pops the traversal stack when a traversal step ends
struct StackGuard {
  std::vector<const Schema *> *stack;
  ~StackGuard() { stack->pop_back(); }
};

/// Field, group and schema names must be identifiers and not reserved
Status check_name(std::string_view name) {
  if (!options::is_identifier(name)) {
    return Status::ConfigError("Invalid name: '" + std::string(name) +
                               "' is not an identifier");
  }
  if (name.starts_with(config::kSpacerPrefix) ||
      name.starts_with(config::kRepeatPrefix)) {
    return Status::ConfigError("Invalid name: '" + std::string(name) +
                               "' is a reserved keyword");
  }
  return Status::Ok();
}

std::vector<Status> unique_statuses(const std::vector<Status> &statuses) {
  std::vector<Status> result;
  std::vector<std::string> seen;
  for (const auto &status : statuses) {
    std::string text = status.to_string();
    if (std::find(seen.begin(), seen.end(), text) == seen.end()) {
      seen.push_back(std::move(text));
      result.push_back(status);
    }
  }
  return result;
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

Schema::Schema(Token, Schema *parent, SchemaCatalog *catalog)
    : parent_(parent), catalog_(catalog) {}

Schema::~Schema() = default;

Status Schema::create(std::string name, const OptionMap &options,
                      Schema *parent, std::unique_ptr<Schema> *out) {
  return create_impl(std::move(name), options, parent, nullptr, out);
}

Status Schema::create(std::string name, const OptionMap &options,
                      SchemaCatalog *catalog, std::unique_ptr<Schema> *out) {
  return create_impl(std::move(name), options, nullptr, catalog, out);
}

Status Schema::create(std::string name, const OptionMap &options,
                      std::unique_ptr<Schema> *out) {
  return create_impl(std::move(name), options, nullptr, nullptr, out);
}

Status Schema::create_impl(std::string name, const OptionMap &options,
                           Schema *parent, SchemaCatalog *catalog,
                           std::unique_ptr<Schema> *out) {
  OptionMap provided = options;
  provided["name"] = Value(std::move(name));

  auto schema = std::make_unique<Schema>(Token{}, parent, catalog);
  FIXEDWIDTH_RETURN_IF_ERROR(OptionTable::create(schema_option_schema(),
                                                 provided, &schema->options_));
  schema->name_ = schema->options_.get("name").as_string();
  FIXEDWIDTH_RETURN_IF_ERROR(check_name(schema->name_));

  // Enclosing scope only fills options this schema leaves unset
  const OptionTable *inherited = nullptr;
  if (parent != nullptr) {
    inherited = &parent->options_;
  } else if (catalog != nullptr) {
    inherited = catalog->options();
  }
  if (inherited != nullptr) {
    FIXEDWIDTH_RETURN_IF_ERROR(schema->options_.merge(*inherited));
  }

  *out = std::move(schema);
  return Status::Ok();
}

bool Schema::optional() const {
  return options_.get("optional").try_bool().value_or(false);
}

bool Schema::singular() const {
  return options_.get("singular").try_bool().value_or(false);
}

Status Schema::set_optional(bool optional) {
  return options_.set("optional", Value(optional));
}

Status Schema::set_singular(bool singular) {
  return options_.set("singular", Value(singular));
}

// ─────────────────────────────────────────────────────────────────────────────
// Setup
// ─────────────────────────────────────────────────────────────────────────────

Status Schema::setup(const Builder &builder) {
  if (!builder) {
    return Status::SchemaError("Setup of schema '" + name_ +
                               "' requires a builder");
  }
  if (in_setup_) {
    return Status::SchemaError("Schema '" + name_ +
                               "' is already in setup; recursion forbidden");
  }
  in_setup_ = true;
  Status status = builder(*this);
  in_setup_ = false;
  return status;
}

Status Schema::add_column(std::string name, size_t length,
                          const OptionMap &options, Column **out) {
  std::unique_ptr<Column> column;
  FIXEDWIDTH_RETURN_IF_ERROR(
      Column::create(std::move(name), length, options, &column));
  FIXEDWIDTH_RETURN_IF_ERROR(check_name(column->name()));
  if (!column->group().empty()) {
    FIXEDWIDTH_RETURN_IF_ERROR(check_name(column->group()));
  }

  std::string key;
  FIXEDWIDTH_RETURN_IF_ERROR(check_column(*column, &key));
  FIXEDWIDTH_RETURN_IF_ERROR(column->options()->merge(options_));

  Column *raw = column.get();
  append(std::move(key), FieldEntry(std::unique_ptr<FieldCodec>(std::move(column))));
  if (out != nullptr) {
    *out = raw;
  }
  return Status::Ok();
}

Status Schema::add_column(std::unique_ptr<FieldCodec> codec) {
  if (codec == nullptr) {
    return Status::SchemaError("Cannot add a null codec to schema '" + name_ +
                               "'");
  }
  if (codec->length() == 0) {
    return Status::SchemaError("Column '" + codec->name() +
                               "' must have a positive length");
  }
  FIXEDWIDTH_RETURN_IF_ERROR(check_name(codec->name()));
  if (!codec->group().empty()) {
    FIXEDWIDTH_RETURN_IF_ERROR(check_name(codec->group()));
  }

  std::string key;
  FIXEDWIDTH_RETURN_IF_ERROR(check_column(*codec, &key));
  if (OptionTable *table = codec->options()) {
    FIXEDWIDTH_RETURN_IF_ERROR(table->merge(options_));
  }

  append(std::move(key), FieldEntry(std::move(codec)));
  return Status::Ok();
}

Status Schema::add_filler(size_t length, const std::string &padding) {
  if (length == 0) {
    return Status::SchemaError("Filler in schema '" + name_ +
                               "' must have a positive length");
  }

  std::string name = std::string(config::kSpacerPrefix) + "_" +
                     std::to_string(spacer_count_ + 1);
  FIXEDWIDTH_RETURN_IF_ERROR(check_new_key(name));

  std::unique_ptr<Column> column;
  FIXEDWIDTH_RETURN_IF_ERROR(
      Column::create_filler(name, length, padding, &column));
  FIXEDWIDTH_RETURN_IF_ERROR(column->options()->merge(options_));

  ++spacer_count_;
  append(std::move(name), FieldEntry(std::unique_ptr<FieldCodec>(std::move(column))));
  return Status::Ok();
}

Status Schema::add_nested_schema(std::string name, const Builder &builder,
                                 const OptionMap &options, Schema **out) {
  if (!builder) {
    return Status::SchemaError("Nested schema '" + name + "' in schema '" +
                               name_ + "' requires a builder");
  }

  std::unique_ptr<Schema> child;
  FIXEDWIDTH_RETURN_IF_ERROR(
      create_impl(std::move(name), options, this, nullptr, &child));
  std::string key = child->name();
  FIXEDWIDTH_RETURN_IF_ERROR(check_new_key(key));

  for (const auto &[id, entry] : entries_) {
    const Reference *ref = entry.reference();
    if (ref == nullptr) {
      continue;
    }
    const bool same_target =
        ref->schema_name() == key ||
        (ref->target() != nullptr && ref->target()->name() == key);
    if (same_target) {
      return Status::DuplicateName("Nested schema '" + key +
                                   "' conflicts with reference '" + id +
                                   "' to a schema of the same name in '" +
                                   name_ + "'");
    }
  }

  // A failed builder leaves no trace in this schema
  FIXEDWIDTH_RETURN_IF_ERROR(child->setup(builder));

  Schema *raw = child.get();
  append(std::move(key), FieldEntry(std::move(child)));
  if (out != nullptr) {
    *out = raw;
  }
  return Status::Ok();
}

Status Schema::add_reference(ReferenceSpec spec) {
  if (spec.schema_name.empty()) {
    return Status::SchemaError("Reference in schema '" + name_ +
                               "' is missing a schema name");
  }
  if (!options::is_identifier(spec.schema_name)) {
    return Status::SchemaError("Reference in schema '" + name_ +
                               "' has a malformed schema name '" +
                               spec.schema_name + "'");
  }
  if (spec.store_name.empty()) {
    spec.store_name = spec.schema_name;
  }
  FIXEDWIDTH_RETURN_IF_ERROR(check_name(spec.store_name));
  FIXEDWIDTH_RETURN_IF_ERROR(check_new_key(spec.store_name));

  auto nested = entries_.find(spec.schema_name);
  if (nested != entries_.end() && nested->second.schema() != nullptr) {
    return Status::DuplicateName("Reference '" + spec.store_name +
                                 "' targets '" + spec.schema_name +
                                 "', which is a nested schema of '" + name_ +
                                 "'");
  }

  // Only inheritable schema options can travel through a reference
  for (const auto &[key, value] : spec.options) {
    const OptionSpec *option = schema_option_schema().find(key);
    if (option == nullptr || !option->inheritable) {
      return Status::ConfigError("Option '" + key +
                                 "' cannot be passed through reference '" +
                                 spec.store_name + "'");
    }
  }
  OptionMap probe = spec.options;
  probe["name"] = Value(spec.store_name);
  OptionTable normalized;
  FIXEDWIDTH_RETURN_IF_ERROR(
      OptionTable::create(schema_option_schema(), probe, &normalized));
  spec.options = normalized.defined_values();
  spec.options.erase("name");

  std::string key = spec.store_name;
  append(std::move(key),
         FieldEntry(std::make_unique<Reference>(std::move(spec))));
  return Status::Ok();
}

Status Schema::add_reference(std::string schema_name) {
  return add_reference(ReferenceSpec{std::move(schema_name), "", {}});
}

Status Schema::add_reference(std::string store_name, std::string schema_name,
                             OptionMap options) {
  return add_reference(ReferenceSpec{std::move(schema_name),
                                     std::move(store_name),
                                     std::move(options)});
}

Status Schema::check_new_key(const std::string &key) const {
  if (entries_.count(key) > 0) {
    return Status::DuplicateName("A field named '" + key +
                                 "' is already defined in schema '" + name_ +
                                 "'");
  }
  if (groups_.count(key) > 0) {
    return Status::DuplicateName(
        "A group named '" + key + "' is already defined in schema '" + name_ +
        "'; a group and a field cannot share a name");
  }
  return Status::Ok();
}

Status Schema::check_column(const FieldCodec &codec, std::string *key) const {
  const std::string &group = codec.group();
  if (group.empty()) {
    *key = codec.name();
    return check_new_key(*key);
  }

  if (entries_.count(group) > 0) {
    return Status::DuplicateName(
        "A field named '" + group + "' is already defined in schema '" +
        name_ + "'; a group and a field cannot share a name");
  }
  *key = group + "." + codec.name();
  if (entries_.count(*key) > 0) {
    return Status::DuplicateName("A column named '" + codec.name() +
                                 "' is already defined in group '" + group +
                                 "' of schema '" + name_ + "'");
  }
  return Status::Ok();
}

void Schema::append(std::string key, FieldEntry entry) {
  if (const FieldCodec *codec = entry.codec(); codec && !codec->group().empty()) {
    groups_.insert(codec->group());
  }
  fields_.push_back(key);
  entries_.emplace(std::move(key), std::move(entry));
  g_layout_generation.fetch_add(1, std::memory_order_relaxed);
  cached_length_.reset();
}

// ─────────────────────────────────────────────────────────────────────────────
// Fields & Resolution
// ─────────────────────────────────────────────────────────────────────────────

const FieldEntry *Schema::entry(std::string_view field_name) const {
  auto it = entries_.find(std::string(field_name));
  return it != entries_.end() ? &it->second : nullptr;
}

std::vector<const FieldCodec *> Schema::columns() const {
  std::vector<const FieldCodec *> result;
  for (const auto &id : fields_) {
    if (const FieldCodec *codec = entries_.at(id).codec()) {
      result.push_back(codec);
    }
  }
  return result;
}

std::vector<const Schema *> Schema::schemas() const {
  std::vector<const Schema *> result;
  for (const auto &id : fields_) {
    if (const Schema *nested = entries_.at(id).schema()) {
      result.push_back(nested);
    }
  }
  return result;
}

Status Schema::lookup(std::string_view field_name, ResolvedField *out) const {
  auto it = entries_.find(std::string(field_name));
  if (it == entries_.end()) {
    return Status::NotFound("Schema '" + name_ + "' has no field named '" +
                            std::string(field_name) + "'");
  }

  const FieldEntry &entry = it->second;
  out->kind = entry.kind();
  out->codec = nullptr;
  out->schema = nullptr;

  switch (entry.kind()) {
  case FieldKind::COLUMN:
    out->key = entry.codec()->name();
    out->codec = entry.codec();
    return Status::Ok();

  case FieldKind::SCHEMA:
    out->key = it->first;
    out->schema = entry.schema();
    return Status::Ok();

  case FieldKind::REFERENCE: {
    Reference &ref = *entry.reference();
    FIXEDWIDTH_RETURN_IF_ERROR(resolve(ref));
    out->key = ref.store_name();
    out->schema = ref.target();
    return Status::Ok();
  }
  }

  return Status::SchemaError("Unknown field type for '" + it->first +
                             "' in schema '" + name_ + "'");
}

Status Schema::find_schema(std::string_view name, Schema **out) const {
  auto it = entries_.find(std::string(name));
  if (it != entries_.end()) {
    if (it->second.codec() != nullptr) {
      return Status::SchemaError("found column '" + it->first +
                                 "' in schema '" + name_ +
                                 "' instead of a schema");
    }
    ResolvedField field;
    FIXEDWIDTH_RETURN_IF_ERROR(lookup(name, &field));
    *out = field.schema;
    return Status::Ok();
  }

  if (parent_ != nullptr) {
    return parent_->find_schema(name, out);
  }
  if (catalog_ != nullptr) {
    for (Schema *candidate : catalog_->lookup_by_name(name)) {
      if (candidate != nullptr) {
        *out = candidate;
        return Status::Ok();
      }
    }
    return Status::NotFound("no schema named '" + std::string(name) +
                            "' in catalog '" + catalog_->name() + "'");
  }
  return Status::NotFound("no schema named '" + std::string(name) +
                          "' is visible from schema '" + name_ + "'");
}

Status Schema::resolve(Reference &ref) const {
  if (ref.is_resolved()) {
    return Status::Ok();
  }

  Schema *target = nullptr;
  Status status;
  if (parent_ != nullptr) {
    status = parent_->find_schema(ref.schema_name(), &target);
  } else if (catalog_ != nullptr) {
    for (Schema *candidate : catalog_->lookup_by_name(ref.schema_name())) {
      if (candidate != nullptr) {
        target = candidate;
        break;
      }
    }
    if (target == nullptr) {
      status = Status::NotFound("no schema named '" + ref.schema_name() +
                                "' in catalog '" + catalog_->name() + "'");
    }
  } else {
    status = Status::NotFound("schema '" + name_ + "' has no parent");
  }

  if (!status.ok() || target == nullptr) {
    std::string reason = "Cannot resolve reference '" + ref.store_name() +
                         "' in schema '" + name_ + "' to a schema named '" +
                         ref.schema_name() + "'";
    if (!status.message().empty()) {
      reason += ": ";
      reason += status.message();
    }
    LOG_WARN("{}", reason);
    ref.fail(reason);
    return Status::SchemaError(std::move(reason));
  }

  std::vector<OptionMap> queued = ref.bind(target);
  LOG_DEBUG("Resolved reference '{}' in schema '{}' to schema '{}'",
            ref.store_name(), name_, target->name());

  // Closest settings first, queued ancestor sets last
  FIXEDWIDTH_RETURN_IF_ERROR(target->propagate(ref.options()));
  FIXEDWIDTH_RETURN_IF_ERROR(target->propagate(options_.defined_values()));
  for (const auto &options : queued) {
    FIXEDWIDTH_RETURN_IF_ERROR(target->propagate(options));
  }
  return Status::Ok();
}

Status Schema::propagate(const OptionMap &options) {
  if (options.empty()) {
    return Status::Ok();
  }
  if (std::find(applied_.begin(), applied_.end(), options) != applied_.end()) {
    return Status::Ok();
  }
  applied_.push_back(options);
  LOG_TRACE("Propagating {} option(s) into schema '{}'", options.size(), name_);

  FIXEDWIDTH_RETURN_IF_ERROR(options_.merge(options));
  for (const auto &id : fields_) {
    FieldEntry &entry = entries_.at(id);
    switch (entry.kind()) {
    case FieldKind::COLUMN:
      if (OptionTable *table = entry.codec()->options()) {
        FIXEDWIDTH_RETURN_IF_ERROR(table->merge(options));
      }
      break;
    case FieldKind::SCHEMA:
      FIXEDWIDTH_RETURN_IF_ERROR(entry.schema()->propagate(options));
      break;
    case FieldKind::REFERENCE: {
      Reference *ref = entry.reference();
      if (ref->is_resolved()) {
        FIXEDWIDTH_RETURN_IF_ERROR(ref->target()->propagate(options));
      } else {
        ref->enqueue(options);
      }
      break;
    }
    }
  }
  return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Traversal
// ─────────────────────────────────────────────────────────────────────────────

Status Schema::enter(Stack *stack) const {
  if (std::find(stack->begin(), stack->end(), this) != stack->end()) {
    return Status::SchemaError("Schema '" + name_ +
                               "' contains itself through a reference cycle");
  }
  if (stack->size() >= config::kMaxSchemaDepth) {
    return Status::SchemaError("Schema '" + name_ + "' is nested deeper than " +
                               std::to_string(config::kMaxSchemaDepth) +
                               " levels");
  }
  stack->push_back(this);
  return Status::Ok();
}

Status Schema::length(size_t *out) const {
  Stack stack;
  return length_impl(&stack, out);
}

Status Schema::length_impl(Stack *stack, size_t *out) const {
  const uint64_t generation =
      g_layout_generation.load(std::memory_order_relaxed);
  if (cached_length_ && cached_generation_ == generation) {
    *out = *cached_length_;
    return Status::Ok();
  }

  FIXEDWIDTH_RETURN_IF_ERROR(enter(stack));
  StackGuard guard{stack};

  size_t total = 0;
  for (const auto &id : fields_) {
    ResolvedField field;
    FIXEDWIDTH_RETURN_IF_ERROR(lookup(id, &field));
    if (field.codec != nullptr) {
      total += field.codec->length();
    } else {
      size_t nested = 0;
      FIXEDWIDTH_RETURN_IF_ERROR(field.schema->length_impl(stack, &nested));
      total += nested;
    }
  }

  cached_length_ = total;
  cached_generation_ = generation;
  *out = total;
  return Status::Ok();
}

Status Schema::parse(std::string_view line, Record *out, size_t start) const {
  Stack stack;
  return parse_impl(line, start, &stack, out);
}

Status Schema::parse_impl(std::string_view line, size_t start, Stack *stack,
                          Record *out) const {
  FIXEDWIDTH_RETURN_IF_ERROR(enter(stack));
  StackGuard guard{stack};

  Record data;
  std::vector<std::pair<std::string, Record>> groups;
  size_t cursor = start;

  for (const auto &id : fields_) {
    ResolvedField field;
    FIXEDWIDTH_RETURN_IF_ERROR(lookup(id, &field));

    if (field.codec != nullptr) {
      const FieldCodec &codec = *field.codec;
      if (!codec.is_filler()) {
        Value value;
        FIXEDWIDTH_RETURN_IF_ERROR(
            codec.parse(utf8::slice(line, cursor, codec.length()), &value));
        if (codec.group().empty()) {
          data.set(field.key, std::move(value));
        } else {
          auto group = std::find_if(groups.begin(), groups.end(), [&](const auto &g) {
            return g.first == codec.group();
          });
          if (group == groups.end()) {
            // Reserve the group's position; filled in once complete
            data.set(codec.group(), Value());
            groups.emplace_back(codec.group(), Record());
            group = std::prev(groups.end());
          }
          group->second.set(field.key, std::move(value));
        }
      }
      cursor += codec.length();
      continue;
    }

    Record nested;
    FIXEDWIDTH_RETURN_IF_ERROR(
        field.schema->parse_impl(line, cursor, stack, &nested));
    size_t nested_length = 0;
    FIXEDWIDTH_RETURN_IF_ERROR(field.schema->length_impl(stack, &nested_length));
    data.set(field.key, Value(std::move(nested)));
    cursor += nested_length;
  }

  for (auto &[group, record] : groups) {
    data.set(group, Value(std::move(record)));
  }
  *out = std::move(data);
  return Status::Ok();
}

Status Schema::format(const Record &record, std::string *out) const {
  Stack stack;
  std::string line;
  FIXEDWIDTH_RETURN_IF_ERROR(format_impl(record, &stack, &line));

  size_t expected = 0;
  FIXEDWIDTH_RETURN_IF_ERROR(length(&expected));
  const size_t actual = utf8::length(line);
  if (actual != expected) {
    return Status::Internal("Formatted line for schema '" + name_ + "' has " +
                            std::to_string(actual) + " characters, expected " +
                            std::to_string(expected));
  }
  *out = std::move(line);
  return Status::Ok();
}

Status Schema::format_impl(const Record &record, Stack *stack,
                           std::string *out) const {
  static const Record kEmpty;

  FIXEDWIDTH_RETURN_IF_ERROR(enter(stack));
  StackGuard guard{stack};

  std::string line;
  for (const auto &id : fields_) {
    ResolvedField field;
    FIXEDWIDTH_RETURN_IF_ERROR(lookup(id, &field));
    std::string text;

    if (field.codec != nullptr) {
      const FieldCodec &codec = *field.codec;
      const Value *value = nullptr;
      if (codec.is_filler()) {
        // Fillers ignore record data
      } else if (codec.group().empty()) {
        value = record.find(field.key);
      } else if (const Value *group = record.find(codec.group())) {
        if (!group->is_null() && group->try_record() == nullptr) {
          return Status::InvalidArgument("Group '" + codec.group() +
                                         "' of schema '" + name_ +
                                         "' expects a record, got '" +
                                         group->to_string() + "'");
        }
        if (const Record *members = group->try_record()) {
          value = members->find(field.key);
        }
      }
      FIXEDWIDTH_RETURN_IF_ERROR(codec.format(value ? *value : Value(), &text));
    } else {
      const Record *nested = &kEmpty;
      const Value *value = record.find(field.key);
      if (value != nullptr && !value->is_null()) {
        nested = value->try_record();
        if (nested == nullptr) {
          return Status::InvalidArgument("Field '" + field.key +
                                         "' of schema '" + name_ +
                                         "' expects a record, got '" +
                                         value->to_string() + "'");
        }
      }
      FIXEDWIDTH_RETURN_IF_ERROR(field.schema->format_impl(*nested, stack, &text));
    }
    line += text;
  }

  *out = std::move(line);
  return Status::Ok();
}

bool Schema::match(std::string_view line) const {
  size_t expected = 0;
  auto status = length(&expected);
  if (!status.ok()) {
    LOG_DEBUG("Schema '{}' cannot match lines: {}", name_, status.to_string());
    return false;
  }

  std::string_view trimmed = line;
  while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\t' ||
                              trimmed.back() == '\r' || trimmed.back() == '\n')) {
    trimmed.remove_suffix(1);
  }
  if (utf8::length(trimmed) > expected) {
    return false;
  }
  return !trap_ || trap_(line);
}

// ─────────────────────────────────────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────────────────────────────────────

std::vector<Status> Schema::errors() const {
  Stack stack;
  std::vector<Status> problems;
  collect_errors(&stack, &problems);
  return unique_statuses(problems);
}

void Schema::collect_errors(Stack *stack, std::vector<Status> *out) const {
  auto status = enter(stack);
  if (!status.ok()) {
    out->push_back(std::move(status));
    return;
  }
  StackGuard guard{stack};

  for (const auto &id : fields_) {
    const FieldEntry &entry = entries_.at(id);
    switch (entry.kind()) {
    case FieldKind::COLUMN:
      break;
    case FieldKind::SCHEMA:
      entry.schema()->collect_errors(stack, out);
      break;
    case FieldKind::REFERENCE: {
      ResolvedField field;
      auto resolved = lookup(id, &field);
      if (!resolved.ok()) {
        out->push_back(std::move(resolved));
      } else {
        field.schema->collect_errors(stack, out);
      }
      break;
    }
    }
  }
}

Status Schema::validate() const {
  auto problems = errors();
  if (problems.empty()) {
    // Resolves every reference and warms the length caches
    size_t total = 0;
    return length(&total);
  }

  LOG_WARN("Schema '{}' has {} error(s)", name_, problems.size());
  if (problems.size() == 1) {
    return problems.front();
  }
  return Status(problems.front().code(),
                std::string(problems.front().message()) + " (and " +
                    std::to_string(problems.size() - 1) + " more)");
}

} // namespace fixedwidth
