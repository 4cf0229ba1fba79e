/**
 * @file definition.cpp
 * @brief Definition implementation
 */

#include "fixedwidth/definition.hpp"

#include <algorithm>

#include "common/logger.hpp"
#include "common/status.hpp"

namespace fixedwidth {

Status Definition::create(std::string name, const OptionMap &options,
                          std::unique_ptr<Definition> *out) {
  OptionMap provided = options;
  provided["name"] = Value(std::move(name));

  auto definition = std::make_unique<Definition>(Token{});
  FIXEDWIDTH_RETURN_IF_ERROR(OptionTable::create(
      schema_option_schema(), provided, &definition->options_));
  definition->name_ = definition->options_.get("name").as_string();

  LOG_INFO("Created definition '{}'", definition->name_);
  *out = std::move(definition);
  return Status::Ok();
}

Definition::~Definition() = default;

Status Definition::add_schema(std::string name, const Schema::Builder &builder,
                              const OptionMap &options, Schema **out) {
  std::unique_ptr<Schema> created;
  FIXEDWIDTH_RETURN_IF_ERROR(
      Schema::create(std::move(name), options, this, &created));

  // Compare the normalized name, the name option trims whitespace
  if (schema(created->name()) != nullptr) {
    return Status::DuplicateName("Schema '" + created->name() +
                                 "' is already defined in '" + name_ + "'");
  }
  if (builder) {
    FIXEDWIDTH_RETURN_IF_ERROR(created->setup(builder));
  }

  LOG_DEBUG("Added schema '{}' to definition '{}'", created->name(), name_);
  if (out != nullptr) {
    *out = created.get();
  }
  schemas_.push_back(std::move(created));
  return Status::Ok();
}

std::vector<Schema *> Definition::lookup_by_name(std::string_view name) const {
  std::vector<Schema *> result;
  for (const auto &schema : schemas_) {
    if (schema->name() == name) {
      result.push_back(schema.get());
    }
  }
  return result;
}

Schema *Definition::schema(std::string_view name) const {
  for (const auto &schema : schemas_) {
    if (schema->name() == name) {
      return schema.get();
    }
  }
  return nullptr;
}

std::vector<std::string> Definition::schema_names() const {
  std::vector<std::string> names;
  names.reserve(schemas_.size());
  for (const auto &schema : schemas_) {
    names.push_back(schema->name());
  }
  return names;
}

std::vector<Status> Definition::errors() const {
  std::vector<Status> result;
  std::vector<std::string> seen;
  for (const auto &schema : schemas_) {
    for (auto &status : schema->errors()) {
      std::string text = status.to_string();
      if (std::find(seen.begin(), seen.end(), text) == seen.end()) {
        seen.push_back(std::move(text));
        result.push_back(std::move(status));
      }
    }
  }
  return result;
}

Status Definition::validate() const {
  auto problems = errors();
  if (!problems.empty()) {
    LOG_WARN("Definition '{}' has {} error(s)", name_, problems.size());
    if (problems.size() == 1) {
      return problems.front();
    }
    return Status(problems.front().code(),
                  std::string(problems.front().message()) + " (and " +
                      std::to_string(problems.size() - 1) + " more)");
  }

  for (const auto &schema : schemas_) {
    FIXEDWIDTH_RETURN_IF_ERROR(schema->validate());
  }
  return Status::Ok();
}

Status Definition::match_schema(std::string_view line,
                                const Schema **out) const {
  for (const auto &schema : schemas_) {
    if (schema->match(line)) {
      *out = schema.get();
      return Status::Ok();
    }
  }
  return Status::NotFound("No schema in '" + name_ + "' matches the line");
}

Status Definition::parse_line(std::string_view line, Record *out,
                              std::string *schema_name) const {
  const Schema *schema = nullptr;
  FIXEDWIDTH_RETURN_IF_ERROR(match_schema(line, &schema));
  FIXEDWIDTH_RETURN_IF_ERROR(schema->parse(line, out));
  if (schema_name != nullptr) {
    *schema_name = schema->name();
  }
  return Status::Ok();
}

} // namespace fixedwidth
