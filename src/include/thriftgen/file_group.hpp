#pragma once

#include <thriftgen/schema.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace thriftgen {

  class file_group;

  enum class entity_kind { typedef_, struct_, union_, exception, enum_ };

  std::string_view
  to_string(entity_kind k);

  // A named type reference resolved to its declaration.
  struct entity_ref {
    entity_kind kind = entity_kind::struct_;
    std::string module;
    std::string output_name;
    const typedef_def* typedef_decl = nullptr;
    const struct_def* struct_decl = nullptr;
    const enum_def* enum_decl = nullptr;
  };

  struct constant_ref {
    std::string module;
    const constant_def* decl = nullptr;
  };

  struct enum_value_ref {
    std::string enum_output_name;
    const enumerator* value = nullptr;
  };

  // Name resolution as seen from one schema of a file group. Cheap to copy;
  // invalidated when the file group is destroyed or a schema is added.
  class name_scope {
    const file_group* group_;
    const schema* schema_;

  public:
    name_scope(const file_group& group, const schema& current);

    const file_group&
    group() const {
      return *group_;
    }

    const schema&
    current_schema() const {
      return *schema_;
    }

    const std::string&
    module() const {
      return schema_->module();
    }

    // "Point" or "shared.Point" -> "a::b::Point"
    std::string
    dest_module(std::string_view logical_name) const;

    // Output name of the unit holding the group's owned constants.
    std::string
    constants_module() const;

    // True when the constant is declared by this schema and this schema is
    // the group's initial schema; constants of included schemas are
    // inherited.
    bool
    owns_constant(const constant_def& c) const;

    std::optional<entity_ref>
    find_type(std::string_view logical_name) const;

    // Throws std::runtime_error for dangling references.
    entity_ref
    resolve_type(const type_ref& named) const;

    // Follows typedef chains down to a non-typedef type, returning the
    // scope the final type must be interpreted in.
    std::pair<type_ref, name_scope>
    underlying_type(const type_ref& t) const;

    // "MAX", "shared.MAX"
    std::optional<constant_ref>
    find_constant(std::string_view identifier) const;

    // "Color.RED", "shared.Color.RED"
    std::optional<enum_value_ref>
    find_enum_value(std::string_view identifier) const;
  };

  class file_group {
    std::string initial_module_;
    std::vector<schema> schemas_;

  public:
    file_group() = default;

    explicit file_group(std::string initial_module)
        : initial_module_(std::move(initial_module)) {}

    // Throws std::runtime_error when the module is already present. The first
    // schema added becomes the initial schema unless one was named.
    void
    add(schema s);

    const std::string&
    initial_module() const {
      return initial_module_;
    }

    void
    set_initial_module(std::string module) {
      initial_module_ = std::move(module);
    }

    const std::vector<schema>&
    schemas() const {
      return schemas_;
    }

    const schema*
    find_schema(std::string_view module) const;

    // Throws std::runtime_error for an unknown module.
    name_scope
    scope(std::string_view module) const;
  };

} // namespace thriftgen
