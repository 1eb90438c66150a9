#pragma once

#include <thriftgen/cpp_code.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace thriftgen {

  // Which emitter produced a type unit.
  enum class unit_origin {
    enum_,
    struct_,
    union_,
    exception,
    service,
    behaviour,
    test_data,
  };

  std::string_view
  to_string(unit_origin o);

  struct type_definition {
    unit_origin origin = unit_origin::struct_;
    cpp_file file;

    bool
    operator==(const type_definition&) const = default;
  };

  struct constant_definition {
    cpp_file file;

    bool
    operator==(const constant_definition&) const = default;
  };

  using unit_kind = std::variant<type_definition, constant_definition>;

  // One generated module under its fully qualified output name.
  struct generated_unit {
    std::string name;
    unit_kind kind;

    const cpp_file&
    file() const;

    bool
    is_constant() const {
      return std::holds_alternative<constant_definition>(kind);
    }

    // "struct", "enum", ..., or "constant"
    std::string
    kind_name() const;

    bool
    operator==(const generated_unit&) const = default;
  };

  struct name_collision {
    std::string name;
    std::string first_kind;
    std::string second_kind;

    std::string
    message() const;

    bool
    operator==(const name_collision&) const = default;
  };

  // Merges two units sharing an output name. A constant unit folds into a
  // type unit, keeping the type unit's tag and filename; any other pairing
  // is a name_collision.
  std::variant<generated_unit, name_collision>
  merge_units(generated_unit first, generated_unit second);

  struct collision_resolution {
    // Uniquely named, in order of first appearance.
    std::vector<generated_unit> units;
    std::optional<name_collision> collision;

    bool
    ok() const {
      return !collision.has_value();
    }
  };

  // Folds a stream of units by output name. Stops at the first collision that
  // cannot be merged.
  collision_resolution
  resolve_name_collisions(std::vector<generated_unit> units);

} // namespace thriftgen
