#pragma once

#include <thriftgen/cpp_types.hpp>
#include <thriftgen/generated_unit.hpp>
#include <thriftgen/schema.hpp>

#include <string>
#include <vector>

namespace thriftgen {

  // How a field is held by its generated struct.
  enum class field_storage {
    value,
    optional, // std::optional<T>
    pointer,  // std::unique_ptr<T>, for references back to the owner
  };

  field_storage
  storage_of(const field& f, const cpp_types& types,
             const std::string& owner_name);

  std::string
  field_type(const field& f, const cpp_types& types,
             const std::string& owner_name);

  // An empty file for `output_name` with one namespace for its qualifier.
  cpp_file
  module_file(const std::string& output_name);

  generated_unit
  emit_enum(const std::string& output_name, const enum_def& e);

  generated_unit
  emit_constants(const std::string& output_name,
                 const std::vector<const constant_def*>& constants,
                 const cpp_types& types);

  // Structs, unions and exceptions; the kind only changes the unit's tag.
  generated_unit
  emit_struct(const std::string& output_name, const struct_def& s,
              const cpp_types& types);

  // Argument and result structs for every function of the service.
  generated_unit
  emit_service(const std::string& output_name, const service_def& svc,
               const cpp_types& types);

  // Abstract handler class with one pure virtual member per function. The
  // unit is named after the service with a "Handler" suffix.
  generated_unit
  emit_behaviour(const std::string& output_name, const service_def& svc,
                 const cpp_types& types);

} // namespace thriftgen
