#pragma once

#include <thriftgen/literal.hpp>
#include <thriftgen/type_ref.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace thriftgen {

  // "default" is the requiredness of a field declared without a keyword.
  enum class requiredness { required, optional, default_ };

  struct field {
    std::int16_t id = 0;
    std::string name;
    type_ref type;
    requiredness req = requiredness::default_;
    std::optional<literal> default_value;

    bool
    is_optional() const {
      return req == requiredness::optional;
    }

    bool
    operator==(const field&) const = default;
  };

  enum class struct_kind { struct_, union_, exception };

  std::string_view
  to_string(struct_kind k);

  struct struct_def {
    std::string name;
    struct_kind kind = struct_kind::struct_;
    std::vector<field> fields;

    const field*
    find_field(std::string_view field_name) const {
      for (const auto& f : fields) {
        if (f.name == field_name) return &f;
      }
      return nullptr;
    }

    bool
    operator==(const struct_def&) const = default;
  };

  struct enumerator {
    std::string name;
    std::int32_t value = 0;

    bool
    operator==(const enumerator&) const = default;
  };

  struct enum_def {
    std::string name;
    std::vector<enumerator> values;

    bool
    operator==(const enum_def&) const = default;
  };

  struct constant_def {
    std::string name;
    type_ref type;
    literal value;

    bool
    operator==(const constant_def&) const = default;
  };

  struct typedef_def {
    std::string name;
    type_ref target;

    bool
    operator==(const typedef_def&) const = default;
  };

  struct function_def {
    std::string name;
    std::optional<type_ref> return_type;
    std::vector<field> params;
    std::vector<field> exceptions;
    bool oneway = false;

    bool
    operator==(const function_def&) const = default;
  };

  struct service_def {
    std::string name;
    std::optional<std::string> extends;
    std::vector<function_def> functions;

    bool
    operator==(const service_def&) const = default;
  };

  // One parsed Thrift file. Entity names are unique within a schema.
  class schema {
    std::string module_;
    std::string path_;
    std::map<std::string, std::string> namespaces_;
    std::vector<std::string> includes_;
    std::vector<typedef_def> typedefs_;
    std::vector<struct_def> structs_;
    std::vector<struct_def> unions_;
    std::vector<struct_def> exceptions_;
    std::vector<enum_def> enums_;
    std::vector<constant_def> constants_;
    std::vector<service_def> services_;

  public:
    schema() = default;

    explicit schema(std::string module) : module_(std::move(module)) {}

    const std::string&
    module() const {
      return module_;
    }

    void
    set_path(std::string path) {
      path_ = std::move(path);
    }

    const std::string&
    path() const {
      return path_;
    }

    void
    set_namespace(std::string language, std::string ns) {
      namespaces_.insert_or_assign(std::move(language), std::move(ns));
    }

    // Declared namespace for a target language, or nullptr.
    const std::string*
    namespace_for(const std::string& language) const {
      auto it = namespaces_.find(language);
      if (it == namespaces_.end()) return nullptr;
      return &it->second;
    }

    void
    add_include(std::string module) {
      includes_.push_back(std::move(module));
    }

    const std::vector<std::string>&
    includes() const {
      return includes_;
    }

    void
    add_typedef(typedef_def t) {
      typedefs_.push_back(std::move(t));
    }

    const std::vector<typedef_def>&
    typedefs() const {
      return typedefs_;
    }

    // Routed to structs, unions or exceptions by s.kind.
    void
    add_struct(struct_def s);

    const std::vector<struct_def>&
    structs() const {
      return structs_;
    }

    const std::vector<struct_def>&
    unions() const {
      return unions_;
    }

    const std::vector<struct_def>&
    exceptions() const {
      return exceptions_;
    }

    void
    add_enum(enum_def e) {
      enums_.push_back(std::move(e));
    }

    const std::vector<enum_def>&
    enums() const {
      return enums_;
    }

    void
    add_constant(constant_def c) {
      constants_.push_back(std::move(c));
    }

    const std::vector<constant_def>&
    constants() const {
      return constants_;
    }

    void
    add_service(service_def s) {
      services_.push_back(std::move(s));
    }

    const std::vector<service_def>&
    services() const {
      return services_;
    }

    const typedef_def*
    find_typedef(std::string_view name) const;

    // Searches structs, unions and exceptions.
    const struct_def*
    find_struct(std::string_view name) const;

    const enum_def*
    find_enum(std::string_view name) const;

    const constant_def*
    find_constant(std::string_view name) const;

    const service_def*
    find_service(std::string_view name) const;
  };

} // namespace thriftgen
