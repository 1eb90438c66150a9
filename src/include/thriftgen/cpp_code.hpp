#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace thriftgen {

  struct cpp_include {
    std::string path;

    bool
    operator==(const cpp_include&) const = default;
  };

  struct cpp_enumerator {
    std::string name;
    std::int32_t value = 0;

    bool
    operator==(const cpp_enumerator&) const = default;
  };

  struct cpp_enum {
    std::string name;
    std::vector<cpp_enumerator> values;

    bool
    operator==(const cpp_enum&) const = default;
  };

  struct cpp_field {
    std::string type;
    std::string name;
    std::string default_value;

    bool
    operator==(const cpp_field&) const = default;
  };

  struct cpp_struct {
    std::string name;
    std::vector<cpp_field> fields;
    bool generate_equality = true;

    bool
    operator==(const cpp_struct&) const = default;
  };

  // Rendered inline; generated modules are header-only. A declaration-only
  // function is rendered without its body.
  struct cpp_function {
    std::string return_type;
    std::string name;
    std::string parameters;
    std::string body;
    bool declaration_only = false;

    bool
    operator==(const cpp_function&) const = default;
  };

  struct cpp_variable {
    std::string type;
    std::string name;
    std::string initializer;
    bool is_constexpr = false;

    bool
    operator==(const cpp_variable&) const = default;
  };

  struct cpp_method {
    std::string return_type;
    std::string name;
    std::string parameters;

    bool
    operator==(const cpp_method&) const = default;
  };

  // Abstract class of pure virtual methods.
  struct cpp_interface {
    std::string name;
    std::string base;
    std::vector<cpp_method> methods;

    bool
    operator==(const cpp_interface&) const = default;
  };

  // `struct name;` for a record defined in a header that includes this one.
  struct cpp_forward_decl {
    std::string name;

    bool
    operator==(const cpp_forward_decl&) const = default;
  };

  using cpp_decl = std::variant<cpp_struct, cpp_enum, cpp_function,
                                cpp_variable, cpp_interface, cpp_forward_decl>;

  // An empty name places the declarations in the global namespace.
  struct cpp_namespace {
    std::string name;
    std::vector<cpp_decl> declarations;

    bool
    operator==(const cpp_namespace&) const = default;
  };

  struct cpp_file {
    std::string filename;
    std::vector<cpp_include> includes;
    std::vector<cpp_namespace> namespaces;

    bool
    operator==(const cpp_file&) const = default;
  };

  // Name of a declaration, forward declarations included.
  std::string
  decl_name(const cpp_decl& decl);

} // namespace thriftgen
