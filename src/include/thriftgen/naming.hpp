#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace thriftgen {

  std::string
  to_snake_case(std::string_view name);

  // "myInt" -> "Myint": first character upper-cased, the rest lower-cased.
  std::string
  capitalize(std::string_view name);

  // "point" -> "Point": only the first character changes.
  std::string
  initial_case(std::string_view name);

  // "shared_types" -> "SharedTypes"
  std::string
  camelize(std::string_view name);

  // Appends '_' to C++ keywords; IDL spelling is otherwise kept.
  std::string
  escape_identifier(std::string_view name);

  // Thrift namespace "a.b.c" -> "a::b::c"
  std::string
  cpp_namespace_for(std::string_view thrift_namespace);

  // Output names are C++ qualified names: "a::b::Point".
  std::vector<std::string>
  split_qualified(std::string_view qualified_name);

  std::string
  join_qualified(const std::vector<std::string>& segments);

  // "a::b::Point" -> "a::b"; "Point" -> ""
  std::string
  qualifier_of(std::string_view qualified_name);

  // "a::b::Point" -> "Point"
  std::string
  unqualified_name(std::string_view qualified_name);

  // "a::b::Point" -> "a::b::test_data::Point"
  std::string
  test_data_module_name(std::string_view data_module_name);

  // "a::b::ShapeKind" -> "a/b/shape_kind.hpp"
  std::string
  target_path(std::string_view output_name);

} // namespace thriftgen
