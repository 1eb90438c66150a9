#include <thriftgen/cpp_writer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace thriftgen;

static std::string
write(const cpp_file& file) {
  return cpp_writer{}.write(file);
}

TEST_CASE("empty file is just the include guard", "[cpp_writer]") {
  CHECK(write(cpp_file{}) == "#pragma once\n");
}

TEST_CASE("system includes come before local includes", "[cpp_writer]") {
  cpp_file file;
  file.includes = {{"\"a/point.hpp\""}, {"<cstdint>"}, {"<string>"}};

  CHECK(write(file) == R"(#pragma once

#include <cstdint>
#include <string>

#include "a/point.hpp"
)");
}

TEST_CASE("struct with equality", "[cpp_writer]") {
  cpp_file file;
  file.includes = {{"<cstdint>"}};
  cpp_struct s{"Point", {{"std::int32_t", "x", {}}, {"std::int32_t", "y", "5"}}};
  file.namespaces.push_back({"a", {s}});

  CHECK(write(file) == R"(#pragma once

#include <cstdint>

namespace a {

struct Point {
  std::int32_t x;
  std::int32_t y = 5;

  bool operator==(const Point&) const = default;
};

} // namespace a
)");
}

TEST_CASE("struct without equality", "[cpp_writer]") {
  cpp_file file;
  cpp_struct node{"Node", {{"std::unique_ptr<::Node>", "next", {}}}, false};
  cpp_struct empty{"Empty", {}, false};
  file.namespaces.push_back({"", {node, empty}});

  CHECK(write(file) == R"(#pragma once

struct Node {
  std::unique_ptr<::Node> next;
};

struct Empty {};
)");
}

TEST_CASE("enum with string conversions", "[cpp_writer]") {
  cpp_file file;
  file.namespaces.push_back({"a", {cpp_enum{"Color", {{"RED", 1}, {"GREEN", 2}}}}});

  CHECK(write(file) == R"(#pragma once

namespace a {

enum class Color : std::int32_t {
  RED = 1,
  GREEN = 2,
};

inline std::string_view to_string(Color v) {
  switch (v) {
  case Color::RED: return "RED";
  case Color::GREEN: return "GREEN";
  }
  return "";
}

inline Color Color_from_string(std::string_view s) {
  if (s == "RED") return Color::RED;
  if (s == "GREEN") return Color::GREEN;
  throw std::invalid_argument(std::string("invalid Color value: ") + std::string(s));
}

} // namespace a
)");
}

TEST_CASE("functions and declarations", "[cpp_writer]") {
  cpp_file file;
  cpp_function decl{"int", "twice", "int v", "", true};
  cpp_function def{"int", "twice", "int v", "  return v * 2;\n"};
  file.namespaces.push_back({"", {decl, def}});

  CHECK(write(file) == R"(#pragma once

inline int twice(int v);

inline int twice(int v) {
  return v * 2;
}
)");
}

TEST_CASE("variables", "[cpp_writer]") {
  cpp_file file;
  file.namespaces.push_back(
      {"a",
       {cpp_variable{"std::int32_t", "FOO", "1", true},
        cpp_variable{"std::string", "NAME", "\"x\"", false}}});

  CHECK(write(file) == R"(#pragma once

namespace a {

inline constexpr std::int32_t FOO = 1;

inline const std::string NAME = "x";

} // namespace a
)");
}

TEST_CASE("variables follow the records they use", "[cpp_writer]") {
  cpp_file file;
  file.namespaces.push_back(
      {"app",
       {cpp_variable{"::app::Foo", "ORIGIN", "::app::Foo{.v = 2}", false},
        cpp_struct{"Foo", {{"std::int32_t", "v", {}}}, false}}});

  CHECK(write(file) == R"(#pragma once

namespace app {

struct Foo {
  std::int32_t v;
};

inline const ::app::Foo ORIGIN = ::app::Foo{.v = 2};

} // namespace app
)");
}

TEST_CASE("forward declarations and field defaults", "[cpp_writer]") {
  cpp_file file;
  file.namespaces.push_back(
      {"mm",
       {cpp_forward_decl{"B"},
        cpp_struct{"A",
                   {{"std::unique_ptr<::mm::B>", "b", {}},
                    {"std::int32_t", "id", "7"}},
                   false}}});

  CHECK(write(file) == R"(#pragma once

namespace mm {

struct B;

struct A {
  std::unique_ptr<::mm::B> b;
  std::int32_t id = 7;
};

} // namespace mm
)");
}

TEST_CASE("interface with base", "[cpp_writer]") {
  cpp_file file;
  cpp_interface c{"CalculatorHandler",
                  "::shared::SharedServiceHandler",
                  {{"void", "ping", ""},
                   {"std::int32_t", "add", "const std::int32_t& a"}}};
  file.namespaces.push_back({"tutorial", {c}});

  CHECK(write(file) == R"(#pragma once

namespace tutorial {

class CalculatorHandler : public ::shared::SharedServiceHandler {
public:
  virtual ~CalculatorHandler() = default;

  virtual void ping() = 0;

  virtual std::int32_t add(const std::int32_t& a) = 0;
};

} // namespace tutorial
)");
}

TEST_CASE("decl_name names every declaration kind", "[cpp_writer]") {
  CHECK(decl_name(cpp_struct{"S", {}}) == "S");
  CHECK(decl_name(cpp_enum{"E", {}}) == "E");
  CHECK(decl_name(cpp_function{"void", "f", "", ""}) == "f");
  CHECK(decl_name(cpp_variable{"int", "v", "0", true}) == "v");
  CHECK(decl_name(cpp_interface{"I", "", {}}) == "I");
  CHECK(decl_name(cpp_forward_decl{"F"}) == "F");
}
