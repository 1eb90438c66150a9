#include <thriftgen/cpp_writer.hpp>
#include <thriftgen/test_data_compiler.hpp>
#include <thriftgen/test_data_emitter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace thriftgen;

static field
make_field(std::string name, type_ref type, requiredness req,
           std::optional<literal> default_value = std::nullopt) {
  field f;
  f.name = std::move(name);
  f.type = std::move(type);
  f.req = req;
  f.default_value = std::move(default_value);
  return f;
}

static file_group
make_group() {
  schema s("geometry");
  s.set_namespace("cpp", "demo");

  struct_def point;
  point.name = "Point";
  point.fields = {
      make_field("x", type_ref::of(base_type::i32), requiredness::required),
      make_field("y", type_ref::of(base_type::i32), requiredness::optional,
                 literal::integer(5))};
  s.add_struct(point);

  struct_def node;
  node.name = "Node";
  node.fields = {
      make_field("children", type_ref::list_of(type_ref::named("Node")),
                 requiredness::required),
      make_field("next", type_ref::named("Node"), requiredness::optional)};
  s.add_struct(node);

  struct_def line;
  line.name = "Line";
  line.fields = {
      make_field("from", type_ref::named("Point"), requiredness::required),
      make_field("color", type_ref::named("Color"), requiredness::optional,
                 literal::identifier("Color.RED"))};
  s.add_struct(line);

  struct_def empty;
  empty.name = "Empty";
  s.add_struct(empty);

  s.add_enum({"Color", {{"RED", 1}, {"BLUE", 2}}});
  s.add_typedef({"points", type_ref::list_of(type_ref::named("Point"))});

  file_group group;
  group.add(std::move(s));
  return group;
}

static std::string
emit(const file_group& group, const std::string& data_name) {
  auto map = type_map::defaults();
  test_data_emitter emitter(group, map);
  for (const auto& m :
       test_data_compiler(group.scope("geometry")).compile_schema()) {
    if (m.data_name == data_name) return cpp_writer{}.write(emitter.emit(m).file());
  }
  FAIL("no companion for " << data_name);
  return {};
}

static bool
contains(const std::string& text, const std::string& part) {
  return text.find(part) != std::string::npos;
}

TEST_CASE("companion unit is tagged test_data", "[test_data_emitter]") {
  auto group = make_group();
  auto map = type_map::defaults();
  test_data_emitter emitter(group, map);
  auto m = test_data_compiler(group.scope("geometry"))
               .compile(*group.schemas().front().find_struct("Point"));

  auto unit = emitter.emit(m);
  CHECK(unit.name == "demo::test_data::Point");
  CHECK(unit.kind_name() == "test_data");
  CHECK(unit.file().filename == "demo/test_data/point.hpp");
}

TEST_CASE("Point companion", "[test_data_emitter]") {
  auto group = make_group();
  CHECK(emit(group, "demo::Point") == R"(#pragma once

#include <thriftgen/runtime/test_data.hpp>
#include <utility>
#include <cstdint>

#include "demo/point.hpp"

namespace demo {

inline thriftgen::generator<::demo::Point> thriftgen_generator(const ::demo::Point*, const thriftgen::generation_context& context);

inline ::demo::Point thriftgen_apply_defaults(::demo::Point value, const thriftgen::generation_context& context);

} // namespace demo

namespace demo::test_data::Point {

inline thriftgen::generator<::demo::Point> get_generator(const thriftgen::generation_context& context) {
  return thriftgen::let_all(
      [](std::int32_t v0, std::optional<std::int32_t> v1) {
        return ::demo::Point{std::move(v0), std::move(v1)};
      },
      thriftgen::arbitrary<std::int32_t>(),
      thriftgen::one_of<std::optional<std::int32_t>>({thriftgen::optional_of(thriftgen::arbitrary<std::int32_t>()), thriftgen::absent<std::optional<std::int32_t>>()}));
}

inline ::demo::Point apply_defaults(::demo::Point value, const thriftgen::generation_context& context) {
  return ::demo::Point{
      thriftgen::apply_defaults(std::move(value.x), context),
      thriftgen::or_default(
          thriftgen::apply_defaults(std::move(value.y), context),
          [&] { return thriftgen::apply_fallback_defaults(std::optional<std::int32_t>(5), context); })};
}

} // namespace demo::test_data::Point

namespace demo {

inline thriftgen::generator<::demo::Point> thriftgen_generator(const ::demo::Point*, const thriftgen::generation_context& context) {
  return ::demo::test_data::Point::get_generator(context);
}

inline ::demo::Point thriftgen_apply_defaults(::demo::Point value, const thriftgen::generation_context& context) {
  return ::demo::test_data::Point::apply_defaults(std::move(value), context);
}

} // namespace demo
)");
}

TEST_CASE("self references are drawn through pointers", "[test_data_emitter]") {
  auto group = make_group();
  auto text = emit(group, "demo::Node");

  CHECK(contains(text, "[](std::vector<::demo::Node> v0, "
                       "std::unique_ptr<::demo::Node> v1)"));
  CHECK(contains(text, "thriftgen::list_of<std::vector<::demo::Node>>("
                       "thriftgen::generator_for<::demo::Node>(context))"));
  CHECK(contains(text, "thriftgen::one_of<std::unique_ptr<::demo::Node>>({"
                       "thriftgen::pointer_of(thriftgen::generator_for<::"
                       "demo::Node>(context)), "
                       "thriftgen::absent<std::unique_ptr<::demo::Node>>()})"));
  CHECK(contains(text, "      thriftgen::apply_defaults(std::move(value.next), "
                       "context)};\n"));
  CHECK_FALSE(contains(text, "\"demo/test_data/node.hpp\""));
}

TEST_CASE("nested records and enums", "[test_data_emitter]") {
  auto group = make_group();
  auto text = emit(group, "demo::Line");

  CHECK(contains(text, "#include \"demo/test_data/point.hpp\""));
  CHECK(contains(text, "#include \"demo/point.hpp\""));
  CHECK(contains(text, "#include \"demo/color.hpp\""));
  CHECK(contains(text, "thriftgen::generator_for<::demo::Point>(context)"));
  CHECK(contains(text, "thriftgen::optional_of(thriftgen::elements_of("
                       "std::vector<::demo::Color>{::demo::Color::RED, "
                       "::demo::Color::BLUE}))"));
  CHECK(contains(text, "thriftgen::apply_fallback_defaults(std::optional<"
                       "::demo::Color>(::demo::Color::RED), context)"));
}

TEST_CASE("zero-field struct companion is a point generator",
          "[test_data_emitter]") {
  auto group = make_group();
  auto text = emit(group, "demo::Empty");

  CHECK(contains(text, "  return thriftgen::constant(::demo::Empty{});\n"));
  CHECK(contains(text, "inline ::demo::Empty apply_defaults(::demo::Empty "
                       "value, const thriftgen::generation_context&) {\n"
                       "  return value;\n}"));
  CHECK(contains(text, "thriftgen_generator"));
}

TEST_CASE("enum companion has no hooks", "[test_data_emitter]") {
  auto group = make_group();
  auto text = emit(group, "demo::Color");

  CHECK(contains(text, "namespace demo::test_data::Color {"));
  CHECK(contains(text, "  return thriftgen::constant(::demo::Color::RED);\n"));
  CHECK(contains(text, "#include \"demo/color.hpp\""));
  CHECK_FALSE(contains(text, "thriftgen_generator"));
}

TEST_CASE("typedef companion delegates to the aliased type",
          "[test_data_emitter]") {
  auto group = make_group();
  auto text = emit(group, "demo::Points");

  CHECK(contains(text, "namespace demo::test_data::Points {"));
  CHECK(contains(text, "inline thriftgen::generator<std::vector<::demo::"
                       "Point>> get_generator("));
  CHECK(contains(text, "  return thriftgen::list_of<std::vector<::demo::"
                       "Point>>(thriftgen::generator_for<::demo::Point>("
                       "context));\n"));
  CHECK(contains(text, "  return thriftgen::apply_defaults(std::move(value), "
                       "context);\n"));
  CHECK(contains(text, "#include \"demo/test_data/point.hpp\""));
  CHECK_FALSE(contains(text, "\"demo/points.hpp\""));
  CHECK_FALSE(contains(text, "thriftgen_generator"));
}
