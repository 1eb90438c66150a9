#include <thriftgen/test_data_interpreter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

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

  struct_def line;
  line.name = "Line";
  line.fields = {
      make_field("from", type_ref::named("Point"), requiredness::required),
      make_field("to", type_ref::named("Point"), requiredness::optional,
                 literal::map({{literal::string("x"), literal::integer(0)}})),
      make_field("color", type_ref::named("Color"), requiredness::default_,
                 literal::identifier("Color.BLUE")),
      make_field("tags", type_ref::list_of(type_ref::of(base_type::string)),
                 requiredness::optional)};
  s.add_struct(line);

  struct_def node;
  node.name = "Node";
  node.fields = {
      make_field("children", type_ref::list_of(type_ref::named("Node")),
                 requiredness::required),
      make_field("next", type_ref::named("Node"), requiredness::optional)};
  s.add_struct(node);

  struct_def loop;
  loop.name = "Loop";
  loop.fields = {
      make_field("next", type_ref::named("Loop"), requiredness::required)};
  s.add_struct(loop);

  struct_def chain;
  chain.name = "Chain";
  chain.fields = {
      make_field("n", type_ref::of(base_type::i32), requiredness::optional),
      make_field("next", type_ref::named("Chain"), requiredness::optional,
                 literal::map({{literal::string("n"), literal::integer(3)}}))};
  s.add_struct(chain);

  struct_def empty;
  empty.name = "Empty";
  s.add_struct(empty);

  s.add_enum({"Color", {{"RED", 1}, {"BLUE", 2}}});
  s.add_typedef({"myInt", type_ref::of(base_type::i32)});

  file_group group;
  group.add(std::move(s));
  return group;
}

static value
point(std::int64_t x, value y) {
  return value::record("demo::Point", {{"x", value::integer(x)}, {"y", y}});
}

TEST_CASE("interpreter knows every companion", "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);

  CHECK(interpreter.contains("demo::Point"));
  CHECK(interpreter.contains("demo::Color"));
  CHECK(interpreter.contains("demo::Myint"));
  CHECK_FALSE(interpreter.contains("demo::Missing"));
  CHECK_THROWS_AS(interpreter.get_generator("demo::Missing", {}),
                  std::runtime_error);
}

TEST_CASE("zero-field entities draw one instance and default to themselves",
          "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);
  generation_context context;

  auto draws = interpreter.get_generator("demo::Empty", context)
                   .sample(context, 20);
  for (const auto& v : draws)
    CHECK(v == value::record("demo::Empty", {}));

  auto v = value::record("demo::Empty", {});
  CHECK(interpreter.apply_defaults("demo::Empty", v, context) == v);
}

TEST_CASE("enums draw their first value", "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);
  generation_context context;

  auto gen = interpreter.get_generator("demo::Color", context);
  for (const auto& v : gen.sample(context, 10))
    CHECK(v == value::integer(1));
}

TEST_CASE("required fields are never absent", "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);
  generation_context context;
  context.seed = 7;

  auto gen = interpreter.get_generator("demo::Point", context);
  for (const auto& v : gen.sample(context, 200)) {
    REQUIRE(v.kind() == value_kind::record);
    const auto* x = v.find_field("x");
    REQUIRE(x != nullptr);
    CHECK(x->kind() == value_kind::integer);
  }
}

TEST_CASE("optional fields are sometimes absent and sometimes present",
          "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);
  generation_context context;
  context.seed = 11;

  std::size_t absent = 0;
  std::size_t present = 0;
  auto gen = interpreter.get_generator("demo::Point", context);
  for (const auto& v : gen.sample(context, 200)) {
    const auto* y = v.find_field("y");
    REQUIRE(y != nullptr);
    if (y->is_absent()) {
      ++absent;
    } else {
      CHECK(y->kind() == value_kind::integer);
      ++present;
    }
  }
  CHECK(absent > 0);
  CHECK(present > 0);
}

TEST_CASE("optional field with a default still draws absent",
          "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);
  generation_context context;

  bool saw_absent = false;
  for (const auto& v :
       interpreter.get_generator("demo::Line", context).sample(context, 100)) {
    if (v.find_field("to")->is_absent()) saw_absent = true;
  }
  CHECK(saw_absent);
}

TEST_CASE("Point defaults fill an absent y", "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);
  generation_context context;

  CHECK(interpreter.apply_defaults("demo::Point", point(1, value::absent()),
                                   context) == point(1, value::integer(5)));
  CHECK(interpreter.apply_defaults("demo::Point", point(1, value::integer(7)),
                                   context) == point(1, value::integer(7)));
}

TEST_CASE("defaults reach nested records and literals",
          "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);
  generation_context context;

  auto line = value::record("demo::Line", {{"from", point(3, value::absent())},
                                           {"to", value::absent()},
                                           {"color", value::absent()},
                                           {"tags", value::absent()}});
  auto result = interpreter.apply_defaults("demo::Line", line, context);

  CHECK(*result.find_field("from") == point(3, value::integer(5)));
  // The literal leaves y out; defaulting it fills y.
  CHECK(*result.find_field("to") == point(0, value::integer(5)));
  CHECK(*result.find_field("color") == value::integer(2));
  CHECK(result.find_field("tags")->is_absent());
}

TEST_CASE("apply_defaults is idempotent", "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);
  generation_context context;
  context.seed = 3;

  for (const auto* name : {"demo::Point", "demo::Line", "demo::Node"}) {
    auto gen = interpreter.get_generator(name, context);
    for (auto& v : gen.sample(context, 50)) {
      auto once = interpreter.apply_defaults(name, v, context);
      auto twice = interpreter.apply_defaults(name, once, context);
      CHECK(once == twice);
    }
  }
}

static std::size_t
chain_length(const value& chain) {
  std::size_t length = 0;
  for (const auto* next = chain.find_field("next");
       next != nullptr && !next->is_absent(); next = next->find_field("next"))
    ++length;
  return length;
}

TEST_CASE("a default containing its own type stops at max_depth",
          "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);
  generation_context context;
  context.max_depth = 2;

  auto bare = value::record("demo::Chain",
                            {{"n", value::absent()}, {"next", value::absent()}});
  auto filled = interpreter.apply_defaults("demo::Chain", bare, context);
  CHECK(chain_length(filled) == context.max_depth + 1);
  for (const auto* next = filled.find_field("next"); !next->is_absent();
       next = next->find_field("next"))
    CHECK(*next->find_field("n") == value::integer(3));

  auto set = value::record(
      "demo::Chain",
      {{"n", value::integer(1)},
       {"next", value::record("demo::Chain", {{"n", value::integer(2)},
                                              {"next", value::absent()}})}});
  auto kept = interpreter.apply_defaults("demo::Chain", set, context);
  CHECK(*kept.find_field("next")->find_field("n") == value::integer(2));
  CHECK(chain_length(kept) == context.max_depth + 2);
}

TEST_CASE("recursive types terminate", "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);
  generation_context context;
  context.max_depth = 3;

  auto draws =
      interpreter.get_generator("demo::Node", context).sample(context, 50);
  CHECK(draws.size() == 50);
}

TEST_CASE("a cycle of required fields is a generation error",
          "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);
  generation_context context;

  auto gen = interpreter.get_generator("demo::Loop", context);
  CHECK_THROWS_AS(gen.sample(context), generation_error);
}

TEST_CASE("draws are reproducible from the seed", "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);
  generation_context context;
  context.seed = 42;

  auto gen = interpreter.get_generator("demo::Line", context);
  CHECK(gen.sample(context, 10) == gen.sample(context, 10));
}

TEST_CASE("typedef companions alias their target", "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);
  generation_context context;

  auto v = interpreter.get_generator("demo::Myint", context).sample(context);
  CHECK(v.kind() == value_kind::integer);
  CHECK(interpreter.apply_defaults("demo::Myint", v, context) == v);
}

TEST_CASE("literal values", "[test_data_interpreter]") {
  auto group = make_group();
  test_data_interpreter interpreter(group);
  auto scope = group.scope("geometry");

  CHECK(interpreter.literal_value(literal::identifier("Color.RED"), scope,
                                  type_ref::named("Color"),
                                  scope) == value::integer(1));
  CHECK(interpreter.literal_value(
            literal::list({literal::string("a"), literal::string("a")}), scope,
            type_ref::set_of(type_ref::of(base_type::string)),
            scope) == value::set({value::string("a")}));
  CHECK(interpreter.literal_value(
            literal::map({{literal::string("x"), literal::integer(4)}}), scope,
            type_ref::named("Point"), scope) == point(4, value::absent()));
  CHECK_THROWS_AS(interpreter.literal_value(literal::string("x"), scope,
                                            type_ref::of(base_type::i32), scope),
                  std::runtime_error);
}
