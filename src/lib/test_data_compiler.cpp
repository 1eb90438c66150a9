#include <thriftgen/test_data_compiler.hpp>
#include <thriftgen/naming.hpp>

namespace thriftgen {

  namespace {

    entity_kind
    entity_kind_of(struct_kind k) {
      switch (k) {
      case struct_kind::struct_: return entity_kind::struct_;
      case struct_kind::union_: return entity_kind::union_;
      case struct_kind::exception: return entity_kind::exception;
      }
      return entity_kind::struct_;
    }

  } // namespace

  draw_expr
  field_draw(const field& f) {
    draw_expr primitive{type_draw{f.type}};
    if (!f.is_optional()) return primitive;
    return draw_expr{
        one_of_draw{{std::move(primitive), draw_expr{absent_draw{}}}}};
  }

  field_default
  field_default_for(const field& f) {
    return {f.name, f.type, f.is_optional(), f.default_value};
  }

  test_data_module
  test_data_compiler::compile(const typedef_def& t) const {
    test_data_module m;
    m.data_name = scope_.dest_module(scope_.module() + "." + capitalize(t.name));
    m.name = test_data_module_name(m.data_name);
    m.module = scope_.module();
    m.kind = entity_kind::typedef_;
    m.generator = alias_draw{t.target};
    m.defaults = alias_defaults{t.target};
    return m;
  }

  test_data_module
  test_data_compiler::compile(const struct_def& s) const {
    test_data_module m;
    m.data_name = scope_.dest_module(s.name);
    m.name = test_data_module_name(m.data_name);
    m.module = scope_.module();
    m.kind = entity_kind_of(s.kind);

    if (s.fields.empty()) {
      m.generator = point_draw{};
      m.defaults = identity_defaults{};
      return m;
    }

    record_draw draw;
    rebuild_defaults defaults;
    for (const auto& f : s.fields) {
      draw.bindings.push_back({f.name, f.type, f.is_optional(), field_draw(f)});
      defaults.fields.push_back(field_default_for(f));
    }
    m.generator = std::move(draw);
    m.defaults = std::move(defaults);
    return m;
  }

  test_data_module
  test_data_compiler::compile(const enum_def& e) const {
    test_data_module m;
    m.data_name = scope_.dest_module(e.name);
    m.name = test_data_module_name(m.data_name);
    m.module = scope_.module();
    m.kind = entity_kind::enum_;

    point_draw draw;
    if (!e.values.empty()) draw.value = e.values.front();
    m.generator = std::move(draw);
    m.defaults = identity_defaults{};
    return m;
  }

  std::vector<test_data_module>
  test_data_compiler::compile_schema() const {
    const auto& s = scope_.current_schema();
    std::vector<test_data_module> modules;
    for (const auto& t : s.typedefs())
      modules.push_back(compile(t));
    for (const auto& st : s.structs())
      modules.push_back(compile(st));
    for (const auto& ex : s.exceptions())
      modules.push_back(compile(ex));
    for (const auto& u : s.unions())
      modules.push_back(compile(u));
    for (const auto& e : s.enums())
      modules.push_back(compile(e));
    return modules;
  }

} // namespace thriftgen
