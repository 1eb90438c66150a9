#include <thriftgen/codegen.hpp>

#include <thriftgen/cpp_types.hpp>
#include <thriftgen/emitters.hpp>
#include <thriftgen/test_data_compiler.hpp>
#include <thriftgen/test_data_emitter.hpp>

#include <stdexcept>

namespace thriftgen {

  std::optional<name_collision>
  codegen_result::collision() const {
    if (modules.collision) return modules.collision;
    return test_data.collision;
  }

  codegen::codegen(const file_group& group, const type_map& types)
      : group_(group), types_(types) {}

  schema_output
  codegen::generate_schema(const schema& s) const {
    auto scope = group_.scope(s.module());
    cpp_types types(types_, scope);
    schema_output out;

    for (const auto& e : s.enums())
      out.modules.push_back(emit_enum(scope.dest_module(e.name), e));

    std::vector<const constant_def*> owned;
    for (const auto& c : s.constants()) {
      if (scope.owns_constant(c)) owned.push_back(&c);
    }
    if (!owned.empty()) {
      out.modules.push_back(
          emit_constants(scope.constants_module(), owned, types));
    }

    for (const auto& st : s.structs())
      out.modules.push_back(emit_struct(scope.dest_module(st.name), st, types));
    for (const auto& u : s.unions())
      out.modules.push_back(emit_struct(scope.dest_module(u.name), u, types));
    for (const auto& ex : s.exceptions())
      out.modules.push_back(emit_struct(scope.dest_module(ex.name), ex, types));

    for (const auto& svc : s.services()) {
      out.modules.push_back(
          emit_service(scope.dest_module(svc.name), svc, types));
    }
    for (const auto& svc : s.services()) {
      out.modules.push_back(
          emit_behaviour(scope.dest_module(svc.name), svc, types));
    }

    test_data_emitter emitter(group_, types_);
    for (const auto& m : test_data_compiler(scope).compile_schema())
      out.test_data.push_back(emitter.emit(m));

    return out;
  }

  codegen_result
  codegen::generate() const {
    std::vector<generated_unit> modules;
    std::vector<generated_unit> test_data;

    for (const auto& s : group_.schemas()) {
      auto out = generate_schema(s);
      for (auto& u : out.modules)
        modules.push_back(std::move(u));
      for (auto& u : out.test_data)
        test_data.push_back(std::move(u));
    }

    return {resolve_name_collisions(std::move(modules)),
            resolve_name_collisions(std::move(test_data))};
  }

  std::vector<std::string>
  codegen::targets() const {
    auto result = generate();
    if (result.modules.collision)
      throw std::runtime_error(result.modules.collision->message());

    std::vector<std::string> paths;
    for (const auto& u : result.modules.units)
      paths.push_back(u.file().filename);
    return paths;
  }

} // namespace thriftgen
