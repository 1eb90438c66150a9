#include <thriftgen/emitters.hpp>
#include <thriftgen/naming.hpp>

namespace thriftgen {

  namespace {

    bool
    is_constexpr_type(const type_ref& t, const cpp_types& types) {
      auto [u, scope] = types.scope().underlying_type(t);
      if (u.is_base()) {
        return u.base() != base_type::string && u.base() != base_type::binary;
      }
      if (u.is_named())
        return scope.resolve_type(u).kind == entity_kind::enum_;
      return false;
    }

  } // namespace

  field_storage
  storage_of(const field& f, const cpp_types& types,
             const std::string& owner_name) {
    if (types.refers_to(f.type, owner_name)) return field_storage::pointer;
    if (f.is_optional()) return field_storage::optional;
    return field_storage::value;
  }

  std::string
  field_type(const field& f, const cpp_types& types,
             const std::string& owner_name) {
    auto name = types.name(f.type);
    switch (storage_of(f, types, owner_name)) {
    case field_storage::value: return name;
    case field_storage::optional: return "std::optional<" + name + ">";
    case field_storage::pointer: return "std::unique_ptr<" + name + ">";
    }
    return name;
  }

  cpp_file
  module_file(const std::string& output_name) {
    cpp_file file;
    file.filename = target_path(output_name);
    file.namespaces.push_back({qualifier_of(output_name), {}});
    return file;
  }

  generated_unit
  emit_enum(const std::string& output_name, const enum_def& e) {
    cpp_file file = module_file(output_name);
    file.includes = {{"<cstdint>"}, {"<stdexcept>"}, {"<string>"},
                     {"<string_view>"}};

    cpp_enum decl;
    decl.name = unqualified_name(output_name);
    for (const auto& v : e.values)
      decl.values.push_back({escape_identifier(v.name), v.value});
    file.namespaces.front().declarations.emplace_back(std::move(decl));

    return {output_name, type_definition{unit_origin::enum_, std::move(file)}};
  }

  generated_unit
  emit_constants(const std::string& output_name,
                 const std::vector<const constant_def*>& constants,
                 const cpp_types& types) {
    cpp_file file = module_file(output_name);
    auto& ns = file.namespaces.front();

    for (const auto* c : constants) {
      types.collect_includes(c->type, file.includes);
      ns.declarations.emplace_back(cpp_variable{
          types.name(c->type), escape_identifier(c->name),
          types.value(c->value, c->type), is_constexpr_type(c->type, types)});
    }

    return {output_name, constant_definition{std::move(file)}};
  }

} // namespace thriftgen
