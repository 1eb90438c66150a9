#include <thriftgen/emitters.hpp>
#include <thriftgen/naming.hpp>

namespace thriftgen {

  namespace {

    std::string
    handler_name(const std::string& service_output_name) {
      return service_output_name + "Handler";
    }

    cpp_field
    member_for(const field& f, const cpp_types& types, cpp_file& file) {
      types.collect_includes(f.type, file.includes);
      if (f.is_optional()) {
        add_include(file.includes, "<optional>");
        return {"std::optional<" + types.name(f.type) + ">",
                escape_identifier(f.name),
                {}};
      }
      std::string initializer;
      if (f.default_value) initializer = types.value(*f.default_value, f.type);
      return {types.name(f.type), escape_identifier(f.name),
              std::move(initializer)};
    }

  } // namespace

  generated_unit
  emit_service(const std::string& output_name, const service_def& svc,
               const cpp_types& types) {
    cpp_file file = module_file(output_name);
    auto& ns = file.namespaces.front();
    const auto prefix = unqualified_name(output_name) + "_";

    for (const auto& fn : svc.functions) {
      cpp_struct args;
      args.name = prefix + fn.name + "_args";
      for (const auto& p : fn.params)
        args.fields.push_back(member_for(p, types, file));
      ns.declarations.emplace_back(std::move(args));

      if (fn.oneway) continue;

      // Exactly one member is set: the return value or a declared exception.
      cpp_struct result;
      result.name = prefix + fn.name + "_result";
      if (fn.return_type) {
        field success;
        success.name = "success";
        success.type = *fn.return_type;
        success.req = requiredness::optional;
        result.fields.push_back(member_for(success, types, file));
      }
      for (auto e : fn.exceptions) {
        e.req = requiredness::optional;
        result.fields.push_back(member_for(e, types, file));
      }
      ns.declarations.emplace_back(std::move(result));
    }

    return {output_name,
            type_definition{unit_origin::service, std::move(file)}};
  }

  generated_unit
  emit_behaviour(const std::string& output_name, const service_def& svc,
                 const cpp_types& types) {
    auto name = handler_name(output_name);
    cpp_file file = module_file(name);

    cpp_interface decl;
    decl.name = unqualified_name(name);
    if (svc.extends) {
      auto base = handler_name(types.scope().dest_module(*svc.extends));
      decl.base = global_name(base);
      add_include(file.includes, "\"" + target_path(base) + "\"");
    }

    for (const auto& fn : svc.functions) {
      cpp_method m;
      m.name = escape_identifier(fn.name);
      if (fn.return_type && !fn.oneway) {
        types.collect_includes(*fn.return_type, file.includes);
        m.return_type = types.name(*fn.return_type);
      } else {
        m.return_type = "void";
      }
      for (const auto& p : fn.params) {
        types.collect_includes(p.type, file.includes);
        if (!m.parameters.empty()) m.parameters += ", ";
        auto type = types.name(p.type);
        if (p.is_optional()) {
          add_include(file.includes, "<optional>");
          type = "std::optional<" + type + ">";
        }
        m.parameters += "const " + type + "& " + escape_identifier(p.name);
      }
      decl.methods.push_back(std::move(m));
    }

    file.namespaces.front().declarations.emplace_back(std::move(decl));
    return {name, type_definition{unit_origin::behaviour, std::move(file)}};
  }

} // namespace thriftgen
