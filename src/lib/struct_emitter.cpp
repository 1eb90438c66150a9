#include <thriftgen/emitters.hpp>
#include <thriftgen/naming.hpp>

#include <algorithm>

namespace thriftgen {

  namespace {

    unit_origin
    origin_of(struct_kind k) {
      switch (k) {
      case struct_kind::struct_: return unit_origin::struct_;
      case struct_kind::union_: return unit_origin::union_;
      case struct_kind::exception: return unit_origin::exception;
      }
      return unit_origin::struct_;
    }

    // Places `struct Name;` for each peer in its namespace block, ahead of
    // the record.
    void
    forward_declare(cpp_file& file, const std::vector<std::string>& peers) {
      for (auto it = peers.rbegin(); it != peers.rend(); ++it) {
        auto qualifier = qualifier_of(*it);
        auto ns = std::find_if(
            file.namespaces.begin(), file.namespaces.end(),
            [&qualifier](const cpp_namespace& n) { return n.name == qualifier; });
        if (ns == file.namespaces.end())
          ns = file.namespaces.insert(file.namespaces.begin(),
                                      cpp_namespace{qualifier, {}});
        ns->declarations.insert(ns->declarations.begin(),
                                cpp_forward_decl{unqualified_name(*it)});
      }
    }

  } // namespace

  generated_unit
  emit_struct(const std::string& output_name, const struct_def& s,
              const cpp_types& types) {
    cpp_file file = module_file(output_name);

    cpp_struct decl;
    decl.name = unqualified_name(output_name);
    std::vector<std::string> peers;

    for (const auto& f : s.fields) {
      switch (storage_of(f, types, output_name)) {
      case field_storage::value: break;
      case field_storage::optional: add_include(file.includes, "<optional>"); break;
      case field_storage::pointer:
        add_include(file.includes, "<memory>");
        // unique_ptr members compare by address
        decl.generate_equality = false;
        break;
      }
      types.collect_includes(f.type, file.includes, output_name);
      types.cycle_peers(f.type, output_name, peers);

      std::string initializer;
      if (f.default_value &&
          storage_of(f, types, output_name) == field_storage::value)
        initializer = types.value(*f.default_value, f.type);
      decl.fields.push_back({field_type(f, types, output_name),
                             escape_identifier(f.name), std::move(initializer)});
    }

    file.namespaces.front().declarations.emplace_back(std::move(decl));
    forward_declare(file, peers);
    return {output_name, type_definition{origin_of(s.kind), std::move(file)}};
  }

} // namespace thriftgen
