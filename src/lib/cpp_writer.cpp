#include <thriftgen/cpp_writer.hpp>

#include <sstream>

namespace thriftgen {

  namespace {

    void
    write_includes(std::ostream& os, const std::vector<cpp_include>& includes) {
      if (includes.empty()) return;

      // Partition into system (<...>) and local ("...") includes
      std::vector<const cpp_include*> system_includes;
      std::vector<const cpp_include*> local_includes;

      for (const auto& inc : includes) {
        if (!inc.path.empty() && inc.path.front() == '<')
          system_includes.push_back(&inc);
        else
          local_includes.push_back(&inc);
      }

      os << '\n';

      for (const auto* inc : system_includes)
        os << "#include " << inc->path << '\n';

      if (!system_includes.empty() && !local_includes.empty()) os << '\n';

      for (const auto* inc : local_includes)
        os << "#include " << inc->path << '\n';
    }

    void
    write_field(std::ostream& os, const cpp_field& field) {
      os << "  " << field.type << ' ' << field.name;
      if (!field.default_value.empty()) os << " = " << field.default_value;
      os << ";\n";
    }

    void
    write_struct(std::ostream& os, const cpp_struct& s) {
      if (s.fields.empty() && !s.generate_equality) {
        os << "struct " << s.name << " {};\n";
        return;
      }

      os << "struct " << s.name << " {\n";
      for (const auto& f : s.fields)
        write_field(os, f);

      if (s.generate_equality) {
        if (!s.fields.empty()) os << '\n';
        os << "  bool operator==(const " << s.name << "&) const = default;\n";
      }

      os << "};\n";
    }

    void
    write_enum(std::ostream& os, const cpp_enum& e) {
      os << "enum class " << e.name << " : std::int32_t {\n";
      for (const auto& v : e.values)
        os << "  " << v.name << " = " << v.value << ",\n";
      os << "};\n";

      os << "\ninline std::string_view to_string(" << e.name << " v) {\n";
      os << "  switch (v) {\n";
      for (const auto& v : e.values) {
        os << "  case " << e.name << "::" << v.name << ": return \"" << v.name
           << "\";\n";
      }
      os << "  }\n";
      os << "  return \"\";\n";
      os << "}\n";

      os << "\ninline " << e.name << ' ' << e.name
         << "_from_string(std::string_view s) {\n";
      for (const auto& v : e.values) {
        os << "  if (s == \"" << v.name << "\") return " << e.name
           << "::" << v.name << ";\n";
      }
      os << "  throw std::invalid_argument(std::string(\"invalid " << e.name
         << " value: \") + std::string(s));\n";
      os << "}\n";
    }

    void
    write_function(std::ostream& os, const cpp_function& f) {
      if (f.declaration_only) {
        os << "inline " << f.return_type << ' ' << f.name << '('
           << f.parameters << ");\n";
        return;
      }
      os << "inline " << f.return_type << ' ' << f.name << '(';
      os << f.parameters;
      os << ") {\n";
      os << f.body;
      os << "}\n";
    }

    void
    write_variable(std::ostream& os, const cpp_variable& v) {
      os << (v.is_constexpr ? "inline constexpr " : "inline const ") << v.type
         << ' ' << v.name << " = " << v.initializer << ";\n";
    }

    void
    write_interface(std::ostream& os, const cpp_interface& c) {
      os << "class " << c.name;
      if (!c.base.empty()) os << " : public " << c.base;
      os << " {\n";
      os << "public:\n";
      os << "  virtual ~" << c.name << "() = default;\n";
      for (const auto& m : c.methods) {
        os << "\n  virtual " << m.return_type << ' ' << m.name << '('
           << m.parameters << ") = 0;\n";
      }
      os << "};\n";
    }

    void
    write_forward_decl(std::ostream& os, const cpp_forward_decl& d) {
      os << "struct " << d.name << ";\n";
    }

    void
    write_decl(std::ostream& os, const cpp_decl& decl) {
      std::visit(
          [&os](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, cpp_function>) {
              write_function(os, d);
            } else if constexpr (std::is_same_v<T, cpp_struct>) {
              write_struct(os, d);
            } else if constexpr (std::is_same_v<T, cpp_enum>) {
              write_enum(os, d);
            } else if constexpr (std::is_same_v<T, cpp_variable>) {
              write_variable(os, d);
            } else if constexpr (std::is_same_v<T, cpp_interface>) {
              write_interface(os, d);
            } else if constexpr (std::is_same_v<T, cpp_forward_decl>) {
              write_forward_decl(os, d);
            }
          },
          decl);
    }

    // Variables follow the other declarations of their namespace, so a
    // constant of a record type comes after that record.
    std::vector<const cpp_decl*>
    order_declarations(const std::vector<cpp_decl>& decls) {
      std::vector<const cpp_decl*> ordered;
      for (const auto& decl : decls) {
        if (!std::holds_alternative<cpp_variable>(decl))
          ordered.push_back(&decl);
      }
      for (const auto& decl : decls) {
        if (std::holds_alternative<cpp_variable>(decl))
          ordered.push_back(&decl);
      }
      return ordered;
    }

    void
    write_namespace(std::ostream& os, const cpp_namespace& ns) {
      if (ns.name.empty()) {
        for (const auto* decl : order_declarations(ns.declarations)) {
          os << '\n';
          write_decl(os, *decl);
        }
        return;
      }

      os << "\nnamespace " << ns.name << " {\n";
      for (const auto* decl : order_declarations(ns.declarations)) {
        os << '\n';
        write_decl(os, *decl);
      }
      os << "\n} // namespace " << ns.name << '\n';
    }

  } // namespace

  std::string
  decl_name(const cpp_decl& decl) {
    return std::visit([](const auto& d) { return d.name; }, decl);
  }

  std::string
  cpp_writer::write(const cpp_file& file) const {
    std::ostringstream os;
    os << "#pragma once\n";
    write_includes(os, file.includes);
    for (const auto& ns : file.namespaces)
      write_namespace(os, ns);
    return os.str();
  }

} // namespace thriftgen
