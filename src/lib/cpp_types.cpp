#include <thriftgen/cpp_types.hpp>
#include <thriftgen/naming.hpp>

#include <algorithm>
#include <cstdio>
#include <limits>
#include <optional>
#include <stdexcept>

namespace thriftgen {

  namespace {

    const char*
    container_key(type_kind k) {
      switch (k) {
      case type_kind::list: return "list";
      case type_kind::set: return "set";
      case type_kind::map: return "map";
      default: return "";
      }
    }

    void
    add_header_list(std::vector<cpp_include>& includes,
                    const std::string& headers) {
      // cpp-header may list several headers separated by spaces
      std::size_t pos = 0;
      while (pos < headers.size()) {
        auto end = headers.find(' ', pos);
        if (end == std::string::npos) end = headers.size();
        if (end > pos) add_include(includes, headers.substr(pos, end - pos));
        pos = end + 1;
      }
    }

    std::string
    integer_text(std::int64_t v) {
      if (v == std::numeric_limits<std::int64_t>::min())
        return "(-9223372036854775807 - 1)";
      return std::to_string(v);
    }

    std::string
    double_text(double v) {
      char buffer[64];
      std::snprintf(buffer, sizeof buffer, "%.17g", v);
      std::string text(buffer);
      if (text.find_first_of(".eEn") == std::string::npos) text += ".0";
      return text;
    }

    [[noreturn]] void
    mismatch(const literal&, const type_ref& t) {
      throw std::runtime_error("cpp_types: literal does not match type '" +
                               to_string(t) + "'");
    }

    // Chains longer than 64 hops are treated as cycles.
    constexpr int max_constant_hops = 64;

  } // namespace

  void
  add_include(std::vector<cpp_include>& includes, std::string path) {
    auto it = std::find_if(includes.begin(), includes.end(),
                           [&](const cpp_include& i) { return i.path == path; });
    if (it == includes.end()) includes.push_back({std::move(path)});
  }

  std::string
  global_name(const std::string& output_name) {
    return "::" + output_name;
  }

  std::string
  quote_string(const std::string& text) {
    std::string out = "\"";
    for (unsigned char c : text) {
      switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20 || c >= 0x7f) {
          char buffer[8];
          std::snprintf(buffer, sizeof buffer, "\\%03o", c);
          out += buffer;
        } else {
          out += static_cast<char>(c);
        }
      }
    }
    out += '"';
    return out;
  }

  std::string
  cpp_types::name(const type_ref& t) const {
    switch (t.kind()) {
    case type_kind::base:
      return types_->at(std::string(to_string(t.base()))).cpp_type;
    case type_kind::list:
    case type_kind::set:
      return types_->at(container_key(t.kind())).cpp_type + "<" +
             name(t.element_type()) + ">";
    case type_kind::map:
      return types_->at("map").cpp_type + "<" + name(t.key_type()) + ", " +
             name(t.value_type()) + ">";
    case type_kind::named: {
      auto ref = scope_.resolve_type(t);
      if (ref.kind == entity_kind::typedef_) {
        cpp_types target(*types_, scope_.group().scope(ref.module));
        return target.name(ref.typedef_decl->target);
      }
      return global_name(ref.output_name);
    }
    }
    return "";
  }

  void
  cpp_types::collect_includes(const type_ref& t,
                              std::vector<cpp_include>& includes,
                              const std::string& self) const {
    switch (t.kind()) {
    case type_kind::base:
      add_header_list(includes,
                      types_->at(std::string(to_string(t.base()))).cpp_header);
      return;
    case type_kind::list:
    case type_kind::set:
      add_header_list(includes, types_->at(container_key(t.kind())).cpp_header);
      collect_includes(t.element_type(), includes, self);
      return;
    case type_kind::map:
      add_header_list(includes, types_->at("map").cpp_header);
      collect_includes(t.key_type(), includes, self);
      collect_includes(t.value_type(), includes, self);
      return;
    case type_kind::named: {
      auto ref = scope_.resolve_type(t);
      if (ref.kind == entity_kind::typedef_) {
        cpp_types target(*types_, scope_.group().scope(ref.module));
        target.collect_includes(ref.typedef_decl->target, includes, self);
        return;
      }
      if (ref.output_name != self)
        add_include(includes, "\"" + target_path(ref.output_name) + "\"");
      return;
    }
    }
  }

  std::vector<entity_ref>
  cpp_types::records_in(const type_ref& t) const {
    auto [u, scope] = scope_.underlying_type(t);
    cpp_types in_scope(*types_, scope);
    std::vector<entity_ref> records;

    switch (u.kind()) {
    case type_kind::base: break;
    case type_kind::list:
    case type_kind::set: records = in_scope.records_in(u.element_type()); break;
    case type_kind::map: {
      records = in_scope.records_in(u.key_type());
      auto values = in_scope.records_in(u.value_type());
      records.insert(records.end(), values.begin(), values.end());
      break;
    }
    case type_kind::named: {
      auto ref = scope.resolve_type(u);
      if (ref.struct_decl != nullptr) records.push_back(std::move(ref));
      break;
    }
    }
    return records;
  }

  bool
  cpp_types::reaches(const entity_ref& from, const std::string& target,
                     std::set<std::string>& visited) const {
    if (!visited.insert(from.output_name).second) return false;

    cpp_types in_scope(*types_, scope_.group().scope(from.module));
    for (const auto& f : from.struct_decl->fields) {
      for (const auto& r : in_scope.records_in(f.type)) {
        if (r.output_name == target) return true;
        if (in_scope.reaches(r, target, visited)) return true;
      }
    }
    return false;
  }

  bool
  cpp_types::refers_to(const type_ref& t,
                       const std::string& output_name) const {
    auto [underlying, scope] = scope_.underlying_type(t);
    if (!underlying.is_named()) return false;
    auto ref = scope.resolve_type(underlying);
    if (ref.struct_decl == nullptr) return false;
    if (ref.output_name == output_name) return true;

    std::set<std::string> visited;
    return reaches(ref, output_name, visited);
  }

  void
  cpp_types::cycle_peers(const type_ref& t, const std::string& output_name,
                         std::vector<std::string>& peers) const {
    for (const auto& r : records_in(t)) {
      if (r.output_name == output_name) continue;
      if (std::find(peers.begin(), peers.end(), r.output_name) != peers.end())
        continue;
      std::set<std::string> visited;
      if (reaches(r, output_name, visited)) peers.push_back(r.output_name);
    }
  }

  std::string
  cpp_types::value(const literal& l, const type_ref& t) const {
    return render(l, scope_, t, scope_, 0);
  }

  std::string
  cpp_types::render(const literal& l, const name_scope& literal_scope,
                    const type_ref& t, const name_scope& type_scope,
                    int hops) const {
    auto [u, uscope] = type_scope.underlying_type(t);
    std::optional<entity_ref> entity;
    if (u.is_named()) entity = uscope.resolve_type(u);

    if (l.kind() == literal_kind::identifier) {
      if (entity && entity->kind == entity_kind::enum_) {
        if (auto ev = literal_scope.find_enum_value(l.text()))
          return global_name(ev->enum_output_name) +
                 "::" + escape_identifier(ev->value->name);
      }
      auto c = literal_scope.find_constant(l.text());
      if (!c) {
        throw std::runtime_error("cpp_types: unresolved identifier '" +
                                 l.text() + "'");
      }
      if (hops > max_constant_hops) {
        throw std::runtime_error("cpp_types: constant cycle through '" +
                                 l.text() + "'");
      }
      return render(c->decl->value, literal_scope.group().scope(c->module), u,
                    uscope, hops + 1);
    }

    cpp_types in_type_scope(*types_, uscope);

    switch (u.kind()) {
    case type_kind::base:
      switch (u.base()) {
      case base_type::boolean:
        if (l.kind() == literal_kind::boolean)
          return l.bool_value() ? "true" : "false";
        if (l.kind() == literal_kind::integer)
          return l.int_value() != 0 ? "true" : "false";
        mismatch(l, t);
      case base_type::byte:
      case base_type::i16:
      case base_type::i32:
      case base_type::i64:
        if (l.kind() == literal_kind::integer) return integer_text(l.int_value());
        if (l.kind() == literal_kind::boolean) return l.bool_value() ? "1" : "0";
        mismatch(l, t);
      case base_type::double_:
        if (l.kind() == literal_kind::floating)
          return double_text(l.double_value());
        if (l.kind() == literal_kind::integer)
          return double_text(static_cast<double>(l.int_value()));
        mismatch(l, t);
      case base_type::string:
      case base_type::binary:
        if (l.kind() == literal_kind::string) return quote_string(l.text());
        mismatch(l, t);
      }
      mismatch(l, t);

    case type_kind::list:
    case type_kind::set: {
      if (l.kind() != literal_kind::list) mismatch(l, t);
      std::string out = in_type_scope.name(u) + "{";
      for (std::size_t i = 0; i < l.elements().size(); ++i) {
        if (i > 0) out += ", ";
        out += render(l.elements()[i], literal_scope, u.element_type(), uscope,
                      hops);
      }
      return out + "}";
    }

    case type_kind::map: {
      if (l.kind() != literal_kind::map) mismatch(l, t);
      std::string out = in_type_scope.name(u) + "{";
      for (std::size_t i = 0; i < l.entries().size(); ++i) {
        const auto& [key, value] = l.entries()[i];
        if (i > 0) out += ", ";
        out += "{" + render(key, literal_scope, u.key_type(), uscope, hops) +
               ", " +
               render(value, literal_scope, u.value_type(), uscope, hops) + "}";
      }
      return out + "}";
    }

    case type_kind::named: {
      if (entity->kind == entity_kind::enum_) {
        if (l.kind() != literal_kind::integer) mismatch(l, t);
        return "static_cast<" + global_name(entity->output_name) + ">(" +
               integer_text(l.int_value()) + ")";
      }

      if (l.kind() != literal_kind::map) mismatch(l, t);
      const auto& decl = *entity->struct_decl;
      auto struct_scope = uscope.group().scope(entity->module);
      cpp_types in_struct_scope(*types_, struct_scope);

      for (const auto& [key, value] : l.entries()) {
        if (key.kind() != literal_kind::string ||
            decl.find_field(key.text()) == nullptr) {
          throw std::runtime_error("cpp_types: '" + entity->output_name +
                                   "' has no field named in struct literal");
        }
      }

      // Designated initializers must follow declaration order.
      const auto type_name = global_name(entity->output_name);
      std::string out = type_name + "{";
      bool first = true;
      for (const auto& f : decl.fields) {
        auto it = std::find_if(
            l.entries().begin(), l.entries().end(),
            [&](const auto& entry) { return entry.first.text() == f.name; });
        if (it == l.entries().end()) continue;
        if (!first) out += ", ";
        first = false;

        auto rendered =
            render(it->second, literal_scope, f.type, struct_scope, hops);
        if (in_struct_scope.refers_to(f.type, entity->output_name)) {
          rendered = "std::make_unique<" + in_struct_scope.name(f.type) +
                     ">(" + rendered + ")";
        }
        out += "." + escape_identifier(f.name) + " = " + rendered;
      }
      return out + "}";
    }
    }
    mismatch(l, t);
  }

} // namespace thriftgen
