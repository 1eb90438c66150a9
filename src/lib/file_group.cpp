#include <thriftgen/file_group.hpp>
#include <thriftgen/naming.hpp>

#include <stdexcept>

namespace thriftgen {

  namespace {

    const std::string target_language = "cpp";
    const std::string any_language = "*";

    // "shared.Point" -> {"shared", "Point"}; "Point" -> {"", "Point"}
    std::pair<std::string_view, std::string_view>
    split_module(std::string_view logical_name) {
      auto dot = logical_name.find('.');
      if (dot == std::string_view::npos) return {{}, logical_name};
      return {logical_name.substr(0, dot), logical_name.substr(dot + 1)};
    }

    std::vector<std::string_view>
    split_dots(std::string_view identifier) {
      std::vector<std::string_view> parts;
      while (true) {
        auto dot = identifier.find('.');
        if (dot == std::string_view::npos) break;
        parts.push_back(identifier.substr(0, dot));
        identifier.remove_prefix(dot + 1);
      }
      parts.push_back(identifier);
      return parts;
    }

  } // namespace

  std::string_view
  to_string(entity_kind k) {
    switch (k) {
    case entity_kind::typedef_: return "typedef";
    case entity_kind::struct_: return "struct";
    case entity_kind::union_: return "union";
    case entity_kind::exception: return "exception";
    case entity_kind::enum_: return "enum";
    }
    return "";
  }

  // ===== file_group =====

  void
  file_group::add(schema s) {
    if (find_schema(s.module()) != nullptr) {
      throw std::runtime_error("file_group: duplicate module '" + s.module() +
                               "'");
    }
    if (initial_module_.empty()) initial_module_ = s.module();
    schemas_.push_back(std::move(s));
  }

  const schema*
  file_group::find_schema(std::string_view module) const {
    for (const auto& s : schemas_) {
      if (s.module() == module) return &s;
    }
    return nullptr;
  }

  name_scope
  file_group::scope(std::string_view module) const {
    const auto* s = find_schema(module);
    if (s == nullptr) {
      throw std::runtime_error("file_group: unknown module '" +
                               std::string(module) + "'");
    }
    return name_scope(*this, *s);
  }

  // ===== name_scope =====

  name_scope::name_scope(const file_group& group, const schema& current)
      : group_(&group), schema_(&current) {}

  std::string
  name_scope::dest_module(std::string_view logical_name) const {
    auto [module_name, name] = split_module(logical_name);
    const schema* owner =
        module_name.empty() ? schema_ : group_->find_schema(module_name);
    if (owner == nullptr) {
      throw std::runtime_error("file_group: unknown module in '" +
                               std::string(logical_name) + "'");
    }

    const std::string* ns = owner->namespace_for(target_language);
    if (ns == nullptr) ns = owner->namespace_for(any_language);

    std::string result;
    if (ns != nullptr && !ns->empty()) {
      result = cpp_namespace_for(*ns);
      result += "::";
    }
    return result + initial_case(name);
  }

  std::string
  name_scope::constants_module() const {
    const auto& initial = group_->initial_module();
    return dest_module(initial + "." + camelize(initial));
  }

  bool
  name_scope::owns_constant(const constant_def& c) const {
    if (schema_->module() != group_->initial_module()) return false;
    return schema_->find_constant(c.name) != nullptr;
  }

  std::optional<entity_ref>
  name_scope::find_type(std::string_view logical_name) const {
    auto [module_name, name] = split_module(logical_name);
    const schema* owner =
        module_name.empty() ? schema_ : group_->find_schema(module_name);
    if (owner == nullptr) return std::nullopt;

    entity_ref ref;
    ref.module = owner->module();
    if (const auto* t = owner->find_typedef(name)) {
      ref.kind = entity_kind::typedef_;
      ref.typedef_decl = t;
    } else if (const auto* s = owner->find_struct(name)) {
      switch (s->kind) {
      case struct_kind::struct_: ref.kind = entity_kind::struct_; break;
      case struct_kind::union_: ref.kind = entity_kind::union_; break;
      case struct_kind::exception: ref.kind = entity_kind::exception; break;
      }
      ref.struct_decl = s;
    } else if (const auto* e = owner->find_enum(name)) {
      ref.kind = entity_kind::enum_;
      ref.enum_decl = e;
    } else {
      return std::nullopt;
    }

    ref.output_name = dest_module(ref.module + "." + std::string(name));
    return ref;
  }

  entity_ref
  name_scope::resolve_type(const type_ref& named) const {
    if (!named.is_named()) {
      throw std::runtime_error("file_group: '" + to_string(named) +
                               "' is not a named type");
    }
    auto ref = find_type(named.name());
    if (!ref) {
      throw std::runtime_error("file_group: unresolved type reference '" +
                               named.name() + "' in module '" + module() +
                               "'");
    }
    return *ref;
  }

  std::pair<type_ref, name_scope>
  name_scope::underlying_type(const type_ref& t) const {
    type_ref current = t;
    name_scope scope = *this;
    // Chains longer than 64 hops are treated as cycles.
    for (std::size_t hops = 0; current.is_named(); ++hops) {
      auto ref = scope.resolve_type(current);
      if (ref.kind != entity_kind::typedef_) break;
      if (hops > 64) {
        throw std::runtime_error("file_group: typedef cycle through '" +
                                 current.name() + "'");
      }
      current = ref.typedef_decl->target;
      scope = group_->scope(ref.module);
    }
    return {current, scope};
  }

  std::optional<constant_ref>
  name_scope::find_constant(std::string_view identifier) const {
    auto [module_name, name] = split_module(identifier);
    const schema* owner = schema_;
    if (!module_name.empty()) {
      owner = group_->find_schema(module_name);
      if (owner == nullptr) return std::nullopt;
    }
    if (const auto* c = owner->find_constant(name))
      return constant_ref{owner->module(), c};
    return std::nullopt;
  }

  std::optional<enum_value_ref>
  name_scope::find_enum_value(std::string_view identifier) const {
    auto parts = split_dots(identifier);
    const schema* owner = schema_;
    std::string_view enum_name;
    std::string_view value_name;

    if (parts.size() == 2) {
      enum_name = parts[0];
      value_name = parts[1];
    } else if (parts.size() == 3) {
      owner = group_->find_schema(parts[0]);
      enum_name = parts[1];
      value_name = parts[2];
    } else {
      return std::nullopt;
    }

    if (owner == nullptr) return std::nullopt;
    const auto* e = owner->find_enum(enum_name);
    if (e == nullptr) return std::nullopt;

    for (const auto& v : e->values) {
      if (v.name == value_name) {
        return enum_value_ref{
            dest_module(owner->module() + "." + std::string(enum_name)), &v};
      }
    }
    return std::nullopt;
  }

} // namespace thriftgen
