#include <thriftgen/schema.hpp>

namespace thriftgen {

  namespace {

    template <typename T>
    const T*
    find_by_name(const std::vector<T>& items, std::string_view name) {
      for (const auto& item : items) {
        if (item.name == name) return &item;
      }
      return nullptr;
    }

  } // namespace

  std::string_view
  to_string(struct_kind k) {
    switch (k) {
    case struct_kind::struct_: return "struct";
    case struct_kind::union_: return "union";
    case struct_kind::exception: return "exception";
    }
    return "";
  }

  void
  schema::add_struct(struct_def s) {
    switch (s.kind) {
    case struct_kind::struct_: structs_.push_back(std::move(s)); break;
    case struct_kind::union_: unions_.push_back(std::move(s)); break;
    case struct_kind::exception: exceptions_.push_back(std::move(s)); break;
    }
  }

  const typedef_def*
  schema::find_typedef(std::string_view name) const {
    return find_by_name(typedefs_, name);
  }

  const struct_def*
  schema::find_struct(std::string_view name) const {
    if (auto* s = find_by_name(structs_, name)) return s;
    if (auto* u = find_by_name(unions_, name)) return u;
    return find_by_name(exceptions_, name);
  }

  const enum_def*
  schema::find_enum(std::string_view name) const {
    return find_by_name(enums_, name);
  }

  const constant_def*
  schema::find_constant(std::string_view name) const {
    return find_by_name(constants_, name);
  }

  const service_def*
  schema::find_service(std::string_view name) const {
    return find_by_name(services_, name);
  }

} // namespace thriftgen
