#include <thriftgen/type_ref.hpp>

namespace thriftgen {

  std::string_view
  to_string(base_type t) {
    switch (t) {
    case base_type::boolean: return "bool";
    case base_type::byte: return "byte";
    case base_type::i16: return "i16";
    case base_type::i32: return "i32";
    case base_type::i64: return "i64";
    case base_type::double_: return "double";
    case base_type::string: return "string";
    case base_type::binary: return "binary";
    }
    return "";
  }

  std::string
  to_string(const type_ref& t) {
    switch (t.kind()) {
    case type_kind::base: return std::string(to_string(t.base()));
    case type_kind::list: return "list<" + to_string(t.element_type()) + ">";
    case type_kind::set: return "set<" + to_string(t.element_type()) + ">";
    case type_kind::map:
      return "map<" + to_string(t.key_type()) + ", " +
             to_string(t.value_type()) + ">";
    case type_kind::named: return t.name();
    }
    return "";
  }

} // namespace thriftgen
