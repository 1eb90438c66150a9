#include <thriftgen/value.hpp>

#include <thriftgen/cpp_types.hpp>

#include <algorithm>
#include <cstdio>

namespace thriftgen {

  value
  value::set(std::vector<value> elements) {
    value r;
    r.kind_ = value_kind::set;
    for (auto& e : elements) {
      if (std::find(r.elements_.begin(), r.elements_.end(), e) ==
          r.elements_.end())
        r.elements_.push_back(std::move(e));
    }
    return r;
  }

  value
  value::map(std::vector<std::pair<value, value>> entries) {
    value r;
    r.kind_ = value_kind::map;
    for (auto& [k, v] : entries) {
      auto it = std::find_if(r.entries_.begin(), r.entries_.end(),
                             [&](const auto& entry) { return entry.first == k; });
      if (it == r.entries_.end())
        r.entries_.emplace_back(std::move(k), std::move(v));
      else
        it->second = std::move(v);
    }
    return r;
  }

  const value*
  value::find_field(std::string_view name) const {
    for (const auto& [field_name, field_value] : fields_) {
      if (field_name == name) return &field_value;
    }
    return nullptr;
  }

  std::string
  to_string(const value& v) {
    switch (v.kind()) {
    case value_kind::absent: return "absent";
    case value_kind::boolean: return v.bool_value() ? "true" : "false";
    case value_kind::integer: return std::to_string(v.int_value());
    case value_kind::floating: {
      char buffer[64];
      std::snprintf(buffer, sizeof buffer, "%g", v.double_value());
      return buffer;
    }
    case value_kind::string: return quote_string(v.text());
    case value_kind::list:
    case value_kind::set: {
      std::string out = v.kind() == value_kind::list ? "[" : "{";
      for (std::size_t i = 0; i < v.elements().size(); ++i) {
        if (i > 0) out += ", ";
        out += to_string(v.elements()[i]);
      }
      return out + (v.kind() == value_kind::list ? "]" : "}");
    }
    case value_kind::map: {
      std::string out = "{";
      for (std::size_t i = 0; i < v.entries().size(); ++i) {
        if (i > 0) out += ", ";
        out += to_string(v.entries()[i].first) + ": " +
               to_string(v.entries()[i].second);
      }
      return out + "}";
    }
    case value_kind::record: {
      std::string out = global_name(v.text()) + "{";
      for (std::size_t i = 0; i < v.fields().size(); ++i) {
        if (i > 0) out += ", ";
        out += v.fields()[i].first + ": " + to_string(v.fields()[i].second);
      }
      return out + "}";
    }
    }
    return "";
  }

} // namespace thriftgen
