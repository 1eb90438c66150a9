#include <thriftgen/type_map.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace thriftgen {

  type_map
  type_map::defaults() {
    type_map map;

    map.set("bool", {"bool", ""});
    map.set("double", {"double", ""});

    map.set("byte", {"std::int8_t", "<cstdint>"});
    map.set("i16", {"std::int16_t", "<cstdint>"});
    map.set("i32", {"std::int32_t", "<cstdint>"});
    map.set("i64", {"std::int64_t", "<cstdint>"});

    map.set("string", {"std::string", "<string>"});
    map.set("binary", {"std::string", "<string>"});

    map.set("list", {"std::vector", "<vector>"});
    map.set("set", {"std::set", "<set>"});
    map.set("map", {"std::map", "<map>"});

    return map;
  }

  namespace {

    const std::set<std::string> known_thrift_types = {
        "bool", "byte",   "i16",    "i32",  "i64", "double",
        "string", "binary", "list", "set",  "map",
    };

    bool
    is_whitespace_only(std::string_view sv) {
      return !sv.empty() && std::all_of(sv.begin(), sv.end(), [](char c) {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
      });
    }

    bool
    read_skip_ws(xml_reader& reader) {
      while (reader.read()) {
        if (reader.node_type() == xml_node_type::characters &&
            is_whitespace_only(reader.text()))
          continue;
        return true;
      }
      return false;
    }

    std::string
    required_attribute(const xml_reader& reader, std::string_view name) {
      const auto* value = reader.find_attribute(name);
      if (value == nullptr) {
        throw std::runtime_error("type_map::load: line " +
                                 std::to_string(reader.line()) +
                                 ": <mapping> is missing '" +
                                 std::string(name) + "'");
      }
      return *value;
    }

  } // namespace

  type_map
  type_map::load(xml_reader& reader) {
    if (!read_skip_ws(reader) ||
        reader.node_type() != xml_node_type::start_element ||
        reader.name() != "typemap") {
      throw std::runtime_error(
          "type_map::load: expected <typemap> root element");
    }

    type_map result;

    while (read_skip_ws(reader)) {
      if (reader.node_type() == xml_node_type::end_element &&
          reader.name() == "typemap") {
        break;
      }

      if (reader.node_type() != xml_node_type::start_element ||
          reader.name() != "mapping") {
        throw std::runtime_error(
            "type_map::load: unexpected element inside <typemap>");
      }

      auto thrift_type = required_attribute(reader, "thrift-type");
      auto cpp_type = required_attribute(reader, "cpp-type");
      const auto* header = reader.find_attribute("cpp-header");
      std::string cpp_header = header != nullptr ? *header : std::string();

      if (known_thrift_types.find(thrift_type) == known_thrift_types.end()) {
        throw std::runtime_error("type_map::load: unknown thrift-type '" +
                                 thrift_type + "'");
      }

      result.set(std::move(thrift_type),
                 {std::move(cpp_type), std::move(cpp_header)});

      // Advance past end_element for this mapping
      read_skip_ws(reader);
    }

    return result;
  }

  void
  type_map::merge(const type_map& overrides) {
    for (const auto& [thrift_type, mapping] : overrides.entries_) {
      if (entries_.find(thrift_type) == entries_.end()) {
        throw std::runtime_error(
            "type_map::merge: cannot override unknown thrift-type '" +
            thrift_type + "'");
      }
      entries_[thrift_type] = mapping;
    }
  }

  const type_mapping*
  type_map::find(const std::string& thrift_type) const {
    auto it = entries_.find(thrift_type);
    if (it == entries_.end()) return nullptr;
    return &it->second;
  }

  const type_mapping&
  type_map::at(const std::string& thrift_type) const {
    const auto* mapping = find(thrift_type);
    if (mapping == nullptr) {
      throw std::runtime_error("type_map: no mapping for '" + thrift_type +
                               "'");
    }
    return *mapping;
  }

  void
  type_map::set(std::string thrift_type, type_mapping mapping) {
    entries_.insert_or_assign(std::move(thrift_type), std::move(mapping));
  }

  std::size_t
  type_map::size() const {
    return entries_.size();
  }

  bool
  type_map::contains(const std::string& thrift_type) const {
    return entries_.count(thrift_type) != 0;
  }

} // namespace thriftgen
