#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace thriftgen {

  enum class value_kind {
    absent,
    boolean,
    integer,
    floating,
    string,
    list,
    set,
    map,
    record,
  };

  // A dynamically typed instance of a Thrift type. Enum values are integers;
  // records keep their fields in declaration order.
  class value {
    value_kind kind_ = value_kind::absent;
    bool bool_value_ = false;
    std::int64_t int_value_ = 0;
    double double_value_ = 0.0;
    std::string text_;
    std::vector<value> elements_;
    std::vector<std::pair<value, value>> entries_;
    std::vector<std::pair<std::string, value>> fields_;

  public:
    value() = default;

    static value
    absent() {
      return value();
    }

    static value
    boolean(bool v) {
      value r;
      r.kind_ = value_kind::boolean;
      r.bool_value_ = v;
      return r;
    }

    static value
    integer(std::int64_t v) {
      value r;
      r.kind_ = value_kind::integer;
      r.int_value_ = v;
      return r;
    }

    static value
    floating(double v) {
      value r;
      r.kind_ = value_kind::floating;
      r.double_value_ = v;
      return r;
    }

    static value
    string(std::string v) {
      value r;
      r.kind_ = value_kind::string;
      r.text_ = std::move(v);
      return r;
    }

    static value
    list(std::vector<value> elements) {
      value r;
      r.kind_ = value_kind::list;
      r.elements_ = std::move(elements);
      return r;
    }

    // Duplicate elements are dropped, keeping the first.
    static value
    set(std::vector<value> elements);

    // Later entries replace earlier ones with an equal key.
    static value
    map(std::vector<std::pair<value, value>> entries);

    static value
    record(std::string type_name,
           std::vector<std::pair<std::string, value>> fields) {
      value r;
      r.kind_ = value_kind::record;
      r.text_ = std::move(type_name);
      r.fields_ = std::move(fields);
      return r;
    }

    value_kind
    kind() const {
      return kind_;
    }

    bool
    is_absent() const {
      return kind_ == value_kind::absent;
    }

    bool
    bool_value() const {
      return bool_value_;
    }

    std::int64_t
    int_value() const {
      return int_value_;
    }

    double
    double_value() const {
      return double_value_;
    }

    // string contents, or a record's type name
    const std::string&
    text() const {
      return text_;
    }

    const std::vector<value>&
    elements() const {
      return elements_;
    }

    const std::vector<std::pair<value, value>>&
    entries() const {
      return entries_;
    }

    const std::vector<std::pair<std::string, value>>&
    fields() const {
      return fields_;
    }

    // nullptr when the record has no such field.
    const value*
    find_field(std::string_view name) const;

    bool
    operator==(const value&) const = default;
  };

  // "::a::b::Point{x: 1, y: absent}", "[1, 2]", "{1, 2}", "{\"k\": 1}"
  std::string
  to_string(const value& v);

} // namespace thriftgen
