#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace thriftgen {

  enum class literal_kind {
    boolean,
    integer,
    floating,
    string,
    list,
    map,
    identifier,
  };

  // A constant value as written in the IDL. Struct literals are maps keyed by
  // field name; identifiers name an enum value ("Color.RED") or a constant.
  class literal {
    literal_kind kind_ = literal_kind::integer;
    bool bool_value_ = false;
    std::int64_t int_value_ = 0;
    double double_value_ = 0.0;
    std::string text_;
    std::vector<literal> elements_;
    std::vector<std::pair<literal, literal>> entries_;

  public:
    literal() = default;

    static literal
    boolean(bool v) {
      literal l;
      l.kind_ = literal_kind::boolean;
      l.bool_value_ = v;
      return l;
    }

    static literal
    integer(std::int64_t v) {
      literal l;
      l.kind_ = literal_kind::integer;
      l.int_value_ = v;
      return l;
    }

    static literal
    floating(double v) {
      literal l;
      l.kind_ = literal_kind::floating;
      l.double_value_ = v;
      return l;
    }

    static literal
    string(std::string v) {
      literal l;
      l.kind_ = literal_kind::string;
      l.text_ = std::move(v);
      return l;
    }

    static literal
    identifier(std::string name) {
      literal l;
      l.kind_ = literal_kind::identifier;
      l.text_ = std::move(name);
      return l;
    }

    static literal
    list(std::vector<literal> elements) {
      literal l;
      l.kind_ = literal_kind::list;
      l.elements_ = std::move(elements);
      return l;
    }

    static literal
    map(std::vector<std::pair<literal, literal>> entries) {
      literal l;
      l.kind_ = literal_kind::map;
      l.entries_ = std::move(entries);
      return l;
    }

    literal_kind
    kind() const {
      return kind_;
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

    // string value or identifier name
    const std::string&
    text() const {
      return text_;
    }

    const std::vector<literal>&
    elements() const {
      return elements_;
    }

    const std::vector<std::pair<literal, literal>>&
    entries() const {
      return entries_;
    }

    bool
    operator==(const literal&) const = default;
  };

} // namespace thriftgen
