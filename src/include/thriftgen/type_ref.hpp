#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace thriftgen {

  enum class base_type { boolean, byte, i16, i32, i64, double_, string, binary };

  enum class type_kind { base, list, set, map, named };

  std::string_view
  to_string(base_type t);

  // A declared Thrift type. Named references are kept as written in the IDL
  // ("Point" or "shared.Point") and resolved through a name_scope.
  class type_ref {
    type_kind kind_ = type_kind::base;
    base_type base_ = base_type::i32;
    std::string name_;
    std::vector<type_ref> params_;

  public:
    type_ref() = default;

    static type_ref
    of(base_type t) {
      type_ref r;
      r.kind_ = type_kind::base;
      r.base_ = t;
      return r;
    }

    static type_ref
    list_of(type_ref element) {
      type_ref r;
      r.kind_ = type_kind::list;
      r.params_.push_back(std::move(element));
      return r;
    }

    static type_ref
    set_of(type_ref element) {
      type_ref r;
      r.kind_ = type_kind::set;
      r.params_.push_back(std::move(element));
      return r;
    }

    static type_ref
    map_of(type_ref key, type_ref value) {
      type_ref r;
      r.kind_ = type_kind::map;
      r.params_.push_back(std::move(key));
      r.params_.push_back(std::move(value));
      return r;
    }

    static type_ref
    named(std::string name) {
      type_ref r;
      r.kind_ = type_kind::named;
      r.name_ = std::move(name);
      return r;
    }

    type_kind
    kind() const {
      return kind_;
    }

    bool
    is_base() const {
      return kind_ == type_kind::base;
    }

    bool
    is_named() const {
      return kind_ == type_kind::named;
    }

    base_type
    base() const {
      return base_;
    }

    const std::string&
    name() const {
      return name_;
    }

    // list and set element
    const type_ref&
    element_type() const {
      return params_.front();
    }

    const type_ref&
    key_type() const {
      return params_.front();
    }

    const type_ref&
    value_type() const {
      return params_.back();
    }

    bool
    operator==(const type_ref&) const = default;
  };

  // IDL spelling: "i32", "list<string>", "map<string, shared.Point>"
  std::string
  to_string(const type_ref& t);

} // namespace thriftgen
