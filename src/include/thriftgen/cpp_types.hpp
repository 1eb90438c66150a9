#pragma once

#include <thriftgen/cpp_code.hpp>
#include <thriftgen/file_group.hpp>
#include <thriftgen/type_map.hpp>

#include <set>
#include <string>
#include <vector>

namespace thriftgen {

  // Adds an include unless an identical one is already present.
  void
  add_include(std::vector<cpp_include>& includes, std::string path);

  // C++ spelling of Thrift types and literals as seen from one schema.
  // Typedefs are expanded to their targets; named types are qualified from
  // the global namespace ("::a::b::Point").
  class cpp_types {
    const type_map* types_;
    name_scope scope_;

  public:
    cpp_types(const type_map& types, name_scope scope)
        : types_(&types), scope_(scope) {}

    const name_scope&
    scope() const {
      return scope_;
    }

    std::string
    name(const type_ref& t) const;

    // Headers needed to spell t. References to `self` (the unit being
    // generated) are skipped.
    void
    collect_includes(const type_ref& t, std::vector<cpp_include>& includes,
                     const std::string& self = {}) const;

    // A C++ expression of type name(t) holding the literal.
    std::string
    value(const literal& l, const type_ref& t) const;

    // True when t names, after typedef expansion, the record `output_name`
    // or a record whose fields lead back to it. Fields of such types are
    // held through std::unique_ptr.
    bool
    refers_to(const type_ref& t, const std::string& output_name) const;

    // Records reachable from t, through containers and typedefs, that lie
    // on a reference cycle with `output_name`, excluding `output_name`
    // itself. Each name is added once.
    void
    cycle_peers(const type_ref& t, const std::string& output_name,
                std::vector<std::string>& peers) const;

  private:
    // Records named anywhere in t, after typedef and container expansion.
    std::vector<entity_ref>
    records_in(const type_ref& t) const;

    // True when `target` is reachable from `from` through record fields.
    bool
    reaches(const entity_ref& from, const std::string& target,
            std::set<std::string>& visited) const;

    // Identifiers in `l` resolve in literal_scope; names in `t` resolve in
    // type_scope.
    std::string
    render(const literal& l, const name_scope& literal_scope, const type_ref& t,
           const name_scope& type_scope, int hops) const;
  };

  // "a::b::Point" -> "::a::b::Point"
  std::string
  global_name(const std::string& output_name);

  // Quoted C++ string literal.
  std::string
  quote_string(const std::string& text);

} // namespace thriftgen
