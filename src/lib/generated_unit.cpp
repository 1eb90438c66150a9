#include <thriftgen/generated_unit.hpp>

#include <map>
#include <set>
#include <string>
#include <utility>

namespace thriftgen {

  namespace {

    // Appends `from` to `into`: includes without duplicates, declarations of
    // same-named namespaces concatenated.
    void
    append_file(cpp_file& into, cpp_file from) {
      std::set<std::string> existing;
      for (const auto& inc : into.includes)
        existing.insert(inc.path);
      for (auto& inc : from.includes) {
        if (existing.insert(inc.path).second)
          into.includes.push_back(std::move(inc));
      }

      for (auto& ns : from.namespaces) {
        bool found = false;
        for (auto& existing_ns : into.namespaces) {
          if (existing_ns.name == ns.name) {
            for (auto& decl : ns.declarations)
              existing_ns.declarations.push_back(std::move(decl));
            found = true;
            break;
          }
        }
        if (!found) into.namespaces.push_back(std::move(ns));
      }
    }

    // Body order follows first/second; metadata comes from the type unit.
    type_definition
    merge_type_and_constant(cpp_file first, cpp_file second,
                            unit_origin origin, std::string filename) {
      cpp_file merged = std::move(first);
      append_file(merged, std::move(second));

      // The constants included the type's header, which is now this one.
      const auto self = "\"" + filename + "\"";
      std::erase_if(merged.includes,
                    [&self](const cpp_include& inc) { return inc.path == self; });
      merged.filename = std::move(filename);
      return type_definition{origin, std::move(merged)};
    }

  } // namespace

  std::string_view
  to_string(unit_origin o) {
    switch (o) {
    case unit_origin::enum_: return "enum";
    case unit_origin::struct_: return "struct";
    case unit_origin::union_: return "union";
    case unit_origin::exception: return "exception";
    case unit_origin::service: return "service";
    case unit_origin::behaviour: return "behaviour";
    case unit_origin::test_data: return "test_data";
    }
    return "";
  }

  const cpp_file&
  generated_unit::file() const {
    return std::visit([](const auto& k) -> const cpp_file& { return k.file; },
                      kind);
  }

  std::string
  generated_unit::kind_name() const {
    if (const auto* t = std::get_if<type_definition>(&kind))
      return std::string(to_string(t->origin));
    return "constant";
  }

  std::string
  name_collision::message() const {
    return "name collision on '" + name + "' between " + first_kind + " and " +
           second_kind + " modules";
  }

  std::variant<generated_unit, name_collision>
  merge_units(generated_unit first, generated_unit second) {
    name_collision collision{first.name, first.kind_name(),
                             second.kind_name()};
    std::string name = first.name;

    return std::visit(
        [&](auto& a, auto& b) -> std::variant<generated_unit, name_collision> {
          using A = std::decay_t<decltype(a)>;
          using B = std::decay_t<decltype(b)>;
          if constexpr (std::is_same_v<A, type_definition> &&
                        std::is_same_v<B, constant_definition>) {
            auto filename = a.file.filename;
            return generated_unit{
                name, merge_type_and_constant(std::move(a.file),
                                              std::move(b.file), a.origin,
                                              std::move(filename))};
          } else if constexpr (std::is_same_v<A, constant_definition> &&
                               std::is_same_v<B, type_definition>) {
            auto filename = b.file.filename;
            return generated_unit{
                name, merge_type_and_constant(std::move(a.file),
                                              std::move(b.file), b.origin,
                                              std::move(filename))};
          } else {
            return collision;
          }
        },
        first.kind, second.kind);
  }

  collision_resolution
  resolve_name_collisions(std::vector<generated_unit> units) {
    collision_resolution result;
    std::map<std::string, std::size_t> index_of;

    for (auto& unit : units) {
      auto it = index_of.find(unit.name);
      if (it == index_of.end()) {
        index_of.emplace(unit.name, result.units.size());
        result.units.push_back(std::move(unit));
        continue;
      }

      auto merged = merge_units(result.units[it->second], std::move(unit));
      if (auto* collision = std::get_if<name_collision>(&merged)) {
        result.collision = std::move(*collision);
        return result;
      }
      result.units[it->second] = std::move(std::get<generated_unit>(merged));
    }
    return result;
  }

} // namespace thriftgen
