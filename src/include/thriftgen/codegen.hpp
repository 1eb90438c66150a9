#pragma once

#include <thriftgen/file_group.hpp>
#include <thriftgen/generated_unit.hpp>
#include <thriftgen/type_map.hpp>

#include <optional>
#include <string>
#include <vector>

namespace thriftgen {

  // Units of one schema before collision resolution.
  struct schema_output {
    std::vector<generated_unit> modules;
    std::vector<generated_unit> test_data;
  };

  // Both streams resolved independently.
  struct codegen_result {
    collision_resolution modules;
    collision_resolution test_data;

    bool
    ok() const {
      return modules.ok() && test_data.ok();
    }

    // The main stream's collision, else the test-data stream's.
    std::optional<name_collision>
    collision() const;
  };

  class codegen {
    const file_group& group_;
    const type_map& types_;

  public:
    codegen(const file_group& group, const type_map& types);

    // Main modules in the order enums, constants, structs, unions,
    // exceptions, services, behaviours; companions in the order typedefs,
    // structs, exceptions, unions, enums.
    schema_output
    generate_schema(const schema& s) const;

    // Every schema of the group, then resolution of each stream.
    codegen_result
    generate() const;

    // Target paths of the resolved main stream. Throws std::runtime_error on
    // a name collision.
    std::vector<std::string>
    targets() const;
  };

} // namespace thriftgen
