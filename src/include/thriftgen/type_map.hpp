#pragma once

#include <thriftgen/xml_reader.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>

namespace thriftgen {

  // C++ spelling of a Thrift base or container type. Container mappings name
  // a class template ("std::vector") that is instantiated by the emitters.
  struct type_mapping {
    std::string cpp_type;
    std::string cpp_header;
  };

  class type_map {
    std::unordered_map<std::string, type_mapping> entries_;

  public:
    type_map() = default;

    static type_map
    defaults();

    // Reads <typemap><mapping thrift-type cpp-type cpp-header/></typemap>.
    static type_map
    load(xml_reader& reader);

    void
    merge(const type_map& overrides);

    const type_mapping*
    find(const std::string& thrift_type) const;

    // Like find, but throws std::runtime_error when no mapping exists.
    const type_mapping&
    at(const std::string& thrift_type) const;

    void
    set(std::string thrift_type, type_mapping mapping);

    std::size_t
    size() const;

    bool
    contains(const std::string& thrift_type) const;
  };

} // namespace thriftgen
