#pragma once

#include <thriftgen/cpp_code.hpp>

#include <string>

namespace thriftgen {

  class cpp_writer {
  public:
    std::string
    write(const cpp_file& file) const;
  };

} // namespace thriftgen
