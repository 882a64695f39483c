#pragma once

#include <oag/cpp_code.hpp>

#include <string>

namespace oag {

  class cpp_writer {
  public:
    std::string
    write(const cpp_file& file) const;
  };

} // namespace oag
