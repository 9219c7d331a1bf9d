#pragma once

#include <stdexcept>
#include <string>

namespace ib {

  // Fatal, unrecoverable generation failure. Raised for output folder
  // problems and output path collisions; caught only by generate().
  class generation_error : public std::runtime_error {
  public:
    explicit generation_error(const std::string& message)
        : std::runtime_error(message) {}
  };

} // namespace ib
