#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace ib {

  // Line-oriented text writer. Indentation is emitted lazily, at the first
  // write of each line, so blank lines carry no trailing whitespace.
  class indent_writer {
    std::ostream* os_;
    std::string unit_;
    std::size_t level_;
    bool at_line_start_ = true;

  public:
    explicit indent_writer(std::ostream& os, std::string unit = "    ",
                           std::size_t level = 0);

    indent_writer&
    w(std::string_view text);

    indent_writer&
    wl(std::string_view text);

    indent_writer&
    wl();

    void
    nested(const std::function<void()>& body);

    void
    nested_n(std::size_t levels, const std::function<void()>& body);

    // "{", nested body, "}"
    void
    braced(const std::function<void()>& body);

    std::size_t
    level() const {
      return level_;
    }

    std::ostream&
    stream() {
      return *os_;
    }
  };

  using writer_factory = std::function<indent_writer(std::ostream&)>;

} // namespace ib
