#include <ib/indent_writer.hpp>

#include <utility>

namespace ib {

  indent_writer::indent_writer(std::ostream& os, std::string unit,
                               std::size_t level)
      : os_(&os), unit_(std::move(unit)), level_(level) {}

  indent_writer&
  indent_writer::w(std::string_view text) {
    if (text.empty()) return *this;
    if (at_line_start_) {
      for (std::size_t i = 0; i < level_; ++i)
        *os_ << unit_;
      at_line_start_ = false;
    }
    *os_ << text;
    return *this;
  }

  indent_writer&
  indent_writer::wl(std::string_view text) {
    w(text);
    return wl();
  }

  indent_writer&
  indent_writer::wl() {
    *os_ << '\n';
    at_line_start_ = true;
    return *this;
  }

  void
  indent_writer::nested(const std::function<void()>& body) {
    nested_n(1, body);
  }

  void
  indent_writer::nested_n(std::size_t levels,
                          const std::function<void()>& body) {
    level_ += levels;
    try {
      body();
    } catch (...) {
      level_ -= levels;
      throw;
    }
    level_ -= levels;
  }

  void
  indent_writer::braced(const std::function<void()>& body) {
    wl("{");
    nested(body);
    wl("}");
  }

} // namespace ib
