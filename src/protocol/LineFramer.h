#ifndef MESHLINK_PROTOCOL_LINE_FRAMER_H
#define MESHLINK_PROTOCOL_LINE_FRAMER_H

#include <stddef.h>
#include <stdint.h>

#include <etl/string.h>
#include <etl/string_view.h>

namespace meshlink {

/**
 * @brief Splits a byte stream into newline-terminated lines.
 *
 * '\r' is dropped so CRLF and LF devices frame identically. A line longer
 * than LINE_MAX is discarded up to its newline and counted in overflows().
 */
template <size_t LINE_MAX>
class LineFramer {
 public:
  LineFramer() : _line(), _discarding(false), _overflows(0) {}

  /**
   * @brief Feed one byte.
   * @return true when @p out now holds a complete line (without terminator).
   */
  bool consume(char c, etl::istring& out) {
    if (c == '\r') {
      return false;
    }
    if (c == '\n') {
      if (_discarding) {
        _discarding = false;
        _line.clear();
        return false;
      }
      out.assign(_line.data(), _line.size());
      _line.clear();
      return true;
    }
    if (_discarding) {
      return false;
    }
    if (_line.full()) {
      _discarding = true;
      ++_overflows;
      return false;
    }
    _line.push_back(c);
    return false;
  }

  void reset() {
    _line.clear();
    _discarding = false;
  }

  size_t pending() const { return _line.size(); }

  // Retained head of the line being discarded, valid until its newline.
  etl::string_view discardedHead() const {
    return _discarding ? etl::string_view(_line.data(), _line.size()) : etl::string_view();
  }
  uint32_t overflows() const { return _overflows; }

 private:
  etl::string<LINE_MAX> _line;
  bool _discarding;
  uint32_t _overflows;
};

}  // namespace meshlink

#endif  // MESHLINK_PROTOCOL_LINE_FRAMER_H
