#ifndef MESHLINK_UTIL_POSIX_REGEX_H
#define MESHLINK_UTIL_POSIX_REGEX_H

#include <regex.h>
#include <stddef.h>

#include <etl/string_view.h>

namespace meshlink {

// Owns a compiled POSIX extended regular expression. A pattern that fails to
// compile never matches; regfree() is only called on a successful compile.
class PosixRegex {
 public:
  static constexpr size_t kMaxGroups = 6;

  explicit PosixRegex(const char* pattern, int flags = 0)
      : _compiled(regcomp(&_regex, pattern, REG_EXTENDED | flags) == 0) {}

  ~PosixRegex() {
    if (_compiled) {
      regfree(&_regex);
    }
  }

  PosixRegex(const PosixRegex&) = delete;
  PosixRegex& operator=(const PosixRegex&) = delete;

  bool valid() const { return _compiled; }

  bool matches(const char* text) const {
    return _compiled && regexec(&_regex, text, 0, nullptr, 0) == 0;
  }

  /**
   * @brief Search @p text and expose capture group @p index.
   * @return false on no match or when the group did not participate.
   */
  bool capture(const char* text, size_t index, etl::string_view& out) const {
    if (!_compiled || index >= kMaxGroups) {
      return false;
    }
    regmatch_t groups[kMaxGroups];
    if (regexec(&_regex, text, kMaxGroups, groups, 0) != 0) {
      return false;
    }
    if (groups[index].rm_so < 0) {
      return false;
    }
    out = etl::string_view(text + groups[index].rm_so,
                           static_cast<size_t>(groups[index].rm_eo - groups[index].rm_so));
    return true;
  }

  // Fills all kMaxGroups slots; unmatched groups come back empty.
  bool captureAll(const char* text, etl::string_view (&out)[kMaxGroups]) const {
    if (!_compiled) {
      return false;
    }
    regmatch_t groups[kMaxGroups];
    if (regexec(&_regex, text, kMaxGroups, groups, 0) != 0) {
      return false;
    }
    for (size_t i = 0; i < kMaxGroups; ++i) {
      if (groups[i].rm_so < 0) {
        out[i] = etl::string_view();
      } else {
        out[i] = etl::string_view(text + groups[i].rm_so,
                                  static_cast<size_t>(groups[i].rm_eo - groups[i].rm_so));
      }
    }
    return true;
  }

 private:
  regex_t _regex;
  bool _compiled;
};

}  // namespace meshlink

#endif  // MESHLINK_UTIL_POSIX_REGEX_H
