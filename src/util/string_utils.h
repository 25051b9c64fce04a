#ifndef MESHLINK_UTIL_STRING_UTILS_H
#define MESHLINK_UTIL_STRING_UTILS_H

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>

#include <etl/string.h>
#include <etl/string_view.h>
#include <etl/vector.h>

namespace meshlink {

inline bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

inline etl::string_view view_of(const etl::istring& s) {
  return etl::string_view(s.data(), s.size());
}

inline etl::string_view trim(etl::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && is_space(text[begin])) {
    ++begin;
  }
  while (end > begin && is_space(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

inline bool contains(etl::string_view haystack, const char* needle) {
  const size_t n = strlen(needle);
  if (n == 0) {
    return true;
  }
  if (haystack.size() < n) {
    return false;
  }
  for (size_t i = 0; i + n <= haystack.size(); ++i) {
    if (memcmp(haystack.data() + i, needle, n) == 0) {
      return true;
    }
  }
  return false;
}

/**
 * @brief Copy a view into a bounded string.
 * @return false if the source did not fit and was truncated.
 */
inline bool assign_bounded(etl::istring& out, etl::string_view src) {
  out.clear();
  const size_t n = src.size() < out.max_size() ? src.size() : out.max_size();
  out.assign(src.data(), n);
  return n == src.size();
}

/**
 * @brief Render a decimal without trailing zeros ("906.875", "250").
 *
 * Four fractional digits covers every LoRa frequency and bandwidth step.
 */
inline void format_decimal(double value, etl::istring& out) {
  char buf[32];
  int n = snprintf(buf, sizeof(buf), "%.4f", value);
  if (n <= 0) {
    out.clear();
    return;
  }
  size_t len = static_cast<size_t>(n) < sizeof(buf) ? static_cast<size_t>(n) : sizeof(buf) - 1;
  if (memchr(buf, '.', len) != nullptr) {
    while (len > 0 && buf[len - 1] == '0') {
      --len;
    }
    if (len > 0 && buf[len - 1] == '.') {
      --len;
    }
  }
  out.assign(buf, len);
}

/**
 * @brief Split a command line on whitespace into argument tokens.
 *
 * Double quotes group a token that contains spaces. No escapes.
 * @return false if a token or the token count exceeded capacity.
 */
template <size_t TOKEN_MAX, size_t COUNT_MAX>
bool split_command_line(etl::string_view line,
                        etl::vector<etl::string<TOKEN_MAX>, COUNT_MAX>& out) {
  out.clear();
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && is_space(line[i])) {
      ++i;
    }
    if (i >= line.size()) {
      break;
    }
    if (out.full()) {
      return false;
    }
    etl::string<TOKEN_MAX> token;
    bool quoted = false;
    while (i < line.size() && (quoted || !is_space(line[i]))) {
      if (line[i] == '"') {
        quoted = !quoted;
      } else {
        if (token.full()) {
          return false;
        }
        token.push_back(line[i]);
      }
      ++i;
    }
    out.push_back(token);
  }
  return true;
}

}  // namespace meshlink

#endif  // MESHLINK_UTIL_STRING_UTILS_H
