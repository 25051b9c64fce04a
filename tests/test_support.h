#pragma once

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <etl/string_view.h>

#define TEST_ASSERT(cond)                                                      \
  do {                                                                         \
    if (!(cond)) {                                                             \
      fprintf(stderr, "[FATAL] Assertion failed at %s:%d: %s\n", __FILE__,   \
              __LINE__, #cond);                                                \
      abort();                                                                 \
    }                                                                          \
  } while (0)

#define TEST_ASSERT_EQ_UINT(actual, expected)                                  \
  do {                                                                         \
    const unsigned long _a = (unsigned long)(actual);                          \
    const unsigned long _e = (unsigned long)(expected);                        \
    if (_a != _e) {                                                            \
      fprintf(stderr,                                                          \
              "[FATAL] Assertion failed at %s:%d: %s == %s (got %lu, exp %lu)\n", \
              __FILE__, __LINE__, #actual, #expected, _a, _e);                 \
      abort();                                                                 \
    }                                                                          \
  } while (0)

#define TEST_ASSERT_EQ_STR(actual, expected)                                   \
  do {                                                                         \
    const etl::string_view _a(actual);                                         \
    const etl::string_view _e(expected);                                       \
    if (!(_a == _e)) {                                                         \
      fprintf(stderr,                                                          \
              "[FATAL] Assertion failed at %s:%d: %s == %s (got '%.*s', exp '%.*s')\n", \
              __FILE__, __LINE__, #actual, #expected, (int)_a.size(), _a.data(), \
              (int)_e.size(), _e.data());                                      \
      abort();                                                                 \
    }                                                                          \
  } while (0)

#define RUN_TEST(fn)                                                           \
  do {                                                                         \
    printf("Running %s...\n", #fn);                                            \
    fn();                                                                      \
  } while (0)
