#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#ifndef __has_builtin
#define __has_builtin(x) 0
#endif

#if !__has_builtin(__builtin_assume)
#define __builtin_assume(x)
#endif

[[noreturn]] void fwbase_assert_fail(const char *AssertionBody,
                                     const char *Message,
                                     const char *File,
                                     unsigned Line);
[[noreturn]] void fwbase_check_fail(const char *CheckBody,
                                    const char *Message,
                                    const char *File,
                                    unsigned Line);
[[noreturn]] void
fwbase_do_abort(const char *Message, const char *File, unsigned Line);

/// Turns an optional message argument into a C string (or null)
inline const char *fwbaseAssertMessage(const char *Message = nullptr) {
  return Message;
}

/// \brief Aborts program execution with a message, in release mode too.
#define fwbase_abort(...) \
  fwbase_do_abort(fwbaseAssertMessage(__VA_ARGS__), __FILE__, __LINE__)

#define fwbase_check_impl(what, message)                      \
  do {                                                        \
    bool Condition = static_cast<bool>(what);                 \
    if (!Condition) {                                         \
      fwbase_check_fail(#what, message, __FILE__, __LINE__); \
    }                                                         \
    __builtin_assume(Condition);                              \
  } while (0)

#ifndef NDEBUG

#define fwbase_assert_impl(what, message)                      \
  do {                                                         \
    bool Condition = static_cast<bool>(what);                  \
    if (!Condition) {                                          \
      fwbase_assert_fail(#what, message, __FILE__, __LINE__); \
    }                                                          \
    __builtin_assume(Condition);                               \
  } while (0)

#else

#define fwbase_assert_impl(what, message) \
  do {                                    \
    (void) sizeof((what));                \
  } while (0)

#endif

#define FWBASE_OVERLOAD_1_OR_2(_1, _2, NAME, ...) NAME

/// \brief Asserts \a what or, in debug mode, aborts with an optional message.
#define fwbase_assert(...)                                         \
  FWBASE_OVERLOAD_1_OR_2(__VA_ARGS__,                              \
                         fwbase_assert_impl,                       \
                         fwbase_assert_impl_nomsg)(__VA_ARGS__)
#define fwbase_assert_impl_nomsg(what) fwbase_assert_impl(what, nullptr)

/// \brief Asserts \a what or aborts with an optional message, in release mode
///        too.
#define fwbase_check(...)                                         \
  FWBASE_OVERLOAD_1_OR_2(__VA_ARGS__,                             \
                         fwbase_check_impl,                       \
                         fwbase_check_impl_nomsg)(__VA_ARGS__)
#define fwbase_check_impl_nomsg(what) fwbase_check_impl(what, nullptr)
