#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <type_traits>

// ================================================================================
// Configuration
// ================================================================================

#ifndef BL_ASSERT_LEVEL
#ifdef NDEBUG
#define BL_ASSERT_LEVEL 1
#else
#define BL_ASSERT_LEVEL 3
#endif
#endif

namespace blink::core {
namespace assert_detail {

struct source_location {
  const char* file_;
  const char* function_;
  std::uint32_t line_;

  constexpr source_location(const char* file = __builtin_FILE(), const char* function = __builtin_FUNCTION(),
                            std::uint32_t line = __builtin_LINE()) noexcept
      : file_(file), function_(function), line_(line) {}
};

// ================================================================================
// Value printing
// ================================================================================

template <typename T>
inline void print_value(char* buf, std::uint64_t buf_size, const T& value) {
  using Type = std::decay_t<T>;
  if constexpr (std::is_same_v<Type, bool>) {
    std::snprintf(buf, buf_size, "%s", value ? "true" : "false");
  } else if constexpr (std::is_same_v<Type, char>) {
    std::snprintf(buf, buf_size, "'%c' (0x%02x)", value, static_cast<unsigned char>(value));
  } else if constexpr (std::is_integral_v<Type>) {
    if constexpr (std::is_signed_v<Type>) {
      std::snprintf(buf, buf_size, "%lld", static_cast<long long>(value));
    } else {
      std::snprintf(buf, buf_size, "%llu", static_cast<unsigned long long>(value));
    }
  } else if constexpr (std::is_floating_point_v<Type>) {
    std::snprintf(buf, buf_size, "%g", static_cast<double>(value));
  } else if constexpr (std::is_same_v<Type, const char*> || std::is_same_v<Type, char*>) {
    if (value == nullptr) {
      std::snprintf(buf, buf_size, "nullptr");
    } else {
      std::snprintf(buf, buf_size, "\"%.*s\"", static_cast<int>(buf_size - 3), value);
    }
  } else if constexpr (std::is_pointer_v<Type> || std::is_null_pointer_v<Type>) {
    if (value == nullptr) {
      std::snprintf(buf, buf_size, "nullptr");
    } else {
      std::snprintf(buf, buf_size, "%p", static_cast<const void*>(value));
    }
  } else {
    std::snprintf(buf, buf_size, "<unprintable>");
  }
}

// ================================================================================
// Assertion level
// ================================================================================

enum class assert_level {
  debug,   // Only in debug builds (BL_ASSERT_LEVEL >= 3)
  verify,  // Checked unless assertions are compiled out (BL_ASSERT_LEVEL >= 1)
  panic    // Always active, unconditional failure
};

// ================================================================================
// Failure handler
// ================================================================================

using failure_handler = void (*)(assert_level level, const char* expression, const char* message,
                                 const source_location& loc) noexcept;

inline void default_failure_handler(assert_level level, const char* expression, const char* message,
                                    const source_location& loc) noexcept {
  const char* level_str = [level]() {
    switch (level) {
      case assert_level::debug: {
        return "DEBUG_ASSERT";
      }
      case assert_level::verify: {
        return "VERIFICATION";
      }
      case assert_level::panic: {
        return "PANIC";
      }
      default: {
        return "ASSERTION";
      }
    }
  }();

  std::fprintf(stderr,
               "\n"
               "================================================================================\n"
               "%s FAILED\n"
               "--------------------------------------------------------------------------------\n"
               "Location: %s:%u\n"
               "Function: %s\n"
               "Expression: %s\n",
               level_str, loc.file_, loc.line_, loc.function_, expression);

  if (message != nullptr && message[0] != '\0') {
    std::fprintf(stderr, "Detailed:\n%s\n", message);
  }

  std::fprintf(stderr, "--------------------------------------------------------------------------------\n\n");
  std::fflush(stderr);
}

// Returns a reference to the process-wide handler.
inline failure_handler& get_failure_handler() noexcept {
  static failure_handler handler = default_failure_handler;
  return handler;
}

// Installs `handler` for every later failure; nullptr restores the default.
// The process aborts once the handler returns.
inline void set_failure_handler(failure_handler handler) noexcept {
  get_failure_handler() = handler ? handler : default_failure_handler;
}

// ================================================================================
// Core assertion implementation
// ================================================================================

[[noreturn, gnu::cold, gnu::noinline]]
inline void assertion_failed(assert_level level, const char* expression, const char* details,
                             const source_location& loc) noexcept {
  get_failure_handler()(level, expression, details, loc);
  std::abort();
}

[[gnu::always_inline]]
inline void check_assertion(assert_level level, bool passed, const char* expression, const char* message,
                            const source_location& location) noexcept {
  if (!passed) [[unlikely]] {
    assertion_failed(level, expression, message, location);
  }
}

template <typename L, typename R>
[[gnu::always_inline]]
inline void check_equal(assert_level level, const L& lhs, const R& rhs, const char* expression,
                        const source_location& location) noexcept {
  if (!(lhs == rhs)) [[unlikely]] {
    constexpr const std::uint64_t k_value_size{64};
    char lhs_buf[k_value_size] = {};
    char rhs_buf[k_value_size] = {};
    print_value(lhs_buf, sizeof(lhs_buf), lhs);
    print_value(rhs_buf, sizeof(rhs_buf), rhs);

    char details[2 * k_value_size + 32] = {};
    std::snprintf(details, sizeof(details), "\tLHS: %s\n\tRHS: %s", lhs_buf, rhs_buf);
    assertion_failed(level, expression, details, location);
  }
}

}  // namespace assert_detail
}  // namespace blink::core

// ================================================================================
// Public macros
// ================================================================================

#define BL_ASSERT_STRINGIFY_IMPL(x) #x
#define BL_ASSERT_STRINGIFY(x) BL_ASSERT_STRINGIFY_IMPL(x)

// BL_DEBUG_ASSERT - only active when BL_ASSERT_LEVEL >= 3
#if BL_ASSERT_LEVEL >= 3
#define BL_DEBUG_ASSERT(expr)                                                                                      \
  ::blink::core::assert_detail::check_assertion(::blink::core::assert_detail::assert_level::debug,                 \
                                                static_cast<bool>(expr), BL_ASSERT_STRINGIFY(expr), nullptr,       \
                                                ::blink::core::assert_detail::source_location{})

#define BL_DEBUG_ASSERT_MSG(expr, msg)                                                                             \
  ::blink::core::assert_detail::check_assertion(::blink::core::assert_detail::assert_level::debug,                 \
                                                static_cast<bool>(expr), BL_ASSERT_STRINGIFY(expr), msg,           \
                                                ::blink::core::assert_detail::source_location{})

#define BL_DEBUG_ASSERT_EQ(lhs, rhs)                                                                               \
  ::blink::core::assert_detail::check_equal(::blink::core::assert_detail::assert_level::debug, lhs, rhs,           \
                                            BL_ASSERT_STRINGIFY(lhs) " == " BL_ASSERT_STRINGIFY(rhs),              \
                                            ::blink::core::assert_detail::source_location{})
#else
#define BL_DEBUG_ASSERT(expr) ((void)0)
#define BL_DEBUG_ASSERT_MSG(expr, msg) ((void)0)
#define BL_DEBUG_ASSERT_EQ(lhs, rhs) ((void)0)
#endif

// BL_VERIFY - active when BL_ASSERT_LEVEL >= 1
#if BL_ASSERT_LEVEL >= 1
#define BL_VERIFY(expr)                                                                                            \
  ::blink::core::assert_detail::check_assertion(::blink::core::assert_detail::assert_level::verify,                \
                                                static_cast<bool>(expr), BL_ASSERT_STRINGIFY(expr), nullptr,       \
                                                ::blink::core::assert_detail::source_location{})

#define BL_VERIFY_MSG(expr, msg)                                                                                   \
  ::blink::core::assert_detail::check_assertion(::blink::core::assert_detail::assert_level::verify,                \
                                                static_cast<bool>(expr), BL_ASSERT_STRINGIFY(expr), msg,           \
                                                ::blink::core::assert_detail::source_location{})
#else
#define BL_VERIFY(expr) ((void)0)
#define BL_VERIFY_MSG(expr, msg) ((void)0)
#endif

// BL_PANIC - always active, unconditional failure
#define BL_PANIC(msg)                                                                                              \
  ::blink::core::assert_detail::assertion_failed(::blink::core::assert_detail::assert_level::panic, "PANIC", msg,  \
                                                 ::blink::core::assert_detail::source_location{})

// BL_UNREACHABLE - marks unreachable code
#define BL_UNREACHABLE()                                                                                           \
  ::blink::core::assert_detail::assertion_failed(::blink::core::assert_detail::assert_level::panic, "UNREACHABLE", \
                                                 "Code marked as unreachable was executed",                        \
                                                 ::blink::core::assert_detail::source_location{})
