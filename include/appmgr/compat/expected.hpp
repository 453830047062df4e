/**
* @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected.
 *
 * Provides a unified alias for expected/unexpected so the rest of the
 * codebase does not depend directly on a specific implementation.
 *
 * - When the standard library ships <expected>: uses std::expected.
 * - Otherwise: falls back to <tl/expected.hpp>, the header-only backport by
 *   TartanLlama (https://github.com/TartanLlama/expected).
 *
 * Only the C++23 core interface is used (has_value/value/error/operator*),
 * no monadic operations, so both backends behave the same.
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
  #include <expected>
  namespace appmgr_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace appmgr_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
