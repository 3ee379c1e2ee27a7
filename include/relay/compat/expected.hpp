/**
 * @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected (C++20).
 *
 * Setup paths (queue construction, socket binding, file opening, config
 * parsing) report failures through these aliases so the rest of the codebase
 * does not depend on a specific implementation.
 *
 * - In C++23 and later: uses <expected> from the standard library.
 * - In C++20: falls back to <tl/expected.hpp> (TartanLlama backport).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #include <expected>
  namespace relay_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace relay_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
