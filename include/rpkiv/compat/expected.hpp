#pragma once
/**
 * @file expected.hpp
 * @brief rpkiv_detail::expected / unexpected: std::expected when the library has it, tl::expected otherwise.
 * @details Every fallible setup or parse operation in rpkiv (prefix parsing, PDU decoding,
 *          transports, config loading, ring and pool construction) returns through these
 *          aliases. RPKIV_STD_EXPECTED is 1 when the standard implementation is in use.
 */

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
#include <expected>
#define RPKIV_STD_EXPECTED 1
namespace rpkiv_detail {
    template <class T, class E> using expected   = std::expected<T, E>;
    template <class E>          using unexpected = std::unexpected<E>;
} // namespace rpkiv_detail
#else
#include <tl/expected.hpp>
#define RPKIV_STD_EXPECTED 0
namespace rpkiv_detail {
    template <class T, class E> using expected   = tl::expected<T, E>;
    template <class E>          using unexpected = tl::unexpected<E>;
} // namespace rpkiv_detail
#endif
