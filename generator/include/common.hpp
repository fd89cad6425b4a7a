//! # Result
//!
//! wrapgen reports failures as values. A fallible operation returns
//! `Result<T>`, holding either its value or a human-readable message, and the
//! caller tests it with `is_ok` / `is_err` before unwrapping:
//!
//! ```cpp
//! auto config = config::load_config(path);
//! if (is_err(config)) {
//!     std::cerr << unwrap_err(config) << "\n";
//! }
//! ```
//!
//! The analysis passes themselves are total and never return a Result.

#ifndef WRAPGEN_COMMON_HPP
#define WRAPGEN_COMMON_HPP

#include <string>
#include <variant>

namespace wrapgen {

template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E> [[nodiscard]] constexpr bool is_ok(const Result<T, E>& r) {
    return std::holds_alternative<T>(r);
}

template <typename T, typename E> [[nodiscard]] constexpr bool is_err(const Result<T, E>& r) {
    return std::holds_alternative<E>(r);
}

/// The held value. Only valid after is_ok().
template <typename T, typename E> [[nodiscard]] constexpr T& unwrap(Result<T, E>& r) {
    return std::get<0>(r);
}

template <typename T, typename E> [[nodiscard]] constexpr const T& unwrap(const Result<T, E>& r) {
    return std::get<0>(r);
}

/// The held message. Only valid after is_err().
template <typename T, typename E> [[nodiscard]] constexpr E& unwrap_err(Result<T, E>& r) {
    return std::get<1>(r);
}

template <typename T, typename E>
[[nodiscard]] constexpr const E& unwrap_err(const Result<T, E>& r) {
    return std::get<1>(r);
}

} // namespace wrapgen

#endif // WRAPGEN_COMMON_HPP
