/**
 * @file Error.hpp
 * @brief Error value carried through std::expected
 *
 * Every fallible operation in the collector returns
 * std::expected<T, util::Error> instead of throwing.
 */

#pragma once

#include <expected>
#include <string>
#include <utility>

namespace util {

/**
 * @struct Error
 * @brief Represents an error with a message and optional code
 */
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }
};

/**
 * @brief Shorthand for returning an error from a std::expected function
 *
 * @code
 * auto open(const std::string& path) -> std::expected<void, util::Error> {
 *     if (path.empty()) {
 *         return util::fail("Empty path");
 *     }
 *     return {};
 * }
 * @endcode
 */
[[nodiscard]] inline auto fail(std::string message, int code = 0) -> std::unexpected<Error> {
    return std::unexpected(Error{std::move(message), code});
}

}  // namespace util
