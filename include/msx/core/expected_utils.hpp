#pragma once

#include "exceptions.hpp"
#include <expected>
#include <string>

namespace msx::core {

/**
 * @brief Utilities for working with std::expected to reduce boilerplate
 *
 * Parsers and evaluators report failures through std::expected; these helpers
 * keep the propagation of those failures short at the call sites.
 */
namespace expected_utils {

/**
 * @brief Assign-or-return helper
 *
 * Usage:
 *   MSX_TRY_ASSIGN(value, some_expected_result);
 * Expands to:
 *   auto tmp = some_expected_result;
 *   if (!tmp) return std::unexpected(tmp.error());
 *   value = std::move(tmp.value());
 */
#define MSX_TRY_ASSIGN(lhs, expr)                                                             \
    do {                                                                                      \
        auto msx_try_tmp = (expr);                                                            \
        if (!msx_try_tmp)                                                                     \
            return std::unexpected(msx_try_tmp.error());                                      \
        lhs = std::move(msx_try_tmp.value());                                                 \
    } while (0)

/**
 * @brief Void-or-return helper
 *
 * Usage: MSX_TRY_VOID(some_void_expected_result);
 */
#define MSX_TRY_VOID(expr)                                                                    \
    do {                                                                                      \
        auto msx_try_tmp_void = (expr);                                                       \
        if (!msx_try_tmp_void)                                                                \
            return std::unexpected(msx_try_tmp_void.error());                                 \
    } while (0)

/**
 * @brief Prefix the message of an error with some context, keeping its type
 *
 * @tparam E Error type, must be constructible from a message
 * @param error The original error
 * @param context Text prepended to the original message
 * @return A new error of the same type
 */
template<typename E>
[[nodiscard]] auto with_context(const E& error, const std::string& context) -> E {
    E copy = error;
    copy.add_context(context);
    return copy;
}

} // namespace expected_utils

} // namespace msx::core
