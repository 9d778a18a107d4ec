/**
 * @file Expected.hpp
 * @brief Expected<T> alias and the error-propagation macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_CORE_EXPECTED_HPP
    #define ORB_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>
    #include <utility>

namespace orb::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace orb::core

    #define ORB_CONCAT_IMPL(a, b) a##b
    #define ORB_CONCAT(a, b)      ORB_CONCAT_IMPL(a, b)

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type orb::core::ExpectedVoid.
 */
    #define ORB_TRY_VOID(expr)                                              \
        do {                                                                \
            auto &&_orb_result = (expr);                                    \
            if (!_orb_result.has_value()) [[unlikely]]                      \
                return std::unexpected(std::move(_orb_result.error()));     \
        } while (false)

/**
 * @brief Evaluate an Expected<U>, return its error or move its value into @p lhs.
 *
 * @p lhs may be a declaration:
 * @code
 * ORB_TRY_ASSIGN(auto graph, ParticipantAudioGraph::attach(...));
 * @endcode
 */
    #define ORB_TRY_ASSIGN(lhs, expr) ORB_TRY_ASSIGN_IMPL(ORB_CONCAT(_orb_try_, __LINE__), lhs, expr)

    #define ORB_TRY_ASSIGN_IMPL(tmp, lhs, expr)                             \
        auto &&tmp = (expr);                                                \
        if (!tmp.has_value()) [[unlikely]]                                  \
            return std::unexpected(std::move(tmp.error()));                 \
        lhs = std::move(*tmp)

#endif // ORB_CORE_EXPECTED_HPP
