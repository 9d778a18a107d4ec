/**
 * @file NonCopyable.hpp
 * @brief CRTP base class that deletes copy operations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_CORE_NON_COPYABLE_HPP
    #define ORB_CORE_NON_COPYABLE_HPP

namespace orb::core {

/**
 * @brief Inherit to disable copy construction and assignment.
 *
 * Audio nodes, graphs and controllers own engine-side resources whose
 * identity matters (a node is referenced by the edges pointing at it), so
 * they derive from this instead of relying on implicit copies.
 *
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

} // namespace orb::core

#endif // ORB_CORE_NON_COPYABLE_HPP
