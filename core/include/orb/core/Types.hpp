/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every Orbit module.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef ORB_CORE_TYPES_HPP
    #define ORB_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace orb::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

} // namespace orb::core

#endif // ORB_CORE_TYPES_HPP
