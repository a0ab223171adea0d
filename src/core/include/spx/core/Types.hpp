/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every spx module.
 *
 * Provides fixed-width integer aliases, floating-point aliases and the
 * complex sample type used by the spectral transforms.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_CORE_TYPES_HPP
    #define SPX_CORE_TYPES_HPP

    #include <complex>
    #include <cstddef>
    #include <cstdint>

namespace spx::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

/**
 * @brief Complex value used for every spectrum and time-domain transform input.
 */
using Complex = std::complex<f64>;

} // namespace spx::core

#endif // SPX_CORE_TYPES_HPP
