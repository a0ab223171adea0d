/**
 * @file Constants.hpp
 * @brief Library-wide compile-time defaults.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_CORE_CONSTANTS_HPP
    #define SPX_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace spx::core {

inline constexpr usize kDefaultFrameSize        = 256;
inline constexpr usize kDefaultHopSize          = 128;

/// Centre angular frequency of the Morlet wavelet (radians per unit scale).
inline constexpr f64   kDefaultMorletOmega      = 6.0;
inline constexpr f64   kDefaultMexicanHatWidth  = 6.0;

/// Largest |A(i,j) - A(j,i)| accepted by the symmetric eigensolver.
inline constexpr f64   kSymmetryTolerance       = 1e-9;

} // namespace spx::core

#endif // SPX_CORE_CONSTANTS_HPP
