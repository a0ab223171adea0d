/**
 * @file FftPlan.hpp
 * @brief Precomputed tables for an iterative radix-2 Cooley-Tukey FFT.
 *
 * A plan owns the bit-reversal permutation and the twiddle factors
 * e^{-2 pi i k / N} for one power-of-two size N.  Executing the plan copies
 * the input into bit-reversed order and runs log2(N) butterfly stages over
 * that owned buffer, so the caller's samples are never touched.  Plans are
 * immutable once created and may be reused for any number of transforms of
 * the same size (the STFT builds one per call and reuses it for every frame).
 *
 * @code
 *   auto plan = FftPlan::create(256);
 *   if (plan)
 *       auto spectrum = plan->execute(frame);
 * @endcode
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef SPX_DSP_FFTPLAN_HPP
    #define SPX_DSP_FFTPLAN_HPP

    #include "Spectrum.hpp"

    #include <spx/core/Expected.hpp>

    #include <span>
    #include <vector>

namespace spx::dsp {

class FftPlan final {
public:
    /**
     * @brief Builds the tables for a transform of @p size points.
     * @param size Transform length, must be a power of two.
     * @return The plan, or kLengthError for any other size.
     */
    [[nodiscard]] static core::Expected<FftPlan> create(core::usize size);

    /**
     * @brief Transforms complex samples.
     * @param input Exactly size() samples.
     * @return A freshly allocated spectrum, or kLengthError on size mismatch.
     */
    [[nodiscard]] core::Expected<Spectrum> execute(std::span<const Complex> input) const;

    /**
     * @brief Transforms real samples (imaginary parts taken as zero).
     */
    [[nodiscard]] core::Expected<Spectrum> execute(std::span<const core::f64> input) const;

    [[nodiscard]] core::usize size() const noexcept { return _size; }
    [[nodiscard]] core::u32 stageCount() const noexcept { return _log2Size; }

    /// Index of the input sample that lands at each output position before the first stage.
    [[nodiscard]] std::span<const core::usize> bitReversal() const noexcept { return _bitReversal; }

    /// Twiddle factors e^{-2 pi i k / N} for k in [0, N/2).
    [[nodiscard]] std::span<const Complex> twiddles() const noexcept { return _twiddles; }

private:
    explicit FftPlan(core::usize size);

    void butterflyStages(Spectrum &data) const;

    core::usize _size;
    core::u32 _log2Size;
    std::vector<core::usize> _bitReversal;
    std::vector<Complex> _twiddles;
};

} // namespace spx::dsp

#endif // SPX_DSP_FFTPLAN_HPP
