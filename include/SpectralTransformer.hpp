#pragma once
/**
 * @file SpectralTransformer.hpp
 * @brief Thin wrapper around FFTW for batched 3-D transforms between the
 *        centred spectral layout and real space.
 *
 * @details
 * Conventions (numpy `norm="forward"`):
 *  - backwardFFT: ifftshift, then f(x_j) = Σ_k F_k e^{+i k x_j} (no scaling).
 *  - forwardFFT : F_k = (1/N) Σ_j f(x_j) e^{-i k x_j}, then fftshift.
 * A batch of `howMany` contiguous (Ny, Nx, Nz) blocks is transformed per call.
 *
 * FFTW plans are memoised per (Nx, Ny, Nz, howMany) for the lifetime of the
 * program; each transformer owns its own aligned work arrays and executes
 * the shared plans through the new-array interface, so independent
 * simulations never share mutable buffers.
 */

#include "common.hpp"

/**
 * @class SpectralTransformer
 * @brief Batched complex-to-complex 3-D FFTs with the zero mode centred.
 *
 * @section usage Usage
 * Construct with the grid shape and batch size, then call backwardFFT to go
 * from centred spectral coefficients to real space and forwardFFT to return.
 */
class SpectralTransformer
{
  private:
    size_t Nx, Ny, Nz;         ///< Grid shape (layout Ny, Nx, Nz).
    size_t N;                  ///< Points per block.
    size_t howMany;            ///< Number of blocks per transform.
    fftw_plan forward_plan {nullptr};   ///< Memoised plan: forward (not owned).
    fftw_plan backward_plan {nullptr};  ///< Memoised plan: backward (not owned).
    fftw_complex *work_in {nullptr}, *work_out {nullptr}; ///< Aligned work arrays.
    std::vector<size_t> fftPosition;    ///< Centred flat index → FFT-ordered flat index.

  public:
    /**
     * @brief Construct transformer for howMany blocks on an (Ny, Nx, Nz) grid.
     */
    SpectralTransformer(size_t Nx, size_t Ny, size_t Nz, size_t howMany);

    /// Destructor: frees work arrays (plans stay memoised).
    ~SpectralTransformer();

    SpectralTransformer(const SpectralTransformer&) = delete;
    SpectralTransformer& operator=(const SpectralTransformer&) = delete;

    /// Number of complex values consumed/produced per call.
    size_t length() const { return N * howMany; }

    /// Centred spectral → real space (ifftshift + unnormalised inverse).
    void backwardFFT(const complex_t* in, complex_t* out);

    /// Real space → centred spectral (1/N-scaled forward + fftshift).
    void forwardFFT(const complex_t* in, complex_t* out);

    /// Vector overloads; `out` is resized to length().
    void backwardFFT(const vec_complex& in, vec_complex& out);
    void forwardFFT(const vec_complex& in, vec_complex& out);

    /// Number of distinct plan pairs created so far in this process.
    static size_t cachedPlanCount();
};
