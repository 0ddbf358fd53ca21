#pragma once
/**
 * @file SpectralGrid.hpp
 * @brief Mode counts, Fourier wavenumber grids and the 2/3 dealias mask.
 *
 * @details
 * All spatial arrays are stored in (Ny, Nx, Nz) row-major order with the
 * zero mode centred on every axis: along an axis of size N, index i carries
 * the integer wavenumber i - N/2 (integer division). This is the layout the
 * SpectralTransformer produces after its frequency shift.
 *
 * The wavenumber grids follow the convention
 *   kx_grid = 2π (i_x - Nx/2),   nabla_x = kx_grid / Lx,
 * so that ∂/∂x ↔ i nabla_x and k2_grid = |nabla|².
 */

#include "common.hpp"

/**
 * @struct ModeCounts
 * @brief The (Nx, Ny, Nz, Nn, Nm, Np, Ns) tuple fixing every array shape of a run.
 */
struct ModeCounts
{
    size_t Nx {33}, Ny {1}, Nz {1};   ///< Fourier modes per spatial axis.
    size_t Nn {20}, Nm {1}, Np {1};   ///< Hermite modes per velocity axis.
    size_t Ns {2};                    ///< Number of species.

    /// Number of spatial grid points Ny·Nx·Nz.
    size_t gridSize() const { return Nx * Ny * Nz; }

    /// Number of Hermite moments per species Nn·Nm·Np.
    size_t momentsPerSpecies() const { return Nn * Nm * Np; }

    /// Number of Hermite moments of all species Ns·Nn·Nm·Np.
    size_t totalMoments() const { return Ns * Nn * Nm * Np; }

    /// Length of the distribution block of the state vector.
    size_t distributionSize() const { return totalMoments() * gridSize(); }

    /// Length of the electromagnetic block of the state vector.
    size_t fieldSize() const { return 6 * gridSize(); }

    /// Total state vector length.
    size_t stateSize() const { return distributionSize() + fieldSize(); }

    /// Moment index inside one species block (n fastest).
    size_t momentIndex(size_t n, size_t m, size_t p) const { return n + Nn * (m + Nm * p); }

    /// @throws std::invalid_argument if any count is zero.
    void validate() const;
};

/**
 * @brief Integer wavenumber carried by index i on a centred axis of size N.
 */
inline long centered_mode(size_t i, size_t N)
{
    return static_cast<long>(i) - static_cast<long>(N / 2);
}

/**
 * @brief Dealias rule on one axis: retain 3|k| < N, never mask when N = 1.
 *
 * The largest retained K satisfies 2K - N < -K, so the image of any product
 * of two retained modes lands on a masked mode.
 */
bool keep_mode_two_thirds(size_t i, size_t N);

/**
 * @class SpectralGrid
 * @brief Immutable wavenumber grids, gradient operator and dealias mask.
 *
 * @section usage Usage
 * Construct once per run with the domain lengths and mode counts; pass by
 * const reference into every right-hand-side evaluation.
 */
class SpectralGrid
{
  private:
    size_t Nx, Ny, Nz;               ///< Spatial mode counts.
    real_t Lx, Ly, Lz;               ///< Domain lengths.
    vec_real kx, ky, kz;             ///< 2π × integer wavenumbers per grid point.
    vec_real k2;                     ///< |nabla|² per grid point.
    vec_real nablaOp;                ///< (kx/Lx | ky/Ly | kz/Lz), three grid blocks.
    std::vector<char> mask;          ///< 2/3 dealias mask per grid point (1 = keep).
    size_t zeroIndex;                ///< Flat index of the k = 0 mode.

  public:
    /**
     * @brief Build grids for the given lengths and spatial mode counts.
     * @throws std::invalid_argument for non-positive lengths or zero counts.
     */
    SpectralGrid(real_t Lx, real_t Ly, real_t Lz, size_t Nx, size_t Ny, size_t Nz);

    size_t size() const { return Nx * Ny * Nz; }

    /// Flat (Ny, Nx, Nz) index.
    size_t flatIndex(size_t iy, size_t ix, size_t iz) const { return (iy * Nx + ix) * Nz + iz; }

    /// Flat index of the wavenumber triple (mx, my, mz) in centred layout.
    /// @throws std::out_of_range if the mode is not resolved on this grid.
    size_t modeIndex(long mx, long my, long mz) const;

    /// Flat index of the zero mode.
    size_t zeroMode() const { return zeroIndex; }

    const vec_real& kxGrid() const { return kx; }
    const vec_real& kyGrid() const { return ky; }
    const vec_real& kzGrid() const { return kz; }
    const vec_real& k2Grid() const { return k2; }

    /// Gradient operator component j ∈ {0,1,2}, one value per grid point.
    const real_t* nabla(size_t j) const { return nablaOp.data() + j * size(); }

    /// Gradient operator as a 3-vector field (x block, y block, z block).
    const vec_real& nablaVector() const { return nablaOp; }

    /// Dealias mask value at flat index idx.
    bool keep(size_t idx) const { return mask[idx] != 0; }

    /// Number of grid points removed by the dealias mask.
    size_t maskedCount() const;
};
