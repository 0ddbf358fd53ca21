//==============================================================================
// SpectralGrid.cpp
// Wavenumber grids, gradient operator and the 2/3 dealias mask on the
// centred (Ny, Nx, Nz) Fourier layout.
//==============================================================================

#include "SpectralGrid.hpp"

void ModeCounts::validate() const
{
    if (Nx == 0 || Ny == 0 || Nz == 0)
    {
        throw std::invalid_argument("Spatial mode counts Nx, Ny, Nz must be at least 1!");
    }
    if (Nn == 0 || Nm == 0 || Np == 0)
    {
        throw std::invalid_argument("Hermite mode counts Nn, Nm, Np must be at least 1!");
    }
    if (Ns == 0)
    {
        throw std::invalid_argument("Number of species Ns must be at least 1!");
    }
}

//------------------------------------------------------------------------------
// 2/3 rule: retained modes satisfy 3|k| < N. Two of them sum to |k1+k2| < 2N/3,
// whose alias |k1+k2| - N falls below -N/3 and is discarded. At 3|k| = N the
// alias of K + K would be -K itself. Single-mode axes cannot alias.
//------------------------------------------------------------------------------
bool keep_mode_two_thirds(size_t i, size_t N)
{
    if (N <= 1) return true;
    return 3 * std::abs(centered_mode(i, N)) < static_cast<long>(N);
}

//------------------------------------------------------------------------------
// Ctor: fill kx/ky/kz, nabla and k2 per grid point and build the dealias mask.
//------------------------------------------------------------------------------
SpectralGrid::SpectralGrid(real_t Lx_, real_t Ly_, real_t Lz_, size_t Nx_, size_t Ny_, size_t Nz_)
    : Nx(Nx_), Ny(Ny_), Nz(Nz_), Lx(Lx_), Ly(Ly_), Lz(Lz_)
{
    if (Nx == 0 || Ny == 0 || Nz == 0)
    {
        throw std::invalid_argument("SpectralGrid: mode counts must be at least 1!");
    }
    if (!(Lx > 0.0) || !(Ly > 0.0) || !(Lz > 0.0))
    {
        throw std::invalid_argument("SpectralGrid: domain lengths must be positive!");
    }

    const size_t N = size();
    kx.resize(N);
    ky.resize(N);
    kz.resize(N);
    k2.resize(N);
    mask.resize(N);
    nablaOp.resize(3*N);

    for (size_t iy=0; iy<Ny; ++iy)
    {
        for (size_t ix=0; ix<Nx; ++ix)
        {
            for (size_t iz=0; iz<Nz; ++iz)
            {
                const size_t idx = flatIndex(iy, ix, iz);

                kx[idx] = 2.0 * M_PI * static_cast<real_t>(centered_mode(ix, Nx));
                ky[idx] = 2.0 * M_PI * static_cast<real_t>(centered_mode(iy, Ny));
                kz[idx] = 2.0 * M_PI * static_cast<real_t>(centered_mode(iz, Nz));

                const real_t gx = kx[idx] / Lx;
                const real_t gy = ky[idx] / Ly;
                const real_t gz = kz[idx] / Lz;

                nablaOp[idx]       = gx;
                nablaOp[N + idx]   = gy;
                nablaOp[2*N + idx] = gz;

                k2[idx] = gx*gx + gy*gy + gz*gz;

                mask[idx] = keep_mode_two_thirds(ix, Nx) && keep_mode_two_thirds(iy, Ny)
                            && keep_mode_two_thirds(iz, Nz);
            }
        }
    }

    zeroIndex = flatIndex(Ny/2, Nx/2, Nz/2);
}

size_t SpectralGrid::modeIndex(long mx, long my, long mz) const
{
    const long ix = mx + static_cast<long>(Nx/2);
    const long iy = my + static_cast<long>(Ny/2);
    const long iz = mz + static_cast<long>(Nz/2);

    if (ix < 0 || ix >= static_cast<long>(Nx) ||
        iy < 0 || iy >= static_cast<long>(Ny) ||
        iz < 0 || iz >= static_cast<long>(Nz))
    {
        throw std::out_of_range("Fourier mode (" + std::to_string(mx) + ", " + std::to_string(my)
                                + ", " + std::to_string(mz) + ") is not resolved on the grid!");
    }

    return flatIndex(static_cast<size_t>(iy), static_cast<size_t>(ix), static_cast<size_t>(iz));
}

size_t SpectralGrid::maskedCount() const
{
    return static_cast<size_t>(std::count(mask.begin(), mask.end(), 0));
}
