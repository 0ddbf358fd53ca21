//==============================================================================
// test_spectral_grid.cpp
// Properties of the wavenumber grid, the 2/3 dealias mask, the moment layout
// and the Hermite helper tables.
//==============================================================================

#include <cassert>
#include "common.hpp"
#include "SpectralGrid.hpp"
#include "HermiteBasis.hpp"

int main()
{
    // -------------------------------------------------------------------------
    // Default 1-D grid: 33 modes, |k| ≤ 10 kept, 12 masked.
    // -------------------------------------------------------------------------
    SpectralGrid grid1(0.8886, 1.0, 1.0, 33, 1, 1);
    assert(grid1.size() == 33);
    assert(grid1.maskedCount() == 12);
    assert(grid1.zeroMode() == 16);
    assert(grid1.keep(grid1.modeIndex(10, 0, 0)));
    assert(grid1.keep(grid1.modeIndex(-10, 0, 0)));
    assert(!grid1.keep(grid1.modeIndex(11, 0, 0)));
    assert(!grid1.keep(grid1.modeIndex(-11, 0, 0)));
    assert(!grid1.keep(grid1.modeIndex(-16, 0, 0)));
    assert(almost_equal(grid1.nabla(0)[grid1.modeIndex(1, 0, 0)], 2.0*M_PI/0.8886, 1e-12));
    assert(almost_equal(grid1.kxGrid()[grid1.modeIndex(-3, 0, 0)], -6.0*M_PI, 1e-12));

    // -------------------------------------------------------------------------
    // 3-D grid with a single-mode axis: Nx=4 and Ny=6 both keep {-1,0,1},
    // Nz=1 never masked → 3·3 = 9 of 24 kept.
    // -------------------------------------------------------------------------
    SpectralGrid grid3(2.0, 3.0, 5.0, 4, 6, 1);
    assert(grid3.size() == 24);
    assert(grid3.maskedCount() == 15);
    assert(keep_mode_two_thirds(0, 1));
    for (size_t i=0; i<6; ++i) assert(keep_mode_two_thirds(i, 6) == (i >= 2 && i <= 4));

    // -------------------------------------------------------------------------
    // Alias freedom on every axis length: the sum of two kept modes either
    // stays on the grid or folds (mod N) onto a masked mode. The kept set is
    // symmetric and its edge K satisfies 3K < N.
    // -------------------------------------------------------------------------
    for (size_t N=2; N<=40; ++N)
    {
        const long half = static_cast<long>(N / 2);
        const long n = static_cast<long>(N);
        long K = -1;
        for (size_t i=0; i<N; ++i)
        {
            const long k = static_cast<long>(i) - half;
            if (keep_mode_two_thirds(i, N))
            {
                assert(keep_mode_two_thirds(static_cast<size_t>(-k + half), N));
                K = std::max(K, std::abs(k));
            }
        }
        assert(K >= 0 && 3*K < n && 3*(K + 1) >= n);

        for (long k1=-K; k1<=K; ++k1)
        {
            for (long k2=-K; k2<=K; ++k2)
            {
                const long sum = k1 + k2;
                if (sum >= -half && sum < n - half) continue;
                const long folded = (sum >= n - half) ? sum - n : sum + n;
                assert(!keep_mode_two_thirds(static_cast<size_t>(folded + half), N));
            }
        }
    }

    size_t zeros = 0;
    for (size_t i=0; i<grid3.size(); ++i)
    {
        const real_t kx = grid3.nabla(0)[i], ky = grid3.nabla(1)[i], kz = grid3.nabla(2)[i];
        assert(grid3.k2Grid()[i] >= 0.0);
        assert(almost_equal(grid3.k2Grid()[i], kx*kx + ky*ky + kz*kz, 1e-12));
        if (grid3.k2Grid()[i] == 0.0) ++zeros;
    }
    assert(zeros == 1);
    assert(grid3.nablaVector().size() == 3*grid3.size());
    assert(grid3.nablaVector()[grid3.size() + grid3.modeIndex(1, 2, 0)] == grid3.nabla(1)[grid3.modeIndex(1, 2, 0)]);
    assert(grid3.k2Grid()[grid3.zeroMode()] == 0.0);
    assert(grid3.nabla(2)[grid3.modeIndex(1, 2, 0)] == 0.0);
    assert(almost_equal(grid3.nabla(1)[grid3.modeIndex(1, 2, 0)], 4.0*M_PI/3.0, 1e-12));

    bool threw = false;
    try { grid3.modeIndex(2, 0, 0); }
    catch (const std::out_of_range&) { threw = true; }
    assert(threw);

    threw = false;
    try { SpectralGrid bad(0.0, 1.0, 1.0, 4, 1, 1); }
    catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    // -------------------------------------------------------------------------
    // Moment layout: n fastest, species blocks contiguous.
    // -------------------------------------------------------------------------
    ModeCounts modes;
    modes.Nn = 4; modes.Nm = 3; modes.Np = 2; modes.Ns = 2;
    modes.Nx = 5; modes.Ny = 1; modes.Nz = 1;
    assert(modes.momentsPerSpecies() == 24);
    assert(modes.totalMoments() == 48);
    assert(modes.momentIndex(1, 2, 1) == 1 + 4*(2 + 3*1));
    assert(modes.stateSize() == 48*5 + 6*5);

    threw = false;
    try { ModeCounts zero = modes; zero.Nm = 0; zero.validate(); }
    catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    // -------------------------------------------------------------------------
    // Ladder coefficients and collision rates.
    // -------------------------------------------------------------------------
    RecurrenceCoefficients rec(20, 1, 1);
    assert(rec.sqrt_n_minus[0] == 0.0);
    assert(almost_equal(rec.sqrt_n_plus[0], 1.0));
    assert(almost_equal(rec.sqrt_n_minus[9], 3.0, 1e-15));
    assert(rec.sqrt_m_plus.size() == 1 && rec.sqrt_m_minus[0] == 0.0);

    const vec_real col = hermite::collision_matrix(20, 1, 1);
    assert(col.size() == 20);
    assert(col[0] == 0.0 && col[1] == 0.0 && col[2] == 0.0);
    assert(col[3] > 0.0);
    assert(almost_equal(col[19], 1.0, 1e-14));
    for (size_t n=1; n<20; ++n) assert(col[n] >= col[n-1]);
    assert(hermite::hypercollision(5, 3) == 0.0);

    // -------------------------------------------------------------------------
    // Basis functions: Ψ_0(0) = 1/√π and ∫Ψ_n dξ = δ_n0 (trapezoid rule).
    // -------------------------------------------------------------------------
    assert(almost_equal(hermite::basis_functions(0.0, 1)[0], 1.0/std::sqrt(M_PI), 1e-15));

    const size_t Nq = 4001;
    const vec_real xi = linspace(-12.0, 12.0, Nq);
    const real_t h = xi[1] - xi[0];
    vec_real integral(6, 0.0);
    for (size_t q=0; q<Nq; ++q)
    {
        const vec_real psi = hermite::basis_functions(xi[q], 6);
        const real_t w = (q == 0 || q == Nq-1) ? 0.5*h : h;
        for (size_t n=0; n<6; ++n) integral[n] += w * psi[n];
    }
    assert(almost_equal(integral[0], 1.0, 1e-10));
    for (size_t n=1; n<6; ++n) assert(almost_equal(integral[n], 0.0, 1e-10));

    return 0;
}
