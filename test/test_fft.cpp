//==============================================================================
// test_fft.cpp
// Sanity test for SpectralTransformer:
//   1) Known spectra of a sine wave and a unit-modulus complex wave on the
//      centred layout (zero mode at N/2).
//   2) Forward+backward round trip on a batched 3-D grid.
//   3) Plans are shared between transformers of the same shape.
// Uses `almost_equal` helpers and plain `assert` for checks.
//==============================================================================

#include <cassert>
#include "common.hpp"
#include "SpectralGrid.hpp"
#include "SpectralTransformer.hpp"

int main()
{
    // -------------------------------------------------------------------------
    // 1-D: N = 16, modes -8..7, zero mode at index 8.
    // sin(2π j/N) has -i/2 at k=+1 (index 9) and +i/2 at k=-1 (index 7);
    // e^{i 2π j/N} is a delta at k=+1.
    // -------------------------------------------------------------------------
    constexpr size_t N {16};
    SpectralTransformer fft(N, 1, 1, 1);

    vec_complex in_sin(N), in_exp(N), out_sin, out_exp, back_sin, back_exp;
    for (size_t j=0; j<N; ++j)
    {
        const real_t phase = 2.0*M_PI*static_cast<real_t>(j)/static_cast<real_t>(N);
        in_sin[j] = std::sin(phase);
        in_exp[j] = std::polar(1.0, phase);
    }

    fft.forwardFFT(in_sin, out_sin);
    fft.forwardFFT(in_exp, out_exp);

    for (size_t i=0; i<N; ++i)
    {
        complex_t ref_sin(0.0, 0.0), ref_exp(0.0, 0.0);
        if (i == N/2 + 1) { ref_sin = complex_t(0.0, -0.5); ref_exp = 1.0; }
        if (i == N/2 - 1) { ref_sin = complex_t(0.0,  0.5); }

        assert(almost_equal(out_sin[i], ref_sin, 1e-15));
        assert(almost_equal(out_exp[i], ref_exp, 1e-15));
    }

    fft.backwardFFT(out_sin, back_sin);
    fft.backwardFFT(out_exp, back_exp);
    for (size_t j=0; j<N; ++j)
    {
        assert(almost_equal(back_sin[j], in_sin[j], 1e-14));
        assert(almost_equal(back_exp[j], in_exp[j], 1e-14));
    }

    // -------------------------------------------------------------------------
    // 3-D batch: a single mode placed with SpectralGrid::modeIndex becomes the
    // plane wave e^{i(kx x + ky y + kz z)} with unit amplitude (no 1/N on the
    // inverse), and returns to the same entry.
    // -------------------------------------------------------------------------
    const size_t Nx = 5, Ny = 4, Nz = 3, batch = 2;
    SpectralGrid grid(1.0, 1.0, 1.0, Nx, Ny, Nz);
    SpectralTransformer fft3(Nx, Ny, Nz, batch);

    const long mx = 1, my = 1, mz = -1;
    vec_complex spectrum(fft3.length(), complex_t(0.0, 0.0));
    spectrum[grid.modeIndex(mx, my, mz)] = 1.0;
    spectrum[grid.size() + grid.zeroMode()] = complex_t(2.0, -1.0);

    vec_complex physical, recovered;
    fft3.backwardFFT(spectrum, physical);

    for (size_t jy=0; jy<Ny; ++jy)
    {
        for (size_t jx=0; jx<Nx; ++jx)
        {
            for (size_t jz=0; jz<Nz; ++jz)
            {
                const real_t phase = 2.0*M_PI*(mx*static_cast<real_t>(jx)/Nx
                                             + my*static_cast<real_t>(jy)/Ny
                                             + mz*static_cast<real_t>(jz)/Nz);
                const size_t idx = grid.flatIndex(jy, jx, jz);
                assert(almost_equal(physical[idx], std::polar(1.0, phase), 1e-13));
                assert(almost_equal(physical[grid.size() + idx], complex_t(2.0, -1.0), 1e-13));
            }
        }
    }

    fft3.forwardFFT(physical, recovered);
    for (size_t i=0; i<spectrum.size(); ++i)
    {
        assert(almost_equal(recovered[i], spectrum[i], 1e-14));
    }

    // -------------------------------------------------------------------------
    // Plan memoisation: a second transformer of an existing shape adds no plan.
    // -------------------------------------------------------------------------
    const size_t plans = SpectralTransformer::cachedPlanCount();
    SpectralTransformer again(Nx, Ny, Nz, batch);
    assert(SpectralTransformer::cachedPlanCount() == plans);
    SpectralTransformer other(Nx, Ny, Nz, batch + 1);
    assert(SpectralTransformer::cachedPlanCount() == plans + 1);

    // Length mismatch is rejected.
    bool threw = false;
    try
    {
        vec_complex wrong(3), out;
        again.forwardFFT(wrong, out);
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    assert(threw);

    return 0;
}
