//==============================================================================
// SpectralTransformer.cpp
// Thin wrapper around FFTW for batched periodic 3-D transforms.
// Features:
//   • Complex-to-complex forward/backward transforms of `howMany` contiguous
//     (Ny, Nx, Nz) blocks with FFTW's advanced interface.
//   • Frequency shift between the centred layout (zero mode at N/2) and the
//     FFT ordering, fused into the copy to/from the aligned work arrays.
//   • Plans memoised per shape, created once and reused by every instance.
// Notes:
//   • FFTW_FORWARD is e^{-ikx}; together with the 1/N on the forward transform
//     this is numpy's norm="forward" convention, so ∂/∂x ↔ i k.
//==============================================================================

#include "SpectralTransformer.hpp"

namespace
{
    struct PlanPair
    {
        fftw_plan forward;
        fftw_plan backward;
    };

    using PlanKey = std::tuple<size_t, size_t, size_t, size_t>;

    //--------------------------------------------------------------------------
    // Process-wide plan cache. Plans are destroyed at exit.
    //--------------------------------------------------------------------------
    struct PlanCache
    {
        std::map<PlanKey, PlanPair> plans;
        std::mutex mtx;

        ~PlanCache()
        {
            for (auto& entry : plans)
            {
                fftw_destroy_plan(entry.second.forward);
                fftw_destroy_plan(entry.second.backward);
            }
        }
    };

    PlanCache& planCache()
    {
        static PlanCache cache;
        return cache;
    }

    //--------------------------------------------------------------------------
    // Fetch or create the plan pair for one shape. Planning happens on
    // throw-away aligned arrays; FFTW_ESTIMATE leaves them untouched.
    // If planning fails the half-built pair is released before throwing.
    //--------------------------------------------------------------------------
    PlanPair acquirePlans(size_t Nx, size_t Ny, size_t Nz, size_t howMany)
    {
        PlanCache& cache = planCache();
        std::lock_guard<std::mutex> lock(cache.mtx);

        const PlanKey key {Nx, Ny, Nz, howMany};
        auto it = cache.plans.find(key);
        if (it != cache.plans.end())
        {
            return it->second;
        }

        const int dims[3] = {static_cast<int>(Ny), static_cast<int>(Nx), static_cast<int>(Nz)};
        const int dist = static_cast<int>(Nx * Ny * Nz);
        const size_t total = Nx * Ny * Nz * howMany;

        fftw_complex* in  = fftw_alloc_complex(total);
        fftw_complex* out = fftw_alloc_complex(total);
        if (in == nullptr || out == nullptr)
        {
            fftw_free(in);
            fftw_free(out);
            throw std::runtime_error("FFTW could not allocate planning buffers!");
        }

        // The FFTW planner is not thread-safe; the cache lock also serialises it.
        PlanPair pair {nullptr, nullptr};
        pair.forward  = fftw_plan_many_dft(3, dims, static_cast<int>(howMany),
                                           in, nullptr, 1, dist,
                                           out, nullptr, 1, dist,
                                           FFTW_FORWARD, FFTW_ESTIMATE);
        pair.backward = fftw_plan_many_dft(3, dims, static_cast<int>(howMany),
                                           in, nullptr, 1, dist,
                                           out, nullptr, 1, dist,
                                           FFTW_BACKWARD, FFTW_ESTIMATE);

        fftw_free(in);
        fftw_free(out);

        if (pair.forward == nullptr || pair.backward == nullptr)
        {
            if (pair.forward)  fftw_destroy_plan(pair.forward);
            if (pair.backward) fftw_destroy_plan(pair.backward);
            throw std::runtime_error("FFTW failed to create a plan for grid "
                                     + std::to_string(Ny) + "x" + std::to_string(Nx) + "x"
                                     + std::to_string(Nz) + " (batch " + std::to_string(howMany) + ")");
        }

        cache.plans.emplace(key, pair);
        return pair;
    }
}

//------------------------------------------------------------------------------
// Ctor: fetch memoised plans, allocate aligned work arrays and precompute the
// shift permutation. Centred index i on an axis of size N sits at FFT position
// (i - N/2) mod N.
//------------------------------------------------------------------------------
SpectralTransformer::SpectralTransformer(size_t Nx_, size_t Ny_, size_t Nz_, size_t howMany_)
    : Nx(Nx_), Ny(Ny_), Nz(Nz_), N(Nx_*Ny_*Nz_), howMany(howMany_)
{
    if (N == 0 || howMany == 0)
    {
        throw std::invalid_argument("SpectralTransformer: empty grid or batch!");
    }

    PlanPair plans = acquirePlans(Nx, Ny, Nz, howMany);
    forward_plan  = plans.forward;
    backward_plan = plans.backward;

    work_in  = fftw_alloc_complex(N * howMany);
    work_out = fftw_alloc_complex(N * howMany);
    if (work_in == nullptr || work_out == nullptr)
    {
        fftw_free(work_in);
        fftw_free(work_out);
        throw std::runtime_error("FFTW could not allocate transform buffers!");
    }

    auto shifted = [](size_t i, size_t n) { return (i + n - n/2) % n; };

    fftPosition.resize(N);
    for (size_t iy=0; iy<Ny; ++iy)
    {
        for (size_t ix=0; ix<Nx; ++ix)
        {
            for (size_t iz=0; iz<Nz; ++iz)
            {
                const size_t centred = (iy*Nx + ix)*Nz + iz;
                fftPosition[centred] = (shifted(iy, Ny)*Nx + shifted(ix, Nx))*Nz + shifted(iz, Nz);
            }
        }
    }
}

//------------------------------------------------------------------------------
// Dtor: free work arrays only; plans belong to the process-wide cache.
//------------------------------------------------------------------------------
SpectralTransformer::~SpectralTransformer()
{
    fftw_free(work_in);
    fftw_free(work_out);
}

//------------------------------------------------------------------------------
// backwardFFT: ifftshift into the work array, inverse transform, copy out.
//------------------------------------------------------------------------------
void SpectralTransformer::backwardFFT(const complex_t* in, complex_t* out)
{
    const size_t total = N * howMany;

    #if defined(USE_OPENMP) || defined(USE_HYBRID)
    #pragma omp parallel for collapse(2) schedule(static)
    #endif
    for (size_t b=0; b<howMany; ++b)
    {
        for (size_t c=0; c<N; ++c)
        {
            const size_t pos = b*N + fftPosition[c];
            work_in[pos][0] = in[b*N + c].real();
            work_in[pos][1] = in[b*N + c].imag();
        }
    }

    fftw_execute_dft(backward_plan, work_in, work_out);

    for (size_t i=0; i<total; ++i)
    {
        out[i] = complex_t(work_out[i][0], work_out[i][1]);
    }
}

//------------------------------------------------------------------------------
// forwardFFT: transform, scale by 1/N and fftshift into the centred layout.
//------------------------------------------------------------------------------
void SpectralTransformer::forwardFFT(const complex_t* in, complex_t* out)
{
    const size_t total = N * howMany;

    for (size_t i=0; i<total; ++i)
    {
        work_in[i][0] = in[i].real();
        work_in[i][1] = in[i].imag();
    }

    fftw_execute_dft(forward_plan, work_in, work_out);

    const real_t scale = 1.0 / static_cast<real_t>(N);

    #if defined(USE_OPENMP) || defined(USE_HYBRID)
    #pragma omp parallel for collapse(2) schedule(static)
    #endif
    for (size_t b=0; b<howMany; ++b)
    {
        for (size_t c=0; c<N; ++c)
        {
            const size_t pos = b*N + fftPosition[c];
            out[b*N + c] = complex_t(work_out[pos][0], work_out[pos][1]) * scale;
        }
    }
}

void SpectralTransformer::backwardFFT(const vec_complex& in, vec_complex& out)
{
    if (in.size() != length())
    {
        throw std::invalid_argument("SpectralTransformer::backwardFFT: input length "
                                    + std::to_string(in.size()) + " != " + std::to_string(length()));
    }
    out.resize(length());
    backwardFFT(in.data(), out.data());
}

void SpectralTransformer::forwardFFT(const vec_complex& in, vec_complex& out)
{
    if (in.size() != length())
    {
        throw std::invalid_argument("SpectralTransformer::forwardFFT: input length "
                                    + std::to_string(in.size()) + " != " + std::to_string(length()));
    }
    out.resize(length());
    forwardFFT(in.data(), out.data());
}

size_t SpectralTransformer::cachedPlanCount()
{
    PlanCache& cache = planCache();
    std::lock_guard<std::mutex> lock(cache.mtx);
    return cache.plans.size();
}
