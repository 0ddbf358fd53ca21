//==============================================================================
// HermiteFourierSystem.cpp
// Moment hierarchy of the Vlasov equation on the Hermite–Fourier basis.
// Features:
//   • Free streaming through the Hermite ladder (couples n-1, n, n+1).
//   • Lorentz force as a pseudo-spectral product, dealiased by the 2/3 rule.
//   • Diagonal collision and spectral diffusion damping.
// Parallel notes:
//   • With USE_OPENMP/USE_HYBRID the (moment, grid point) loops are shared
//     among threads; every output entry is written by exactly one thread.
//==============================================================================

#include "HermiteFourierSystem.hpp"

HermiteFourierSystem::HermiteFourierSystem(const SimulationParameters& params_)
    : params(params_),
      transformer(params_.modes.Nx, params_.modes.Ny, params_.modes.Nz, params_.modes.totalMoments()),
      product(params_.modes.distributionSize()),
      productK(params_.modes.distributionSize())
{}

//------------------------------------------------------------------------------
// lorentzProducts
// (E + v×B)·∇_v f in moment space, pointwise on the real-space grid:
//   Σ_j E_j G_j C + (B_z V_y - B_y V_z) G_x C
//                 + (B_x V_z - B_z V_x) G_y C
//                 + (B_y V_x - B_x V_y) G_z C .
// V_l and G_j act on different velocity axes, so their order is irrelevant.
//------------------------------------------------------------------------------
void HermiteFourierSystem::lorentzProducts(size_t s, const complex_t* C, const complex_t* F)
{
    const ModeCounts& mc = params.modes;
    const size_t N = mc.gridSize();
    const size_t Nnmp = mc.momentsPerSpecies();
    const size_t base = s * Nnmp;
    const real_t invSqrt2 = 1.0 / std::sqrt(2.0);

    const std::array<size_t, 3> count {mc.Nn, mc.Nm, mc.Np};
    const std::array<const vec_real*, 3> plus  {&params.recurrence.sqrt_n_plus,
                                                &params.recurrence.sqrt_m_plus,
                                                &params.recurrence.sqrt_p_plus};
    const std::array<const vec_real*, 3> minus {&params.recurrence.sqrt_n_minus,
                                                &params.recurrence.sqrt_m_minus,
                                                &params.recurrence.sqrt_p_minus};
    const std::array<real_t, 3> alpha {params.alpha(s,0), params.alpha(s,1), params.alpha(s,2)};
    const std::array<real_t, 3> u     {params.drift(s,0), params.drift(s,1), params.drift(s,2)};

    const complex_t *Ex = F, *Ey = F + N, *Ez = F + 2*N;
    const complex_t *Bx = F + 3*N, *By = F + 4*N, *Bz = F + 5*N;

    auto G = [&](size_t j, std::array<size_t, 3> q, size_t i) -> complex_t
    {
        if (q[j] == 0) return complex_t(0.0, 0.0);
        const real_t coeff = -std::sqrt(2.0) * (*minus[j])[q[j]] / alpha[j];
        q[j] -= 1;
        return coeff * C[(base + mc.momentIndex(q[0], q[1], q[2]))*N + i];
    };

    auto VG = [&](size_t l, size_t j, const std::array<size_t, 3>& q, size_t i) -> complex_t
    {
        complex_t value = u[l] * G(j, q, i);
        if (q[l] > 0)
        {
            std::array<size_t, 3> r = q;
            r[l] -= 1;
            value += alpha[l] * (*minus[l])[q[l]] * invSqrt2 * G(j, r, i);
        }
        if (q[l] + 1 < count[l])
        {
            std::array<size_t, 3> r = q;
            r[l] += 1;
            value += alpha[l] * (*plus[l])[q[l]] * invSqrt2 * G(j, r, i);
        }
        return value;
    };

    #if defined(USE_OPENMP) || defined(USE_HYBRID)
    #pragma omp parallel for collapse(2) schedule(static)
    #endif
    for (size_t idx=0; idx<Nnmp; ++idx)
    {
        for (size_t i=0; i<N; ++i)
        {
            const std::array<size_t, 3> q {idx % mc.Nn, (idx / mc.Nn) % mc.Nm, idx / (mc.Nn * mc.Nm)};

            complex_t term = Ex[i]*G(0, q, i) + Ey[i]*G(1, q, i) + Ez[i]*G(2, q, i);

            term += Bz[i]*VG(1, 0, q, i) - By[i]*VG(2, 0, q, i);
            term += Bx[i]*VG(2, 1, q, i) - Bz[i]*VG(0, 1, q, i);
            term += By[i]*VG(0, 2, q, i) - Bx[i]*VG(1, 2, q, i);

            product[(base + idx)*N + i] = term;
        }
    }
}

//------------------------------------------------------------------------------
// evaluate
// Assemble dCk/dt = streaming + Lorentz + collisions + diffusion.
// Only the transformed Lorentz product is multiplied by the dealias mask.
//------------------------------------------------------------------------------
void HermiteFourierSystem::evaluate(const complex_t* Ck, const complex_t* C, const complex_t* F, complex_t* dCk)
{
    const ModeCounts& mc = params.modes;
    const size_t N = mc.gridSize();
    const size_t Nnmp = mc.momentsPerSpecies();
    const real_t invSqrt2 = 1.0 / std::sqrt(2.0);

    for (size_t s=0; s<mc.Ns; ++s)
    {
        lorentzProducts(s, C, F);
    }
    transformer.forwardFFT(product.data(), productK.data());

    const std::array<size_t, 3> count {mc.Nn, mc.Nm, mc.Np};
    const std::array<const vec_real*, 3> plus  {&params.recurrence.sqrt_n_plus,
                                                &params.recurrence.sqrt_m_plus,
                                                &params.recurrence.sqrt_p_plus};
    const std::array<const vec_real*, 3> minus {&params.recurrence.sqrt_n_minus,
                                                &params.recurrence.sqrt_m_minus,
                                                &params.recurrence.sqrt_p_minus};
    const std::array<size_t, 3> stride {1, mc.Nn, mc.Nn * mc.Nm};
    const vec_real& k2 = params.grid.k2Grid();

    for (size_t s=0; s<mc.Ns; ++s)
    {
        const size_t base = s * Nnmp;
        const real_t force = params.qs[s] * params.Omega_cs[s];

        #if defined(USE_OPENMP) || defined(USE_HYBRID)
        #pragma omp parallel for collapse(2) schedule(static)
        #endif
        for (size_t idx=0; idx<Nnmp; ++idx)
        {
            for (size_t i=0; i<N; ++i)
            {
                const std::array<size_t, 3> q {idx % mc.Nn, (idx / mc.Nn) % mc.Nm, idx / (mc.Nn * mc.Nm)};
                const size_t here = (base + idx)*N + i;

                complex_t streaming(0.0, 0.0);
                for (size_t j=0; j<3; ++j)
                {
                    const real_t kj = params.grid.nabla(j)[i];
                    if (kj == 0.0) continue;

                    const real_t a = params.alpha(s, j);
                    complex_t ladder = params.drift(s, j) * Ck[here];
                    if (q[j] > 0)
                    {
                        ladder += a * (*minus[j])[q[j]] * invSqrt2 * Ck[here - stride[j]*N];
                    }
                    if (q[j] + 1 < count[j])
                    {
                        ladder += a * (*plus[j])[q[j]] * invSqrt2 * Ck[here + stride[j]*N];
                    }
                    streaming += kj * ladder;
                }

                const real_t keep = params.grid.keep(i) ? 1.0 : 0.0;
                const real_t damping = params.nu * params.collision_matrix[idx] + params.D * k2[i];

                dCk[here] = -I_unit * streaming - force * keep * productK[here] - damping * Ck[here];
            }
        }
    }
}
