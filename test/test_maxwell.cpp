//==============================================================================
// test_maxwell.cpp
// Cross product identities, the current moment and the curl equations.
//==============================================================================

#include <cassert>
#include "common.hpp"
#include "InitialConditionGenerator.hpp"
#include "MaxwellSolver.hpp"

int main()
{
    // -------------------------------------------------------------------------
    // cross(a,b) = -cross(b,a), cross(a,a) = 0, e_x × e_y = e_z.
    // -------------------------------------------------------------------------
    const size_t N = 4;
    vec_complex a(3*N), b(3*N);
    for (size_t i=0; i<3*N; ++i)
    {
        a[i] = complex_t(std::sin(1.0 + i), std::cos(2.0*i));
        b[i] = complex_t(0.5*i - 1.0, std::sin(3.0*i));
    }

    const vec_complex ab = maxwell::cross_product(a, b);
    const vec_complex ba = maxwell::cross_product(b, a);
    const vec_complex aa = maxwell::cross_product(a, a);
    for (size_t i=0; i<3*N; ++i)
    {
        assert(almost_equal(ab[i], -ba[i], 1e-14));
        assert(almost_equal(aa[i], complex_t(0.0, 0.0), 1e-14));
    }

    const vec_complex ex {1.0, 0.0, 0.0}, ey {0.0, 1.0, 0.0};
    const vec_complex ez = maxwell::cross_product(ex, ey);
    assert(ez[0] == 0.0 && ez[1] == 0.0 && ez[2] == 1.0);

    bool threw = false;
    try { maxwell::cross_product(vec_complex(3), vec_complex(6)); }
    catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    // A real left operand gives the same result as its complex promotion.
    vec_real r(3*N);
    vec_complex rc(3*N), rb(3*N), rcb(3*N);
    for (size_t i=0; i<3*N; ++i)
    {
        r[i] = std::cos(0.7*i) - 0.25;
        rc[i] = complex_t(r[i], 0.0);
    }
    maxwell::cross_product(r.data(), b.data(), rb.data(), N);
    maxwell::cross_product(rc.data(), b.data(), rcb.data(), N);
    for (size_t i=0; i<3*N; ++i) assert(almost_equal(rb[i], rcb[i], 1e-14));

    // -------------------------------------------------------------------------
    // Current: drifting Maxwellians carry J = Σ q_s u_s at k = 0; a first
    // Hermite moment adds q α³ (α/√2) C_100.
    // -------------------------------------------------------------------------
    ModeCounts modes;
    modes.Nx = 5; modes.Nn = 4; modes.Nm = 2; modes.Np = 1; modes.Ns = 2;

    json overrides {
        {"u_s", {0.3, 0.0, -0.2, 0.1, 0.0, 0.0}},
        {"dn1", 0.0}
    };
    const SimulationParameters params = InitialConditionGenerator(modes, overrides).generate();
    const size_t G = modes.gridSize();
    const size_t zero = params.grid.zeroMode();

    vec_complex J(3*G);
    maxwell::plasma_current(params, params.Ck_0.data(), J.data());
    assert(almost_equal(J[zero],       complex_t(-0.3 + 0.1, 0.0), 1e-13));
    assert(almost_equal(J[G + zero],   complex_t(0.0, 0.0), 1e-13));
    assert(almost_equal(J[2*G + zero], complex_t(0.2, 0.0), 1e-13));
    for (size_t i=0; i<3*G; ++i)
    {
        if (i % G != zero) assert(J[i] == complex_t(0.0, 0.0));
    }

    vec_complex Ck = params.Ck_0;
    const size_t e_y = modes.momentIndex(0, 1, 0);
    Ck[e_y*G + zero] = complex_t(2.0, 1.0);    // electron C_010
    maxwell::plasma_current(params, Ck.data(), J.data());
    const real_t ay = params.alpha(0, 1);
    const complex_t expected_y = -1.0 * params.alphaProduct(0) * ay / std::sqrt(2.0) * complex_t(2.0, 1.0);
    assert(almost_equal(J[G + zero], expected_y, 1e-15));

    // Nn > 1 but Np = 1: no thermal current along z, only the drift part.
    assert(almost_equal(J[2*G + zero], complex_t(0.2, 0.0), 1e-13));

    // -------------------------------------------------------------------------
    // Curl equations at k = (1,0,0):
    //   E_y = 1 → dB_z/dt = -i k_x,
    //   B_z = 1 → dE_y/dt = -i k_x (with J = 0).
    // -------------------------------------------------------------------------
    const size_t k1 = params.grid.modeIndex(1, 0, 0);
    const real_t kx = params.grid.nabla(0)[k1];

    vec_complex Fk(6*G, 0.0), dFk(6*G), Jzero(3*G, 0.0);
    Fk[1*G + k1] = 1.0;
    maxwell::field_rhs(params, Fk.data(), Jzero.data(), dFk.data());
    assert(almost_equal(dFk[5*G + k1], complex_t(0.0, -kx), 1e-13));
    for (size_t i=0; i<6*G; ++i)
    {
        if (i != 5*G + k1) assert(dFk[i] == complex_t(0.0, 0.0));
    }

    std::fill(Fk.begin(), Fk.end(), 0.0);
    Fk[5*G + k1] = 1.0;
    maxwell::field_rhs(params, Fk.data(), Jzero.data(), dFk.data());
    assert(almost_equal(dFk[1*G + k1], complex_t(0.0, -kx), 1e-13));
    assert(dFk[0*G + k1] == complex_t(0.0, 0.0));

    // Current enters Ampère's law as -J/Omega_ce.
    std::fill(Fk.begin(), Fk.end(), 0.0);
    maxwell::field_rhs(params, Fk.data(), J.data(), dFk.data());
    for (size_t i=0; i<3*G; ++i)
    {
        assert(almost_equal(dFk[i], -J[i] / params.Omega_ce(), 1e-15));
        assert(dFk[3*G + i] == complex_t(0.0, 0.0));
    }

    return 0;
}
