//==============================================================================
// SimulationParameters.cpp
// Construction, validation and JSON export of the immutable parameter record.
//==============================================================================

#include "SimulationParameters.hpp"

SimulationParameters::SimulationParameters(const ModeCounts& modes_, real_t Lx_, real_t Ly_, real_t Lz_,
                                           vec_real qs_, vec_real Omega_cs_, vec_real alpha_s_, vec_real u_s_,
                                           real_t nu_, real_t D_, real_t t_max_, real_t ode_tolerance_,
                                           vec_real collision_matrix_, vec_complex Ck_0_, vec_complex Fk_0_,
                                           json metadata_)
    : modes(modes_), Lx(Lx_), Ly(Ly_), Lz(Lz_),
      qs(std::move(qs_)), Omega_cs(std::move(Omega_cs_)), alpha_s(std::move(alpha_s_)), u_s(std::move(u_s_)),
      nu(nu_), D(D_), t_max(t_max_), ode_tolerance(ode_tolerance_),
      grid(Lx_, Ly_, Lz_, modes_.Nx, modes_.Ny, modes_.Nz),
      recurrence(modes_.Nn, modes_.Nm, modes_.Np),
      collision_matrix(std::move(collision_matrix_)), Ck_0(std::move(Ck_0_)), Fk_0(std::move(Fk_0_)),
      metadata(std::move(metadata_))
{
    validate();
}

//------------------------------------------------------------------------------
// validate: sizes first (shape mismatches are fatal configuration errors),
// then values that would divide by zero inside the RHS.
//------------------------------------------------------------------------------
void SimulationParameters::validate() const
{
    modes.validate();
    const size_t Ns = modes.Ns;

    auto requireSize = [](const std::string& name, size_t actual, size_t expected)
    {
        if (actual != expected)
        {
            throw std::invalid_argument("Parameter '" + name + "' has " + std::to_string(actual)
                                        + " entries, expected " + std::to_string(expected) + "!");
        }
    };

    requireSize("qs", qs.size(), Ns);
    requireSize("Omega_cs", Omega_cs.size(), Ns);
    requireSize("alpha_s", alpha_s.size(), 3*Ns);
    requireSize("u_s", u_s.size(), 3*Ns);
    requireSize("collision_matrix", collision_matrix.size(), modes.momentsPerSpecies());
    requireSize("Ck_0", Ck_0.size(), modes.distributionSize());
    requireSize("Fk_0", Fk_0.size(), modes.fieldSize());

    if (std::any_of(alpha_s.begin(), alpha_s.end(), [](real_t a){ return a == 0.0 || !std::isfinite(a); }))
    {
        throw std::invalid_argument("Every entry of alpha_s must be finite and nonzero!");
    }
    if (std::any_of(Omega_cs.begin(), Omega_cs.end(), [](real_t w){ return w == 0.0 || !std::isfinite(w); }))
    {
        throw std::invalid_argument("Every entry of Omega_cs must be finite and nonzero!");
    }
    if (!(ode_tolerance > 0.0))
    {
        throw std::invalid_argument("ode_tolerance must be positive!");
    }
    if (!(t_max > 0.0))
    {
        throw std::invalid_argument("t_max must be positive!");
    }
    if (nu < 0.0 || D < 0.0)
    {
        throw std::invalid_argument("Collision rate nu and diffusion D must be non-negative!");
    }
}

json SimulationParameters::toJson() const
{
    json out = metadata;

    out["Nx"] = modes.Nx;  out["Ny"] = modes.Ny;  out["Nz"] = modes.Nz;
    out["Nn"] = modes.Nn;  out["Nm"] = modes.Nm;  out["Np"] = modes.Np;
    out["Ns"] = modes.Ns;

    out["Lx"] = Lx;  out["Ly"] = Ly;  out["Lz"] = Lz;
    out["qs"] = qs;
    out["Omega_cs"] = Omega_cs;
    out["alpha_s"] = alpha_s;
    out["u_s"] = u_s;
    out["nu"] = nu;
    out["D"] = D;
    out["t_max"] = t_max;
    out["ode_tolerance"] = ode_tolerance;

    out["kx_grid"] = grid.kxGrid();
    out["ky_grid"] = grid.kyGrid();
    out["kz_grid"] = grid.kzGrid();
    out["k2_grid"] = grid.k2Grid();
    const size_t N = grid.size();
    out["nabla"]   = {vec_real(grid.nabla(0), grid.nabla(0) + N),
                      vec_real(grid.nabla(1), grid.nabla(1) + N),
                      vec_real(grid.nabla(2), grid.nabla(2) + N)};
    out["collision_matrix"] = collision_matrix;

    out["sqrt_n_plus"]  = recurrence.sqrt_n_plus;
    out["sqrt_n_minus"] = recurrence.sqrt_n_minus;
    out["sqrt_m_plus"]  = recurrence.sqrt_m_plus;
    out["sqrt_m_minus"] = recurrence.sqrt_m_minus;
    out["sqrt_p_plus"]  = recurrence.sqrt_p_plus;
    out["sqrt_p_minus"] = recurrence.sqrt_p_minus;

    out["Ck_0"] = complex_array_to_json(Ck_0, {modes.totalMoments(), modes.Ny, modes.Nx, modes.Nz});
    out["Fk_0"] = complex_array_to_json(Fk_0, {6, modes.Ny, modes.Nx, modes.Nz});

    return out;
}
