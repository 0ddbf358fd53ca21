//==============================================================================
// VlasovMaxwellSystem.cpp
// State packing and right-hand-side assembly for the coupled system.
//==============================================================================

#include "VlasovMaxwellSystem.hpp"

VlasovMaxwellSystem::VlasovMaxwellSystem(const SimulationParameters& params_)
    : params(params_),
      momentTransformer(params_.modes.Nx, params_.modes.Ny, params_.modes.Nz, params_.modes.totalMoments()),
      fieldTransformer(params_.modes.Nx, params_.modes.Ny, params_.modes.Nz, 6),
      hermite(params_),
      C(params_.modes.distributionSize()),
      F(params_.modes.fieldSize()),
      J(3 * params_.modes.gridSize())
{}

vec_complex VlasovMaxwellSystem::pack(const vec_complex& Ck, const vec_complex& Fk) const
{
    const ModeCounts& mc = params.modes;
    if (Ck.size() != mc.distributionSize() || Fk.size() != mc.fieldSize())
    {
        throw std::invalid_argument("pack: Ck has " + std::to_string(Ck.size()) + " entries (expected "
                                    + std::to_string(mc.distributionSize()) + "), Fk has "
                                    + std::to_string(Fk.size()) + " (expected "
                                    + std::to_string(mc.fieldSize()) + ")!");
    }

    vec_complex y;
    y.reserve(mc.stateSize());
    y.insert(y.end(), Ck.begin(), Ck.end());
    y.insert(y.end(), Fk.begin(), Fk.end());
    return y;
}

void VlasovMaxwellSystem::unpack(const vec_complex& y, vec_complex& Ck, vec_complex& Fk) const
{
    const ModeCounts& mc = params.modes;
    if (y.size() != mc.stateSize())
    {
        throw std::invalid_argument("unpack: state has " + std::to_string(y.size())
                                    + " entries, expected " + std::to_string(mc.stateSize()) + "!");
    }

    const auto split = y.begin() + static_cast<std::ptrdiff_t>(mc.distributionSize());
    Ck.assign(y.begin(), split);
    Fk.assign(split, y.end());
}

//------------------------------------------------------------------------------
// operator(): Ck and Fk are read in place from y and dydt is filled in place,
// so no copies of the packed state are made per evaluation.
//------------------------------------------------------------------------------
void VlasovMaxwellSystem::operator()(real_t /*t*/, const vec_complex& y, vec_complex& dydt)
{
    const ModeCounts& mc = params.modes;
    if (y.size() != mc.stateSize())
    {
        throw std::invalid_argument("VlasovMaxwellSystem: state has " + std::to_string(y.size())
                                    + " entries, expected " + std::to_string(mc.stateSize()) + "!");
    }
    dydt.resize(mc.stateSize());

    const complex_t* Ck = y.data();
    const complex_t* Fk = y.data() + mc.distributionSize();
    complex_t* dCk = dydt.data();
    complex_t* dFk = dydt.data() + mc.distributionSize();

    momentTransformer.backwardFFT(Ck, C.data());
    fieldTransformer.backwardFFT(Fk, F.data());

    hermite.evaluate(Ck, C.data(), F.data(), dCk);

    maxwell::plasma_current(params, Ck, J.data());
    maxwell::field_rhs(params, Fk, J.data(), dFk);
}
