//==============================================================================
// ODEStepper.cpp
// Embedded explicit Runge–Kutta stepper with adaptive step size control.
// Supports Dopri5 and Bosh3, both first-same-as-last.
// Responsibilities:
//   • Hold Butcher tableau (a, b, b̂, c) for the chosen scheme.
//   • Propose, accept or reject steps from the embedded error estimate.
//   • Clip steps onto the output times and record the solution there.
// Parallel notes:
//   • USE_OPENMP/USE_HYBRID share the stage combinations among threads.
//==============================================================================

#include "ODEStepper.hpp"

//------------------------------------------------------------------------------
// Ctor: choose scheme and build its Butcher tableau. The last row of `a`
// equals `b`, so the final stage is f(t+h, y_new) and seeds the next step.
//  - Dopri5: 7 stages, order 5, embedded order 4
//  - Bosh3 : 4 stages, order 3, embedded order 2
//------------------------------------------------------------------------------
ODEStepper::ODEStepper(Scheme method_, real_t tolerance_, size_t maxSteps_, bool verbose_)
    : scheme(method_), tolerance(tolerance_), maxSteps(maxSteps_), verbose(verbose_)
{
    if (!(tolerance > 0.0))
    {
        throw std::invalid_argument("ODEStepper: tolerance must be positive!");
    }
    if (maxSteps == 0)
    {
        throw std::invalid_argument("ODEStepper: the step budget must be positive!");
    }

    size_t stage {};

    switch (scheme)
    {
        case Scheme::Dopri5:
            stage = 7;
            a.assign(stage, vec_real(stage, 0.0));
            b.assign(stage, 0.0);
            bHat.assign(stage, 0.0);
            c.assign(stage, 0.0);
            errorOrder = 4;

            c[1] = 1.0/5.0;  c[2] = 3.0/10.0;  c[3] = 4.0/5.0;
            c[4] = 8.0/9.0;  c[5] = 1.0;       c[6] = 1.0;

            a[1][0] = 1.0/5.0;

            a[2][0] = 3.0/40.0;        a[2][1] = 9.0/40.0;

            a[3][0] = 44.0/45.0;       a[3][1] = -56.0/15.0;       a[3][2] = 32.0/9.0;

            a[4][0] = 19372.0/6561.0;  a[4][1] = -25360.0/2187.0;  a[4][2] = 64448.0/6561.0;
            a[4][3] = -212.0/729.0;

            a[5][0] = 9017.0/3168.0;   a[5][1] = -355.0/33.0;      a[5][2] = 46732.0/5247.0;
            a[5][3] = 49.0/176.0;      a[5][4] = -5103.0/18656.0;

            b[0] = 35.0/384.0;   b[2] = 500.0/1113.0;  b[3] = 125.0/192.0;
            b[4] = -2187.0/6784.0;  b[5] = 11.0/84.0;

            bHat[0] = 5179.0/57600.0;  bHat[2] = 7571.0/16695.0;  bHat[3] = 393.0/640.0;
            bHat[4] = -92097.0/339200.0;  bHat[5] = 187.0/2100.0;  bHat[6] = 1.0/40.0;
            break;

        case Scheme::Bosh3:
            stage = 4;
            a.assign(stage, vec_real(stage, 0.0));
            b.assign(stage, 0.0);
            bHat.assign(stage, 0.0);
            c.assign(stage, 0.0);
            errorOrder = 2;

            c[1] = 1.0/2.0;  c[2] = 3.0/4.0;  c[3] = 1.0;

            a[1][0] = 1.0/2.0;
            a[2][1] = 3.0/4.0;

            b[0] = 2.0/9.0;  b[1] = 1.0/3.0;  b[2] = 4.0/9.0;

            bHat[0] = 7.0/24.0;  bHat[1] = 1.0/4.0;  bHat[2] = 1.0/3.0;  bHat[3] = 1.0/8.0;
            break;
    }

    a[stage-1] = b;
}

//------------------------------------------------------------------------------
// attemptStep
// Stages k[1..s-1] from k[0]; the last stage is evaluated at y_new itself.
// The error is h Σ (b_i - b̂_i) k_i, measured in the mixed abs/rel RMS norm.
//------------------------------------------------------------------------------
real_t ODEStepper::attemptStep(const RhsFunction& rhs, real_t t, const vec_complex& y, real_t h,
                               std::vector<vec_complex>& k, vec_complex& yNew)
{
    const size_t stage = b.size();
    const size_t n = y.size();
    vec_complex yStage(n);

    for (size_t i=1; i<stage; ++i)
    {
        #if defined(USE_OPENMP) || defined(USE_HYBRID)
        #pragma omp parallel for schedule(static)
        #endif
        for (size_t j=0; j<n; ++j)
        {
            complex_t tmp = y[j];
            for (size_t l=0; l<i; ++l)
            {
                if (a[i][l] != 0.0) tmp += h * a[i][l] * k[l][j];
            }
            yStage[j] = tmp;
        }

        rhs(t + c[i]*h, yStage, k[i]);
        ++stats.rhsEvaluations;
    }

    yNew = yStage;

    real_t norm2 = 0.0;

    #if defined(USE_OPENMP) || defined(USE_HYBRID)
    #pragma omp parallel for reduction(+:norm2) schedule(static)
    #endif
    for (size_t j=0; j<n; ++j)
    {
        complex_t err(0.0, 0.0);
        for (size_t l=0; l<stage; ++l)
        {
            err += h * (b[l] - bHat[l]) * k[l][j];
        }
        const real_t scale = tolerance + tolerance * std::max(std::abs(y[j]), std::abs(yNew[j]));
        const real_t ratio = std::abs(err) / scale;
        norm2 += ratio * ratio;
    }

    return std::sqrt(norm2 / static_cast<real_t>(n));
}

//------------------------------------------------------------------------------
// integrate
// Standard controller: accept if err ≤ 1, rescale h by 0.9·err^{-1/(q+1)}
// within [0.2, 10] (no growth right after a rejection). Steps landing on an
// output time are shortened so the solution is recorded there exactly; the
// unclipped proposal is kept for the next step.
//------------------------------------------------------------------------------
void ODEStepper::integrate(const RhsFunction& rhs, const vec_complex& y0, const vec_real& times,
                           std::vector<vec_complex>& trajectory, real_t dt0)
{
    if (times.empty())
    {
        throw std::invalid_argument("ODEStepper::integrate: no output times given!");
    }
    for (size_t i=1; i<times.size(); ++i)
    {
        if (!(times[i] > times[i-1]))
        {
            throw std::invalid_argument("ODEStepper::integrate: output times must be strictly increasing!");
        }
    }
    if (!(dt0 > 0.0))
    {
        throw std::invalid_argument("ODEStepper::integrate: initial step must be positive!");
    }

    stats = StepperStatistics {};
    trajectory.clear();
    trajectory.reserve(times.size());
    trajectory.push_back(y0);

    const size_t stage = b.size();
    const real_t exponent = -1.0 / static_cast<real_t>(errorOrder + 1);
    constexpr real_t safety = 0.9, minFactor = 0.2, maxFactor = 10.0;

    std::vector<vec_complex> k(stage, vec_complex(y0.size()));
    vec_complex y = y0, yNew(y0.size());

    real_t t = times.front();
    real_t h = dt0;
    bool lastRejected = false;

    rhs(t, y, k[0]);
    ++stats.rhsEvaluations;

    for (size_t out=1; out<times.size(); ++out)
    {
        const real_t tOut = times[out];

        while (t < tOut)
        {
            if (stats.acceptedSteps + stats.rejectedSteps >= maxSteps)
            {
                throw std::runtime_error("ODEStepper: exceeded the maximum of " + std::to_string(maxSteps)
                                         + " steps at t = " + std::to_string(t) + "!");
            }

            const real_t minStep = 16.0 * std::numeric_limits<real_t>::epsilon() * std::max(1.0, std::abs(t));
            if (h < minStep)
            {
                throw std::runtime_error("ODEStepper: step size underflow at t = " + std::to_string(t) + "!");
            }

            const bool clipped = (t + h >= tOut);
            const real_t hStep = clipped ? tOut - t : h;

            const real_t err = attemptStep(rhs, t, y, hStep, k, yNew);

            real_t factor = (err == 0.0) ? maxFactor : safety * std::pow(err, exponent);
            factor = std::min(maxFactor, std::max(minFactor, factor));

            if (err <= 1.0 && std::isfinite(err))
            {
                ++stats.acceptedSteps;
                t = clipped ? tOut : t + hStep;
                std::swap(y, yNew);
                std::swap(k[0], k[stage-1]);

                if (lastRejected) factor = std::min(factor, 1.0);
                // A clipped step only grows the proposal if it was itself the limiting size.
                if (!clipped || hStep >= h) h = hStep * factor;
                lastRejected = false;
            }
            else
            {
                ++stats.rejectedSteps;
                h = hStep * (std::isfinite(err) ? factor : minFactor);
                lastRejected = true;
            }
        }

        trajectory.push_back(y);

        if (verbose)
        {
            std::cout << "  t = " << std::setw(10) << std::setprecision(6) << t
                      << "  sample " << out+1 << "/" << times.size()
                      << "  steps " << stats.acceptedSteps
                      << " (rejected " << stats.rejectedSteps << ")" << std::endl;
        }
    }
}
