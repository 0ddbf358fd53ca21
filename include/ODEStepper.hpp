#pragma once
/**
 * @file ODEStepper.hpp
 * @brief Adaptive embedded explicit Runge–Kutta integrator for the
 *        Vlasov–Maxwell state vector.
 *
 * @details
 * The ODEStepper advances a complex state y(t) with y' = f(t, y) using an
 * embedded pair with first-same-as-last stages. Supported methods are
 * Dopri5 (Dormand–Prince 5(4)) and Bosh3 (Bogacki–Shampine 3(2)).
 *
 * Responsibilities:
 *  - Hold the Butcher tableau (a, b, b̂, c) of the selected scheme.
 *  - Control the step size from the embedded error estimate.
 *  - Sample the solution exactly at the requested output times.
 *  - Abort with std::runtime_error once the step budget is exhausted.
 */

#include "common.hpp"

/**
 * @struct StepperStatistics
 * @brief Counters of one integrate() call.
 */
struct StepperStatistics
{
    size_t acceptedSteps {0};
    size_t rejectedSteps {0};
    size_t rhsEvaluations {0};
};

/**
 * @class ODEStepper
 * @brief Explicit adaptive Runge–Kutta solver sampling at fixed output times.
 *
 * @section usage Usage
 * - Construct with the scheme, the tolerance (used as atol and rtol) and the
 *   maximum number of internal steps.
 * - Call integrate() with the right-hand side, the initial state, the output
 *   times and a first trial step.
 *
 * @section notes Notes
 * - Error norm: RMS over i of |err_i| / (tol + tol·max(|y_i|, |y_new_i|)).
 * - Step factor 0.9·err^{-1/(q+1)} clamped to [0.2, 10], q the order of
 *   the embedded solution.
 * - Accepted and rejected steps both count against the budget.
 */
class ODEStepper
{
  public:
    using RhsFunction = std::function<void(real_t, const vec_complex&, vec_complex&)>;

  private:
    Scheme scheme;          ///< Selected embedded Runge–Kutta pair.
    real_t tolerance;       ///< Absolute and relative tolerance.
    size_t maxSteps;        ///< Upper bound on internal steps.
    bool verbose;           ///< Print progress per output sample.

    mat_real a;             ///< Butcher matrix (lower triangular).
    vec_real b;             ///< Weights of the propagated solution.
    vec_real bHat;          ///< Weights of the embedded solution.
    vec_real c;             ///< Nodes.
    int errorOrder;         ///< Order q of the embedded solution.

    StepperStatistics stats;

    /**
     * @brief Attempt one step of size h from (t, y).
     * @param[in]     rhs   Right-hand side.
     * @param[in]     t     Start time.
     * @param[in]     y     State at t.
     * @param[in]     h     Step size.
     * @param[in,out] k     Stage derivatives; k[0] must hold f(t, y) on entry.
     * @param[out]    yNew  Candidate state at t + h.
     * @return Scaled RMS error estimate.
     */
    real_t attemptStep(const RhsFunction& rhs, real_t t, const vec_complex& y, real_t h,
                       std::vector<vec_complex>& k, vec_complex& yNew);

  public:
    /**
     * @brief Construct ODEStepper.
     * @param method    Dopri5 or Bosh3.
     * @param tolerance Tolerance used for both atol and rtol (> 0).
     * @param maxSteps  Maximum number of internal steps (> 0).
     * @param verbose   Print progress lines to std::cout.
     * @throws std::invalid_argument for non-positive tolerance or budget.
     */
    ODEStepper(Scheme method, real_t tolerance, size_t maxSteps = 1000000, bool verbose = false);

    /**
     * @brief Integrate from times.front() and record the state at each time.
     * @param[in]  rhs        Right-hand side f(t, y, dydt).
     * @param[in]  y0         State at times.front().
     * @param[in]  times      Strictly increasing output times.
     * @param[out] trajectory One state per output time (first one is y0).
     * @param[in]  dt0        First trial step (> 0).
     * @throws std::invalid_argument for malformed times or dt0.
     * @throws std::runtime_error if the step budget is exhausted or the step
     *         size underflows.
     */
    void integrate(const RhsFunction& rhs, const vec_complex& y0, const vec_real& times,
                   std::vector<vec_complex>& trajectory, real_t dt0);

    /// Counters of the last integrate() call.
    const StepperStatistics& statistics() const { return stats; }

    Scheme method() const { return scheme; }
};
