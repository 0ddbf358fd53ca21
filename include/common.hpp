#pragma once
/**
 * @file common.hpp
 * @brief Common type aliases, utility functions, and third-party includes
 *        for the Hermite–Fourier Vlasov–Maxwell solver.
 *
 * @details
 * This header centralizes:
 *  - Standard library and third-party includes.
 *  - Type aliases for reals, complex numbers, and vectors/matrices.
 *  - Parallelism headers (OpenMP/MPI) enabled via compile-time flags.
 *  - Shared numerical/IO utility functions (approximate equality checks,
 *    printing, small least-squares fitting routines).
 *
 * It is intended to be included across the project for consistent types
 * and helper functions.
 */

// ========== Standard Library ==========
#include <iostream>
#include <iomanip>
#include <cmath>
#include <complex>
#include <vector>
#include <array>
#include <map>
#include <tuple>
#include <mutex>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <functional>
#include <memory>
#include <cstring>
#include <string>
#include <sstream>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <limits>

// ========== Third-Party Libraries ==========
#include <nlohmann/json.hpp> ///< JSON for Modern C++

// ========== LAPACK ==========
#include <lapacke.h>        ///< LAPACK C interface

// ========== FFTW ==========
#include <fftw3.h>          ///< FFTW3 for spectral transforms

// ========== Parallelism ==========
#ifdef USE_OPENMP
#include <omp.h>            ///< OpenMP parallelism
#endif

#ifdef USE_MPI
#include <mpi.h>            ///< MPI parallelism
#endif

#ifdef USE_HYBRID
#include <mpi.h>
#include <omp.h>
#endif

// ========== ENUM CLASSES ==========
/**
 * @enum Scheme
 * @brief Available embedded explicit Runge–Kutta integration schemes.
 */
enum class Scheme { Dopri5, Bosh3 };

// ========== Aliases ===============
using real_t     = double;                     ///< Floating point type used globally.
using complex_t  = std::complex<real_t>;       ///< Complex number type.
using vec_real   = std::vector<real_t>;        ///< Vector of real values.
using vec_complex= std::vector<complex_t>;     ///< Vector of complex values.
using mat_real   = std::vector<std::vector<real_t>>;   ///< Matrix of real values.
using json       = nlohmann::json;             ///< JSON type alias.

/// Imaginary unit.
inline constexpr complex_t I_unit {0.0, 1.0};

// ============ Common Functions =======

/**
 * @brief Check approximate equality of two complex numbers.
 * @param a First number.
 * @param b Second number.
 * @param tol Absolute tolerance (default 1e-15).
 * @return true if both |Re(a-b)| and |Im(a-b)| are below tol.
 */
bool almost_equal(complex_t a, complex_t b, double tol = 1e-15);

/**
 * @brief Check approximate equality of two real numbers.
 * @param a First number.
 * @param b Second number.
 * @param tol Absolute tolerance (default 1e-15).
 * @return true if |a-b| < tol.
 */
bool almost_equal(double a, double b, double tol = 1e-15);

/**
 * @brief Parse a scheme name ("Dopri5", "Bosh3").
 * @throws std::invalid_argument for unknown names.
 */
Scheme scheme_from_string(const std::string& name);

/// Inverse of scheme_from_string.
std::string scheme_to_string(Scheme scheme);

/**
 * @brief Uniformly spaced samples on the closed interval [start, stop].
 * @param num Number of samples (num=1 returns {start}).
 */
vec_real linspace(real_t start, real_t stop, size_t num);

/**
 * @brief Fit y ≈ a + b x in least squares sense.
 *
 * @param x_vals Vector of x-samples.
 * @param y_vals Vector of y-samples (same length as x_vals).
 * @return Coefficients [a, b] minimizing the least squares error.
 *
 * @throws std::invalid_argument if input sizes mismatch or fewer than 2 points.
 * @throws std::runtime_error if LAPACK reports a failure.
 */
vec_real fit_linear_least_squares(const vec_real& x_vals, const vec_real& y_vals);

/**
 * @brief Convert a complex array into a JSON object
 *        {"shape": [...], "real": [...], "imag": [...]}.
 */
json complex_array_to_json(const vec_complex& data, const std::vector<size_t>& shape);

/**
 * @brief Convert a JSON object produced by complex_array_to_json back.
 * @throws std::invalid_argument if the real/imag lengths differ.
 */
vec_complex complex_array_from_json(const json& node);
