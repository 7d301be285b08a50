#ifndef AFFINEFM_CHARACTERISTICFUNCTION_H
#define AFFINEFM_CHARACTERISTICFUNCTION_H

#include <affinefm/models/ModelParameters.h>
#include <complex>
#include <string>
#include <vector>

enum class RiccatiMethod {
    ClosedForm,     // explicit solution of the Riccati system
    NumericalODE    // adaptive Runge-Kutta on the Riccati system
};

enum class HestonFormulation {
    LittleTrap,     // Albrecher et al. (2007), |g| < 1 on the real axis
    Original        // Heston (1993), log taken along the maturity path
};

struct CharacteristicFunctionOptions {
    RiccatiMethod method = RiccatiMethod::ClosedForm;
    HestonFormulation formulation = HestonFormulation::LittleTrap;
    double odeTolerance = 1e-10;
    int odeMaxSteps = 20000;
};


/**
 * Continuous branch of the complex logarithm along a path
 *
 * std::log returns the principal branch, Im in (-π, π]. Along a path z(t)
 * that winds around the origin this jumps by 2π. The tracker keeps the
 * previous value and picks log|z| + i(arg z + 2πk) with k chosen so the
 * imaginary part moves by less than π.
 *
 * Starts at log(1) = 0. Steps must be fine enough that arg z changes by
 * less than π between two calls.
 */
class ContinuousLog
{
public:
    ContinuousLog() = default;

    // log(z) on the branch continuous with the previous call
    std::complex<double> next(std::complex<double> z);

    std::complex<double> value() const { return _value; }
    // Im(value) = arg(z) + 2π · branch()
    int branch() const { return _branch; }

private:
    std::complex<double> _value{0.0, 0.0};
    int _branch = 0;
};


/**
 * ============================================================================
 * CHARACTERISTIC FUNCTION OF AN AFFINE MODEL
 * ============================================================================
 *
 * φ(u) = E[exp(iu · X)],  X = ln(S_T / F_T)     (forward measure, no drift)
 *
 * φ(u) = exp(C(T) + D(T) · v0), with the Riccati system in time to maturity
 *
 *   D' = α - β·D + γ·D²,   α = -(u² + iu)/2,  β = κ - ρσiu,  γ = σ²/2
 *   C' = κθ·D + ψ_J(u),    C(0) = D(0) = 0
 *
 *   ψ_J(u) = λ(e^{iuμ_J - u²δ_J²/2} - 1) - iuλ(e^{μ_J + δ_J²/2} - 1)   (Bates)
 *
 * Closed form, d = sqrt(β² + σ²(u² + iu)) with Re(d) >= 0:
 *
 *   LittleTrap:  g = (β - d)/(β + d)
 *                D = (β - d)/σ² · (1 - e^{-dT}) / (1 - g e^{-dT})
 *                C = κθ/σ² · [(β - d)T - 2 log((1 - g e^{-dT}) / (1 - g))] + ψ_J T
 *
 *   Original:    g = (β + d)/(β - d)
 *                D = (β + d)/σ² · (1 - e^{dT}) / (1 - g e^{dT})
 *                C = κθ/σ² · [(β + d)T - 2 log((1 - g e^{dT}) / (1 - g))] + ψ_J T
 *
 *   evaluated through e^{-dT} so nothing overflows at long maturities:
 *                D = (β + d)/σ² · (e^{-dT} - 1) / (e^{-dT} - g)
 *                C = κθ/σ² · [(β - d)T - 2 log((e^{-dT} - g) / (1 - g))] + ψ_J T
 *
 * The log in C is taken with ContinuousLog along t ∈ [0, T], always for
 * Original. For LittleTrap with |g| < 1 the argument stays in the right
 * half-plane and a single step is exact. A walk that would need more than
 * 2^16 steps throws NumericalInstabilityError.
 *
 * u may be complex: Carr-Madan evaluates at u - (α+1)i, Lipton at u - i/2.
 * φ(0) = 1 and φ(-i) = E[S_T/F_T] = 1 (martingale).
 *
 * Errors:
 *   InvalidParameterError      inadmissible parameters, T <= 0 or non-finite
 *   NumericalInstabilityError  ODE budget / step underflow, non-finite φ
 */
class CharacteristicFunction
{
public:
    CharacteristicFunction(const ModelParameters &params,
                           const CharacteristicFunctionOptions &options = {});

    std::complex<double> evaluate(double maturity, std::complex<double> u) const;

    // vectorised, same order as u
    std::vector<std::complex<double>> evaluate(double maturity,
                                               const std::vector<std::complex<double>> &u) const;

    // C(T) + D(T)·v0
    std::complex<double> logEvaluate(double maturity, std::complex<double> u) const;

    // ψ_J(u), zero for Heston
    std::complex<double> jumpExponent(std::complex<double> u) const;

    const ModelParameters &parameters() const { return _params; }
    const CharacteristicFunctionOptions &options() const { return _options; }

private:
    std::complex<double> closedFormExponent(double T, std::complex<double> u) const;
    std::complex<double> odeExponent(double T, std::complex<double> u) const;
    void checkMaturity(double T) const;
    std::string context(double T, std::complex<double> u) const;

    ModelParameters _params;
    CharacteristicFunctionOptions _options;
};

#endif // AFFINEFM_CHARACTERISTICFUNCTION_H
