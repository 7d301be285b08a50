#ifndef AFFINEFM_RICCATISOLVER_H
#define AFFINEFM_RICCATISOLVER_H

#include <complex>
#include <functional>
#include <vector>

using ComplexState = std::vector<std::complex<double>>;
// y' = f(t, y)
using ComplexRHS = std::function<ComplexState(double, const ComplexState&)>;

struct ODEOptions {
    double tolerance = 1e-10;   // absolute and relative, per component
    int maxSteps = 20000;       // attempted steps (accepted + rejected)
    double minStep = 1e-14;     // relative to the horizon T
};

struct ODEStats {
    int accepted = 0;
    int rejected = 0;
    int evaluations = 0;
};

/**
 * Adaptive embedded Runge-Kutta for complex ODE systems
 *
 * Cash & Karp (1990) 4(5) pair from Boost.Odeint, driven step by step
 * through its controlled stepper so the step budget can be enforced:
 *
 *   err = max_i |e_i| / (tol + tol · (|y_i| + h·|y'_i|))
 *   accept if err <= 1, otherwise retry with a smaller h
 *
 * The Riccati system of an affine CF is mildly stiff for large |u|
 * (decay rate ~ |d(u)|); explicit steps of size O(1/|d|) are still cheap
 * for the truncation ranges used in Fourier pricing.
 *
 * Throws NumericalInstabilityError when the step budget is exhausted,
 * the step size underflows or the state becomes non-finite.
 */
class RiccatiSolver
{
public:
    static ComplexState integrate(const ComplexRHS& f, const ComplexState& y0, double T,
                                  const ODEOptions& opts = {}, ODEStats* stats = nullptr);

private:
    RiccatiSolver() = delete;
};

#endif // AFFINEFM_RICCATISOLVER_H
