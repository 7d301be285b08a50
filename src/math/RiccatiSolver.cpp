#include <affinefm/math/RiccatiSolver.h>
#include <affinefm/utils/Errors.h>
#include <affinefm/utils/Utils.h>

#include <boost/numeric/odeint.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace odeint = boost::numeric::odeint;

namespace {
    // cut applied to h after a trial step that produced a non-finite state
    constexpr double NON_FINITE_SCALE = 0.2;

    bool allFinite(const ComplexState& y)
    {
        for (const auto& yi : y)
            if (!Utils::isFinite(yi))
                return false;
        return true;
    }
}

ComplexState RiccatiSolver::integrate(const ComplexRHS& f, const ComplexState& y0, double T,
                                      const ODEOptions& opts, ODEStats* stats)
{
    if (!std::isfinite(T) || T < 0.0)
        throw InvalidParameterError("RiccatiSolver: horizon must be non-negative, got " + Utils::toString(T));
    if (!(opts.tolerance > 0.0) || opts.maxSteps <= 0)
        throw InvalidParameterError("RiccatiSolver: need tolerance > 0 and maxSteps > 0");

    ODEStats local;
    ComplexState y = y0;
    if (T == 0.0) {
        if (stats) *stats = local;
        return y;
    }

    const size_t n = y.size();
    auto system = [&](const ComplexState& yi, ComplexState& dydt, double ti) {
        ++local.evaluations;
        ComplexState k = f(ti, yi);
        if (k.size() != n)
            throw InvalidParameterError("RiccatiSolver: right-hand side returned " + std::to_string(k.size()) +
                                        " components, expected " + std::to_string(n));
        dydt = std::move(k);
    };

    using Stepper = odeint::runge_kutta_cash_karp54<ComplexState>;
    auto controlled = odeint::make_controlled(opts.tolerance, opts.tolerance, Stepper());

    const double hMin = opts.minStep * std::max(1.0, T);
    double t = 0.0;
    double h = T / 16.0;
    ComplexState yNew(n);

    while (t < T)
    {
        if (local.accepted + local.rejected >= opts.maxSteps)
            throw NumericalInstabilityError("RiccatiSolver: step budget of " + std::to_string(opts.maxSteps) +
                                            " exhausted at t = " + Utils::toString(t) + " of T = " + Utils::toString(T));
        if (h < hMin)
            throw NumericalInstabilityError("RiccatiSolver: step size underflow (h = " + Utils::toString(h) +
                                            ") at t = " + Utils::toString(t) + " of T = " + Utils::toString(T));

        bool last = (t + h >= T);
        if (last) h = T - t;

        const double tPrev = t;
        const double hPrev = h;
        odeint::controlled_step_result result = controlled.try_step(system, y, t, yNew, h);

        if (result == odeint::success && !allFinite(yNew)) {
            // the error norm ignores NaN, an oversized step can slip through
            ++local.rejected;
            t = tPrev;
            h = hPrev * NON_FINITE_SCALE;
            continue;
        }

        if (result == odeint::success) {
            ++local.accepted;
            if (last) t = T;
            y.swap(yNew);
        } else {
            ++local.rejected;
        }
    }

    if (!allFinite(y))
        throw NumericalInstabilityError("RiccatiSolver: non-finite state at T = " + Utils::toString(T));

    if (stats) *stats = local;
    return y;
}
