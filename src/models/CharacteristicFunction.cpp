#include <affinefm/models/CharacteristicFunction.h>
#include <affinefm/math/RiccatiSolver.h>
#include <affinefm/utils/Errors.h>
#include <affinefm/utils/Utils.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <sstream>

namespace {
    constexpr double PI = std::numbers::pi;
    // substeps of the branch walk: at most π/4 rotation of e^{-dt} per step
    constexpr int MIN_LOG_STEPS = 8;
    constexpr int MAX_LOG_STEPS = 1 << 16;
}

// ============================================================================
// ContinuousLog
// ============================================================================

std::complex<double> ContinuousLog::next(std::complex<double> z)
{
    if (!Utils::isFinite(z) || !(std::abs(z) > 0.0)) {
        std::ostringstream oss;
        oss << "ContinuousLog: logarithm undefined at z = " << z;
        throw NumericalInstabilityError(oss.str());
    }

    std::complex<double> w = std::log(z);   // principal branch
    int k = static_cast<int>(std::round((std::imag(_value) - std::imag(w)) / (2.0 * PI)));
    w += std::complex<double>(0.0, 2.0 * PI * k);

    _branch = k;
    _value = w;
    return w;
}

// ============================================================================
// CharacteristicFunction
// ============================================================================

CharacteristicFunction::CharacteristicFunction(const ModelParameters &params,
                                               const CharacteristicFunctionOptions &options)
    : _params(params), _options(options)
{
    _params.validate();
    if (options.method == RiccatiMethod::NumericalODE &&
        (!(options.odeTolerance > 0.0) || options.odeMaxSteps <= 0))
        throw InvalidParameterError("CharacteristicFunction: need odeTolerance > 0 and odeMaxSteps > 0, got " +
                                    Utils::toString(options.odeTolerance) + " / " + std::to_string(options.odeMaxSteps));
}

void CharacteristicFunction::checkMaturity(double T) const
{
    if (!std::isfinite(T) || T <= 0.0)
        throw InvalidParameterError("CharacteristicFunction: maturity must be positive and finite, got T = " +
                                    Utils::toString(T) + " for " + _params.toString());
}

std::string CharacteristicFunction::context(double T, std::complex<double> u) const
{
    std::ostringstream oss;
    oss << _params.toString() << ", T = " << Utils::toString(T)
        << ", u = (" << Utils::toString(u.real()) << ", " << Utils::toString(u.imag()) << ")";
    return oss.str();
}

std::complex<double> CharacteristicFunction::jumpExponent(std::complex<double> u) const
{
    if (!_params.hasJumps() || _params.lambda() == 0.0)
        return {0.0, 0.0};

    using namespace std::complex_literals;
    const double lambda = _params.lambda();
    const double muJ = _params.muJ();
    const double delta2 = _params.deltaJ() * _params.deltaJ();

    const std::complex<double> iu = 1i * u;
    // E[e^J] - 1 compensates the drift so that S/F stays a martingale
    const double compensator = std::exp(muJ + 0.5 * delta2) - 1.0;

    return lambda * (std::exp(iu * muJ - 0.5 * u * u * delta2) - 1.0) - iu * lambda * compensator;
}

std::complex<double> CharacteristicFunction::closedFormExponent(double T, std::complex<double> u) const
{
    using namespace std::complex_literals;

    const double kappa = _params.kappa();
    const double theta = _params.theta();
    const double sigma = _params.sigma();
    const double rho = _params.rho();
    const double sigma2 = sigma * sigma;

    const std::complex<double> iu = 1i * u;
    const std::complex<double> alpha = -0.5 * (u * u + iu);
    const std::complex<double> psiJ = jumpExponent(u);

    // α = 0 (u = 0 or u = -i): D stays at 0, g below would be 0/0 for Original
    if (alpha == std::complex<double>(0.0, 0.0))
        return psiJ * T;

    const std::complex<double> beta = kappa - rho * sigma * iu;
    std::complex<double> d = std::sqrt(beta * beta - 2.0 * sigma2 * alpha);
    // Re(d) >= 0 picks one root consistently (Albrecher et al. 2007)
    if (std::real(d) < 0.0)
        d = -d;

    const bool trap = (_options.formulation == HestonFormulation::LittleTrap);
    const std::complex<double> g = trap ? (beta - d) / (beta + d) : (beta + d) / (beta - d);
    // |e^{-dt}| <= 1 for both formulations, Original is rewritten from e^{dt}
    const std::complex<double> e = std::exp(-d * T);

    // Original: (1 - e^{dT})/(1 - g e^{dT}) = (e^{-dT} - 1)/(e^{-dT} - g)
    const std::complex<double> D = trap ? ((beta - d) / sigma2) * (1.0 - e) / (1.0 - g * e)
                                        : ((beta + d) / sigma2) * (e - 1.0) / (e - g);

    // LittleTrap: log((1 - g e^{-dt}) / (1 - g))
    // Original:   log((1 - g e^{dt}) / (1 - g)) = dt + log((e^{-dt} - g) / (1 - g)),
    //             the dt part is folded into (β - d)T below
    const std::complex<double> oneMinusG = 1.0 - g;
    auto logArgument = [&](const std::complex<double> &et) {
        return trap ? (1.0 - g * et) / oneMinusG : (et - g) / oneMinusG;
    };

    std::complex<double> logTerm;
    if (trap && std::abs(g) < 1.0)
    {
        // both 1 - g and 1 - g e^{-dt} stay in the right half-plane
        logTerm = std::log(1.0 - g * e) - std::log(oneMinusG);
    }
    else
    {
        double steps = std::ceil(4.0 * std::abs(d) * T / PI);
        if (steps > MAX_LOG_STEPS)
            throw NumericalInstabilityError("CharacteristicFunction: branch walk needs " + Utils::toString(steps) +
                                            " steps, more than " + std::to_string(MAX_LOG_STEPS) + ", " +
                                            context(T, u));
        int m = std::max(MIN_LOG_STEPS, static_cast<int>(steps));
        ContinuousLog tracker;
        for (int j = 1; j <= m; ++j) {
            double t = T * static_cast<double>(j) / m;
            tracker.next(logArgument(std::exp(-d * t)));
        }
        logTerm = tracker.value();
    }

    const std::complex<double> C = (kappa * theta / sigma2) * ((beta - d) * T - 2.0 * logTerm) + psiJ * T;
    return C + D * _params.v0();
}

std::complex<double> CharacteristicFunction::odeExponent(double T, std::complex<double> u) const
{
    using namespace std::complex_literals;

    const double kappa = _params.kappa();
    const double theta = _params.theta();
    const double sigma = _params.sigma();
    const double rho = _params.rho();

    const std::complex<double> iu = 1i * u;
    const std::complex<double> alpha = -0.5 * (u * u + iu);
    const std::complex<double> beta = kappa - rho * sigma * iu;
    const double gamma = 0.5 * sigma * sigma;
    const std::complex<double> psiJ = jumpExponent(u);

    // y = (D, C)
    ComplexRHS rhs = [&](double, const ComplexState &y) -> ComplexState {
        const std::complex<double> &D = y[0];
        return {alpha - beta * D + gamma * D * D, kappa * theta * D + psiJ};
    };

    ODEOptions opts;
    opts.tolerance = _options.odeTolerance;
    opts.maxSteps = _options.odeMaxSteps;

    ComplexState y;
    try {
        y = RiccatiSolver::integrate(rhs, {0.0, 0.0}, T, opts);
    } catch (const NumericalInstabilityError &e) {
        throw NumericalInstabilityError(std::string(e.what()) + " for " + context(T, u));
    }
    return y[1] + y[0] * _params.v0();
}

std::complex<double> CharacteristicFunction::logEvaluate(double maturity, std::complex<double> u) const
{
    checkMaturity(maturity);
    if (!Utils::isFinite(u))
        throw InvalidParameterError("CharacteristicFunction: non-finite argument for " + context(maturity, u));

    std::complex<double> exponent = (_options.method == RiccatiMethod::ClosedForm)
                                        ? closedFormExponent(maturity, u)
                                        : odeExponent(maturity, u);
    if (!Utils::isFinite(exponent))
        throw NumericalInstabilityError("CharacteristicFunction: non-finite exponent for " + context(maturity, u));
    return exponent;
}

std::complex<double> CharacteristicFunction::evaluate(double maturity, std::complex<double> u) const
{
    std::complex<double> phi = std::exp(logEvaluate(maturity, u));
    if (!Utils::isFinite(phi))
        throw NumericalInstabilityError("CharacteristicFunction: non-finite value for " + context(maturity, u));
    return phi;
}

std::vector<std::complex<double>> CharacteristicFunction::evaluate(double maturity,
                                                                   const std::vector<std::complex<double>> &u) const
{
    checkMaturity(maturity);
    std::vector<std::complex<double>> result(u.size());
    for (size_t i = 0; i < u.size(); ++i)
        result[i] = evaluate(maturity, u[i]);
    return result;
}
