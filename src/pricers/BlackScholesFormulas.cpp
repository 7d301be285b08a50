#include <affinefm/pricers/BlackScholesFormulas.h>
#include <affinefm/utils/Errors.h>
#include <affinefm/utils/Utils.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>

namespace {
    double normCdf(double x) {
        return Utils::stdNormCdf(x);
    }

    double normPdf(double x) {
        return Utils::stdNormPdf(x);
    }

    std::string context(double price, double forward, double strike, double maturity, OptionType type)
    {
        return toString(type) + " price = " + Utils::toString(price) + ", F = " + Utils::toString(forward) +
               ", K = " + Utils::toString(strike) + ", T = " + Utils::toString(maturity);
    }
}

// ============================================================================
// d1/d2 Helpers
// ============================================================================

double BlackScholesFormulas::d1(double forward, double strike, double volatility, double maturity)
{
    if (maturity <= 0.0 || volatility <= 0.0)
    {
        return 0.0;
    }
    const double sqrtTime = std::sqrt(maturity);
    return (std::log(forward / strike) + 0.5 * volatility * volatility * maturity) / (volatility * sqrtTime);
}

double BlackScholesFormulas::d2(double forward, double strike, double volatility, double maturity)
{
    if (maturity <= 0.0 || volatility <= 0.0)
    {
        return 0.0;
    }
    return d1(forward, strike, volatility, maturity) - volatility * std::sqrt(maturity);
}

// ============================================================================
// Pricing Functions
// ============================================================================

double BlackScholesFormulas::price(double forward, double strike, double volatility, double maturity,
                                   OptionType type)
{
    return (type == OptionType::Call)
            ? callPrice(forward, strike, volatility, maturity)
            : putPrice(forward, strike, volatility, maturity);
}

/**
 * C = F·N(d1) - K·N(d2)
 */
double BlackScholesFormulas::callPrice(double forward, double strike, double volatility, double maturity)
{
    // zero vol or expiry: intrinsic on the forward
    if (maturity <= 0.0 || volatility <= 0.0)
    {
        return std::max(forward - strike, 0.0);
    }
    const double d1Val = d1(forward, strike, volatility, maturity);
    const double d2Val = d1Val - volatility * std::sqrt(maturity);
    return forward * normCdf(d1Val) - strike * normCdf(d2Val);
}

/**
 * P = K·N(-d2) - F·N(-d1)
 */
double BlackScholesFormulas::putPrice(double forward, double strike, double volatility, double maturity)
{
    if (maturity <= 0.0 || volatility <= 0.0)
    {
        return std::max(strike - forward, 0.0);
    }
    const double d1Val = d1(forward, strike, volatility, maturity);
    const double d2Val = d1Val - volatility * std::sqrt(maturity);
    return strike * normCdf(-d2Val) - forward * normCdf(-d1Val);
}

double BlackScholesFormulas::vega(double forward, double strike, double volatility, double maturity)
{
    if (maturity <= 0.0 || volatility <= 0.0) {
        return 0.0;
    }
    const double d1Val = d1(forward, strike, volatility, maturity);
    return forward * normPdf(d1Val) * std::sqrt(maturity);
}

double BlackScholesFormulas::price(const MarketData &market, double strike, double volatility, double maturity,
                                   OptionType type)
{
    return market.discount(maturity) * price(market.forward(maturity), strike, volatility, maturity, type);
}

double BlackScholesFormulas::intrinsic(double forward, double strike, OptionType type)
{
    return (type == OptionType::Call) ? std::max(forward - strike, 0.0) : std::max(strike - forward, 0.0);
}

double BlackScholesFormulas::upperBound(double forward, double strike, OptionType type)
{
    return (type == OptionType::Call) ? forward : strike;
}

// ============================================================================
// Implied Volatility
// ============================================================================

double BlackScholesFormulas::impliedVolatility(double price, double forward, double strike, double maturity,
                                               OptionType type, const ImpliedVolOptions &options)
{
    if (!std::isfinite(price))
        throw InvalidParameterError("impliedVolatility: non-finite price, " +
                                    context(price, forward, strike, maturity, type));
    if (!std::isfinite(forward) || forward <= 0.0 || !std::isfinite(strike) || strike <= 0.0 ||
        !std::isfinite(maturity) || maturity <= 0.0)
        throw InvalidParameterError("impliedVolatility: need positive forward, strike and maturity, " +
                                    context(price, forward, strike, maturity, type));

    const double tol = options.tolerance * forward;
    const double lowerBound = intrinsic(forward, strike, type);
    const double upper = upperBound(forward, strike, type);

    if (price < lowerBound - tol)
        throw NoArbitrageViolation("impliedVolatility: price below intrinsic " + Utils::toString(lowerBound) +
                                   ", " + context(price, forward, strike, maturity, type));
    if (price >= upper)
        throw NoArbitrageViolation("impliedVolatility: price at or above upper bound " + Utils::toString(upper) +
                                   ", " + context(price, forward, strike, maturity, type));
    if (price <= lowerBound + tol)
        return 0.0;

    int iter = 0;
    auto budgetExceeded = [&]() {
        return ConvergenceError("impliedVolatility: no convergence after " + std::to_string(options.maxIterations) +
                                " iterations, " + context(price, forward, strike, maturity, type));
    };

    // Bracket: Black(0) = intrinsic < price, grow σ_hi until Black(σ_hi) >= price
    double lo = 0.0;
    double hi = options.initialUpper;
    while (BlackScholesFormulas::price(forward, strike, hi, maturity, type) < price)
    {
        if (++iter >= options.maxIterations)
            throw budgetExceeded();
        lo = hi;
        hi *= 2.0;
    }

    // Initial guess from Brenner-Subrahmanyam, pulled into the bracket
    double sigma = std::sqrt(2.0 * std::numbers::pi / maturity) * price / forward;
    if (!(sigma > lo && sigma < hi))
        sigma = 0.5 * (lo + hi);

    while (iter < options.maxIterations)
    {
        ++iter;
        const double diff = BlackScholesFormulas::price(forward, strike, sigma, maturity, type) - price;
        if (std::abs(diff) <= tol)
            return sigma;

        // Black price is increasing in σ
        if (diff > 0.0) hi = sigma;
        else lo = sigma;

        if (hi - lo <= 1e-15 * hi)
            return sigma;

        const double v = vega(forward, strike, sigma, maturity);
        const double newton = (v > 0.0) ? sigma - diff / v : lo;
        sigma = (newton > lo && newton < hi) ? newton : 0.5 * (lo + hi);
    }

    throw budgetExceeded();
}
