#include <affinefm/pricers/FourierPricer.h>
#include <affinefm/utils/Errors.h>
#include <affinefm/utils/Utils.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <numbers>

namespace {
    constexpr double PI = std::numbers::pi;
}

// ============================================================================
// PricingGrid
// ============================================================================

std::vector<double> PricingGrid::strikes() const
{
    std::vector<double> out;
    out.reserve(points.size());
    for (const auto &p : points) out.push_back(p.strike);
    return out;
}

std::vector<double> PricingGrid::prices() const
{
    std::vector<double> out;
    out.reserve(points.size());
    for (const auto &p : points) out.push_back(p.price);
    return out;
}

std::vector<double> PricingGrid::logMoneyness() const
{
    std::vector<double> out;
    out.reserve(points.size());
    for (const auto &p : points) out.push_back(p.logMoneyness);
    return out;
}

// ============================================================================
// FourierPricer - setup
// ============================================================================

FourierOptions FourierPricer::validated(const FourierOptions &options)
{
    if (options.nNodes == 0)
        throw InvalidParameterError("FourierPricer: nNodes must be positive");
    if (!std::isfinite(options.uMax) || options.uMax <= 0.0)
        throw InvalidParameterError("FourierPricer: uMax must be positive, got " + Utils::toString(options.uMax));
    if (!std::isfinite(options.dampingAlpha) || options.dampingAlpha <= 0.0)
        throw InvalidParameterError("FourierPricer: dampingAlpha must be positive, got " +
                                    Utils::toString(options.dampingAlpha));
    if (!std::isfinite(options.cosTruncation) || options.cosTruncation <= 0.0)
        throw InvalidParameterError("FourierPricer: cosTruncation must be positive, got " +
                                    Utils::toString(options.cosTruncation));
    if (!(options.integrationTolerance > 0.0))
        throw InvalidParameterError("FourierPricer: integrationTolerance must be positive, got " +
                                    Utils::toString(options.integrationTolerance));
    if (!(options.noArbitrageTolerance >= 0.0))
        throw InvalidParameterError("FourierPricer: noArbitrageTolerance must be non-negative, got " +
                                    Utils::toString(options.noArbitrageTolerance));
    return options;
}

FourierPricer::FourierPricer(const FourierOptions &options)
    : _options(validated(options)), _rule(_options.nNodes, 0.0, _options.uMax)
{
}

// ============================================================================
// FourierPricer - public interface
// ============================================================================

std::vector<double> FourierPricer::prices(const ModelParameters &params, double maturity, double forward,
                                          const std::vector<double> &strikes, OptionType type) const
{
    if (!std::isfinite(maturity) || maturity <= 0.0)
        throw InvalidParameterError("FourierPricer: maturity must be positive, got T = " + Utils::toString(maturity));
    if (!std::isfinite(forward) || forward <= 0.0)
        throw InvalidParameterError("FourierPricer: forward must be positive, got F = " + Utils::toString(forward));
    for (double K : strikes)
        if (!std::isfinite(K) || K <= 0.0)
            throw InvalidParameterError("FourierPricer: strikes must be positive, got K = " + Utils::toString(K));

    if (strikes.empty())
        return {};

    CharacteristicFunction cf(params, _options.cf);

    std::vector<double> k(strikes.size());
    for (size_t j = 0; j < strikes.size(); ++j)
        k[j] = std::log(strikes[j] / forward);

    std::vector<double> calls;
    switch (_options.method) {
        case FourierMethod::CarrMadan: calls = carrMadanCalls(cf, maturity, k); break;
        case FourierMethod::Lipton:    calls = liptonCalls(cf, maturity, k); break;
        case FourierMethod::COS:       calls = cosCalls(cf, maturity, k); break;
    }

    std::vector<double> result(strikes.size());
    for (size_t j = 0; j < strikes.size(); ++j) {
        double call = forward * calls[j];
        // undiscounted parity
        double value = (type == OptionType::Call) ? call : call - (forward - strikes[j]);
        result[j] = enforceBounds(value, forward, strikes[j], maturity, type, params);
    }
    return result;
}

double FourierPricer::price(const ModelParameters &params, double maturity, double forward, double strike,
                            OptionType type) const
{
    return prices(params, maturity, forward, std::vector<double>{strike}, type)[0];
}

PricingGrid FourierPricer::grid(const ModelParameters &params, double maturity, double forward,
                                const std::vector<double> &strikes, OptionType type) const
{
    auto values = prices(params, maturity, forward, strikes, type);

    PricingGrid g;
    g.maturity = maturity;
    g.forward = forward;
    g.type = type;
    g.points.reserve(strikes.size());
    for (size_t j = 0; j < strikes.size(); ++j)
        g.points.push_back({std::log(strikes[j] / forward), strikes[j], values[j]});
    return g;
}

std::vector<PricingGrid> FourierPricer::surface(const ModelParameters &params,
                                                const std::vector<double> &maturities,
                                                const std::vector<double> &forwards,
                                                const std::vector<std::vector<double>> &strikes,
                                                OptionType type) const
{
    size_t n = maturities.size();
    if (forwards.size() != n || strikes.size() != n)
        throw InvalidParameterError("FourierPricer::surface: got " + std::to_string(n) + " maturities, " +
                                    std::to_string(forwards.size()) + " forwards and " +
                                    std::to_string(strikes.size()) + " strike slices");

    std::vector<PricingGrid> result(n);
    // exceptions must not leave the parallel region, first one (by index) is rethrown
    std::vector<std::exception_ptr> errors(n);

#pragma omp parallel for schedule(dynamic)
    for (size_t i = 0; i < n; ++i)
    {
        try {
            result[i] = grid(params, maturities[i], forwards[i], strikes[i], type);
        } catch (...) {
            errors[i] = std::current_exception();
        }
    }

    for (const auto &e : errors)
        if (e) std::rethrow_exception(e);
    return result;
}

// ============================================================================
// FourierPricer - transforms
// ============================================================================

std::vector<double> FourierPricer::carrMadanCalls(const CharacteristicFunction &cf, double T,
                                                  const std::vector<double> &k) const
{
    using namespace std::complex_literals;

    const double alpha = _options.dampingAlpha;
    const auto &u = _rule.nodes();
    const auto &w = _rule.weights();
    const size_t n = u.size();

    auto kernel = [&](double v) {
        std::complex<double> den(alpha * alpha + alpha - v * v, (2.0 * alpha + 1.0) * v);
        return cf.evaluate(T, v - (alpha + 1.0) * 1i) / den;
    };

    // φ part does not depend on the strike
    std::vector<std::complex<double>> psi(n);
    for (size_t j = 0; j < n; ++j)
        psi[j] = kernel(u[j]);

    double kMin = *std::min_element(k.begin(), k.end());
    checkTail(std::exp(-alpha * kMin) / PI * std::abs(kernel(_options.uMax)), cf.parameters(), T);

    std::vector<double> calls(k.size());
    for (size_t m = 0; m < k.size(); ++m) {
        double sum = 0.0;
        for (size_t j = 0; j < n; ++j)
            sum += w[j] * std::real(std::exp(-1i * (u[j] * k[m])) * psi[j]);
        calls[m] = std::exp(-alpha * k[m]) / PI * sum;
    }
    return calls;
}

std::vector<double> FourierPricer::liptonCalls(const CharacteristicFunction &cf, double T,
                                               const std::vector<double> &k) const
{
    using namespace std::complex_literals;

    const auto &u = _rule.nodes();
    const auto &w = _rule.weights();
    const size_t n = u.size();

    auto kernel = [&](double v) {
        return cf.evaluate(T, v - 0.5i) / (v * v + 0.25);
    };

    std::vector<std::complex<double>> psi(n);
    for (size_t j = 0; j < n; ++j)
        psi[j] = kernel(u[j]);

    double kMax = *std::max_element(k.begin(), k.end());
    checkTail(std::exp(0.5 * kMax) / PI * std::abs(kernel(_options.uMax)), cf.parameters(), T);

    std::vector<double> calls(k.size());
    for (size_t m = 0; m < k.size(); ++m) {
        double sum = 0.0;
        for (size_t j = 0; j < n; ++j)
            sum += w[j] * std::real(std::exp(-1i * (u[j] * k[m])) * psi[j]);
        calls[m] = 1.0 - std::exp(0.5 * k[m]) / PI * sum;
    }
    return calls;
}

double FourierPricer::chi(size_t n, double a, double b, double c, double d)
{
    if (n == 0)
        return std::exp(d) - std::exp(c);

    double w = n * PI / (b - a);
    return (std::exp(d) * (std::cos(w * (d - a)) + w * std::sin(w * (d - a))) -
            std::exp(c) * (std::cos(w * (c - a)) + w * std::sin(w * (c - a)))) / (1.0 + w * w);
}

double FourierPricer::psi(size_t n, double a, double b, double c, double d)
{
    if (n == 0)
        return d - c;

    double w = n * PI / (b - a);
    return (std::sin(w * (d - a)) - std::sin(w * (c - a))) / w;
}

std::vector<double> FourierPricer::cosCalls(const CharacteristicFunction &cf, double T,
                                            const std::vector<double> &k) const
{
    /**
     * y = ln(S_T/K) = x0 + X, x0 = ln(F/K) = -k
     * Common domain [a, b] covering every strike, a < 0 < b so the put
     * payoff K(1 - e^y)^+ on [a, 0] is never empty.
     */
    const ModelParameters &params = cf.parameters();
    const size_t N = _options.nNodes;

    double variance = std::max(params.v0(), params.theta());
    if (params.hasJumps())
        variance += params.lambda() * (params.muJ() * params.muJ() + params.deltaJ() * params.deltaJ());
    double halfWidth = _options.cosTruncation * std::sqrt(variance * T);

    double x0Min = std::numeric_limits<double>::max();
    double x0Max = std::numeric_limits<double>::lowest();
    for (double km : k) {
        x0Min = std::min(x0Min, -km);
        x0Max = std::max(x0Max, -km);
    }
    double a = std::min(x0Min - halfWidth, -halfWidth);
    double b = std::max(x0Max + halfWidth, halfWidth);
    double bma = b - a;

    // φ(ω_n) and put payoff coefficients, shared by all strikes
    std::vector<std::complex<double>> phi(N);
    std::vector<double> V(N);
    for (size_t n = 0; n < N; ++n) {
        double w = n * PI / bma;
        phi[n] = cf.evaluate(T, w);
        V[n] = (2.0 / bma) * (-chi(n, a, b, a, 0.0) + psi(n, a, b, a, 0.0));
    }
    V[0] *= 0.5;   // first term halved

    // last series term in units of F, with the envelope |V_n| <= 2/(b-a) · (2(1+ω)/(1+ω²) + 1/ω)
    double kMax = *std::max_element(k.begin(), k.end());
    double wLast = (N - 1) * PI / bma;
    double envelope = (N > 1)
        ? (2.0 / bma) * (2.0 * (1.0 + wLast) / (1.0 + wLast * wLast) + 1.0 / wLast)
        : std::abs(V[0]);
    checkTail(std::exp(kMax) * std::abs(phi[N - 1]) * envelope, params, T);

    std::vector<double> calls(k.size());
    for (size_t m = 0; m < k.size(); ++m) {
        double x0 = -k[m];
        double sum = 0.0;
        for (size_t n = 0; n < N; ++n) {
            double w = n * PI / bma;
            sum += std::real(phi[n] * std::exp(std::complex<double>(0.0, w * (x0 - a)))) * V[n];
        }
        double putOverF = std::exp(k[m]) * sum;
        // C/F = P/F + 1 - K/F
        calls[m] = putOverF + 1.0 - std::exp(k[m]);
    }
    return calls;
}

// ============================================================================
// FourierPricer - checks
// ============================================================================

void FourierPricer::checkTail(double magnitude, const ModelParameters &params, double T) const
{
    if (!std::isfinite(magnitude) || magnitude > _options.integrationTolerance)
        throw IntegrationError("FourierPricer: integrand not decayed at truncation (|f| = " +
                               Utils::toString(magnitude) + " > " + Utils::toString(_options.integrationTolerance) +
                               ", uMax = " + Utils::toString(_options.uMax) + ", nNodes = " +
                               std::to_string(_options.nNodes) + ") for " + params.toString() +
                               ", T = " + Utils::toString(T));
}

double FourierPricer::enforceBounds(double value, double forward, double strike, double T, OptionType type,
                                    const ModelParameters &params) const
{
    const bool isCall = (type == OptionType::Call);
    const double lower = isCall ? std::max(forward - strike, 0.0) : std::max(strike - forward, 0.0);
    const double upper = isCall ? forward : strike;
    const double tol = _options.noArbitrageTolerance * forward;

    auto fail = [&](const std::string &what) {
        throw IntegrationError("FourierPricer: " + what + " " + ::toString(type) + " price " +
                               Utils::toString(value) + " (bounds [" + Utils::toString(lower) + ", " +
                               Utils::toString(upper) + "], tol " + Utils::toString(tol) + ") at K = " +
                               Utils::toString(strike) + ", F = " + Utils::toString(forward) + ", T = " +
                               Utils::toString(T) + " for " + params.toString());
    };

    if (!std::isfinite(value))
        fail("non-finite");
    if (value < lower) {
        if (value < lower - tol)
            fail("below intrinsic");
        return lower;
    }
    if (value > upper) {
        if (value > upper + tol)
            fail("above upper bound");
        return upper;
    }
    return value;
}
