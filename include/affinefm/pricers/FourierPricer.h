#ifndef AFFINEFM_FOURIERPRICER_H
#define AFFINEFM_FOURIERPRICER_H

#include <affinefm/market/OptionType.h>
#include <affinefm/math/Quadrature.h>
#include <affinefm/models/CharacteristicFunction.h>
#include <affinefm/models/ModelParameters.h>
#include <complex>
#include <vector>

enum class FourierMethod {
    CarrMadan,  // damped transform, Gauss-Legendre on [0, uMax]
    Lipton,     // Lewis-Lipton single integral at u - i/2, Gauss-Legendre on [0, uMax]
    COS         // Fang-Oosterlee cosine expansion, nNodes terms
};

struct FourierOptions {
    FourierMethod method = FourierMethod::CarrMadan;
    size_t nNodes = 256;                 // quadrature nodes (COS: series terms)
    double uMax = 200.0;                 // truncation of the Fourier integral
    double dampingAlpha = 1.5;           // Carr-Madan α > 0, needs E[S_T^{α+1}] < ∞
    double cosTruncation = 10.0;         // COS: domain half-width in standard deviations
    double integrationTolerance = 1e-6;  // max |integrand| at uMax, in units of the forward
    double noArbitrageTolerance = 1e-7;  // bound violation tolerance, in units of the forward
    CharacteristicFunctionOptions cf;
};

struct PricingPoint {
    double logMoneyness;  // ln(K/F)
    double strike;
    double price;         // undiscounted
};

/**
 * Output of one transform call at a fixed maturity
 * Points are in input strike order.
 */
struct PricingGrid {
    double maturity = 0.0;
    double forward = 0.0;
    OptionType type = OptionType::Call;
    std::vector<PricingPoint> points;

    std::vector<double> strikes() const;
    std::vector<double> prices() const;
    std::vector<double> logMoneyness() const;
};


/**
 * ============================================================================
 * FOURIER PRICER
 * ============================================================================
 *
 * Undiscounted European prices from the characteristic function of
 * X = ln(S_T/F_T), k = ln(K/F):
 *
 * Carr & Madan (1999):
 *   C/F = e^{-αk}/π ∫_0^uMax Re[ e^{-iuk} φ(u - (α+1)i) / (α² + α - u² + i(2α+1)u) ] du
 *
 * Lewis (2000) / Lipton (2002):
 *   C/F = 1 - e^{k/2}/π ∫_0^uMax Re[ e^{-iuk} φ(u - i/2) ] / (u² + 1/4) du
 *
 * COS, Fang & Oosterlee (2008):
 *   P = K · Σ' Re[φ(ω_n) e^{iω_n(x0 - a)}] · V_n,  x0 = ln(F/K),  ω_n = nπ/(b - a)
 *   priced as puts (bounded payoff on [a, 0]), calls by parity
 *
 * Puts from calls by undiscounted parity: P = C - (F - K).
 *
 * NOTES:
 * (1) The Gauss-Legendre rule is built once in the constructor. The pricer
 *     is immutable afterwards and safe to share across threads.
 * (2) φ is evaluated once per maturity and reused for every strike.
 * (3) Guarantees intrinsic - tol <= price <= F (call) / K (put) + tol.
 *     Values within tol are snapped onto the bound, anything further out
 *     throws IntegrationError. Never silently clipped.
 * (4) IntegrationError also when |integrand(uMax)| > integrationTolerance
 *     (truncation not converged) or the sum is non-finite.
 */
class FourierPricer
{
public:
    explicit FourierPricer(const FourierOptions &options = {});

    std::vector<double> prices(const ModelParameters &params, double maturity, double forward,
                               const std::vector<double> &strikes,
                               OptionType type = OptionType::Call) const;

    double price(const ModelParameters &params, double maturity, double forward, double strike,
                 OptionType type = OptionType::Call) const;

    PricingGrid grid(const ModelParameters &params, double maturity, double forward,
                     const std::vector<double> &strikes,
                     OptionType type = OptionType::Call) const;

    /**
     * Several maturities at once, one PricingGrid per maturity (same order).
     * Maturities are independent and priced in parallel (OpenMP).
     */
    std::vector<PricingGrid> surface(const ModelParameters &params,
                                     const std::vector<double> &maturities,
                                     const std::vector<double> &forwards,
                                     const std::vector<std::vector<double>> &strikes,
                                     OptionType type = OptionType::Call) const;

    const FourierOptions &options() const { return _options; }
    const GaussLegendreRule &rule() const { return _rule; }

private:
    // undiscounted call prices divided by F, one per log-moneyness
    std::vector<double> carrMadanCalls(const CharacteristicFunction &cf, double T,
                                       const std::vector<double> &k) const;
    std::vector<double> liptonCalls(const CharacteristicFunction &cf, double T,
                                    const std::vector<double> &k) const;
    std::vector<double> cosCalls(const CharacteristicFunction &cf, double T,
                                 const std::vector<double> &k) const;

    void checkTail(double magnitude, const ModelParameters &params, double T) const;
    // bound check + snapping, throws IntegrationError
    double enforceBounds(double value, double forward, double strike, double T, OptionType type,
                         const ModelParameters &params) const;

    // χ_n(c,d) = ∫_c^d e^y cos(nπ(y-a)/(b-a)) dy
    static double chi(size_t n, double a, double b, double c, double d);
    // ψ_n(c,d) = ∫_c^d cos(nπ(y-a)/(b-a)) dy
    static double psi(size_t n, double a, double b, double c, double d);

    static FourierOptions validated(const FourierOptions &options);

    FourierOptions _options;
    GaussLegendreRule _rule;
};

#endif // AFFINEFM_FOURIERPRICER_H
