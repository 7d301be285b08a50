#ifndef AFFINEFM_BLACKSCHOLESFORMULAS_H
#define AFFINEFM_BLACKSCHOLESFORMULAS_H

#include <affinefm/market/MarketData.h>
#include <affinefm/market/OptionType.h>

struct ImpliedVolOptions {
    double tolerance = 1e-12;   // |Black(σ) - price| in units of the forward
    int maxIterations = 100;    // bracket growth + Newton/bisection steps
    double initialUpper = 2.0;  // first σ_hi, doubled until it brackets
};

/**
 * @class BlackScholesFormulas
 * @brief Static Black-76 formulas on the forward, and implied vol inversion
 *
 * Everything is undiscounted (forward measure) unless the signature takes a
 * MarketData, in which case the price is the present value
 *   V = B(T) · Black(F(T), K, σ, T)
 */
class BlackScholesFormulas
{
public:
    // d1 = [ln(F/K) + σ²T/2] / (σ√T)
    static double d1(double forward, double strike, double volatility, double maturity);
    // d2 = d1 - σ√T
    static double d2(double forward, double strike, double volatility, double maturity);

    // Undiscounted Black-76
    static double price(double forward, double strike, double volatility, double maturity, OptionType type);
    static double callPrice(double forward, double strike, double volatility, double maturity);
    static double putPrice(double forward, double strike, double volatility, double maturity);
    // ∂price/∂σ = F·φ(d1)·√T, same for calls and puts
    static double vega(double forward, double strike, double volatility, double maturity);

    // Present value from spot, curve and dividend yield
    static double price(const MarketData &market, double strike, double volatility, double maturity,
                        OptionType type);

    // max(F - K, 0) / max(K - F, 0)
    static double intrinsic(double forward, double strike, OptionType type);
    // F for calls, K for puts
    static double upperBound(double forward, double strike, OptionType type);

    /**
     * Black-76 implied volatility of an undiscounted price
     *
     * Safeguarded Newton: Newton steps with closed-form vega while they stay
     * inside the bisection bracket [σ_lo, σ_hi], bisection otherwise.
     * σ_hi starts at initialUpper and is doubled until Black(σ_hi) >= price.
     *
     * @return σ >= 0, exactly 0 when price equals intrinsic (within tolerance)
     * @throws NoArbitrageViolation  price < intrinsic - tol or price >= upper bound
     * @throws ConvergenceError      maxIterations exceeded
     * @throws InvalidParameterError non-positive forward/strike/maturity, non-finite price
     */
    static double impliedVolatility(double price, double forward, double strike, double maturity,
                                    OptionType type, const ImpliedVolOptions &options = {});

private:
    BlackScholesFormulas() = delete;
};

#endif // AFFINEFM_BLACKSCHOLESFORMULAS_H
