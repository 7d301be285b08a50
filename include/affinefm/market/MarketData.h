#ifndef AFFINEFM_MARKETDATA_H
#define AFFINEFM_MARKETDATA_H

#include <affinefm/market/DiscountCurve.h>
#include <memory>

/**
 * Market context of one underlying: spot, discount curve, dividend yield.
 *
 * Fourier prices are undiscounted and quoted against the forward, so this is
 * the only place where spot, rates and dividends meet:
 *
 *   F(T) = S0 · e^{-qT} / B(T)
 *
 * The curve is cloned on construction (value semantics, safe to share
 * copies across threads).
 */
class MarketData
{
public:
    MarketData(double spot, const DiscountCurve &discountCurve, double dividendYield = 0.0);
    MarketData(const MarketData &other);
    MarketData &operator=(const MarketData &other);
    ~MarketData() = default;

    double spot() const { return _spot; }
    double dividendYield() const { return _dividendYield; }
    const DiscountCurve &discountCurve() const { return *_discountCurve; }

    // B(T)
    double discount(double maturity) const;
    // F(T) = S0 · e^{-qT} / B(T)
    double forward(double maturity) const;

private:
    double _spot;
    std::unique_ptr<DiscountCurve> _discountCurve;
    double _dividendYield;
};

#endif // AFFINEFM_MARKETDATA_H
