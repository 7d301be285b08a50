#include <affinefm/market/MarketData.h>
#include <affinefm/utils/Errors.h>
#include <affinefm/utils/Utils.h>
#include <cmath>

MarketData::MarketData(double spot, const DiscountCurve &discountCurve, double dividendYield)
    : _spot(spot), _discountCurve(discountCurve.clone()), _dividendYield(dividendYield)
{
    if (!std::isfinite(spot) || spot <= 0.0)
        throw InvalidParameterError("MarketData: spot must be positive, got " + Utils::toString(spot));
    if (!std::isfinite(dividendYield))
        throw InvalidParameterError("MarketData: dividend yield must be finite, got " + Utils::toString(dividendYield));
}

MarketData::MarketData(const MarketData &other)
    : _spot(other._spot), _discountCurve(other._discountCurve->clone()), _dividendYield(other._dividendYield)
{
}

MarketData &MarketData::operator=(const MarketData &other)
{
    if (this != &other)
    {
        _spot = other._spot;
        _discountCurve = other._discountCurve->clone();
        _dividendYield = other._dividendYield;
    }
    return *this;
}

double MarketData::discount(double maturity) const
{
    if (!std::isfinite(maturity) || maturity < 0.0)
        throw InvalidParameterError("MarketData: maturity must be non-negative, got " + Utils::toString(maturity));
    return _discountCurve->discount(maturity);
}

double MarketData::forward(double maturity) const
{
    double df = discount(maturity);
    if (!(df > 0.0))
        throw InvalidParameterError("MarketData: non-positive discount factor " + Utils::toString(df) +
                                    " at T = " + Utils::toString(maturity));
    return _spot * std::exp(-_dividendYield * maturity) / df;
}
