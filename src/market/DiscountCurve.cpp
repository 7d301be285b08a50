#include <affinefm/market/DiscountCurve.h>
#include <affinefm/utils/Errors.h>
#include <affinefm/utils/Utils.h>
#include <cmath>


FlatDiscountCurve::FlatDiscountCurve(double rate)
    : _rate(rate)
{
    if (!std::isfinite(rate))
        throw InvalidParameterError("FlatDiscountCurve: rate must be finite, got " + Utils::toString(rate));
}

double FlatDiscountCurve::discount(double time) const
{
    return std::exp(-_rate * time);
}

double FlatDiscountCurve::rate() const
{
    return _rate;
}

std::unique_ptr<DiscountCurve> FlatDiscountCurve::clone() const
{
    return std::make_unique<FlatDiscountCurve>(*this);
}
