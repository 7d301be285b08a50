#ifndef AFFINEFM_DISCOUNTCURVE_H
#define AFFINEFM_DISCOUNTCURVE_H

#include <cmath>
#include <memory>

class DiscountCurve // for modelling with deterministic rates
{
public:
    virtual double discount(double time) const = 0;
    virtual std::unique_ptr<DiscountCurve> clone() const = 0;

    // zero rate to T: -ln(B(T)) / T
    virtual double zeroRate(double time) const {
        if (time <= 0.0)
            return 0.0;
        return -std::log(discount(time)) / time;
    }

    virtual ~DiscountCurve() = default;
};

class FlatDiscountCurve : public DiscountCurve
{
public:
    FlatDiscountCurve(double rate);
    double discount(double time) const override;
    double zeroRate(double) const override { return _rate; }
    double rate() const;
    std::unique_ptr<DiscountCurve> clone() const override;

private:
    double _rate;
};

#endif // AFFINEFM_DISCOUNTCURVE_H
