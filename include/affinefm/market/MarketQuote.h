#ifndef AFFINEFM_MARKETQUOTE_H
#define AFFINEFM_MARKETQUOTE_H

#include <affinefm/market/OptionType.h>
#include <optional>
#include <string>

/**
 * One observed European option quote.
 *
 * Carries an implied volatility and/or a premium (present value, i.e.
 * discounted like a traded price), optionally the bid/ask of that premium,
 * and a calibration weight.
 *
 * NOTES:
 * (1) Immutable once constructed: no setters, only const accessors. The
 *     Calibrator converts quotes into its own targets and never writes back.
 * (2) Construction validates everything and throws InvalidParameterError.
 *     Arbitrage bounds need the forward, so they are checked later by the
 *     Calibrator (NoArbitrageViolation).
 */
class MarketQuote
{
public:
    MarketQuote(double strike, double maturity, OptionType type,
                std::optional<double> impliedVol,
                std::optional<double> premium,
                std::optional<double> bid = std::nullopt,
                std::optional<double> ask = std::nullopt,
                double weight = 1.0);

    static MarketQuote fromImpliedVol(double strike, double maturity, OptionType type,
                                      double impliedVol, double weight = 1.0);
    static MarketQuote fromPrice(double strike, double maturity, OptionType type,
                                 double premium, double weight = 1.0);
    // premium taken at mid
    static MarketQuote fromBidAsk(double strike, double maturity, OptionType type,
                                  double bid, double ask, double weight = 1.0);

    double strike() const { return _strike; }
    double maturity() const { return _maturity; }
    OptionType type() const { return _type; }
    double weight() const { return _weight; }

    bool hasImpliedVol() const { return _impliedVol.has_value(); }
    bool hasPremium() const { return _premium.has_value(); }
    bool hasBidAsk() const { return _bid.has_value(); }

    // throw std::bad_optional_access when absent
    double impliedVol() const { return _impliedVol.value(); }
    double premium() const { return _premium.value(); }
    double bid() const { return _bid.value(); }
    double ask() const { return _ask.value(); }
    double spread() const { return _ask.value() - _bid.value(); }

    std::string toString() const;

private:
    double _strike;
    double _maturity;
    OptionType _type;
    std::optional<double> _impliedVol;
    std::optional<double> _premium;
    std::optional<double> _bid;
    std::optional<double> _ask;
    double _weight;
};

#endif // AFFINEFM_MARKETQUOTE_H
