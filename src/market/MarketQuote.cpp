#include <affinefm/market/MarketQuote.h>
#include <affinefm/utils/Errors.h>
#include <affinefm/utils/Utils.h>
#include <cmath>
#include <sstream>

MarketQuote::MarketQuote(double strike, double maturity, OptionType type,
                         std::optional<double> impliedVol,
                         std::optional<double> premium,
                         std::optional<double> bid,
                         std::optional<double> ask,
                         double weight)
    : _strike(strike), _maturity(maturity), _type(type),
      _impliedVol(impliedVol), _premium(premium), _bid(bid), _ask(ask), _weight(weight)
{
    if (!std::isfinite(strike) || strike <= 0.0)
        throw InvalidParameterError("MarketQuote: strike must be positive, got " + Utils::toString(strike));
    if (!std::isfinite(maturity) || maturity <= 0.0)
        throw InvalidParameterError("MarketQuote: maturity must be positive, got " + Utils::toString(maturity));
    if (!impliedVol && !premium)
        throw InvalidParameterError("MarketQuote: need an implied vol or a premium (K = " +
                                    Utils::toString(strike) + ", T = " + Utils::toString(maturity) + ")");
    if (impliedVol && (!std::isfinite(*impliedVol) || *impliedVol < 0.0))
        throw InvalidParameterError("MarketQuote: implied vol must be non-negative, got " + Utils::toString(*impliedVol));
    if (premium && (!std::isfinite(*premium) || *premium < 0.0))
        throw InvalidParameterError("MarketQuote: premium must be non-negative, got " + Utils::toString(*premium));
    if (bid.has_value() != ask.has_value())
        throw InvalidParameterError("MarketQuote: bid and ask must be given together");
    if (bid)
    {
        if (!std::isfinite(*bid) || !std::isfinite(*ask) || *bid < 0.0 || *bid > *ask)
            throw InvalidParameterError("MarketQuote: need 0 <= bid <= ask, got bid = " +
                                        Utils::toString(*bid) + ", ask = " + Utils::toString(*ask));
    }
    if (!std::isfinite(weight) || weight <= 0.0)
        throw InvalidParameterError("MarketQuote: weight must be positive, got " + Utils::toString(weight));
}

MarketQuote MarketQuote::fromImpliedVol(double strike, double maturity, OptionType type,
                                        double impliedVol, double weight)
{
    return MarketQuote(strike, maturity, type, impliedVol, std::nullopt, std::nullopt, std::nullopt, weight);
}

MarketQuote MarketQuote::fromPrice(double strike, double maturity, OptionType type,
                                   double premium, double weight)
{
    return MarketQuote(strike, maturity, type, std::nullopt, premium, std::nullopt, std::nullopt, weight);
}

MarketQuote MarketQuote::fromBidAsk(double strike, double maturity, OptionType type,
                                    double bid, double ask, double weight)
{
    return MarketQuote(strike, maturity, type, std::nullopt, 0.5 * (bid + ask), bid, ask, weight);
}

std::string MarketQuote::toString() const
{
    std::ostringstream oss;
    oss << ::toString(_type) << "(K = " << Utils::toString(_strike)
        << ", T = " << Utils::toString(_maturity);
    if (_impliedVol)
        oss << ", vol = " << Utils::toString(*_impliedVol);
    if (_premium)
        oss << ", premium = " << Utils::toString(*_premium);
    if (_bid)
        oss << ", bid = " << Utils::toString(*_bid) << ", ask = " << Utils::toString(*_ask);
    oss << ")";
    return oss.str();
}
