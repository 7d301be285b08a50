#include <affinefm/models/ModelParameters.h>
#include <affinefm/utils/Errors.h>
#include <affinefm/utils/Utils.h>
#include <cmath>
#include <sstream>
#include <utility>

namespace {
    /**
     * Admissible domain of a single parameter, by vector index
     * Returns an empty string when admissible, otherwise the violated condition
     */
    std::string admissibility(size_t index, double value)
    {
        if (!std::isfinite(value))
            return "must be finite";
        switch (index) {
            case 0: return value >= 0.0 ? "" : "must be >= 0";           // v0
            case 1: return value > 0.0 ? "" : "must be > 0";             // kappa
            case 2: return value > 0.0 ? "" : "must be > 0";             // theta
            case 3: return value > 0.0 ? "" : "must be > 0";             // sigma
            case 4: return (value > -1.0 && value < 1.0) ? "" : "must lie in (-1, 1)"; // rho
            case 5: return value >= 0.0 ? "" : "must be >= 0";           // lambda
            case 6: return "";                                           // muJ
            case 7: return value >= 0.0 ? "" : "must be >= 0";           // deltaJ
            default: return "unknown parameter index";
        }
    }
}

std::string toString(ModelVariant variant)
{
    return variant == ModelVariant::Heston ? "Heston" : "Bates";
}

// ============================================================================
// ModelParameters
// ============================================================================

ModelParameters::ModelParameters(ModelVariant variant, double v0, double kappa, double theta, double sigma,
                                 double rho, double lambda, double muJ, double deltaJ)
    : _variant(variant), _v0(v0), _kappa(kappa), _theta(theta), _sigma(sigma), _rho(rho),
      _lambda(lambda), _muJ(muJ), _deltaJ(deltaJ)
{
    validate();
}

ModelParameters ModelParameters::heston(double v0, double kappa, double theta, double sigma, double rho)
{
    return ModelParameters(ModelVariant::Heston, v0, kappa, theta, sigma, rho, 0.0, 0.0, 0.0);
}

ModelParameters ModelParameters::bates(double v0, double kappa, double theta, double sigma, double rho,
                                       double lambda, double muJ, double deltaJ)
{
    return ModelParameters(ModelVariant::Bates, v0, kappa, theta, sigma, rho, lambda, muJ, deltaJ);
}

ModelParameters ModelParameters::fromVector(ModelVariant variant, const std::vector<double> &values)
{
    if (values.size() != size(variant))
        throw InvalidParameterError(::toString(variant) + " expects " + std::to_string(size(variant)) +
                                    " parameters, got " + std::to_string(values.size()));
    if (variant == ModelVariant::Heston)
        return heston(values[0], values[1], values[2], values[3], values[4]);
    return bates(values[0], values[1], values[2], values[3], values[4], values[5], values[6], values[7]);
}

size_t ModelParameters::size(ModelVariant variant)
{
    return variant == ModelVariant::Heston ? 5 : 8;
}

std::vector<std::string> ModelParameters::names(ModelVariant variant)
{
    std::vector<std::string> n = {"v0", "kappa", "theta", "sigma", "rho"};
    if (variant == ModelVariant::Bates) {
        n.push_back("lambda");
        n.push_back("muJ");
        n.push_back("deltaJ");
    }
    return n;
}

std::vector<double> ModelParameters::toVector() const
{
    std::vector<double> v = {_v0, _kappa, _theta, _sigma, _rho};
    if (_variant == ModelVariant::Bates) {
        v.push_back(_lambda);
        v.push_back(_muJ);
        v.push_back(_deltaJ);
    }
    return v;
}

bool ModelParameters::satisfiesFellerCondition() const
{
    return fellerMargin() >= 0.0;
}

double ModelParameters::fellerMargin() const
{
    return 2.0 * _kappa * _theta - _sigma * _sigma;
}

void ModelParameters::validate() const
{
    auto values = toVector();
    auto labels = names();
    for (size_t i = 0; i < values.size(); ++i) {
        std::string violation = admissibility(i, values[i]);
        if (!violation.empty())
            throw InvalidParameterError("Inadmissible " + ::toString(_variant) + " parameter " + labels[i] +
                                        " = " + Utils::toString(values[i]) + " (" + violation + "), params " +
                                        Utils::toString(values));
    }
}

std::string ModelParameters::toString() const
{
    std::ostringstream oss;
    auto values = toVector();
    auto labels = names();
    oss << ::toString(_variant) << "(";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << labels[i] << " = " << Utils::toString(values[i]);
    }
    oss << ")";
    return oss.str();
}

bool ModelParameters::operator==(const ModelParameters &other) const
{
    return _variant == other._variant && toVector() == other.toVector();
}

// ============================================================================
// ParameterBounds
// ============================================================================

ParameterBounds::ParameterBounds(ModelVariant variant, std::vector<double> lower, std::vector<double> upper)
    : _variant(variant), _lower(std::move(lower)), _upper(std::move(upper))
{
    validate();
}

ParameterBounds ParameterBounds::defaults(ModelVariant variant)
{
    std::vector<double> lower = {1e-4, 1e-2, 1e-4, 1e-2, -0.99};
    std::vector<double> upper = {1.0, 15.0, 1.0, 3.0, 0.99};
    if (variant == ModelVariant::Bates) {
        lower.insert(lower.end(), {0.0, -1.0, 0.0});
        upper.insert(upper.end(), {5.0, 1.0, 1.0});
    }
    return ParameterBounds(variant, lower, upper);
}

bool ParameterBounds::contains(const ModelParameters &params) const
{
    if (params.variant() != _variant)
        return false;
    auto values = params.toVector();
    for (size_t i = 0; i < values.size(); ++i)
        if (values[i] < _lower[i] || values[i] > _upper[i])
            return false;
    return true;
}

void ParameterBounds::validate() const
{
    size_t n = ModelParameters::size(_variant);
    if (_lower.size() != n || _upper.size() != n)
        throw InvalidParameterError("ParameterBounds: " + toString(_variant) + " expects " + std::to_string(n) +
                                    " bounds, got lower " + std::to_string(_lower.size()) +
                                    " / upper " + std::to_string(_upper.size()));

    auto labels = ModelParameters::names(_variant);
    for (size_t i = 0; i < n; ++i) {
        if (!(_lower[i] < _upper[i]))
            throw InvalidParameterError("ParameterBounds: " + labels[i] + " needs lower < upper, got [" +
                                        Utils::toString(_lower[i]) + ", " + Utils::toString(_upper[i]) + "]");
        std::string lo = admissibility(i, _lower[i]);
        std::string hi = admissibility(i, _upper[i]);
        if (!lo.empty() || !hi.empty())
            throw InvalidParameterError("ParameterBounds: box for " + labels[i] + " [" +
                                        Utils::toString(_lower[i]) + ", " + Utils::toString(_upper[i]) +
                                        "] leaves the admissible domain (" + (lo.empty() ? hi : lo) + ")");
    }
}

void ParameterBounds::validateStart(const ModelParameters &params) const
{
    if (params.variant() != _variant)
        throw InvalidParameterError("ParameterBounds: bounds are for " + toString(_variant) +
                                    ", initial parameters are " + toString(params.variant()));
    auto values = params.toVector();
    auto labels = params.names();
    for (size_t i = 0; i < values.size(); ++i)
        if (values[i] < _lower[i] || values[i] > _upper[i])
            throw InvalidParameterError("Initial " + labels[i] + " = " + Utils::toString(values[i]) +
                                        " outside bounds [" + Utils::toString(_lower[i]) + ", " +
                                        Utils::toString(_upper[i]) + "]");
}
