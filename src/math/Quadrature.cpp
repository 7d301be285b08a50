#include <affinefm/math/Quadrature.h>
#include <affinefm/utils/Errors.h>
#include <affinefm/utils/Utils.h>

#include <boost/math/special_functions/legendre.hpp>

#include <algorithm>
#include <cmath>
#include <string>

GaussLegendreRule::GaussLegendreRule(size_t n, double a, double b)
    : _a(a), _b(b)
{
    if (n == 0)
        throw InvalidParameterError("GaussLegendreRule: need at least one node");
    if (!std::isfinite(a) || !std::isfinite(b) || !(a < b))
        throw InvalidParameterError("GaussLegendreRule: need finite a < b, got [" + Utils::toString(a) +
                                    ", " + Utils::toString(b) + "]");

    const int order = static_cast<int>(n);
    // non-negative zeros only, the rest follow by symmetry
    std::vector<double> zeros = boost::math::legendre_p_zeros<double>(order);

    std::vector<double> x, w;
    x.reserve(n);
    w.reserve(n);
    for (double xi : zeros) {
        double dp = boost::math::legendre_p_prime(order, xi);
        double wi = 2.0 / ((1.0 - xi * xi) * dp * dp);
        x.push_back(xi);
        w.push_back(wi);
        if (xi != 0.0) {
            x.push_back(-xi);
            w.push_back(wi);
        }
    }

    // sort ascending, carry the weights along
    std::vector<size_t> idx(x.size());
    for (size_t i = 0; i < idx.size(); ++i) idx[i] = i;
    std::sort(idx.begin(), idx.end(), [&](size_t i, size_t j) { return x[i] < x[j]; });

    // [-1, 1] -> [a, b]
    const double half = 0.5 * (b - a);
    const double mid = 0.5 * (b + a);
    _nodes.resize(x.size());
    _weights.resize(x.size());
    for (size_t i = 0; i < idx.size(); ++i) {
        _nodes[i] = mid + half * x[idx[i]];
        _weights[i] = half * w[idx[i]];
    }

    if (_nodes.size() != n)
        throw NumericalInstabilityError("GaussLegendreRule: expected " + std::to_string(n) +
                                        " nodes, Legendre zeros produced " + std::to_string(_nodes.size()));
}
