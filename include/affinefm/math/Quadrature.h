#ifndef AFFINEFM_QUADRATURE_H
#define AFFINEFM_QUADRATURE_H

#include <cstddef>
#include <vector>

/**
 * Fixed-node Gauss-Legendre rule on [a, b]
 *
 * Nodes are the zeros x_i of P_n (Boost.Math), weights
 *   w_i = 2 / ((1 - x_i²) · P_n'(x_i)²)
 * mapped affinely from [-1, 1]. Exact for polynomials of degree 2n - 1.
 *
 * Built once and reused: the Fourier pricer owns one rule per configuration
 * and never rebuilds it per call.
 */
class GaussLegendreRule
{
public:
    GaussLegendreRule(size_t n, double a, double b);

    size_t size() const { return _nodes.size(); }
    double lower() const { return _a; }
    double upper() const { return _b; }
    // ascending
    const std::vector<double>& nodes() const { return _nodes; }
    const std::vector<double>& weights() const { return _weights; }

    template <typename F>
    double integrate(F&& f) const
    {
        double sum = 0.0;
        for (size_t i = 0; i < _nodes.size(); ++i)
            sum += _weights[i] * f(_nodes[i]);
        return sum;
    }

private:
    double _a, _b;
    std::vector<double> _nodes;
    std::vector<double> _weights;
};

#endif // AFFINEFM_QUADRATURE_H
