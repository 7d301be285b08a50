#ifndef AFFINEFM_UTILS_H
#define AFFINEFM_UTILS_H

#include <complex>
#include <string>
#include <vector>

/**
 *  NOTES:
 *  (1) Everything here is stateless -> static methods, no instances.
 *  (2) Formatting helpers exist so every thrown error can carry the offending
 *      values (parameters, maturity, strike) needed to reproduce it.
 */

class Utils
{
public:
    static double stdNormCdf(double x);

    static double stdNormPdf(double x);

    static bool isFinite(const std::complex<double>& z);

    /**
     * Format a vector as "[a, b, c]" with full precision
     */
    static std::string toString(const std::vector<double>& values);

    /**
     * Format a double with full precision (std::to_string truncates to 6 digits)
     */
    static std::string toString(double value);

    /**
     * Evenly spaced grid of n points on [start, stop], like numpy.linspace
     */
    static std::vector<double> linspace(double start, double stop, size_t n);

private:
    Utils() = delete; // delete constructor; everything is static
};

#endif // AFFINEFM_UTILS_H
