#include <affinefm/utils/Utils.h>
#include <cmath>
#include <iomanip>
#include <limits>
#include <numbers>
#include <sstream>

// ============================================================================
// * Statistics
// ============================================================================

constexpr double PI = std::numbers::pi;

// Standard normal CDF
double Utils::stdNormCdf(double x)
{
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double Utils::stdNormPdf(double x)
{
    // φ(x) = (1/√(2π)) * exp(-x²/2)
    return (1.0 / std::sqrt(2.0 * PI)) * std::exp(-0.5 * x * x);
}

bool Utils::isFinite(const std::complex<double>& z)
{
    return std::isfinite(z.real()) && std::isfinite(z.imag());
}

// ============================================================================
// * Formatting
// ============================================================================

std::string Utils::toString(double value)
{
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
}

std::string Utils::toString(const std::vector<double>& values)
{
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << values[i];
    }
    oss << "]";
    return oss.str();
}

std::vector<double> Utils::linspace(double start, double stop, size_t n)
{
    std::vector<double> grid(n);
    if (n == 0) return grid;
    if (n == 1) {
        grid[0] = start;
        return grid;
    }
    double step = (stop - start) / static_cast<double>(n - 1);
    for (size_t i = 0; i < n; ++i)
        grid[i] = start + static_cast<double>(i) * step;
    grid[n - 1] = stop; // exact endpoint
    return grid;
}
