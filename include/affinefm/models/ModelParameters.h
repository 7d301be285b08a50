#ifndef AFFINEFM_MODELPARAMETERS_H
#define AFFINEFM_MODELPARAMETERS_H

#include <string>
#include <vector>

/**
 * ============================================================================
 * AFFINE MODEL PARAMETERS
 * ============================================================================
 *
 * Heston (1993):
 *   dS/S = sqrt(v) dW^S
 *   dv   = κ(θ - v)dt + σ sqrt(v) dW^v,   d<W^S, W^v> = ρ dt
 *
 * Bates (1996) = Heston + Merton lognormal jumps in S:
 *   intensity λ, log jump size ~ N(μ_J, δ_J²), compensated under Q
 *
 * Vector layout (used by the optimizer):
 *   Heston: [v0, kappa, theta, sigma, rho]
 *   Bates:  [v0, kappa, theta, sigma, rho, lambda, muJ, deltaJ]
 *
 * NOTES:
 * (1) Construction validates the admissible domain and throws
 *     InvalidParameterError. Never clamps.
 * (2) Feller (2κθ >= σ²) is reported, not enforced; the CF is well defined
 *     without it, the variance just touches zero.
 */

enum class ModelVariant { Heston, Bates };

std::string toString(ModelVariant variant);

class ModelParameters
{
public:
    ModelParameters() = delete;

    static ModelParameters heston(double v0, double kappa, double theta, double sigma, double rho);
    static ModelParameters bates(double v0, double kappa, double theta, double sigma, double rho,
                                 double lambda, double muJ, double deltaJ);

    // inverse of toVector(), validates
    static ModelParameters fromVector(ModelVariant variant, const std::vector<double> &values);

    static size_t size(ModelVariant variant);
    static std::vector<std::string> names(ModelVariant variant);

    ModelVariant variant() const { return _variant; }
    size_t size() const { return size(_variant); }
    std::vector<double> toVector() const;
    std::vector<std::string> names() const { return names(_variant); }

    double v0() const { return _v0; }
    double kappa() const { return _kappa; }
    double theta() const { return _theta; }
    double sigma() const { return _sigma; }
    double rho() const { return _rho; }
    // zero for Heston
    double lambda() const { return _lambda; }
    double muJ() const { return _muJ; }
    double deltaJ() const { return _deltaJ; }

    bool hasJumps() const { return _variant == ModelVariant::Bates; }

    // 2κθ >= σ²
    bool satisfiesFellerCondition() const;
    // 2κθ - σ², negative when violated
    double fellerMargin() const;

    // throws InvalidParameterError with every value in the message
    void validate() const;

    std::string toString() const;

    bool operator==(const ModelParameters &other) const;

private:
    ModelParameters(ModelVariant variant, double v0, double kappa, double theta, double sigma, double rho,
                    double lambda, double muJ, double deltaJ);

    ModelVariant _variant;
    double _v0, _kappa, _theta, _sigma, _rho;
    double _lambda, _muJ, _deltaJ;
};


/**
 * Box constraints for calibration, one [lower, upper] pair per parameter in
 * the ModelParameters vector layout.
 *
 * Mandatory in calibration: every trial point of the optimizer is projected
 * into the box, so the box must sit inside the admissible domain.
 */
class ParameterBounds
{
public:
    ParameterBounds(ModelVariant variant, std::vector<double> lower, std::vector<double> upper);

    /**
     * Default boxes:
     *   v0     [1e-4, 1.0]     kappa  [1e-2, 15]     theta [1e-4, 1.0]
     *   sigma  [1e-2, 3.0]     rho    [-0.99, 0.99]
     *   lambda [0, 5]          muJ    [-1, 1]        deltaJ [0, 1]
     */
    static ParameterBounds defaults(ModelVariant variant);

    ModelVariant variant() const { return _variant; }
    const std::vector<double> &lower() const { return _lower; }
    const std::vector<double> &upper() const { return _upper; }

    bool contains(const ModelParameters &params) const;

    // throws InvalidParameterError naming the offending parameter
    void validate() const;
    void validateStart(const ModelParameters &params) const;

private:
    ModelVariant _variant;
    std::vector<double> _lower;
    std::vector<double> _upper;
};

#endif // AFFINEFM_MODELPARAMETERS_H
