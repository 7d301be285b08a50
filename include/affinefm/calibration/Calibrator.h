#ifndef AFFINEFM_CALIBRATOR_H
#define AFFINEFM_CALIBRATOR_H

#include <affinefm/market/MarketData.h>
#include <affinefm/market/MarketQuote.h>
#include <affinefm/models/ModelParameters.h>
#include <affinefm/optimization/Optimizer.h>
#include <affinefm/pricers/BlackScholesFormulas.h>
#include <affinefm/pricers/FourierPricer.h>
#include <string>
#include <vector>

enum class CalibrationTarget
{
	ImpliedVol, // residual in Black vol
	Price		// residual in undiscounted price / forward
};

enum class CalibrationStatus
{
	Initialized,
	Iterating,
	Converged,
	MaxIterationsExceeded, // iteration or time budget
	Failed				   // too many rejected trial points, or no descent step
};

std::string toString(CalibrationStatus status);

struct CalibrationOptions
{
	CalibrationTarget target = CalibrationTarget::ImpliedVol;
	LMOptions lm;					 // iteration/time budget and tolerances
	int restarts = 0;				 // extra starts drawn uniformly inside the bounds
	unsigned int seed = 42;			 // for the restart draws
	int maxConsecutiveFailures = 20; // rejected trial points in a row before Failed
	double penaltyResidual = 1.0;	 // residual per quote (times sqrt weight) at a rejected trial point
	double fellerPenalty = 0.0;		 // weight of max(0, σ² - 2κθ), 0 disables
	bool weightBySpread = false;	 // weight /= (ask - bid) where quoted
	ImpliedVolOptions impliedVol;
	bool verbose = false;
};

// The results from calibrate()
struct CalibrationResult
{
	explicit CalibrationResult(const ModelParameters &p) : params(p) {}

	ModelParameters params;			// fitted, or last valid on Failed
	std::vector<double> residuals;	// sqrt(w)·(model - market), Feller term last if enabled
	CalibrationStatus status = CalibrationStatus::Initialized;
	int iterations = 0;				// accepted LM steps
	int evaluations = 0;			// trial points priced
	double objective = 0.0;			// Σ residuals²
	double rmse = 0.0;				// sqrt(mean squared quote residual)
	std::string message;
	int restartIndex = 0;			// 0 = supplied initial parameters
	int rejectedTrials = 0;

	bool converged() const { return status == CalibrationStatus::Converged; }
};


/**
 * ============================================================================
 * CALIBRATOR
 * ============================================================================
 *
 * Bounded least squares over ModelParameters:
 *
 *   min Σ_i w_i (model_i - market_i)²   s.t.  lower <= θ <= upper
 *
 * market_i is the quote converted once to the target (implied vol, or
 * undiscounted price / F). model_i comes from one FourierPricer call per
 * maturity slice; vols are inverted from the OTM side.
 *
 * NOTES:
 * (1) Bounds are mandatory and must lie inside the admissible domain, so
 *     every projected trial point is a valid parameter set.
 * (2) Quotes violating arbitrage bounds throw NoArbitrageViolation before
 *     any optimisation. Quotes are never modified.
 * (3) Pricing failures at a trial point (InvalidParameterError,
 *     NumericalInstabilityError, IntegrationError, NoArbitrageViolation,
 *     ConvergenceError) become penalty residuals. More than
 *     maxConsecutiveFailures in a row ends the run as Failed with the best
 *     valid parameters seen. A failure at the final solution is rethrown.
 * (4) restarts > 0: independent runs from uniform draws inside the bounds,
 *     in parallel (OpenMP). Winner = Converged run with the lowest
 *     objective, ties to the lowest restart index.
 */
class Calibrator
{
public:
	Calibrator(const MarketData &market, const FourierPricer &pricer,
			   const CalibrationOptions &options = {});

	CalibrationResult calibrate(const std::vector<MarketQuote> &quotes,
								const ModelParameters &initial,
								const ParameterBounds &bounds) const;

	// residuals at fixed parameters, pricing errors propagate
	std::vector<double> residuals(const std::vector<MarketQuote> &quotes,
								  const ModelParameters &params) const;

	const MarketData &market() const { return _market; }
	const CalibrationOptions &options() const { return _options; }

private:
	// quotes sharing one maturity, priced by a single transform call
	struct Slice
	{
		double maturity;
		double forward;
		std::vector<double> strikes;
		std::vector<OptionType> types;
		std::vector<size_t> rows; // positions in the residual vector
	};

	struct Problem
	{
		std::vector<Slice> slices;
		std::vector<double> targets;
		std::vector<double> sqrtWeights;
		size_t nQuotes = 0;
	};

	Problem prepare(const std::vector<MarketQuote> &quotes) const;
	std::vector<double> evaluate(const Problem &problem, const ModelParameters &params) const;
	CalibrationResult run(const Problem &problem, ModelVariant variant,
						  const std::vector<double> &x0, const ParameterBounds &bounds,
						  int restartIndex) const;

	MarketData _market;
	FourierPricer _pricer;
	CalibrationOptions _options;
};

#endif // AFFINEFM_CALIBRATOR_H
