#include <affinefm/calibration/Calibrator.h>
#include <affinefm/utils/Errors.h>
#include <affinefm/utils/Utils.h>

#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_real_distribution.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace
{
	// thrown out of the residual function to stop LM, deliberately not a std::exception
	struct CalibrationAborted
	{
		std::string reason;
	};

	int statusRank(CalibrationStatus status)
	{
		switch (status)
		{
		case CalibrationStatus::Converged:
			return 0;
		case CalibrationStatus::MaxIterationsExceeded:
			return 1;
		default:
			return 2;
		}
	}

	double quoteRmse(const std::vector<double> &r, size_t nQuotes)
	{
		if (nQuotes == 0 || r.size() < nQuotes)
			return std::numeric_limits<double>::infinity();
		double sumSq = 0.0;
		for (size_t i = 0; i < nQuotes; ++i)
			sumSq += r[i] * r[i];
		return std::sqrt(sumSq / static_cast<double>(nQuotes));
	}
}

std::string toString(CalibrationStatus status)
{
	switch (status)
	{
	case CalibrationStatus::Initialized:
		return "Initialized";
	case CalibrationStatus::Iterating:
		return "Iterating";
	case CalibrationStatus::Converged:
		return "Converged";
	case CalibrationStatus::MaxIterationsExceeded:
		return "MaxIterationsExceeded";
	case CalibrationStatus::Failed:
		return "Failed";
	}
	return "Unknown";
}

Calibrator::Calibrator(const MarketData &market, const FourierPricer &pricer,
					   const CalibrationOptions &options)
	: _market(market), _pricer(pricer), _options(options)
{
	if (options.restarts < 0)
		throw InvalidParameterError("Calibrator: restarts must be >= 0, got " + std::to_string(options.restarts));
	if (options.maxConsecutiveFailures < 0)
		throw InvalidParameterError("Calibrator: maxConsecutiveFailures must be >= 0, got " +
									std::to_string(options.maxConsecutiveFailures));
	if (!(options.penaltyResidual > 0.0) || !std::isfinite(options.penaltyResidual))
		throw InvalidParameterError("Calibrator: penaltyResidual must be positive, got " +
									Utils::toString(options.penaltyResidual));
	if (!(options.fellerPenalty >= 0.0) || !std::isfinite(options.fellerPenalty))
		throw InvalidParameterError("Calibrator: fellerPenalty must be non-negative, got " +
									Utils::toString(options.fellerPenalty));
}

// ============================================================================
// Market preprocessing
// ============================================================================

Calibrator::Problem Calibrator::prepare(const std::vector<MarketQuote> &quotes) const
{
	if (quotes.empty())
		throw InvalidParameterError("Calibrator: no quotes to calibrate to");

	Problem problem;
	problem.nQuotes = quotes.size();
	problem.targets.resize(quotes.size());
	problem.sqrtWeights.resize(quotes.size());

	// group by maturity, slices ordered by maturity
	std::map<double, size_t> sliceIndex;

	for (size_t i = 0; i < quotes.size(); ++i)
	{
		const MarketQuote &q = quotes[i];
		const double T = q.maturity();
		const double K = q.strike();
		const double F = _market.forward(T);
		const double B = _market.discount(T);

		// premium is a present value, transforms work undiscounted
		std::optional<double> undiscounted;
		if (q.hasPremium())
		{
			double u = q.premium() / B;
			double lower = BlackScholesFormulas::intrinsic(F, K, q.type());
			double upper = BlackScholesFormulas::upperBound(F, K, q.type());
			double tol = _options.impliedVol.tolerance * F;
			if (u < lower - tol || u >= upper)
				throw NoArbitrageViolation("Calibrator: quote " + q.toString() +
										   " violates arbitrage bounds, undiscounted premium " + Utils::toString(u) +
										   " outside [" + Utils::toString(lower) + ", " + Utils::toString(upper) +
										   ") with F = " + Utils::toString(F));
			undiscounted = u;
		}

		double target;
		if (_options.target == CalibrationTarget::ImpliedVol)
		{
			target = q.hasImpliedVol()
						 ? q.impliedVol()
						 : BlackScholesFormulas::impliedVolatility(*undiscounted, F, K, T, q.type(), _options.impliedVol);
		}
		else
		{
			double p = undiscounted ? *undiscounted
									: BlackScholesFormulas::price(F, K, q.impliedVol(), T, q.type());
			target = p / F;
		}

		double weight = q.weight();
		if (_options.weightBySpread && q.hasBidAsk() && q.spread() > 0.0)
			weight /= q.spread();

		problem.targets[i] = target;
		problem.sqrtWeights[i] = std::sqrt(weight);

		auto it = sliceIndex.find(T);
		if (it == sliceIndex.end())
		{
			it = sliceIndex.emplace(T, problem.slices.size()).first;
			problem.slices.push_back({T, F, {}, {}, {}});
		}
		Slice &slice = problem.slices[it->second];
		slice.strikes.push_back(K);
		slice.types.push_back(q.type());
		slice.rows.push_back(i);
	}
	return problem;
}

// ============================================================================
// Residuals
// ============================================================================

std::vector<double> Calibrator::evaluate(const Problem &problem, const ModelParameters &params) const
{
	const bool feller = _options.fellerPenalty > 0.0;
	std::vector<double> r(problem.nQuotes + (feller ? 1 : 0), 0.0);

	for (const Slice &slice : problem.slices)
	{
		const double F = slice.forward;
		const double T = slice.maturity;
		// one transform per maturity, CF reused across strikes
		auto calls = _pricer.prices(params, T, F, slice.strikes, OptionType::Call);

		for (size_t j = 0; j < slice.strikes.size(); ++j)
		{
			const double K = slice.strikes[j];
			const size_t row = slice.rows[j];
			double model;
			if (_options.target == CalibrationTarget::Price)
			{
				double p = (slice.types[j] == OptionType::Call) ? calls[j] : calls[j] - (F - K);
				model = p / F;
			}
			else
			{
				// invert the OTM side, Black-76 vol is the same for both by parity
				bool otmCall = (K >= F);
				double p = otmCall ? calls[j] : calls[j] - (F - K);
				model = BlackScholesFormulas::impliedVolatility(p, F, K, T,
																otmCall ? OptionType::Call : OptionType::Put,
																_options.impliedVol);
			}
			r[row] = problem.sqrtWeights[row] * (model - problem.targets[row]);
		}
	}

	if (feller)
		r.back() = _options.fellerPenalty * std::max(0.0, -params.fellerMargin());
	return r;
}

std::vector<double> Calibrator::residuals(const std::vector<MarketQuote> &quotes,
										  const ModelParameters &params) const
{
	return evaluate(prepare(quotes), params);
}

// ============================================================================
// Single run
// ============================================================================

CalibrationResult Calibrator::run(const Problem &problem, ModelVariant variant,
								  const std::vector<double> &x0, const ParameterBounds &bounds,
								  int restartIndex) const
{
	CalibrationResult result(ModelParameters::fromVector(variant, x0));
	result.restartIndex = restartIndex;
	result.status = CalibrationStatus::Iterating;

	if (_options.verbose)
		std::cout << "Calibration start " << restartIndex << ": " << result.params.toString() << "\n";

	int consecutive = 0;
	int rejected = 0;
	int evaluations = 0;
	std::string lastError;
	std::vector<double> bestX, bestR;
	double bestObjective = std::numeric_limits<double>::infinity();

	// trial point boundary: pricing errors become penalty residuals
	auto objective = [&](const std::vector<double> &x) -> std::vector<double>
	{
		++evaluations;
		try
		{
			auto r = evaluate(problem, ModelParameters::fromVector(variant, x));
			consecutive = 0;
			double obj = MatrixOps::dot(r, r);
			if (obj < bestObjective)
			{
				bestObjective = obj;
				bestX = x;
				bestR = r;
			}
			return r;
		}
		catch (const InvalidParameterError &e)
		{
			lastError = e.what();
		}
		catch (const NumericalInstabilityError &e)
		{
			lastError = e.what();
		}
		catch (const IntegrationError &e)
		{
			lastError = e.what();
		}
		catch (const NoArbitrageViolation &e)
		{
			lastError = e.what();
		}
		catch (const ConvergenceError &e)
		{
			lastError = e.what();
		}

		++rejected;
		if (++consecutive > _options.maxConsecutiveFailures)
			throw CalibrationAborted{lastError};
		if (_options.verbose)
			std::cout << "  rejected trial point: " << lastError << "\n";

		std::vector<double> penalty(problem.nQuotes, 0.0);
		for (size_t i = 0; i < problem.nQuotes; ++i)
			penalty[i] = _options.penaltyResidual * problem.sqrtWeights[i];
		if (_options.fellerPenalty > 0.0)
			penalty.push_back(_options.penaltyResidual);
		return penalty;
	};

	LMOptions lmOpts = _options.lm;
	lmOpts.verbose = lmOpts.verbose || _options.verbose;

	LevenbergMarquardt lm;
	LMResult lmResult;
	try
	{
		lmResult = lm.solve(objective, x0, bounds.lower(), bounds.upper(), nullptr, lmOpts);
	}
	catch (const CalibrationAborted &abort)
	{
		result.status = CalibrationStatus::Failed;
		result.message = "failed: more than " + std::to_string(_options.maxConsecutiveFailures) +
						 " consecutive rejected trial points, last error: " + abort.reason;
		if (!bestX.empty())
		{
			result.params = ModelParameters::fromVector(variant, bestX);
			result.residuals = bestR;
			result.objective = bestObjective;
		}
		else
		{
			result.objective = std::numeric_limits<double>::infinity();
		}
		result.rmse = quoteRmse(result.residuals, problem.nQuotes);
		result.evaluations = evaluations;
		result.rejectedTrials = rejected;
		return result;
	}

	result.iterations = lmResult.iterations;
	result.params = ModelParameters::fromVector(variant, lmResult.params);
	// final solution must price, failures here propagate to the caller
	result.residuals = evaluate(problem, result.params);
	result.objective = MatrixOps::dot(result.residuals, result.residuals);
	result.rmse = quoteRmse(result.residuals, problem.nQuotes);
	result.evaluations = evaluations;
	result.rejectedTrials = rejected;
	result.message = lmResult.message;

	switch (lmResult.status)
	{
	case LMStatus::Converged:
		result.status = CalibrationStatus::Converged;
		break;
	case LMStatus::MaxIterations:
	case LMStatus::TimeBudget:
		result.status = CalibrationStatus::MaxIterationsExceeded;
		break;
	case LMStatus::Stalled:
		result.status = CalibrationStatus::Failed;
		break;
	}

	if (_options.verbose)
		std::cout << "Calibration run " << restartIndex << ": " << toString(result.status)
				  << ", rmse = " << result.rmse << ", " << result.message << "\n";
	return result;
}

// ============================================================================
// Multi-start calibration
// ============================================================================

CalibrationResult Calibrator::calibrate(const std::vector<MarketQuote> &quotes,
										const ModelParameters &initial,
										const ParameterBounds &bounds) const
{
	bounds.validate();
	bounds.validateStart(initial);

	// NoArbitrageViolation on the market side propagates from here
	Problem problem = prepare(quotes);

	const ModelVariant variant = initial.variant();
	const auto &lower = bounds.lower();
	const auto &upper = bounds.upper();

	// starts drawn up front so the result does not depend on thread scheduling
	std::vector<std::vector<double>> starts;
	starts.push_back(initial.toVector());
	boost::random::mt19937 gen(_options.seed);
	for (int s = 0; s < _options.restarts; ++s)
	{
		std::vector<double> x(lower.size());
		for (size_t i = 0; i < x.size(); ++i)
		{
			boost::random::uniform_real_distribution<double> dist(lower[i], upper[i]);
			x[i] = dist(gen);
		}
		starts.push_back(x);
	}

	const int nStarts = static_cast<int>(starts.size());
	std::vector<std::optional<CalibrationResult>> results(nStarts);
	std::vector<std::exception_ptr> errors(nStarts);

	if (_options.verbose)
	{
#ifdef _OPENMP
		int numThreads = omp_get_max_threads();
#else
		int numThreads = 1;
#endif
		std::cout << "Calibration: " << quotes.size() << " quotes in " << problem.slices.size()
				  << " maturities, " << nStarts << " start(s) on " << numThreads << " thread(s)\n";
	}

#pragma omp parallel for schedule(dynamic)
	for (int s = 0; s < nStarts; ++s)
	{
		try
		{
			results[s].emplace(run(problem, variant, starts[s], bounds, s));
		}
		catch (...)
		{
			errors[s] = std::current_exception();
		}
	}

	// Converged first, then lowest objective, ties to the lowest index
	int best = -1;
	for (int s = 0; s < nStarts; ++s)
	{
		if (!results[s])
			continue;
		if (best < 0)
		{
			best = s;
			continue;
		}
		const auto &candidate = *results[s];
		const auto &incumbent = *results[best];
		int rc = statusRank(candidate.status);
		int ri = statusRank(incumbent.status);
		if (rc < ri || (rc == ri && candidate.objective < incumbent.objective))
			best = s;
	}

	// every run threw at its final solution
	if (best < 0)
	{
		for (const auto &e : errors)
			if (e)
				std::rethrow_exception(e);
	}

	CalibrationResult winner = *results[best];
	if (_options.verbose && nStarts > 1)
		std::cout << "Calibration: start " << winner.restartIndex << " of " << nStarts
				  << " selected, " << toString(winner.status) << ", objective = " << winner.objective << "\n";
	return winner;
}
