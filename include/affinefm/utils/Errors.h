#ifndef AFFINEFM_ERRORS_H
#define AFFINEFM_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * Error taxonomy of the pricing engine
 *
 *   InvalidParameterError      precondition violated on model parameters / inputs
 *   NumericalInstabilityError  Riccati ODE or CF evaluation diverged / non-finite
 *   IntegrationError           Fourier integral not converged or out of bounds
 *   NoArbitrageViolation       price outside the arbitrage-free bounds
 *   ConvergenceError           root-find exceeded its iteration budget
 *
 * Pricing components throw immediately. Only the Calibrator catches these
 * (at the trial point boundary) and turns them into penalised residuals.
 */

class InvalidParameterError : public std::invalid_argument
{
public:
	explicit InvalidParameterError(const std::string &what)
		: std::invalid_argument(what) {}
};

class NumericalInstabilityError : public std::runtime_error
{
public:
	explicit NumericalInstabilityError(const std::string &what)
		: std::runtime_error(what) {}
};

class IntegrationError : public std::runtime_error
{
public:
	explicit IntegrationError(const std::string &what)
		: std::runtime_error(what) {}
};

class NoArbitrageViolation : public std::domain_error
{
public:
	explicit NoArbitrageViolation(const std::string &what)
		: std::domain_error(what) {}
};

class ConvergenceError : public std::runtime_error
{
public:
	explicit ConvergenceError(const std::string &what)
		: std::runtime_error(what) {}
};

#endif // AFFINEFM_ERRORS_H
