#include <affinefm/optimization/Optimizer.h>
#include <chrono>
#include <cmath>
#include <gtest/gtest.h>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <thread>

// ---------------------------------------------------------------
// basic LM tests
// ---------------------------------------------------------------

TEST(OptimizerTest, LM_SimplePointFinding)
{
	// r = [x-3, y-4], solution at (3,4)
	auto residuals = [](const std::vector<double> &x) -> std::vector<double>
	{ return {x[0] - 3.0, x[1] - 4.0}; };

	LevenbergMarquardt lm;
	auto result = lm.solve(residuals, {0.0, 0.0});

	EXPECT_TRUE(result.converged);
	EXPECT_EQ(result.status, LMStatus::Converged);
	EXPECT_NEAR(result.params[0], 3.0, 1e-6);
	EXPECT_NEAR(result.params[1], 4.0, 1e-6);
	EXPECT_LT(result.finalResidual, 1e-12);
	EXPECT_GT(result.evaluations, result.iterations);
}

TEST(OptimizerTest, LM_Rosenbrock)
{
	// r = [10(y-x^2), 1-x], minimum at (1,1)
	auto residuals = [](const std::vector<double> &x) -> std::vector<double>
	{ return {10.0 * (x[1] - x[0] * x[0]), 1.0 - x[0]}; };

	LevenbergMarquardt lm;
	auto result = lm.solve(residuals, {-1.0, 1.0});

	EXPECT_TRUE(result.converged);
	EXPECT_NEAR(result.params[0], 1.0, 1e-6);
	EXPECT_NEAR(result.params[1], 1.0, 1e-6);
	EXPECT_LT(result.finalResidual, 1e-12);
}

TEST(OptimizerTest, LM_OverdeterminedExact)
{
	// x+y=1, x-y=1, 2x=2 → (1,0)
	auto residuals = [](const std::vector<double> &x) -> std::vector<double>
	{ return {x[0] + x[1] - 1.0, x[0] - x[1] - 1.0, 2.0 * x[0] - 2.0}; };

	LevenbergMarquardt lm;
	auto result = lm.solve(residuals, {0.0, 0.0});

	EXPECT_TRUE(result.converged);
	EXPECT_NEAR(result.params[0], 1.0, 1e-6);
	EXPECT_NEAR(result.params[1], 0.0, 1e-6);
}

TEST(OptimizerTest, LM_AnalyticalJacobian)
{
	// Rosenbrock with explicit J
	auto residuals = [](const std::vector<double> &x) -> std::vector<double>
	{ return {10.0 * (x[1] - x[0] * x[0]), 1.0 - x[0]}; };
	auto jacobian = [](const std::vector<double> &x) -> Matrix
	{ return {{-20.0 * x[0], 10.0}, {-1.0, 0.0}}; };

	LevenbergMarquardt lm;
	auto result = lm.solve(residuals, {-1.0, 1.0}, {}, {}, jacobian);

	EXPECT_TRUE(result.converged);
	EXPECT_NEAR(result.params[0], 1.0, 1e-6);
	EXPECT_NEAR(result.params[1], 1.0, 1e-6);
}

TEST(OptimizerTest, LM_UnderdeterminedCircle)
{
	// x^2+y^2=1, infinite solutions, LM should find *some* point on the circle
	// J^T J is rank one here, so this also runs the eigen fallback path
	auto residuals = [](const std::vector<double> &x) -> std::vector<double>
	{ return {x[0] * x[0] + x[1] * x[1] - 1.0}; };

	LevenbergMarquardt lm;
	auto result = lm.solve(residuals, {2.0, 1.0});

	EXPECT_TRUE(result.converged);
	double r2 = result.params[0] * result.params[0] +
				result.params[1] * result.params[1];
	EXPECT_NEAR(r2, 1.0, 1e-6);
	EXPECT_LT(result.finalResidual, 1e-12);
}

TEST(OptimizerTest, LM_BoundedOptimization)
{
	// unconstrained solution at (3,4), bounds [0,2]x[0,2]
	// at (2,2) both gradient components point out of the box, the
	// projected gradient vanishes and LM reports convergence
	auto residuals = [](const std::vector<double> &x) -> std::vector<double>
	{ return {x[0] - 3.0, x[1] - 4.0}; };

	std::vector<double> lb = {0.0, 0.0};
	std::vector<double> ub = {2.0, 2.0};

	LevenbergMarquardt lm;
	auto result = lm.solve(residuals, {0.5, 0.5}, lb, ub);

	EXPECT_TRUE(result.converged);
	EXPECT_EQ(result.status, LMStatus::Converged);
	EXPECT_NEAR(result.params[0], 2.0, 1e-6);
	EXPECT_NEAR(result.params[1], 2.0, 1e-6);
	EXPECT_NEAR(result.finalResidual, 1.0 + 4.0, 1e-9);
}

TEST(OptimizerTest, LM_IteratesStayInsideBox)
{
	// minimum of the unconstrained problem at x = -1, box [0, 5]
	auto residuals = [](const std::vector<double> &x) -> std::vector<double>
	{
		if (x[0] < 0.0 || x[0] > 5.0)
			throw std::logic_error("evaluated outside the box");
		return {x[0] + 1.0, 0.1 * x[1] - 0.2};
	};

	LevenbergMarquardt lm;
	auto result = lm.solve(residuals, {4.0, 0.0}, {0.0, 0.0}, {5.0, 5.0});

	EXPECT_TRUE(result.converged);
	EXPECT_NEAR(result.params[0], 0.0, 1e-9);
	EXPECT_NEAR(result.params[1], 2.0, 1e-6);
}

TEST(OptimizerTest, LM_StartIsProjectedOntoBox)
{
	auto residuals = [](const std::vector<double> &x) -> std::vector<double>
	{ return {x[0] - 1.0}; };

	LevenbergMarquardt lm;
	auto result = lm.solve(residuals, {10.0}, {0.0}, {3.0});

	EXPECT_TRUE(result.converged);
	EXPECT_NEAR(result.params[0], 1.0, 1e-6);
}

TEST(OptimizerTest, LM_CustomOptions)
{
	auto residuals = [](const std::vector<double> &x) -> std::vector<double>
	{ return {x[0] - 1.0, x[1] - 2.0}; };

	LMOptions opts;
	opts.tol = 1e-8;
	opts.maxIter = 200;

	LevenbergMarquardt lm;
	auto result = lm.solve(residuals, {10.0, 10.0}, {}, {}, nullptr, opts);

	EXPECT_TRUE(result.converged);
	EXPECT_NEAR(result.params[0], 1.0, 1e-6);
	EXPECT_NEAR(result.params[1], 2.0, 1e-6);
	EXPECT_LT(result.finalResidual, 1e-12);
}

TEST(OptimizerTest, LM_ResidualTolerance)
{
	auto residuals = [](const std::vector<double> &x) -> std::vector<double>
	{ return {x[0] - 1.0, x[1] - 2.0}; };

	LMOptions opts;
	opts.residualTol = 1e-2;

	LevenbergMarquardt lm;
	auto result = lm.solve(residuals, {1.01, 2.01}, {}, {}, nullptr, opts);

	// already inside the tolerance at the start point
	EXPECT_TRUE(result.converged);
	EXPECT_EQ(result.iterations, 0);
	EXPECT_DOUBLE_EQ(result.params[0], 1.01);
}

TEST(OptimizerTest, LM_MaxIterationsStatus)
{
	auto residuals = [](const std::vector<double> &x) -> std::vector<double>
	{ return {10.0 * (x[1] - x[0] * x[0]), 1.0 - x[0]}; };

	LMOptions opts;
	opts.maxIter = 1;

	LevenbergMarquardt lm;
	auto result = lm.solve(residuals, {-1.2, 1.0}, {}, {}, nullptr, opts);

	EXPECT_FALSE(result.converged);
	EXPECT_EQ(result.status, LMStatus::MaxIterations);
	EXPECT_LE(result.iterations, 1);
	EXPECT_FALSE(result.message.empty());
}

TEST(OptimizerTest, LM_TimeBudgetStatus)
{
	// slow residual, the budget runs out before the first step is taken
	auto residuals = [](const std::vector<double> &x) -> std::vector<double>
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(2));
		return {x[0] - 3.0, x[1] - 4.0};
	};

	LMOptions opts;
	opts.maxTimeSeconds = 1e-3;

	LevenbergMarquardt lm;
	auto result = lm.solve(residuals, {0.0, 0.0}, {}, {}, nullptr, opts);

	EXPECT_FALSE(result.converged);
	EXPECT_EQ(result.status, LMStatus::TimeBudget);
	EXPECT_EQ(result.iterations, 0);
}

TEST(OptimizerTest, LM_BoundSizeMismatchThrows)
{
	auto residuals = [](const std::vector<double> &x) -> std::vector<double>
	{ return {x[0], x[1]}; };

	LevenbergMarquardt lm;
	EXPECT_THROW(lm.solve(residuals, {1.0, 1.0}, {0.0}, {}), std::invalid_argument);
	EXPECT_THROW(lm.solve(residuals, {1.0, 1.0}, {}, {2.0, 2.0, 2.0}), std::invalid_argument);
}

// ============================================================================
// Himmelblau test
// ============================================================================

// ---------------------------------------------------------------
// Himmelblau from different basins of attraction
//
// f(x,y) = (x^2 + y - 11)^2 + (x + y^2 - 7)^2
//
// four global minima (all f=0):
//   (3.0, 2.0), (-2.805, 3.131), (-3.779, -3.283), (3.584, -1.848)
// ---------------------------------------------------------------

namespace
{

struct Min2D
{
	double x, y;
	const char *label;
};

const Min2D knownMinima[] = {{3.0, 2.0, "( 3.00,  2.00)"},
							 {-2.805118, 3.131312, "(-2.81,  3.13)"},
							 {-3.779310, -3.283186, "(-3.78, -3.28)"},
							 {3.584428, -1.848126, "( 3.58, -1.85)"}};

std::string identifyMin(const std::vector<double> &p)
{
	for (auto &m : knownMinima)
	{
		if (std::hypot(p[0] - m.x, p[1] - m.y) < 0.1)
			return m.label;
	}
	return "  ???";
}

// residuals for LM: r = [x^2+y-11, x+y^2-7]
std::vector<double> himmelblauResiduals(const std::vector<double> &x)
{
	return {x[0] * x[0] + x[1] - 11.0, x[0] + x[1] * x[1] - 7.0};
}

} // namespace

TEST(HimmelblauTest, ConvergenceFromManyStarts)
{
	std::vector<std::vector<double>> starts = {
		{0.0, 0.0},	 {1.0, 1.0}, {-4.0, 3.0},  {-4.0, -4.0},
		{4.0, -1.0}, {5.0, 5.0}, {-1.0, -1.0}, {2.0, -3.0},
	};

	LevenbergMarquardt lm;

	std::cout << "\n  Himmelblau convergence: LM\n";
	std::cout << std::string(44, '-') << "\n";
	std::cout << std::setw(14) << "start"
			  << " | " << std::setw(22) << "LM" << "\n";
	std::cout << std::string(44, '-') << "\n";

	for (auto &x0 : starts)
	{
		auto lmR = lm.solve(himmelblauResiduals, x0);

		EXPECT_TRUE(lmR.converged)
			<< "LM failed from (" << x0[0] << "," << x0[1] << ")";
		EXPECT_LT(lmR.finalResidual, 1e-6);

		std::cout << std::fixed << std::setprecision(1);
		std::cout << "(" << std::setw(5) << x0[0] << "," << std::setw(5)
				  << x0[1] << ")"
				  << " | " << identifyMin(lmR.params) << " " << std::setw(5)
				  << lmR.iterations << "it"
				  << "\n";
	}
	std::cout << std::string(44, '-') << "\n\n";
}

int main(int argc, char **argv)
{
	testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
