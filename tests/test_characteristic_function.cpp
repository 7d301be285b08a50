#include <affinefm/models/CharacteristicFunction.h>
#include <affinefm/utils/Errors.h>
#include <cmath>
#include <complex>
#include <gtest/gtest.h>
#include <iomanip>
#include <iostream>
#include <numbers>
#include <vector>

using namespace std::complex_literals;

/**
 * Test fixture for the affine characteristic function
 */
class CharacteristicFunctionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        v0 = 0.04;
        kappa = 1.5;
        theta = 0.05;
        sigma = 0.6;
        rho = -0.7;
    }

    ModelParameters heston() const { return ModelParameters::heston(v0, kappa, theta, sigma, rho); }

    double v0, kappa, theta, sigma, rho;
};

TEST_F(CharacteristicFunctionTest, NormalisationAndMartingale)
{
    CharacteristicFunction cf(heston());
    for (double T : {0.1, 1.0, 5.0}) {
        // φ(0) = 1
        EXPECT_NEAR(std::abs(cf.evaluate(T, 0.0) - 1.0), 0.0, 1e-14);
        // φ(-i) = E[S_T / F_T] = 1
        EXPECT_NEAR(std::abs(cf.evaluate(T, -1i) - 1.0), 0.0, 1e-14);
    }

    auto bates = ModelParameters::bates(v0, kappa, theta, sigma, rho, 0.8, -0.15, 0.2);
    CharacteristicFunction bcf(bates);
    EXPECT_NEAR(std::abs(bcf.evaluate(2.0, 0.0) - 1.0), 0.0, 1e-14);
    EXPECT_NEAR(std::abs(bcf.evaluate(2.0, -1i) - 1.0), 0.0, 1e-14);
}

TEST_F(CharacteristicFunctionTest, MartingaleNearMinusI)
{
    // φ is analytic in the strip -1 <= Im(u) <= 0, φ(u - i) stays close to 1 for small real u
    CharacteristicFunction cf(heston());
    std::complex<double> a = cf.evaluate(1.0, 1e-6 - 1i);
    std::complex<double> b = cf.evaluate(1.0, -1e-6 - 1i);
    EXPECT_NEAR(std::abs(a - 1.0), 0.0, 1e-5);
    EXPECT_NEAR(std::abs(b - 1.0), 0.0, 1e-5);
}

TEST_F(CharacteristicFunctionTest, HermitianSymmetry)
{
    // X is real, so φ(-u) = conj(φ(u)) on the real axis
    CharacteristicFunction cf(heston());
    for (double u : {0.3, 2.0, 15.0}) {
        auto plus = cf.evaluate(1.5, u);
        auto minus = cf.evaluate(1.5, -u);
        EXPECT_NEAR(std::abs(minus - std::conj(plus)), 0.0, 1e-13);
        EXPECT_LE(std::abs(plus), 1.0 + 1e-14);
    }
}

TEST_F(CharacteristicFunctionTest, BlackScholesLimit)
{
    // σ → 0 with v0 = θ: variance frozen, X ~ N(-v0·T/2, v0·T)
    auto p = ModelParameters::heston(0.04, 2.0, 0.04, 1e-3, 0.0);
    CharacteristicFunction cf(p);
    const double T = 2.0;
    for (double u : {0.5, 1.0, 4.0}) {
        std::complex<double> expected = std::exp(-0.5 * 0.04 * T * (u * u + 1i * u));
        EXPECT_NEAR(std::abs(cf.evaluate(T, u) - expected), 0.0, 1e-5) << "u = " << u;
    }
}

TEST_F(CharacteristicFunctionTest, ClosedFormMatchesNumericalODE)
{
    CharacteristicFunctionOptions odeOpts;
    odeOpts.method = RiccatiMethod::NumericalODE;

    CharacteristicFunction closed(heston());
    CharacteristicFunction ode(heston(), odeOpts);

    std::cout << "\n  closed form vs ODE, Heston\n";
    std::cout << std::setw(8) << "T" << std::setw(10) << "u" << std::setw(16) << "|diff|" << "\n";
    for (double T : {0.05, 1.0, 10.0}) {
        for (std::complex<double> u : {std::complex<double>(0.5, 0.0), std::complex<double>(5.0, 0.0),
                                       std::complex<double>(25.0, 0.0), std::complex<double>(3.0, -2.5),
                                       std::complex<double>(10.0, -0.5)}) {
            auto a = closed.evaluate(T, u);
            auto b = ode.evaluate(T, u);
            double diff = std::abs(a - b);
            std::cout << std::setw(8) << T << std::setw(10) << std::real(u) << std::setw(16) << diff << "\n";
            EXPECT_NEAR(diff, 0.0, 1e-7 * (1.0 + std::abs(a))) << "T = " << T << ", u = " << u;
        }
    }
}

TEST_F(CharacteristicFunctionTest, BatesClosedFormMatchesNumericalODE)
{
    auto bates = ModelParameters::bates(v0, kappa, theta, sigma, rho, 0.5, -0.1, 0.15);
    CharacteristicFunctionOptions odeOpts;
    odeOpts.method = RiccatiMethod::NumericalODE;

    CharacteristicFunction closed(bates);
    CharacteristicFunction ode(bates, odeOpts);
    for (double T : {0.25, 3.0}) {
        for (double u : {1.0, 8.0}) {
            auto a = closed.evaluate(T, u);
            auto b = ode.evaluate(T, u);
            EXPECT_NEAR(std::abs(a - b), 0.0, 1e-7 * (1.0 + std::abs(a)));
        }
    }
}

TEST_F(CharacteristicFunctionTest, OriginalFormulationTracksTheBranch)
{
    // long maturity, strong vol of vol: the Original log argument winds around 0
    auto p = ModelParameters::heston(0.04, 1.0, 0.05, 1.0, -0.9);
    CharacteristicFunctionOptions original;
    original.formulation = HestonFormulation::Original;

    CharacteristicFunction trap(p);
    CharacteristicFunction orig(p, original);

    const double T = 10.0;
    for (double u = 0.5; u <= 20.0; u += 0.5) {
        auto a = trap.logEvaluate(T, u);
        auto b = orig.logEvaluate(T, u);
        EXPECT_NEAR(std::abs(a - b), 0.0, 1e-6 * (1.0 + std::abs(a))) << "u = " << u;
    }
}

TEST_F(CharacteristicFunctionTest, OriginalFormulationStaysFiniteAtLongMaturity)
{
    // Re(d)·T far beyond the double range of e^{dT}
    CharacteristicFunctionOptions original;
    original.formulation = HestonFormulation::Original;
    CharacteristicFunction trap(heston());
    CharacteristicFunction orig(heston(), original);

    for (double T : {20.0, 100.0}) {
        for (std::complex<double> u : {std::complex<double>(50.0, 0.0), std::complex<double>(160.0, -2.5)}) {
            auto a = trap.logEvaluate(T, u);
            auto b = orig.logEvaluate(T, u);
            EXPECT_TRUE(std::isfinite(std::real(b)) && std::isfinite(std::imag(b))) << "T = " << T;
            EXPECT_NEAR(std::abs(a - b), 0.0, 1e-8 * (1.0 + std::abs(a))) << "T = " << T << ", u = " << u;
        }
    }
}

TEST_F(CharacteristicFunctionTest, BranchWalkTooLongThrows)
{
    // the Original log is always walked, 4|d|T/π substeps
    CharacteristicFunctionOptions original;
    original.formulation = HestonFormulation::Original;
    CharacteristicFunction orig(heston(), original);

    EXPECT_NO_THROW(orig.logEvaluate(1.0, 1e4));
    EXPECT_THROW(orig.logEvaluate(1.0, 2e5), NumericalInstabilityError);

    // LittleTrap on the real axis needs no walk
    CharacteristicFunction trap(heston());
    EXPECT_NO_THROW(trap.logEvaluate(1.0, 2e5));
}

TEST_F(CharacteristicFunctionTest, ContinuousInU)
{
    // no 2π jumps in Im(log φ) along a fine u grid
    auto p = ModelParameters::heston(0.04, 1.0, 0.05, 1.0, -0.9);
    CharacteristicFunction cf(p);
    std::complex<double> prev = cf.logEvaluate(10.0, 0.0);
    for (double u = 0.05; u <= 30.0; u += 0.05) {
        std::complex<double> next = cf.logEvaluate(10.0, u);
        EXPECT_LT(std::abs(std::imag(next) - std::imag(prev)), 1.0) << "jump at u = " << u;
        prev = next;
    }
}

TEST_F(CharacteristicFunctionTest, BatesWithoutJumpsIsHeston)
{
    auto bates = ModelParameters::bates(v0, kappa, theta, sigma, rho, 0.0, -0.1, 0.15);
    CharacteristicFunction h(heston());
    CharacteristicFunction b(bates);
    for (double u : {0.5, 3.0, 12.0}) {
        EXPECT_NEAR(std::abs(h.evaluate(1.0, u) - b.evaluate(1.0, u)), 0.0, 1e-15);
    }
    EXPECT_EQ(b.jumpExponent(2.0), std::complex<double>(0.0, 0.0));
}

TEST_F(CharacteristicFunctionTest, JumpsFactorOut)
{
    // φ_Bates = φ_Heston · exp(ψ_J(u) · T)
    auto bates = ModelParameters::bates(v0, kappa, theta, sigma, rho, 0.5, -0.1, 0.15);
    CharacteristicFunction h(heston());
    CharacteristicFunction b(bates);
    const double T = 1.5;
    for (double u : {0.5, 3.0}) {
        auto expected = h.evaluate(T, u) * std::exp(b.jumpExponent(u) * T);
        EXPECT_NEAR(std::abs(b.evaluate(T, u) - expected), 0.0, 1e-13);
    }
    EXPECT_NEAR(std::abs(b.jumpExponent(-1i)), 0.0, 1e-15);
}

TEST_F(CharacteristicFunctionTest, VectorEvaluationKeepsOrder)
{
    CharacteristicFunction cf(heston());
    std::vector<std::complex<double>> u = {0.0, 1.0, 2.0 - 0.5i, -1i};
    auto values = cf.evaluate(0.75, u);
    ASSERT_EQ(values.size(), u.size());
    for (size_t i = 0; i < u.size(); ++i)
        EXPECT_EQ(values[i], cf.evaluate(0.75, u[i]));
}

TEST_F(CharacteristicFunctionTest, InvalidInputsThrow)
{
    CharacteristicFunction cf(heston());
    EXPECT_THROW(cf.evaluate(0.0, 1.0), InvalidParameterError);
    EXPECT_THROW(cf.evaluate(-1.0, 1.0), InvalidParameterError);
    EXPECT_THROW(cf.evaluate(std::nan(""), 1.0), InvalidParameterError);
    EXPECT_THROW(cf.evaluate(1.0, std::complex<double>(std::nan(""), 0.0)), InvalidParameterError);

    CharacteristicFunctionOptions bad;
    bad.method = RiccatiMethod::NumericalODE;
    bad.odeTolerance = 0.0;
    EXPECT_THROW(CharacteristicFunction(heston(), bad), InvalidParameterError);
}

TEST_F(CharacteristicFunctionTest, OdeBudgetExhaustionThrows)
{
    CharacteristicFunctionOptions tight;
    tight.method = RiccatiMethod::NumericalODE;
    tight.odeMaxSteps = 1;
    CharacteristicFunction cf(heston(), tight);
    EXPECT_THROW(cf.evaluate(1.0, 10.0), NumericalInstabilityError);
}

// ============================================================================
// ContinuousLog
// ============================================================================

TEST(ContinuousLogTest, FollowsWindingPath)
{
    ContinuousLog tracker;
    const double pi = std::numbers::pi;
    // two full turns around the origin at radius 2
    const int steps = 32;
    for (int j = 1; j <= steps; ++j) {
        double angle = 4.0 * pi * j / steps;
        tracker.next(2.0 * std::exp(1i * angle));
    }
    EXPECT_NEAR(std::real(tracker.value()), std::log(2.0), 1e-14);
    EXPECT_NEAR(std::imag(tracker.value()), 4.0 * pi, 1e-12);
    EXPECT_EQ(tracker.branch(), 2);

    // and back the other way
    for (int j = steps - 1; j >= 0; --j) {
        double angle = 4.0 * pi * j / steps;
        tracker.next(2.0 * std::exp(1i * angle));
    }
    EXPECT_NEAR(std::imag(tracker.value()), 0.0, 1e-12);
    EXPECT_EQ(tracker.branch(), 0);
}

TEST(ContinuousLogTest, PrincipalBranchForSmallMoves)
{
    ContinuousLog tracker;
    auto w = tracker.next(1.0 + 0.5i);
    EXPECT_NEAR(std::abs(w - std::log(1.0 + 0.5i)), 0.0, 1e-15);
    EXPECT_EQ(tracker.branch(), 0);
}

TEST(ContinuousLogTest, ZeroAndNonFiniteThrow)
{
    ContinuousLog tracker;
    EXPECT_THROW(tracker.next(0.0), NumericalInstabilityError);
    EXPECT_THROW(tracker.next(std::complex<double>(INFINITY, 0.0)), NumericalInstabilityError);
}
