#include <affinefm/models/ModelParameters.h>
#include <affinefm/utils/Errors.h>
#include <cmath>
#include <gtest/gtest.h>
#include <limits>

TEST(ModelParametersTest, HestonVectorLayout)
{
    auto p = ModelParameters::heston(0.04, 2.0, 0.05, 0.3, -0.7);

    EXPECT_EQ(p.variant(), ModelVariant::Heston);
    EXPECT_EQ(p.size(), 5u);
    EXPECT_FALSE(p.hasJumps());
    EXPECT_DOUBLE_EQ(p.lambda(), 0.0);

    std::vector<double> expected = {0.04, 2.0, 0.05, 0.3, -0.7};
    EXPECT_EQ(p.toVector(), expected);

    std::vector<std::string> names = {"v0", "kappa", "theta", "sigma", "rho"};
    EXPECT_EQ(p.names(), names);

    auto back = ModelParameters::fromVector(ModelVariant::Heston, p.toVector());
    EXPECT_TRUE(back == p);
}

TEST(ModelParametersTest, BatesVectorLayout)
{
    auto p = ModelParameters::bates(0.04, 2.0, 0.05, 0.3, -0.7, 0.5, -0.1, 0.15);

    EXPECT_EQ(p.size(), 8u);
    EXPECT_TRUE(p.hasJumps());
    EXPECT_DOUBLE_EQ(p.muJ(), -0.1);
    EXPECT_EQ(p.names().back(), "deltaJ");

    auto back = ModelParameters::fromVector(ModelVariant::Bates, p.toVector());
    EXPECT_TRUE(back == p);

    // wrong length for the variant
    EXPECT_THROW(ModelParameters::fromVector(ModelVariant::Bates, {0.04, 2.0, 0.05, 0.3, -0.7}),
                 InvalidParameterError);
    EXPECT_THROW(ModelParameters::fromVector(ModelVariant::Heston, p.toVector()), InvalidParameterError);
}

TEST(ModelParametersTest, FellerCondition)
{
    // 2κθ = 0.2 > σ² = 0.09
    auto satisfied = ModelParameters::heston(0.04, 2.0, 0.05, 0.3, -0.7);
    EXPECT_TRUE(satisfied.satisfiesFellerCondition());
    EXPECT_NEAR(satisfied.fellerMargin(), 0.2 - 0.09, 1e-15);

    // 2κθ = 0.08 < σ² = 0.36, reported but still a valid model
    auto violated = ModelParameters::heston(0.04, 1.0, 0.04, 0.6, -0.7);
    EXPECT_FALSE(violated.satisfiesFellerCondition());
    EXPECT_LT(violated.fellerMargin(), 0.0);
}

TEST(ModelParametersTest, InadmissibleValuesThrow)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_THROW(ModelParameters::heston(-0.01, 2.0, 0.05, 0.3, -0.7), InvalidParameterError);
    EXPECT_THROW(ModelParameters::heston(0.04, 0.0, 0.05, 0.3, -0.7), InvalidParameterError);
    EXPECT_THROW(ModelParameters::heston(0.04, 2.0, -0.05, 0.3, -0.7), InvalidParameterError);
    EXPECT_THROW(ModelParameters::heston(0.04, 2.0, 0.05, 0.0, -0.7), InvalidParameterError);
    EXPECT_THROW(ModelParameters::heston(0.04, 2.0, 0.05, 0.3, 1.0), InvalidParameterError);
    EXPECT_THROW(ModelParameters::heston(0.04, 2.0, 0.05, 0.3, -1.0), InvalidParameterError);
    EXPECT_THROW(ModelParameters::heston(nan, 2.0, 0.05, 0.3, -0.7), InvalidParameterError);

    EXPECT_THROW(ModelParameters::bates(0.04, 2.0, 0.05, 0.3, -0.7, -0.1, 0.0, 0.1), InvalidParameterError);
    EXPECT_THROW(ModelParameters::bates(0.04, 2.0, 0.05, 0.3, -0.7, 0.1, 0.0, -0.1), InvalidParameterError);

    // v0 = 0 and λ = 0 sit on the boundary and are admissible
    EXPECT_NO_THROW(ModelParameters::heston(0.0, 2.0, 0.05, 0.3, -0.7));
    EXPECT_NO_THROW(ModelParameters::bates(0.04, 2.0, 0.05, 0.3, -0.7, 0.0, 0.0, 0.0));
}

TEST(ModelParametersTest, ErrorMessageNamesTheParameter)
{
    try {
        ModelParameters::heston(0.04, 2.0, 0.05, 0.3, 1.5);
        FAIL() << "expected InvalidParameterError";
    } catch (const InvalidParameterError &e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("rho"), std::string::npos);
        EXPECT_NE(msg.find("1.5"), std::string::npos);
    }
}

// ============================================================================
// ParameterBounds
// ============================================================================

TEST(ParameterBoundsTest, DefaultsAreAdmissible)
{
    auto heston = ParameterBounds::defaults(ModelVariant::Heston);
    EXPECT_EQ(heston.lower().size(), 5u);
    EXPECT_EQ(heston.upper().size(), 5u);
    EXPECT_DOUBLE_EQ(heston.lower()[4], -0.99);
    EXPECT_DOUBLE_EQ(heston.upper()[1], 15.0);

    auto bates = ParameterBounds::defaults(ModelVariant::Bates);
    EXPECT_EQ(bates.lower().size(), 8u);
    EXPECT_DOUBLE_EQ(bates.upper()[5], 5.0);

    auto p = ModelParameters::heston(0.04, 2.0, 0.05, 0.3, -0.7);
    EXPECT_TRUE(heston.contains(p));
    EXPECT_FALSE(bates.contains(p));
    EXPECT_NO_THROW(heston.validateStart(p));
}

TEST(ParameterBoundsTest, InvalidBoxesThrow)
{
    std::vector<double> lower = {1e-4, 1e-2, 1e-4, 1e-2, -0.99};
    std::vector<double> upper = {1.0, 15.0, 1.0, 3.0, 0.99};

    // wrong length
    EXPECT_THROW(ParameterBounds(ModelVariant::Bates, lower, upper), InvalidParameterError);

    // lower >= upper
    auto badOrder = upper;
    badOrder[1] = 1e-2;
    EXPECT_THROW(ParameterBounds(ModelVariant::Heston, lower, badOrder), InvalidParameterError);

    // rho box reaching |rho| = 1 leaves the admissible domain
    auto badRho = upper;
    badRho[4] = 1.0;
    EXPECT_THROW(ParameterBounds(ModelVariant::Heston, lower, badRho), InvalidParameterError);

    // negative sigma
    auto badSigma = lower;
    badSigma[3] = -0.5;
    EXPECT_THROW(ParameterBounds(ModelVariant::Heston, badSigma, upper), InvalidParameterError);
}

TEST(ParameterBoundsTest, StartOutsideBoxThrows)
{
    auto bounds = ParameterBounds::defaults(ModelVariant::Heston);

    // kappa above the default upper bound of 15
    auto outside = ModelParameters::heston(0.04, 20.0, 0.05, 0.3, -0.7);
    EXPECT_FALSE(bounds.contains(outside));
    EXPECT_THROW(bounds.validateStart(outside), InvalidParameterError);

    // variant mismatch
    auto bates = ModelParameters::bates(0.04, 2.0, 0.05, 0.3, -0.7, 0.5, -0.1, 0.15);
    EXPECT_THROW(bounds.validateStart(bates), InvalidParameterError);
}
