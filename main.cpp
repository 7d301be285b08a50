#include <affinefm/calibration/Calibrator.h>
#include <affinefm/market/DiscountCurve.h>
#include <affinefm/market/MarketData.h>
#include <affinefm/models/ModelParameters.h>
#include <affinefm/pricers/BlackScholesFormulas.h>
#include <affinefm/pricers/FourierPricer.h>
#include <affinefm/utils/Errors.h>
#include <affinefm/utils/Utils.h>

#include <iomanip>
#include <iostream>
#include <vector>

int main()
{
    // ============================================================================
    // Heston reference case: F = 100, T = 1, K = 100
    // ============================================================================
    auto heston = ModelParameters::heston(0.04, 2.0, 0.04, 0.3, -0.7);

    std::cout << std::fixed << std::setprecision(8);
    std::cout << "Heston ATM call, F = 100, T = 1: " << heston.toString() << std::endl;

    FourierOptions carrMadan;
    FourierOptions lipton;
    lipton.method = FourierMethod::Lipton;
    FourierOptions cos;
    cos.method = FourierMethod::COS;

    std::cout << "  Carr-Madan: " << FourierPricer(carrMadan).price(heston, 1.0, 100.0, 100.0) << std::endl;
    std::cout << "  Lipton:     " << FourierPricer(lipton).price(heston, 1.0, 100.0, 100.0) << std::endl;
    std::cout << "  COS:        " << FourierPricer(cos).price(heston, 1.0, 100.0, 100.0) << std::endl;

    // ============================================================================
    // Smile at T = 1
    // ============================================================================
    FourierPricer pricer(carrMadan);
    std::vector<double> strikes = Utils::linspace(70.0, 130.0, 7);
    PricingGrid grid = pricer.grid(heston, 1.0, 100.0, strikes);

    std::cout << "\n" << std::setw(10) << "K" << std::setw(14) << "ln(K/F)"
              << std::setw(16) << "call" << std::setw(14) << "implied vol" << std::endl;
    for (const auto &p : grid.points) {
        double vol = BlackScholesFormulas::impliedVolatility(
            p.strike >= grid.forward ? p.price : p.price - (grid.forward - p.strike),
            grid.forward, p.strike, grid.maturity,
            p.strike >= grid.forward ? OptionType::Call : OptionType::Put);
        std::cout << std::setw(10) << p.strike << std::setw(14) << p.logMoneyness
                  << std::setw(16) << p.price << std::setw(14) << vol << std::endl;
    }

    // ============================================================================
    // Calibration to synthetic quotes
    // ============================================================================
    FlatDiscountCurve curve(0.02);
    MarketData market(1640.0, curve, 0.01);
    auto truth = ModelParameters::heston(0.0457, 5.07, 0.0457, 0.48, -0.767);

    std::vector<MarketQuote> quotes;
    for (double T : {0.25, 0.5, 1.0}) {
        double F = market.forward(T);
        for (double K : {1312.0, 1476.0, 1640.0, 1804.0, 1968.0}) {
            OptionType type = K >= F ? OptionType::Call : OptionType::Put;
            double undiscounted = pricer.price(truth, T, F, K, type);
            quotes.push_back(MarketQuote::fromPrice(K, T, type, market.discount(T) * undiscounted));
        }
    }

    CalibrationOptions options;
    options.restarts = 2;
    Calibrator calibrator(market, pricer, options);

    auto initial = ModelParameters::heston(0.08, 2.0, 0.08, 0.8, -0.3);
    try {
        CalibrationResult result = calibrator.calibrate(quotes, initial, ParameterBounds::defaults(ModelVariant::Heston));

        std::cout << "\nCalibration " << toString(result.status) << " after " << result.iterations
                  << " iterations (start " << result.restartIndex << ", " << result.message << ")" << std::endl;
        std::cout << "  fitted: " << result.params.toString() << std::endl;
        std::cout << "  truth:  " << truth.toString() << std::endl;
        std::cout << "  vol rmse: " << std::scientific << result.rmse << std::endl;
        std::cout << "  Feller satisfied: " << (result.params.satisfiesFellerCondition() ? "yes" : "no") << std::endl;
    } catch (const NoArbitrageViolation &e) {
        std::cerr << "Bad market quote: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
