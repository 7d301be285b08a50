#include <affinefm/optimization/Optimizer.h>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <limits>

// ============================================================================
// Levenberg-Marquardt
// ============================================================================

Matrix LevenbergMarquardt::numericalJacobian(const ResidualFunc& f, const std::vector<double>& x,
    const std::vector<double>& r,
    const std::vector<double>& lb,
    const std::vector<double>& ub,
    double h, int& evaluations)
{
    size_t n = x.size();
    size_t m = r.size();
    const double inf = std::numeric_limits<double>::infinity();

    Matrix J(m, std::vector<double>(n, 0.0));
    std::vector<double> xp = x, xm = x;

    for (size_t j = 0; j < n; ++j) {
        double hj = h * std::max(1.0, std::abs(x[j]));
        double roomUp = ub.empty() ? inf : ub[j] - x[j];
        double roomDown = lb.empty() ? inf : x[j] - lb[j];

        if (roomUp >= hj && roomDown >= hj) {
            // central difference
            xp[j] = x[j] + hj;
            xm[j] = x[j] - hj;
            auto rp = f(xp);
            auto rm = f(xm);
            evaluations += 2;
            for (size_t i = 0; i < m; ++i)
                J[i][j] = (rp[i] - rm[i]) / (2.0 * hj);
        } else if (roomUp >= roomDown) {
            // forward difference, x sits on (or near) its lower bound
            double step = std::min(hj, roomUp);
            if (step > 0.0) {
                xp[j] = x[j] + step;
                auto rp = f(xp);
                ++evaluations;
                for (size_t i = 0; i < m; ++i)
                    J[i][j] = (rp[i] - r[i]) / step;
            }
        } else {
            // backward difference, x sits on its upper bound
            double step = std::min(hj, roomDown);
            if (step > 0.0) {
                xm[j] = x[j] - step;
                auto rm = f(xm);
                ++evaluations;
                for (size_t i = 0; i < m; ++i)
                    J[i][j] = (r[i] - rm[i]) / step;
            }
        }
        xp[j] = x[j];
        xm[j] = x[j];
    }
    return J;
}

std::vector<double> LevenbergMarquardt::clamp(const std::vector<double>& x,
    const std::vector<double>& lb,
    const std::vector<double>& ub)
{
    std::vector<double> xc = x;
    clampInPlace(xc, lb, ub);
    return xc;
}

void LevenbergMarquardt::clampInPlace(std::vector<double>& x,
    const std::vector<double>& lb,
    const std::vector<double>& ub)
{
    for (size_t i = 0; i < x.size(); ++i) {
        if (!lb.empty()) x[i] = std::max(x[i], lb[i]);
        if (!ub.empty()) x[i] = std::min(x[i], ub[i]);
    }
}

std::vector<double> LevenbergMarquardt::projectedGradient(const std::vector<double>& g,
    const std::vector<double>& x,
    const std::vector<double>& lb,
    const std::vector<double>& ub)
{
    std::vector<double> pg = g;
    for (size_t i = 0; i < g.size(); ++i) {
        // descent direction is -g
        if (!lb.empty() && x[i] <= lb[i] && g[i] > 0.0) pg[i] = 0.0;
        if (!ub.empty() && x[i] >= ub[i] && g[i] < 0.0) pg[i] = 0.0;
    }
    return pg;
}

LMResult LevenbergMarquardt::solve(ResidualFunc residuals,
    const std::vector<double>& x0,
    const std::vector<double>& lb,
    const std::vector<double>& ub,
    JacobianFunc jacobian,
    const LMOptions& opts)
{
    if (!lb.empty() && lb.size() != x0.size())
        throw std::invalid_argument("LevenbergMarquardt: lower bound size " + std::to_string(lb.size()) +
                                    " does not match parameter size " + std::to_string(x0.size()));
    if (!ub.empty() && ub.size() != x0.size())
        throw std::invalid_argument("LevenbergMarquardt: upper bound size " + std::to_string(ub.size()) +
                                    " does not match parameter size " + std::to_string(x0.size()));

    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();
    auto elapsedSeconds = [&]() {
        return std::chrono::duration<double>(Clock::now() - start).count();
    };

    LMResult result;
    std::vector<double> x = clamp(x0, lb, ub);
    size_t n = x.size();

    auto r = residuals(x);
    result.evaluations = 1;
    double rNorm2 = MatrixOps::dot(r, r);

    auto computeJacobian = [&](const std::vector<double>& at, const std::vector<double>& rAt) {
        if (jacobian)
            return jacobian(at);
        return numericalJacobian(residuals, at, rAt, lb, ub, opts.jacobianStep, result.evaluations);
    };

    double lambda = opts.lambda0;
    int iter = 0;
    int totalIter = 0;

    // pre-allocate workspace
    std::vector<double> xNew(n);
    std::vector<double> negJtr(n);
    std::vector<double> delta(n);
    std::vector<double> actualStep(n);
    double xNorm = MatrixOps::norm2(x);

    // initial Jacobian and normal equations
    Matrix J = computeJacobian(x, r);
    auto JtJ = MatrixOps::multiplyAtA(J);
    auto Jtr = MatrixOps::multiplyAtb(J, r);

    if (opts.residualTol > 0.0 && rNorm2 <= opts.residualTol) {
        result.converged = true;
        result.status = LMStatus::Converged;
        result.message = "converged: residual below tolerance at start";
    } else if (MatrixOps::normInf(projectedGradient(Jtr, x, lb, ub)) < opts.gradTol) {
        result.converged = true;
        result.status = LMStatus::Converged;
        result.message = "converged: gradient below tolerance at start";
    }

    while (!result.converged && iter < opts.maxIter && totalIter < 10 * opts.maxIter)
    {
        if (opts.maxTimeSeconds > 0.0 && elapsedSeconds() > opts.maxTimeSeconds) {
            result.status = LMStatus::TimeBudget;
            result.message = "stopped: time budget exhausted";
            break;
        }
        ++totalIter;

        // (J^T*J + λ·diag(J^T*J)) * δ = -J^T*r
        // Marquardt scaling, params live on very different scales (v0 ~ 1e-2, kappa ~ 1)
        double maxDiag = 0.0;
        for (size_t i = 0; i < n; ++i)
            maxDiag = std::max(maxDiag, JtJ[i][i]);
        double diagFloor = 1e-12 * (1.0 + maxDiag);

        auto JtJ_aug = JtJ;
        for (size_t i = 0; i < n; ++i)
            JtJ_aug[i][i] += lambda * std::max(JtJ[i][i], diagFloor);

        for (size_t i = 0; i < n; ++i)
            negJtr[i] = -Jtr[i];

        // Cholesky first, eigen fallback for rank deficient J
        bool usedEigen = false;
        try
        {
            auto L = Cholesky::decompose(JtJ_aug);
            delta = Cholesky::solve(L, negJtr);
        }
        catch (const std::runtime_error &)
        {
            auto eig = SymmetricEigen::decompose(JtJ_aug);
            delta = SymmetricEigen::solve(eig, negJtr);
            usedEigen = true;
        }

        // trial point
        for (size_t i = 0; i < n; ++i)
            xNew[i] = x[i] + delta[i];
        clampInPlace(xNew, lb, ub);

        // actual step after clamping
        for (size_t i = 0; i < n; ++i)
            actualStep[i] = xNew[i] - x[i];

        auto rNew = residuals(xNew);
        ++result.evaluations;
        double rNewNorm2 = MatrixOps::dot(rNew, rNew);

        if (std::isfinite(rNewNorm2) && rNewNorm2 < rNorm2)
        {
            // predicted reduction of the linear model: ||r||^2 - ||r + J*s||^2
            auto Js = MatrixOps::multiply(J, actualStep);
            double linearNorm2 = 0.0;
            for (size_t i = 0; i < r.size(); ++i)
                linearNorm2 += (r[i] + Js[i]) * (r[i] + Js[i]);
            double predicted = rNorm2 - linearNorm2;
            double actual = rNorm2 - rNewNorm2;
            double previous = rNorm2;

            // accept step
            x = xNew;
            r = rNew;
            rNorm2 = rNewNorm2;
            lambda = std::max(lambda * opts.lambdaDown, 1e-16);
            ++iter;

            double stepNorm = MatrixOps::norm2(actualStep);
            xNorm = MatrixOps::norm2(x);

            if (opts.verbose)
            {
                std::cout << "LM iter " << iter << ": ||r||^2 = " << rNorm2
                          << ", λ = " << lambda
                          << (usedEigen ? " (eigen)" : "") << "\n";
            }

            if (stepNorm < opts.tol * (1.0 + xNorm))
            {
                result.converged = true;
                result.message = "converged: step size below tolerance";
                break;
            }
            if (opts.residualTol > 0.0 && rNorm2 <= opts.residualTol)
            {
                result.converged = true;
                result.message = "converged: residual below tolerance";
                break;
            }
            if (actual <= opts.fTol * previous && std::abs(predicted) <= opts.fTol * previous)
            {
                result.converged = true;
                result.message = "converged: relative reduction below tolerance";
                break;
            }

            // recompute Jacobian at new x before gradient check
            J = computeJacobian(x, r);
            JtJ = MatrixOps::multiplyAtA(J);
            Jtr = MatrixOps::multiplyAtb(J, r);

            double gradNorm = MatrixOps::normInf(projectedGradient(Jtr, x, lb, ub));
            if (gradNorm < opts.gradTol)
            {
                result.converged = true;
                result.message = "converged: gradient below tolerance";
                break;
            }
        }
        else
        {
            // damped step already below resolution: no further progress possible
            if (MatrixOps::norm2(delta) < opts.tol * (1.0 + xNorm))
            {
                result.converged = true;
                result.message = "converged: step size below tolerance";
                break;
            }

            // reject step, increase damping (J unchanged, skip recompute)
            lambda *= opts.lambdaUp;
            if (lambda > 1e16)
            {
                result.status = LMStatus::Stalled;
                result.message = "failed: lambda overflow";
                break;
            }
        }
    }

    if (result.converged)
        result.status = LMStatus::Converged;
    else if (result.message.empty())
        result.message = "stopped: max iterations reached";

    result.params = x;
    result.finalResidual = rNorm2;
    result.iterations = iter;
    return result;
}
