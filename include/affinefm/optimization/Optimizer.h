/**
    Optimizer
    - Levenberg-Marquardt with box constraints (projection onto [lb, ub])
*/

#ifndef AFFINEFM_OPTIMIZER_H
#define AFFINEFM_OPTIMIZER_H

#include <affinefm/math/LinearAlgebra.h>
#include <functional>
#include <string>
#include <vector>

// ---- function types ----

using ResidualFunc = std::function<std::vector<double>(const std::vector<double>&)>;
using JacobianFunc = std::function<Matrix(const std::vector<double>&)>;

// ---- result ----

enum class LMStatus {
    Converged,       // step, gradient, reduction or residual criterion met
    MaxIterations,   // iteration budget exhausted
    TimeBudget,      // wall clock budget exhausted
    Stalled          // damping overflow, no descent step found
};

struct LMResult {
    std::vector<double> params;
    double finalResidual = 0.0;   // ||r||^2 at params
    int iterations = 0;           // accepted steps
    int evaluations = 0;          // residual evaluations incl. Jacobian columns
    bool converged = false;
    LMStatus status = LMStatus::MaxIterations;
    std::string message;
};

// ---- options ----

struct LMOptions {
    double tol = 1e-8;            // relative step size
    double gradTol = 1e-10;       // projected gradient ||J^T r||_inf
    double fTol = 1e-12;          // relative reduction of ||r||^2 (actual and predicted)
    double residualTol = 0.0;     // absolute ||r||^2, 0 disables
    int maxIter = 100;
    double maxTimeSeconds = 0.0;  // 0 disables
    double lambda0 = 1e-3;
    double lambdaUp = 10.0;
    double lambdaDown = 0.1;
    double jacobianStep = 1e-7;   // relative central difference step
    bool verbose = false;
};

// ---- Levenberg-Marquardt ----

class LevenbergMarquardt {
public:
    LMResult solve(ResidualFunc residuals,
        const std::vector<double>& x0,
        const std::vector<double>& lb = {},
        const std::vector<double>& ub = {},
        JacobianFunc jacobian = nullptr,
        const LMOptions& opts = {});

private:
    // central differences, one-sided at an active bound so trial points stay feasible
    Matrix numericalJacobian(const ResidualFunc& f, const std::vector<double>& x,
        const std::vector<double>& r,
        const std::vector<double>& lb,
        const std::vector<double>& ub,
        double h, int& evaluations);
    std::vector<double> clamp(const std::vector<double>& x,
        const std::vector<double>& lb,
        const std::vector<double>& ub);
    void clampInPlace(std::vector<double>& x,
        const std::vector<double>& lb,
        const std::vector<double>& ub);
    // gradient with components pointing out of the box (at an active bound) removed
    std::vector<double> projectedGradient(const std::vector<double>& g,
        const std::vector<double>& x,
        const std::vector<double>& lb,
        const std::vector<double>& ub);
};

#endif
