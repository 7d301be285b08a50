#include <affinefm/math/LinearAlgebra.h>

#include <algorithm>
#include <numeric>
#include <string>

// ===========================================================================
// Matrix Operations
// ===========================================================================

std::vector<double> MatrixOps::multiply(const Matrix &A, const std::vector<double> &x)
{
    size_t m = A.size();
    if (m == 0)
        return {};
    size_t n = A[0].size();
    if (n != x.size())
        throw std::invalid_argument("Dimension mismatch");

    std::vector<double> y(m, 0.0);
    for (size_t i = 0; i < m; ++i)
        for (size_t j = 0; j < n; ++j)
            y[i] += A[i][j] * x[j];
    return y;
}

double MatrixOps::norm2(const std::vector<double> &x)
{
    double sum = 0.0;
    for (double xi : x)
        sum += xi * xi;
    return std::sqrt(sum);
}

double MatrixOps::normInf(const std::vector<double> &x)
{
    double maxVal = 0.0;
    for (double xi : x)
        maxVal = std::max(maxVal, std::abs(xi));
    return maxVal;
}

double MatrixOps::dot(const std::vector<double> &x, const std::vector<double> &y)
{
    if (x.size() != y.size())
        throw std::invalid_argument("Dimension mismatch");
    double sum = 0.0;
    for (size_t i = 0; i < x.size(); ++i)
        sum += x[i] * y[i];
    return sum;
}

void MatrixOps::axpy(double alpha, const std::vector<double> &x, std::vector<double> &y)
{
    for (size_t i = 0; i < x.size(); ++i)
        y[i] += alpha * x[i];
}

Matrix MatrixOps::identity(size_t n)
{
    Matrix I = zeros(n, n);
    for (size_t i = 0; i < n; ++i)
        I[i][i] = 1.0;
    return I;
}

Matrix MatrixOps::zeros(size_t m, size_t n)
{
    return Matrix(m, std::vector<double>(n, 0.0));
}

Matrix MatrixOps::multiplyAtA(const Matrix &A)
{
    size_t m = A.size();
    if (m == 0) return {};
    size_t n = A[0].size();

    Matrix C = zeros(n, n);
    // only compute upper triangle, then mirror
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i; j < n; ++j) {
            double sum = 0.0;
            for (size_t k = 0; k < m; ++k)
                sum += A[k][i] * A[k][j];
            C[i][j] = sum;
            C[j][i] = sum;
        }
    }
    return C;
}

std::vector<double> MatrixOps::multiplyAtb(const Matrix &A, const std::vector<double> &b)
{
    size_t m = A.size();
    if (m == 0) return {};
    size_t n = A[0].size();
    if (b.size() != m)
        throw std::invalid_argument("Dimension mismatch");

    std::vector<double> y(n, 0.0);
    for (size_t j = 0; j < n; ++j)
        for (size_t i = 0; i < m; ++i)
            y[j] += A[i][j] * b[i];
    return y;
}

// ===========================================================================
// Cholesky
// ===========================================================================

Matrix Cholesky::decompose(const Matrix &S)
{
    size_t n = S.size();
    if (n == 0)
        return {};

    // check symmetry (relative, normal matrices can be badly scaled)
    for (size_t i = 0; i < n; ++i)
        for (size_t j = i + 1; j < n; ++j)
            if (std::abs(S[i][j] - S[j][i]) > 1e-10 * (1.0 + std::abs(S[i][j])))
                throw std::invalid_argument("Matrix is not symmetric");

    Matrix L = MatrixOps::zeros(n, n);

    for (size_t i = 0; i < n; ++i)
    {
        for (size_t j = 0; j <= i; ++j)
        {
            double sum = S[i][j];
            for (size_t k = 0; k < j; ++k)
                sum -= L[i][k] * L[j][k];

            if (i == j)
            {
                if (!(sum > 0.0)) // also catches NaN
                    throw std::runtime_error("Matrix not positive definite at pivot " + std::to_string(i));
                L[i][j] = std::sqrt(sum);
            }
            else
            {
                L[i][j] = sum / L[j][j];
            }
        }
    }
    return L;
}

std::vector<double> Cholesky::solveL(const Matrix &L, const std::vector<double> &b)
{
    size_t n = L.size();
    std::vector<double> y(n);

    for (size_t i = 0; i < n; ++i)
    {
        double sum = b[i];
        for (size_t j = 0; j < i; ++j)
            sum -= L[i][j] * y[j];
        y[i] = sum / L[i][i];
    }
    return y;
}

std::vector<double> Cholesky::solveLT(const Matrix &L, const std::vector<double> &y)
{
    size_t n = L.size();
    std::vector<double> x(n);

    for (int i = static_cast<int>(n) - 1; i >= 0; --i)
    {
        double sum = y[i];
        for (size_t j = i + 1; j < n; ++j)
            sum -= L[j][i] * x[j];
        x[i] = sum / L[i][i];
    }
    return x;
}

std::vector<double> Cholesky::solve(const Matrix &L, const std::vector<double> &b)
{
    auto y = solveL(L, b);
    return solveLT(L, y);
}

// ===========================================================================
// Symmetric eigendecomposition - cyclic Jacobi
// ===========================================================================

EigenResult SymmetricEigen::decompose(const Matrix &S, double tol, int maxSweeps)
{
    size_t n = S.size();
    EigenResult result;
    if (n == 0)
        return result;

    Matrix A = S;
    Matrix V = MatrixOps::identity(n);

    auto offDiagonal = [&]() {
        double sum = 0.0;
        for (size_t i = 0; i < n; ++i)
            for (size_t j = i + 1; j < n; ++j)
                sum += A[i][j] * A[i][j];
        return std::sqrt(sum);
    };

    double scale = 0.0;
    for (size_t i = 0; i < n; ++i)
        for (size_t j = 0; j < n; ++j)
            scale = std::max(scale, std::abs(A[i][j]));

    int sweep = 0;
    while (offDiagonal() > tol * std::max(scale, 1e-300))
    {
        if (++sweep > maxSweeps)
            throw std::runtime_error("Jacobi eigensolver failed to converge after " +
                                     std::to_string(maxSweeps) + " sweeps");

        for (size_t p = 0; p < n; ++p)
        {
            for (size_t q = p + 1; q < n; ++q)
            {
                if (A[p][q] == 0.0)
                    continue;

                // rotation angle that zeroes A[p][q]
                double theta = (A[q][q] - A[p][p]) / (2.0 * A[p][q]);
                double t = (theta >= 0.0 ? 1.0 : -1.0) /
                           (std::abs(theta) + std::sqrt(theta * theta + 1.0));
                double c = 1.0 / std::sqrt(t * t + 1.0);
                double s = t * c;

                for (size_t k = 0; k < n; ++k)
                {
                    double akp = A[k][p];
                    double akq = A[k][q];
                    A[k][p] = c * akp - s * akq;
                    A[k][q] = s * akp + c * akq;
                }
                for (size_t k = 0; k < n; ++k)
                {
                    double apk = A[p][k];
                    double aqk = A[q][k];
                    A[p][k] = c * apk - s * aqk;
                    A[q][k] = s * apk + c * aqk;
                }
                for (size_t k = 0; k < n; ++k)
                {
                    double vkp = V[k][p];
                    double vkq = V[k][q];
                    V[k][p] = c * vkp - s * vkq;
                    V[k][q] = s * vkp + c * vkq;
                }
            }
        }
    }

    // sort eigenvalues descending, carry the vectors along
    std::vector<size_t> idx(n);
    std::iota(idx.begin(), idx.end(), 0);
    std::sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
        return A[a][a] > A[b][b];
    });

    result.values.resize(n);
    result.vectors = MatrixOps::zeros(n, n);
    for (size_t j = 0; j < n; ++j)
    {
        result.values[j] = A[idx[j]][idx[j]];
        for (size_t i = 0; i < n; ++i)
            result.vectors[i][j] = V[i][idx[j]];
    }
    return result;
}

std::vector<double> SymmetricEigen::solve(const EigenResult &eig, const std::vector<double> &b, double tol)
{
    size_t n = eig.values.size();
    std::vector<double> x(n, 0.0);
    if (n == 0)
        return x;

    double maxAbs = 0.0;
    for (double v : eig.values)
        maxAbs = std::max(maxAbs, std::abs(v));
    double thresh = tol * maxAbs;

    for (size_t j = 0; j < n; ++j)
    {
        if (std::abs(eig.values[j]) <= thresh)
            continue;
        double s = 0.0;
        for (size_t i = 0; i < n; ++i)
            s += eig.vectors[i][j] * b[i];
        s /= eig.values[j];
        for (size_t i = 0; i < n; ++i)
            x[i] += s * eig.vectors[i][j];
    }
    return x;
}
