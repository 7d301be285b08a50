#ifndef AFFINEFM_LINEARALGEBRA_H
#define AFFINEFM_LINEARALGEBRA_H

#include <cmath>
#include <stdexcept>
#include <vector>

// Matrix = row-major 2D vector
using Matrix = std::vector<std::vector<double>>;

// Basic matrix/vector operations
class MatrixOps
{
public:
    // y = A * x
    static std::vector<double> multiply(const Matrix &A, const std::vector<double> &x);
    // ||x||_2
    static double norm2(const std::vector<double> &x);
    // ||x||_inf
    static double normInf(const std::vector<double> &x);
    // dot product
    static double dot(const std::vector<double> &x, const std::vector<double> &y);
    // y = alpha * x + y
    static void axpy(double alpha, const std::vector<double> &x, std::vector<double> &y);
    // identity matrix
    static Matrix identity(size_t n);
    // zero matrix
    static Matrix zeros(size_t m, size_t n);
    // A^T * A (symmetric, avoids forming A^T)
    static Matrix multiplyAtA(const Matrix &A);
    // A^T * b (avoids forming A^T)
    static std::vector<double> multiplyAtb(const Matrix &A, const std::vector<double> &b);

private:
    MatrixOps() = delete;
};

// Cholesky: S = L * L^T for symmetric positive definite S
class Cholesky
{
public:
    // returns lower triangular L, throws std::runtime_error if S is not SPD
    static Matrix decompose(const Matrix &S);
    // solve L * y = b (forward substitution)
    static std::vector<double> solveL(const Matrix &L, const std::vector<double> &b);
    // solve L^T * x = y (back substitution)
    static std::vector<double> solveLT(const Matrix &L, const std::vector<double> &y);
    // solve S * x = b via L * L^T
    static std::vector<double> solve(const Matrix &L, const std::vector<double> &b);

private:
    Cholesky() = delete;
};

// Symmetric eigendecomposition S = Q * diag(lambda) * Q^T
struct EigenResult
{
    std::vector<double> values; // eigenvalues, descending
    Matrix vectors;             // columns are eigenvectors
};

/**
 * Cyclic Jacobi rotations for small symmetric matrices.
 *
 * Used as the fallback when Cholesky rejects the damped normal matrix
 * J^T J + λI (rank deficient Jacobian, λ underflow). The normal matrix is
 * symmetric, so its eigendecomposition doubles as its SVD and the
 * pseudo-inverse solve truncates the directions the data cannot identify.
 */
class SymmetricEigen
{
public:
    static EigenResult decompose(const Matrix &S, double tol = 1e-14, int maxSweeps = 100);
    // pseudo-inverse solve, eigenvalues below tol * max|lambda| are dropped
    static std::vector<double> solve(const EigenResult &eig, const std::vector<double> &b, double tol = 1e-12);

private:
    SymmetricEigen() = delete;
};

#endif // AFFINEFM_LINEARALGEBRA_H
