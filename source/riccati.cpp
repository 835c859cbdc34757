#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>
#include <string>

#include "Eigen/Dense"
#include "Eigen/Eigenvalues"
#include "control.hpp"

namespace ctrlkit {

namespace {
    using CMatrix = Eigen::MatrixXcd;
    using CVector = Eigen::VectorXcd;

    void checkSquare(const Matrix& A, const Matrix& Q, const char* who) {
        if (A.rows() != A.cols() || Q.rows() != A.rows() || Q.cols() != A.cols()) {
            throw std::invalid_argument(std::string(who) + ": dimension mismatch");
        }
    }

    void checkWeights(const Matrix& A, const Matrix& B, const Matrix& Q, const Matrix& R, const char* who) {
        const auto n = A.rows();
        const auto m = B.cols();
        if (A.rows() != A.cols() || B.rows() != n || Q.rows() != n || Q.cols() != n || R.rows() != m || R.cols() != m) {
            throw std::invalid_argument(std::string(who) + ": dimension mismatch");
        }
        if (Eigen::SelfAdjointEigenSolver<Matrix>(R, Eigen::EigenvaluesOnly).eigenvalues().minCoeff() <= 0.0) {
            throw std::invalid_argument(std::string(who) + ": R must be positive definite");
        }
        if (Eigen::SelfAdjointEigenSolver<Matrix>(Q, Eigen::EigenvaluesOnly).eigenvalues().minCoeff() < -1e-12) {
            throw std::invalid_argument(std::string(who) + ": Q must be positive semidefinite");
        }
    }

    Matrix symmetricPart(const Matrix& X) { return 0.5 * (X + X.transpose()); }

    // Tolerance for a vanishing pivot t_ii + shift
    double pivotTolerance(const CMatrix& T) { return 1e-13 * std::max(1.0, T.cwiseAbs().maxCoeff()); }
}  // namespace

// Bartels-Stewart on the complex Schur form A = U T U^H. With Y = U^H X U and F = U^H Q U the
// equation becomes T Y + Y T^H + F = 0, solved one column at a time from the last.
Matrix lyap(const Matrix& A, const Matrix& Q) {
    checkSquare(A, Q, "lyap");
    const Eigen::Index n = A.rows();
    if (n == 0) return Matrix::Zero(0, 0);

    const Eigen::ComplexSchur<CMatrix> schur(A.cast<std::complex<double>>());
    if (schur.info() != Eigen::Success) {
        throw std::runtime_error("lyap: Schur decomposition did not converge");
    }
    const CMatrix& U = schur.matrixU();
    const CMatrix& T = schur.matrixT();
    const CMatrix  F = U.adjoint() * Q.cast<std::complex<double>>() * U;
    const double   tol = pivotTolerance(T);

    CMatrix Y = CMatrix::Zero(n, n);
    for (Eigen::Index j = n - 1; j >= 0; --j) {
        CVector rhs = -F.col(j);
        for (Eigen::Index k = j + 1; k < n; ++k) {
            rhs -= std::conj(T(j, k)) * Y.col(k);
        }
        CMatrix M = T;
        M.diagonal().array() += std::conj(T(j, j));
        if (M.diagonal().cwiseAbs().minCoeff() <= tol) {
            throw std::runtime_error("lyap: A has eigenvalues mirrored about the imaginary axis");
        }
        Y.col(j) = M.triangularView<Eigen::Upper>().solve(rhs);
    }

    return symmetricPart((U * Y * U.adjoint()).real());
}

// Same reduction for A X A^T - X + Q = 0, giving T Y T^H - Y + F = 0
Matrix dlyap(const Matrix& A, const Matrix& Q) {
    checkSquare(A, Q, "dlyap");
    const Eigen::Index n = A.rows();
    if (n == 0) return Matrix::Zero(0, 0);

    const Eigen::ComplexSchur<CMatrix> schur(A.cast<std::complex<double>>());
    if (schur.info() != Eigen::Success) {
        throw std::runtime_error("dlyap: Schur decomposition did not converge");
    }
    const CMatrix& U = schur.matrixU();
    const CMatrix& T = schur.matrixT();
    const CMatrix  F = U.adjoint() * Q.cast<std::complex<double>>() * U;
    const double   tol = pivotTolerance(T);

    CMatrix Y = CMatrix::Zero(n, n);
    for (Eigen::Index j = n - 1; j >= 0; --j) {
        CVector known = CVector::Zero(n);
        for (Eigen::Index k = j + 1; k < n; ++k) {
            known += std::conj(T(j, k)) * Y.col(k);
        }
        const CVector rhs = -F.col(j) - T * known;

        CMatrix M = std::conj(T(j, j)) * T;
        M.diagonal().array() -= 1.0;
        if (M.diagonal().cwiseAbs().minCoeff() <= tol) {
            throw std::runtime_error("dlyap: A has reciprocal eigenvalue pairs");
        }
        Y.col(j) = M.triangularView<Eigen::Upper>().solve(rhs);
    }

    return symmetricPart((U * Y * U.adjoint()).real());
}

/**
 * Stabilizing solution of A^T X + X A - X B R^-1 B^T X + Q = 0.
 *
 * The matrix sign function W = sign(H) of the Hamiltonian H = [A, -G; -Q, -A^T] with G = B R^-1 B^T
 * is computed by the scaled Newton iteration Z <- (c Z + (c Z)^-1) / 2. The stable invariant
 * subspace [I; X] satisfies (W + I) [I; X] = 0, which is solved for X in the least-squares sense.
 */
Matrix care(const Matrix& A, const Matrix& B, const Matrix& Q, const Matrix& R) {
    checkWeights(A, B, Q, R, "care");
    const Eigen::Index n = A.rows();
    if (n == 0) return Matrix::Zero(0, 0);

    const Matrix G = B * R.llt().solve(B.transpose());

    Matrix Z(2 * n, 2 * n);
    Z << A, -G, -Q, -A.transpose();

    constexpr int    maxIterations = 100;
    constexpr double tol           = 1e-12;

    bool converged = false;
    for (int iter = 0; iter < maxIterations && !converged; ++iter) {
        const Eigen::PartialPivLU<Matrix> lu(Z);
        const auto                        pivots = lu.matrixLU().diagonal().cwiseAbs();
        if (!(pivots.minCoeff() > 0.0) || !pivots.allFinite()) {
            throw std::runtime_error("care: Hamiltonian has eigenvalues on the imaginary axis");
        }

        // Determinant scaling keeps the early iterates well conditioned
        const double logDet = pivots.array().log().sum();
        const double c      = std::exp(-logDet / static_cast<double>(2 * n));

        const Matrix next = 0.5 * (c * Z + lu.inverse() / c);
        converged         = (next - Z).lpNorm<1>() <= tol * next.lpNorm<1>();
        Z                 = next;
    }
    if (!converged || !Z.allFinite()) {
        throw std::runtime_error("care: sign iteration did not converge");
    }

    const Matrix I = Matrix::Identity(n, n);
    Matrix       lhs(2 * n, n);
    Matrix       rhs(2 * n, n);
    lhs << Z.topRightCorner(n, n), Z.bottomRightCorner(n, n) + I;
    rhs << -(Z.topLeftCorner(n, n) + I), -Z.bottomLeftCorner(n, n);

    const auto qr = lhs.colPivHouseholderQr();
    if (qr.rank() < n) {
        throw std::runtime_error("care: no stabilizing solution (is (A, B) stabilizable?)");
    }
    return symmetricPart(qr.solve(rhs));
}

/**
 * Stabilizing solution of A^T X A - X - A^T X B (R + B^T X B)^-1 B^T X A + Q = 0.
 *
 * Structured doubling on X = A^T X (I + G X)^-1 A + Q with G = B R^-1 B^T. The H iterate converges
 * quadratically to X.
 */
Matrix dare(const Matrix& A, const Matrix& B, const Matrix& Q, const Matrix& R) {
    checkWeights(A, B, Q, R, "dare");
    const Eigen::Index n = A.rows();
    if (n == 0) return Matrix::Zero(0, 0);

    const Matrix I = Matrix::Identity(n, n);
    Matrix       Ak = A;
    Matrix       Gk = B * R.llt().solve(B.transpose());
    Matrix       Hk = Q;

    constexpr int    maxIterations = 60;
    constexpr double tol           = 1e-14;

    for (int iter = 0; iter < maxIterations; ++iter) {
        const Eigen::FullPivLU<Matrix> W(I + Gk * Hk);
        if (!W.isInvertible()) {
            throw std::runtime_error("dare: doubling step is singular");
        }
        const Matrix WinvA = W.solve(Ak);
        const Matrix WinvG = W.solve(Gk);

        const Matrix Hnext = Hk + Ak.transpose() * Hk * WinvA;
        Gk                 = Gk + Ak * WinvG * Ak.transpose();
        Ak                 = Ak * WinvA;

        if (!Hnext.allFinite()) {
            throw std::runtime_error("dare: iteration diverged (is (A, B) stabilizable?)");
        }
        const bool done = (Hnext - Hk).norm() <= tol * std::max(1.0, Hnext.norm());
        Hk              = Hnext;
        if (done) {
            return symmetricPart(Hk);
        }
    }
    throw std::runtime_error("dare: doubling iteration did not converge");
}

// [B, AB, ..., A^(n-1) B]
Matrix ctrb(const Matrix& A, const Matrix& B) {
    if (A.rows() != A.cols() || B.rows() != A.rows()) {
        throw std::invalid_argument("ctrb: dimension mismatch");
    }
    const Eigen::Index n = A.rows();
    const Eigen::Index m = B.cols();

    Matrix W(n, n * m);
    Matrix block = B;
    for (Eigen::Index k = 0; k < n; ++k) {
        W.middleCols(k * m, m) = block;
        block                  = A * block;
    }
    return W;
}

// [C; CA; ...; C A^(n-1)], the transpose of the dual controllability matrix
Matrix obsv(const Matrix& C, const Matrix& A) {
    if (A.rows() != A.cols() || C.cols() != A.rows()) {
        throw std::invalid_argument("obsv: dimension mismatch");
    }
    return ctrb(A.transpose(), C.transpose()).transpose();
}

}  // namespace ctrlkit
