#include "ss.hpp"

#include <stdexcept>
#include <string>

#include "control.hpp"
#include "polynomial.hpp"
#include "tf.hpp"

namespace ctrlkit {

namespace {
    void checkShapes(const Matrix& A, const Matrix& B, const Matrix& C, const Matrix& D) {
        if (A.rows() != A.cols()) {
            throw std::invalid_argument("StateSpace: A must be square");
        }
        if (B.rows() != A.rows()) {
            throw std::invalid_argument("StateSpace: B must have as many rows as A");
        }
        if (C.cols() != A.cols()) {
            throw std::invalid_argument("StateSpace: C must have as many columns as A");
        }
        if (D.rows() != C.rows() || D.cols() != B.cols()) {
            throw std::invalid_argument("StateSpace: D must be outputs x inputs");
        }
    }

    void checkIndex(int index, Eigen::Index count, const char* what) {
        if (index < 0 || index >= count) {
            throw std::out_of_range(std::string(what) + " index " + std::to_string(index) + " out of range for " +
                                    std::to_string(count) + " channel(s)");
        }
    }
}  // namespace

StateSpace::StateSpace(Matrix A_, Matrix B_, Matrix C_, Matrix D_, std::optional<double> Ts_)
    : A(std::move(A_)), B(std::move(B_)), C(std::move(C_)), D(std::move(D_)) {
    checkShapes(A, B, C, D);
    if (Ts_.has_value() && !(*Ts_ > 0.0)) {
        throw std::invalid_argument("StateSpace: sampling time must be positive");
    }
    Ts = Ts_;
}

StateSpace::StateSpace(const TransferFunction& tf) : StateSpace(tf.toStateSpace()) {}

std::vector<Pole> StateSpace::poles() const { return ctrlkit::poles(*this); }

std::vector<Zero> StateSpace::zeros() const { return ctrlkit::zeros(*this); }

/**
 * @brief SISO channel G(s) = c (sI - A)^-1 b + d.
 *
 * The Faddeev-LeVerrier recursion builds det(sI - A) and adj(sI - A) in one pass:
 *   M_k = A M_(k-1) + a_(k-1) I,  a_k = -tr(A M_k) / k,  adj(sI - A) = sum_k M_k s^(n-k)
 *
 * @throws std::out_of_range for an invalid channel
 */
TransferFunction StateSpace::toTransferFunction(int output, int input) const {
    checkIndex(output, C.rows(), "Output");
    checkIndex(input, B.cols(), "Input");

    const Eigen::Index       n = A.rows();
    const Eigen::RowVectorXd c = C.row(output);
    const ColVec             b = B.col(input);
    const double             d = D(output, input);

    Poly den(n + 1, 0.0);
    Poly num(n + 1, 0.0);
    den[0] = 1.0;

    Matrix M = Matrix::Zero(n, n);
    for (Eigen::Index k = 1; k <= n; ++k) {
        M.diagonal().array() += den[k - 1];
        num[k] = c.dot(M * b);
        M      = A * M;
        den[k] = -M.trace() / static_cast<double>(k);
    }
    for (Eigen::Index k = 0; k <= n; ++k) {
        num[k] += d * den[k];
    }

    return TransferFunction(trimLeadingZeros(num, 1e-10), den, Ts);
}

}  // namespace ctrlkit
