#pragma once

#include "statkit/core/errors.hpp"
#include "statkit/core/regression_options.hpp"
#include "statkit/core/regression_result.hpp"
#include "statkit/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace statkit {
namespace solvers {

/**
 * Ordinary Least Squares (OLS) Regression Solver
 *
 * Default strategy is the normal-equations closed form:
 *
 *   beta = (X'X)^-1 X'y
 *
 * which requires X'X to be invertible (X full column rank, p <= n). A
 * rank-deficient design is rejected with SingularMatrixError. The
 * PSEUDO_INVERSE strategy instead returns the minimum-norm least-squares
 * solution through Eigen's CompleteOrthogonalDecomposition and accepts
 * rank-deficient designs.
 *
 * The solver uses X exactly as given. For a model with an intercept, prepend
 * a column of ones (utils::AddInterceptColumn) before calling Fit(); the
 * intercept coefficient is then coefficients[0].
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 * - Every call returns a new, independent RegressionResult
 */
class OLSSolver {
public:
	/**
	 * Fit OLS regression
	 *
	 * @param X Design matrix (n × p)
	 * @param y Response vector (length n)
	 * @param options Regression options (strategy, tolerances)
	 * @return RegressionResult holding the fitted LinearModel
	 *
	 * @throws EmptyInputError if X has no rows or no columns
	 * @throws ShapeMismatchError if y.size() != X.rows()
	 * @throws SingularMatrixError if X'X is not invertible (NORMAL_EQUATIONS only)
	 */
	static core::RegressionResult Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                                  const core::RegressionOptions &options = core::RegressionOptions());

	/**
	 * Quick check for constant columns
	 *
	 * A constant column next to an intercept column makes X'X singular, so
	 * this is useful for explaining a SingularMatrixError.
	 *
	 * @param X Design matrix
	 * @param tol Tolerance for considering variance as zero
	 * @return Vector of bools, true if column is constant
	 */
	static std::vector<bool> DetectConstantColumns(const Eigen::MatrixXd &X, double tol = 1e-10);

	/**
	 * Check if matrix has full column rank
	 *
	 * @param X Design matrix
	 * @param tolerance Threshold for rank determination (-1 = auto)
	 * @return true if rank(X) == ncol(X)
	 */
	static bool IsFullRank(const Eigen::MatrixXd &X, double tolerance = -1.0);

private:
	static void ValidateInputs(const Eigen::MatrixXd &X, const Eigen::VectorXd &y);

	static Eigen::VectorXd SolveNormalEquations(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                                            const core::RegressionOptions &options, double &rcond_out);

	static Eigen::VectorXd SolvePseudoInverse(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
	                                          const core::RegressionOptions &options, size_t &rank_out);

	/**
	 * Compute fit quality statistics (R², adjusted R², residual MSE)
	 */
	static void ComputeStatistics(const Eigen::VectorXd &y, core::RegressionResult &result);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void OLSSolver::ValidateInputs(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) {
	if (X.rows() == 0 || X.cols() == 0) {
		throw core::EmptyInputError("design matrix is empty (" + std::to_string(X.rows()) + " x " +
		                            std::to_string(X.cols()) + ")");
	}
	if (y.size() != X.rows()) {
		throw core::ShapeMismatchError("target has " + std::to_string(y.size()) + " values but design matrix has " +
		                               std::to_string(X.rows()) + " rows");
	}
}

inline core::RegressionResult OLSSolver::Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                             const core::RegressionOptions &options) {
	options.Validate();
	ValidateInputs(X, y);

	const size_t n = static_cast<size_t>(X.rows());
	const size_t p = static_cast<size_t>(X.cols());

	STATKIT_DEBUG("OLS fit: n=" << n << " p=" << p << " strategy=" << core::StrategyName(options.strategy));

	Eigen::VectorXd beta;
	size_t rank = p;
	double rcond = std::numeric_limits<double>::quiet_NaN();

	switch (options.strategy) {
	case core::OLSStrategy::NORMAL_EQUATIONS:
		beta = SolveNormalEquations(X, y, options, rcond);
		break;
	case core::OLSStrategy::PSEUDO_INVERSE:
		beta = SolvePseudoInverse(X, y, options, rank);
		break;
	default:
		throw std::invalid_argument("unknown OLS strategy");
	}

	core::RegressionResult result {core::LinearModel(std::move(beta))};
	result.n_obs = n;
	result.n_params = p;
	result.rank = rank;
	result.strategy = options.strategy;
	result.rcond = rcond;
	result.fitted_values = result.model.Predict(X);
	result.residuals = y - result.fitted_values;

	if (options.compute_statistics) {
		ComputeStatistics(y, result);
	}

	return result;
}

inline Eigen::VectorXd OLSSolver::SolveNormalEquations(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                                       const core::RegressionOptions &options, double &rcond_out) {
	const auto n = X.rows();
	const auto p = X.cols();

	// More parameters than observations can never give an invertible X'X
	if (p > n) {
		throw core::SingularMatrixError("X'X is singular: " + std::to_string(p) + " columns but only " +
		                                std::to_string(n) + " rows");
	}

	const Eigen::MatrixXd XtX = X.transpose() * X;
	const Eigen::VectorXd Xty = X.transpose() * y;

	Eigen::FullPivLU<Eigen::MatrixXd> lu(XtX);
	if (options.singular_tolerance > 0.0) {
		lu.setThreshold(options.singular_tolerance);
	}

	if (!lu.isInvertible()) {
		throw core::SingularMatrixError("X'X is singular (rank " + std::to_string(lu.rank()) + " of " +
		                                std::to_string(p) + "); remove collinear columns or use PSEUDO_INVERSE");
	}

	rcond_out = lu.rcond();
	if (rcond_out < options.min_rcond) {
		throw core::SingularMatrixError("X'X is ill-conditioned (rcond " + std::to_string(rcond_out) +
		                                "); remove collinear columns or use PSEUDO_INVERSE");
	}

	const Eigen::MatrixXd XtX_inv = lu.inverse();
	Eigen::VectorXd beta = XtX_inv * Xty;

	if (!beta.allFinite()) {
		throw core::SingularMatrixError("normal equations produced non-finite coefficients");
	}
	return beta;
}

inline Eigen::VectorXd OLSSolver::SolvePseudoInverse(const Eigen::MatrixXd &X, const Eigen::VectorXd &y,
                                                     const core::RegressionOptions &options, size_t &rank_out) {
	Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod(X);
	if (options.singular_tolerance > 0.0) {
		cod.setThreshold(options.singular_tolerance);
	}
	rank_out = static_cast<size_t>(cod.rank());

	if (rank_out < static_cast<size_t>(X.cols())) {
		STATKIT_WARN("design matrix is rank deficient (rank " << rank_out << " of " << X.cols()
		                                                      << "); returning minimum-norm solution");
	}

	return cod.solve(y);
}

inline std::vector<bool> OLSSolver::DetectConstantColumns(const Eigen::MatrixXd &X, double tol) {
	const size_t p = static_cast<size_t>(X.cols());
	std::vector<bool> is_constant(p, false);

	if (X.rows() == 0) {
		return is_constant;
	}

	for (size_t j = 0; j < p; j++) {
		const auto col = X.col(static_cast<Eigen::Index>(j));
		const double mean = col.mean();
		const double variance = (col.array() - mean).square().mean();
		if (variance < tol) {
			is_constant[j] = true;
		}
	}

	return is_constant;
}

inline bool OLSSolver::IsFullRank(const Eigen::MatrixXd &X, double tolerance) {
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
	if (tolerance > 0.0) {
		qr.setThreshold(tolerance);
	}

	return qr.rank() == X.cols();
}

inline void OLSSolver::ComputeStatistics(const Eigen::VectorXd &y, core::RegressionResult &result) {
	const size_t n = result.n_obs;
	const size_t rank = result.rank;

	const double ss_res = result.residuals.squaredNorm();
	const double y_mean = y.mean();
	const double ss_tot = (y.array() - y_mean).square().sum();

	// R² is undefined for a constant target
	if (ss_tot > 1e-12) {
		result.r_squared = 1.0 - ss_res / ss_tot;
	}

	if (n > rank && std::isfinite(result.r_squared)) {
		const double adj_factor = static_cast<double>(n - 1) / static_cast<double>(n - rank);
		result.adj_r_squared = 1.0 - (1.0 - result.r_squared) * adj_factor;
	}

	if (n > rank) {
		result.residual_mse = ss_res / static_cast<double>(n - rank);
	}
	// Saturated model: no residual degrees of freedom, residual_mse stays NaN
}

} // namespace solvers
} // namespace statkit
