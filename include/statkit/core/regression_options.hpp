#pragma once

#include <string>
#include <stdexcept>

namespace statkit {
namespace core {

/**
 * Strategy used to solve the least-squares problem
 */
enum class OLSStrategy {
	/// beta = (X'X)^-1 X'y, rejects singular X'X
	NORMAL_EQUATIONS,
	/// Moore-Penrose minimum-norm solution, tolerates rank deficiency
	PSEUDO_INVERSE
};

/**
 * Configuration options for the OLS solver
 *
 * Design notes:
 * - All defaults specified in-class for clarity
 * - The solver never adds an intercept column; prepend one with
 *   utils::AddInterceptColumn() when an intercept is wanted
 * - Validation method to check for invalid values
 */
struct RegressionOptions {
	/// Solve strategy
	/// Default: NORMAL_EQUATIONS (closed form, full-rank designs only)
	OLSStrategy strategy = OLSStrategy::NORMAL_EQUATIONS;

	/// Relative threshold for the singularity / rank decision
	/// - <= 0: use Eigen's default threshold
	/// - > 0: pivots smaller than threshold * max pivot count as zero
	/// Default: -1.0 (auto)
	double singular_tolerance = -1.0;

	/// Minimum acceptable reciprocal condition number of X'X for the
	/// normal equations. Below this the fit is rejected as singular.
	/// Default: 1e-12
	double min_rcond = 1e-12;

	/// Compute fit statistics (R^2, residual MSE) in the result
	/// Default: true
	bool compute_statistics = true;

	RegressionOptions() = default;

	/// Convenience constructor for the closed-form normal equations
	static RegressionOptions NormalEquations() {
		RegressionOptions opts;
		opts.strategy = OLSStrategy::NORMAL_EQUATIONS;
		return opts;
	}

	/// Convenience constructor for the pseudo-inverse fallback
	static RegressionOptions PseudoInverse(double singular_tolerance_ = -1.0) {
		RegressionOptions opts;
		opts.strategy = OLSStrategy::PSEUDO_INVERSE;
		opts.singular_tolerance = singular_tolerance_;
		return opts;
	}

	/**
	 * Validate option values
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (min_rcond < 0.0 || min_rcond >= 1.0) {
			throw std::invalid_argument("min_rcond must be in [0, 1) (got " + std::to_string(min_rcond) + ")");
		}
		if (singular_tolerance >= 1.0) {
			throw std::invalid_argument("singular_tolerance must be < 1 (got " + std::to_string(singular_tolerance) +
			                            ")");
		}
	}
};

inline std::string StrategyName(OLSStrategy strategy) {
	switch (strategy) {
	case OLSStrategy::NORMAL_EQUATIONS:
		return "normal_equations";
	case OLSStrategy::PSEUDO_INVERSE:
		return "pseudo_inverse";
	default:
		return "unknown";
	}
}

} // namespace core
} // namespace statkit
