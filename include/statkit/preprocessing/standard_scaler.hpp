#pragma once

#include "statkit/core/errors.hpp"
#include "statkit/core/scaler_options.hpp"
#include "statkit/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace statkit {
namespace preprocessing {

/**
 * Fitted standardization parameters
 *
 * Produced once by StandardScaler::Fit() on a reference (training) dataset
 * and then reused, unchanged, for every Transform() call on training and
 * test data. All three members have one entry per reference column.
 */
class ScalerState {
public:
	/**
	 * @throws ShapeMismatchError if the lengths differ
	 */
	ScalerState(Eigen::VectorXd means, Eigen::VectorXd std_devs, std::vector<bool> is_degenerate)
	    : means_(std::move(means)), std_devs_(std::move(std_devs)), is_degenerate_(std::move(is_degenerate)) {
		if (means_.size() != std_devs_.size() || static_cast<size_t>(means_.size()) != is_degenerate_.size()) {
			throw core::ShapeMismatchError("scaler state vectors differ in length");
		}
	}

	const Eigen::VectorXd &Means() const {
		return means_;
	}

	const Eigen::VectorXd &StdDevs() const {
		return std_devs_;
	}

	/// True for columns passed through unscaled
	const std::vector<bool> &DegenerateMask() const {
		return is_degenerate_;
	}

	size_t NumFeatures() const {
		return static_cast<size_t>(means_.size());
	}

	size_t NumDegenerate() const {
		size_t count = 0;
		for (bool degenerate : is_degenerate_) {
			if (degenerate) {
				count++;
			}
		}
		return count;
	}

private:
	Eigen::VectorXd means_;
	Eigen::VectorXd std_devs_;
	std::vector<bool> is_degenerate_;
};

/**
 * Z-score standardization: X'_ij = (X_ij - mu_j) / sigma_j
 *
 * Fit() is meant to be called once, on training data only. Transform()
 * takes the state explicitly and never recomputes mu or sigma, so held-out
 * data cannot leak into the parameters.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 * - Never divides by zero: degenerate columns are rejected or passed through
 */
class StandardScaler {
public:
	/**
	 * Compute per-column mean and standard deviation
	 *
	 * @param X_ref Reference dataset (n × p)
	 * @param options ddof and degenerate-column policy
	 * @return ScalerState with p means / std devs
	 *
	 * @throws EmptyInputError if X_ref has no columns or fewer than ddof + 1 rows
	 * @throws DegenerateFeatureError for a constant column under REJECT
	 */
	static ScalerState Fit(const Eigen::MatrixXd &X_ref, const core::ScalerOptions &options = core::ScalerOptions());

	/**
	 * Apply a fitted state to X
	 *
	 * @throws ShapeMismatchError if X.cols() differs from the fitted column count
	 * @throws DegenerateFeatureError if the state holds a non-positive std for an
	 *         unflagged column
	 */
	static Eigen::MatrixXd Transform(const ScalerState &state, const Eigen::MatrixXd &X);

	/**
	 * Map standardized values back to original units
	 *
	 * @throws ShapeMismatchError if X_scaled.cols() differs from the fitted column count
	 */
	static Eigen::MatrixXd InverseTransform(const ScalerState &state, const Eigen::MatrixXd &X_scaled);

	/**
	 * Fit on X and transform X in one step (training data only)
	 */
	static std::pair<ScalerState, Eigen::MatrixXd> FitTransform(const Eigen::MatrixXd &X,
	                                                            const core::ScalerOptions &options =
	                                                                core::ScalerOptions());

private:
	static void CheckColumns(const ScalerState &state, const Eigen::MatrixXd &X);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline ScalerState StandardScaler::Fit(const Eigen::MatrixXd &X_ref, const core::ScalerOptions &options) {
	options.Validate();

	const auto n = X_ref.rows();
	const auto p = X_ref.cols();

	if (p == 0) {
		throw core::EmptyInputError("reference dataset has no columns");
	}
	if (n <= static_cast<Eigen::Index>(options.ddof)) {
		throw core::EmptyInputError("reference dataset needs more than " + std::to_string(options.ddof) +
		                            " rows (got " + std::to_string(n) + ")");
	}

	const Eigen::VectorXd means = X_ref.colwise().mean().transpose();
	Eigen::VectorXd std_devs(p);
	std::vector<bool> is_degenerate(static_cast<size_t>(p), false);

	const double denom = static_cast<double>(n) - static_cast<double>(options.ddof);
	for (Eigen::Index j = 0; j < p; j++) {
		// Constant columns get std exactly 0; their computed mean may carry rounding
		const bool is_constant = X_ref.col(j).maxCoeff() == X_ref.col(j).minCoeff();
		if (is_constant) {
			std_devs(j) = 0.0;
		} else {
			const double ss = (X_ref.col(j).array() - means(j)).square().sum();
			std_devs(j) = std::sqrt(ss / denom);
		}

		if (is_constant || !(std_devs(j) > options.zero_tolerance)) {
			if (options.degenerate_policy == core::DegeneratePolicy::REJECT) {
				throw core::DegenerateFeatureError("column " + std::to_string(j) + " has zero variance",
				                                   static_cast<size_t>(j));
			}
			STATKIT_WARN("column " << j << " has zero variance; passing it through unscaled");
			is_degenerate[static_cast<size_t>(j)] = true;
		}
	}

	STATKIT_DEBUG("scaler fit: n=" << n << " p=" << p << " ddof=" << options.ddof);

	return ScalerState(means, std_devs, std::move(is_degenerate));
}

inline void StandardScaler::CheckColumns(const ScalerState &state, const Eigen::MatrixXd &X) {
	if (static_cast<size_t>(X.cols()) != state.NumFeatures()) {
		throw core::ShapeMismatchError("scaler was fitted on " + std::to_string(state.NumFeatures()) +
		                               " columns, got " + std::to_string(X.cols()));
	}
}

inline Eigen::MatrixXd StandardScaler::Transform(const ScalerState &state, const Eigen::MatrixXd &X) {
	CheckColumns(state, X);

	Eigen::MatrixXd out(X.rows(), X.cols());
	for (Eigen::Index j = 0; j < X.cols(); j++) {
		if (state.DegenerateMask()[static_cast<size_t>(j)]) {
			out.col(j) = X.col(j);
			continue;
		}
		const double sigma = state.StdDevs()(j);
		if (!(sigma > 0.0) || !std::isfinite(sigma)) {
			throw core::DegenerateFeatureError("column " + std::to_string(j) + " has non-positive std " +
			                                       std::to_string(sigma),
			                                   static_cast<size_t>(j));
		}
		out.col(j) = (X.col(j).array() - state.Means()(j)) / sigma;
	}
	return out;
}

inline Eigen::MatrixXd StandardScaler::InverseTransform(const ScalerState &state, const Eigen::MatrixXd &X_scaled) {
	CheckColumns(state, X_scaled);

	Eigen::MatrixXd out(X_scaled.rows(), X_scaled.cols());
	for (Eigen::Index j = 0; j < X_scaled.cols(); j++) {
		if (state.DegenerateMask()[static_cast<size_t>(j)]) {
			out.col(j) = X_scaled.col(j);
		} else {
			out.col(j) = X_scaled.col(j).array() * state.StdDevs()(j) + state.Means()(j);
		}
	}
	return out;
}

inline std::pair<ScalerState, Eigen::MatrixXd> StandardScaler::FitTransform(const Eigen::MatrixXd &X,
                                                                            const core::ScalerOptions &options) {
	ScalerState state = Fit(X, options);
	Eigen::MatrixXd transformed = Transform(state, X);
	return std::make_pair(std::move(state), std::move(transformed));
}

} // namespace preprocessing
} // namespace statkit
