#pragma once

#include "statkit/core/linear_model.hpp"
#include "statkit/core/regression_options.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <cstdint>
#include <limits>

namespace statkit {
namespace core {

/**
 * Result of an OLS fit
 *
 * Contains the fitted model plus in-sample fit information.
 *
 * Design notes:
 * - The model is a LinearModel value, independent of this struct's lifetime
 * - Optional statistics are NaN when not computed or undefined
 * - Coefficients follow the column order of the design matrix
 */
struct RegressionResult {
	// ========================================================================
	// Core regression outputs
	// ========================================================================

	/// Fitted linear model (coefficient vector + Predict())
	LinearModel model;

	/// In-sample predictions X * beta (length = n_obs)
	Eigen::VectorXd fitted_values;

	/// Residuals: y - X*beta (length = n_obs)
	Eigen::VectorXd residuals;

	// ========================================================================
	// Dimensions and rank
	// ========================================================================

	/// Number of observations (rows in design matrix)
	size_t n_obs = 0;

	/// Number of parameters (columns in design matrix)
	size_t n_params = 0;

	/// Numerical rank of the design matrix.
	/// Always n_params for NORMAL_EQUATIONS (otherwise the fit is rejected).
	size_t rank = 0;

	/// Strategy that produced the coefficients
	OLSStrategy strategy = OLSStrategy::NORMAL_EQUATIONS;

	/// Reciprocal condition estimate of X'X (NaN for PSEUDO_INVERSE)
	double rcond = std::numeric_limits<double>::quiet_NaN();

	// ========================================================================
	// Fit quality statistics
	// ========================================================================

	/// Coefficient of determination: 1 - SSE/SST
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Adjusted R²: 1 - (1-R²)*(n-1)/(n-rank)
	double adj_r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Residual mean square: SSE / (n - rank). NaN for saturated fits.
	double residual_mse = std::numeric_limits<double>::quiet_NaN();

	RegressionResult() : model(Eigen::VectorXd()) {
	}

	explicit RegressionResult(LinearModel model_) : model(std::move(model_)) {
	}

	/// Shortcut to model.Coefficients()
	const Eigen::VectorXd &coefficients() const {
		return model.Coefficients();
	}

	/// Degrees of freedom for residuals: n - rank
	size_t df_residual() const {
		if (n_obs <= rank) {
			return 0;
		}
		return n_obs - rank;
	}

	/// Check if result is valid (finite coefficients, non-zero rank)
	bool is_valid() const {
		if (rank == 0 || n_params == 0 || n_obs == 0) {
			return false;
		}
		return model.Coefficients().allFinite();
	}
};

} // namespace core
} // namespace statkit
