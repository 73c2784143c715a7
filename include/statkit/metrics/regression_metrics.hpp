#pragma once

#include "statkit/core/errors.hpp"
#include "statkit/core/i_predictor.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace statkit {
namespace metrics {

/**
 * Regression error metrics
 *
 * Pure functions of (y_true, y_pred):
 *
 *   MSE  = (1/n) Σ (y_i - ŷ_i)²
 *   MAE  = (1/n) Σ |y_i - ŷ_i|
 *   RMSE = sqrt(MSE)
 *   R²   = 1 - SSE/SST            (NaN when SST == 0)
 *
 * Note the MSE here divides by n. OLSSolver's residual_mse divides by the
 * residual degrees of freedom instead.
 */
class RegressionMetrics {
public:
	/**
	 * @throws EmptyInputError if the vectors are empty
	 * @throws ShapeMismatchError if the lengths differ
	 */
	static double MSE(const Eigen::VectorXd &y_true, const Eigen::VectorXd &y_pred);

	static double MAE(const Eigen::VectorXd &y_true, const Eigen::VectorXd &y_pred);

	static double RMSE(const Eigen::VectorXd &y_true, const Eigen::VectorXd &y_pred);

	static double RSquared(const Eigen::VectorXd &y_true, const Eigen::VectorXd &y_pred);

	/// Shared argument check for all metrics
	static void Validate(const Eigen::VectorXd &y_true, const Eigen::VectorXd &y_pred);
};

/**
 * Immutable evaluation of one set of predictions against targets
 *
 * Built once from (predictions, targets) and validated at construction, so
 * the query methods cannot fail. FromModel() runs the predictor exactly once.
 * Values are identical to the RegressionMetrics free functions.
 */
class RegressionEvaluator {
public:
	/**
	 * @throws EmptyInputError if the vectors are empty
	 * @throws ShapeMismatchError if the lengths differ
	 */
	RegressionEvaluator(Eigen::VectorXd predictions, Eigen::VectorXd targets);

	/**
	 * Evaluate a fitted model on (X, y)
	 *
	 * @throws ShapeMismatchError if X does not fit the model or y
	 */
	static RegressionEvaluator FromModel(const core::IPredictor &model, const Eigen::MatrixXd &X,
	                                     const Eigen::VectorXd &y);

	double MSE() const {
		return RegressionMetrics::MSE(targets_, predictions_);
	}

	double MAE() const {
		return RegressionMetrics::MAE(targets_, predictions_);
	}

	double RMSE() const {
		return RegressionMetrics::RMSE(targets_, predictions_);
	}

	double RSquared() const {
		return RegressionMetrics::RSquared(targets_, predictions_);
	}

	const Eigen::VectorXd &Predictions() const {
		return predictions_;
	}

	const Eigen::VectorXd &Targets() const {
		return targets_;
	}

	size_t Size() const {
		return static_cast<size_t>(targets_.size());
	}

private:
	Eigen::VectorXd predictions_;
	Eigen::VectorXd targets_;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void RegressionMetrics::Validate(const Eigen::VectorXd &y_true, const Eigen::VectorXd &y_pred) {
	if (y_true.size() != y_pred.size()) {
		throw core::ShapeMismatchError("y_true has " + std::to_string(y_true.size()) + " values, y_pred has " +
		                               std::to_string(y_pred.size()));
	}
	if (y_true.size() == 0) {
		throw core::EmptyInputError("cannot compute an error metric over zero observations");
	}
}

inline double RegressionMetrics::MSE(const Eigen::VectorXd &y_true, const Eigen::VectorXd &y_pred) {
	Validate(y_true, y_pred);
	return (y_true - y_pred).squaredNorm() / static_cast<double>(y_true.size());
}

inline double RegressionMetrics::MAE(const Eigen::VectorXd &y_true, const Eigen::VectorXd &y_pred) {
	Validate(y_true, y_pred);
	return (y_true - y_pred).cwiseAbs().sum() / static_cast<double>(y_true.size());
}

inline double RegressionMetrics::RMSE(const Eigen::VectorXd &y_true, const Eigen::VectorXd &y_pred) {
	return std::sqrt(MSE(y_true, y_pred));
}

inline double RegressionMetrics::RSquared(const Eigen::VectorXd &y_true, const Eigen::VectorXd &y_pred) {
	Validate(y_true, y_pred);
	const double ss_res = (y_true - y_pred).squaredNorm();
	const double ss_tot = (y_true.array() - y_true.mean()).square().sum();
	if (ss_tot == 0.0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return 1.0 - ss_res / ss_tot;
}

inline RegressionEvaluator::RegressionEvaluator(Eigen::VectorXd predictions, Eigen::VectorXd targets)
    : predictions_(std::move(predictions)), targets_(std::move(targets)) {
	RegressionMetrics::Validate(targets_, predictions_);
}

inline RegressionEvaluator RegressionEvaluator::FromModel(const core::IPredictor &model, const Eigen::MatrixXd &X,
                                                          const Eigen::VectorXd &y) {
	if (X.rows() != y.size()) {
		throw core::ShapeMismatchError("design matrix has " + std::to_string(X.rows()) + " rows but target has " +
		                               std::to_string(y.size()) + " values");
	}
	return RegressionEvaluator(model.Predict(X), y);
}

} // namespace metrics
} // namespace statkit
