#pragma once

#include "statkit/core/errors.hpp"
#include "statkit/core/i_predictor.hpp"
#include <Eigen/Dense>
#include <string>
#include <utility>

namespace statkit {
namespace core {

/**
 * Fitted linear model: a coefficient vector and the linear map it defines
 *
 * Immutable once constructed. Every fit produces a new LinearModel value;
 * there is no refit-in-place. If the design matrix used for fitting had an
 * intercept column prepended, coefficients[0] is the intercept and the same
 * column must be present in matrices passed to Predict().
 */
class LinearModel : public IPredictor {
public:
	explicit LinearModel(Eigen::VectorXd coefficients) : coefficients_(std::move(coefficients)) {
	}

	const Eigen::VectorXd &Coefficients() const {
		return coefficients_;
	}

	size_t NumFeatures() const override {
		return static_cast<size_t>(coefficients_.size());
	}

	std::string GetName() const override {
		return "OLS";
	}

	/**
	 * Apply the linear map: y_hat = X * beta
	 *
	 * @throws ShapeMismatchError if X.cols() != number of coefficients
	 */
	Eigen::VectorXd Predict(const Eigen::MatrixXd &X) const override {
		if (X.cols() != coefficients_.size()) {
			throw ShapeMismatchError("design matrix has " + std::to_string(X.cols()) + " columns, model expects " +
			                         std::to_string(coefficients_.size()));
		}
		return X * coefficients_;
	}

private:
	Eigen::VectorXd coefficients_;
};

} // namespace core
} // namespace statkit
