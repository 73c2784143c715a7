#pragma once

#include <Eigen/Dense>
#include <string>

namespace statkit {
namespace core {

/**
 * IPredictor: Abstract interface for fitted regression models
 *
 * Anything that maps a design matrix to a prediction vector can be evaluated
 * by metrics::RegressionEvaluator. Predict() must be deterministic and free of
 * side effects: calling it twice on the same input yields the same vector.
 */
class IPredictor {
public:
	virtual ~IPredictor() = default;

	/**
	 * Predict targets for each row of X
	 *
	 * @param X Design matrix (n × p), same column layout as at fit time
	 * @return Predictions (length n)
	 *
	 * @throws ShapeMismatchError if X has the wrong number of columns
	 */
	virtual Eigen::VectorXd Predict(const Eigen::MatrixXd &X) const = 0;

	/// Number of columns expected by Predict()
	virtual size_t NumFeatures() const = 0;

	/// Short model name (e.g. "OLS")
	virtual std::string GetName() const = 0;
};

} // namespace core
} // namespace statkit
