#pragma once

#include "statkit/core/errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cstdint>
#include <numeric>
#include <random>
#include <string>
#include <vector>

namespace statkit {
namespace utils {

/**
 * Helpers for building and slicing design matrices
 *
 * These sit between raw tabular data and the solvers: the solvers take
 * Eigen matrices as given and never reshape or augment them.
 */

/// Row-index partition produced by TrainTestSplit()
struct TrainTestIndices {
	std::vector<size_t> train;
	std::vector<size_t> test;
};

/**
 * Prepend a column of 1.0 to X
 *
 * @param X Design matrix (n × p)
 * @return [1 | X] (n × (p+1))
 */
inline Eigen::MatrixXd AddInterceptColumn(const Eigen::MatrixXd &X) {
	Eigen::MatrixXd augmented(X.rows(), X.cols() + 1);
	augmented.col(0).setOnes();
	augmented.rightCols(X.cols()) = X;
	return augmented;
}

/**
 * Build a design matrix from a list of rows
 *
 * @throws EmptyInputError if there are no rows or the rows have no columns
 * @throws ShapeMismatchError if rows have different lengths
 */
inline Eigen::MatrixXd FromRows(const std::vector<std::vector<double>> &rows) {
	if (rows.empty()) {
		throw core::EmptyInputError("design matrix has no rows");
	}
	const size_t p = rows[0].size();
	if (p == 0) {
		throw core::EmptyInputError("design matrix has no columns");
	}

	Eigen::MatrixXd X(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(p));
	for (size_t i = 0; i < rows.size(); i++) {
		if (rows[i].size() != p) {
			throw core::ShapeMismatchError("row " + std::to_string(i) + " has " + std::to_string(rows[i].size()) +
			                               " values, expected " + std::to_string(p));
		}
		for (size_t j = 0; j < p; j++) {
			X(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
		}
	}
	return X;
}

/// Build a target vector from values
inline Eigen::VectorXd FromValues(const std::vector<double> &values) {
	Eigen::VectorXd y(static_cast<Eigen::Index>(values.size()));
	for (size_t i = 0; i < values.size(); i++) {
		y(static_cast<Eigen::Index>(i)) = values[i];
	}
	return y;
}

/**
 * Gather rows of X in the given order
 *
 * @throws InvalidInputError if an index is out of range
 */
inline Eigen::MatrixXd SelectRows(const Eigen::MatrixXd &X, const std::vector<size_t> &indices) {
	Eigen::MatrixXd out(static_cast<Eigen::Index>(indices.size()), X.cols());
	for (size_t i = 0; i < indices.size(); i++) {
		if (indices[i] >= static_cast<size_t>(X.rows())) {
			throw core::InvalidInputError("row index " + std::to_string(indices[i]) + " out of range for " +
			                              std::to_string(X.rows()) + " rows");
		}
		out.row(static_cast<Eigen::Index>(i)) = X.row(static_cast<Eigen::Index>(indices[i]));
	}
	return out;
}

inline Eigen::VectorXd SelectRows(const Eigen::VectorXd &y, const std::vector<size_t> &indices) {
	Eigen::VectorXd out(static_cast<Eigen::Index>(indices.size()));
	for (size_t i = 0; i < indices.size(); i++) {
		if (indices[i] >= static_cast<size_t>(y.size())) {
			throw core::InvalidInputError("index " + std::to_string(indices[i]) + " out of range for " +
			                              std::to_string(y.size()) + " values");
		}
		out(static_cast<Eigen::Index>(i)) = y(static_cast<Eigen::Index>(indices[i]));
	}
	return out;
}

/**
 * Shuffle 0..n-1 with a seeded generator and split off a test partition
 *
 * The test partition has round(n * test_fraction) rows, clamped so that both
 * partitions are non-empty. Both index lists are returned in ascending order.
 *
 * @param n Number of rows
 * @param test_fraction Share of rows in the test partition, in (0, 1)
 * @param seed Seed for std::mt19937_64
 *
 * @throws InvalidInputError if n < 2 or test_fraction is outside (0, 1)
 */
inline TrainTestIndices TrainTestSplit(size_t n, double test_fraction, uint64_t seed = 42) {
	if (!(test_fraction > 0.0 && test_fraction < 1.0)) {
		throw core::InvalidInputError("test_fraction must be in (0, 1) (got " + std::to_string(test_fraction) + ")");
	}
	if (n < 2) {
		throw core::InvalidInputError("need at least 2 rows to split (got " + std::to_string(n) + ")");
	}

	std::vector<size_t> order(n);
	std::iota(order.begin(), order.end(), static_cast<size_t>(0));
	std::mt19937_64 rng(seed);
	std::shuffle(order.begin(), order.end(), rng);

	auto n_test = static_cast<size_t>(static_cast<double>(n) * test_fraction + 0.5);
	n_test = std::min(std::max<size_t>(n_test, 1), n - 1);

	TrainTestIndices split;
	split.test.assign(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(n_test));
	split.train.assign(order.begin() + static_cast<std::ptrdiff_t>(n_test), order.end());
	std::sort(split.test.begin(), split.test.end());
	std::sort(split.train.begin(), split.train.end());
	return split;
}

} // namespace utils
} // namespace statkit
