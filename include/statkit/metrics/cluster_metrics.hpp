#pragma once

#include "statkit/core/errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace statkit {
namespace metrics {

/**
 * Cluster quality metrics
 *
 * Inertia:
 *   Σ_i ||x_i - c_{label(i)}||²        (non-negative, lower is better)
 *
 * Silhouette, per observation i with Euclidean distance:
 *   a(i) = mean distance from i to the other members of its cluster
 *   b(i) = min over other clusters of the mean distance from i to that cluster
 *   s(i) = (b(i) - a(i)) / max(a(i), b(i)),   s(i) = 0 for a singleton cluster
 * and the silhouette score is the mean of s(i), in [-1, 1].
 *
 * Silhouette labels may be arbitrary integers.
 */
class ClusterMetrics {
public:
	/**
	 * @param X Observations (n × d)
	 * @param centroids Centroid set (k × d)
	 * @param assignment Label in [0, k) for each observation
	 *
	 * @throws ShapeMismatchError if assignment.size() != n or centroid dimension != d
	 * @throws InvalidInputError if a label is outside [0, k)
	 */
	static double Inertia(const Eigen::MatrixXd &X, const Eigen::MatrixXd &centroids,
	                      const std::vector<int> &assignment);

	/**
	 * Per-observation silhouette values s(i)
	 *
	 * @throws ShapeMismatchError if assignment.size() != X.rows()
	 * @throws InvalidInputError if the number of distinct labels is 1 or n
	 */
	static Eigen::VectorXd SilhouetteSamples(const Eigen::MatrixXd &X, const std::vector<int> &assignment);

	/**
	 * Mean silhouette over all observations
	 *
	 * @throws ShapeMismatchError if assignment.size() != X.rows()
	 * @throws InvalidInputError if the number of distinct labels is 1 or n
	 */
	static double Silhouette(const Eigen::MatrixXd &X, const std::vector<int> &assignment);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double ClusterMetrics::Inertia(const Eigen::MatrixXd &X, const Eigen::MatrixXd &centroids,
                                      const std::vector<int> &assignment) {
	if (assignment.size() != static_cast<size_t>(X.rows())) {
		throw core::ShapeMismatchError("assignment has " + std::to_string(assignment.size()) +
		                               " labels but dataset has " + std::to_string(X.rows()) + " rows");
	}
	if (X.rows() > 0 && centroids.cols() != X.cols()) {
		throw core::ShapeMismatchError("centroids have " + std::to_string(centroids.cols()) + " columns, data has " +
		                               std::to_string(X.cols()));
	}

	double total = 0.0;
	for (Eigen::Index i = 0; i < X.rows(); i++) {
		const int label = assignment[static_cast<size_t>(i)];
		if (label < 0 || label >= centroids.rows()) {
			throw core::InvalidInputError("label " + std::to_string(label) + " at row " + std::to_string(i) +
			                              " has no centroid (k = " + std::to_string(centroids.rows()) + ")");
		}
		total += (X.row(i) - centroids.row(label)).squaredNorm();
	}
	return total;
}

inline Eigen::VectorXd ClusterMetrics::SilhouetteSamples(const Eigen::MatrixXd &X,
                                                         const std::vector<int> &assignment) {
	const auto n = static_cast<size_t>(X.rows());
	if (assignment.size() != n) {
		throw core::ShapeMismatchError("assignment has " + std::to_string(assignment.size()) +
		                               " labels but dataset has " + std::to_string(n) + " rows");
	}

	// Dense cluster index per observation
	std::map<int, size_t> label_index;
	std::vector<size_t> cluster_of(n);
	for (size_t i = 0; i < n; i++) {
		auto it = label_index.find(assignment[i]);
		if (it == label_index.end()) {
			it = label_index.emplace(assignment[i], label_index.size()).first;
		}
		cluster_of[i] = it->second;
	}

	const size_t k = label_index.size();
	if (k < 2 || k >= n) {
		throw core::InvalidInputError("silhouette needs 2 <= clusters < n (got " + std::to_string(k) +
		                              " clusters for " + std::to_string(n) + " observations)");
	}

	std::vector<size_t> cluster_sizes(k, 0);
	for (size_t c : cluster_of) {
		cluster_sizes[c]++;
	}

	Eigen::VectorXd samples(static_cast<Eigen::Index>(n));
	std::vector<double> dist_sums(k);
	for (size_t i = 0; i < n; i++) {
		std::fill(dist_sums.begin(), dist_sums.end(), 0.0);
		for (size_t j = 0; j < n; j++) {
			if (j == i) {
				continue;
			}
			dist_sums[cluster_of[j]] +=
			    (X.row(static_cast<Eigen::Index>(i)) - X.row(static_cast<Eigen::Index>(j))).norm();
		}

		const size_t own = cluster_of[i];
		if (cluster_sizes[own] == 1) {
			samples(static_cast<Eigen::Index>(i)) = 0.0;
			continue;
		}

		const double a = dist_sums[own] / static_cast<double>(cluster_sizes[own] - 1);
		double b = std::numeric_limits<double>::infinity();
		for (size_t c = 0; c < k; c++) {
			if (c == own) {
				continue;
			}
			b = std::min(b, dist_sums[c] / static_cast<double>(cluster_sizes[c]));
		}

		const double denom = std::max(a, b);
		samples(static_cast<Eigen::Index>(i)) = denom > 0.0 ? (b - a) / denom : 0.0;
	}
	return samples;
}

inline double ClusterMetrics::Silhouette(const Eigen::MatrixXd &X, const std::vector<int> &assignment) {
	return SilhouetteSamples(X, assignment).mean();
}

} // namespace metrics
} // namespace statkit
