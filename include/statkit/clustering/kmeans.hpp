#pragma once

#include "statkit/core/clustering_options.hpp"
#include "statkit/core/errors.hpp"
#include "statkit/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <numeric>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace statkit {
namespace clustering {

/**
 * Status of a K-Means run on completion
 */
enum class KMeansStatus {
	SUCCESS,       ///< Converged, every cluster non-empty
	EMPTY_CLUSTER, ///< Converged, at least one cluster has no members
	MAX_ITERATIONS ///< Iteration cap reached before assignments stabilized
};

namespace detail {

/// Index of the nearest centroid by squared Euclidean distance; ties go to the lowest index
template <typename Row>
inline int NearestCentroid(const Row &point, const Eigen::MatrixXd &centroids, double *best_dist = nullptr) {
	int best = 0;
	double best_d = std::numeric_limits<double>::infinity();
	for (Eigen::Index c = 0; c < centroids.rows(); c++) {
		const double d = (centroids.row(c) - point).squaredNorm();
		if (d < best_d) {
			best_d = d;
			best = static_cast<int>(c);
		}
	}
	if (best_dist != nullptr) {
		*best_dist = best_d;
	}
	return best;
}

} // namespace detail

/**
 * Result of a K-Means fit
 *
 * The assignment is always the nearest-centroid assignment for the returned
 * centroids, including when the iteration cap was reached.
 */
struct KMeansResult {
	/// Final centroids (k × d)
	Eigen::MatrixXd centroids;

	/// Cluster label in [0, k) for each observation
	std::vector<int> assignment;

	/// Number of observations per cluster
	std::vector<size_t> sizes;

	/// Number of centroid relocation steps performed
	size_t iterations = 0;

	/// True if assignments stopped changing before the cap
	bool converged = false;

	KMeansStatus status = KMeansStatus::SUCCESS;

	/// Sum of squared distances to assigned centroids (non-negative)
	double inertia = 0.0;

	size_t NumClusters() const {
		return static_cast<size_t>(centroids.rows());
	}

	/**
	 * Assign new observations to the nearest fitted centroid
	 *
	 * @throws ShapeMismatchError if X.cols() differs from the centroid dimension
	 */
	std::vector<int> Predict(const Eigen::MatrixXd &X) const {
		if (X.cols() != centroids.cols()) {
			throw core::ShapeMismatchError("data has " + std::to_string(X.cols()) + " columns, centroids have " +
			                               std::to_string(centroids.cols()));
		}
		std::vector<int> labels(static_cast<size_t>(X.rows()));
		for (Eigen::Index i = 0; i < X.rows(); i++) {
			labels[static_cast<size_t>(i)] = detail::NearestCentroid(X.row(i), centroids);
		}
		return labels;
	}

	/**
	 * Inertia of X against the fitted centroids (each row to its nearest one)
	 *
	 * Non-negative; negate it if a higher-is-better score is needed.
	 *
	 * @throws ShapeMismatchError if X.cols() differs from the centroid dimension
	 */
	double Score(const Eigen::MatrixXd &X) const {
		if (X.cols() != centroids.cols()) {
			throw core::ShapeMismatchError("data has " + std::to_string(X.cols()) + " columns, centroids have " +
			                               std::to_string(centroids.cols()));
		}
		double total = 0.0;
		for (Eigen::Index i = 0; i < X.rows(); i++) {
			double d = 0.0;
			detail::NearestCentroid(X.row(i), centroids, &d);
			total += d;
		}
		return total;
	}
};

/**
 * K-Means clustering with Lloyd iterations
 *
 * Each iteration assigns every observation to its closest centroid, then
 * recomputes each centroid as the mean of its members. A centroid with no
 * members keeps its previous position. Iteration stops when no assignment
 * changes or after options.max_iterations relocation steps; the latter is
 * reported (status MAX_ITERATIONS and a warning), not thrown.
 *
 * Initialization is either k distinct observations drawn with a seeded
 * std::mt19937_64, or a caller-supplied centroid set such as the Ward cluster
 * means from WardLinkage::ClusterMeans().
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 */
class KMeans {
public:
	/**
	 * Fit with random initialization
	 *
	 * With options.n_init > 1 the best of n_init runs (lowest inertia) is
	 * returned; ties keep the earliest run.
	 *
	 * @throws EmptyInputError if X has no rows or no columns
	 * @throws InvalidKError if k < 1 or k > n
	 */
	static KMeansResult Fit(const Eigen::MatrixXd &X, int k,
	                        const core::KMeansOptions &options = core::KMeansOptions());

	/**
	 * Fit from supplied initial centroids (k = initial_centroids.rows())
	 *
	 * @throws EmptyInputError if X has no rows or no columns
	 * @throws InvalidKError if the centroid count is outside [1, n]
	 * @throws ShapeMismatchError if the centroid dimension differs from X.cols()
	 */
	static KMeansResult Fit(const Eigen::MatrixXd &X, const Eigen::MatrixXd &initial_centroids,
	                        const core::KMeansOptions &options = core::KMeansOptions());

	/**
	 * Pick k distinct rows of X as starting centroids
	 *
	 * @throws InvalidKError if k < 1 or k > n
	 */
	static Eigen::MatrixXd RandomCentroids(const Eigen::MatrixXd &X, int k, uint64_t seed);

private:
	static void ValidateData(const Eigen::MatrixXd &X);

	static KMeansResult RunLloyd(const Eigen::MatrixXd &X, Eigen::MatrixXd centroids, size_t max_iterations);

	/// Returns true if any label changed
	static bool AssignStep(const Eigen::MatrixXd &X, const Eigen::MatrixXd &centroids, std::vector<int> &assignment);

	static void UpdateStep(const Eigen::MatrixXd &X, const std::vector<int> &assignment, Eigen::MatrixXd &centroids,
	                       std::vector<size_t> &sizes);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void KMeans::ValidateData(const Eigen::MatrixXd &X) {
	if (X.rows() == 0 || X.cols() == 0) {
		throw core::EmptyInputError("cannot cluster an empty dataset (" + std::to_string(X.rows()) + " x " +
		                            std::to_string(X.cols()) + ")");
	}
}

inline Eigen::MatrixXd KMeans::RandomCentroids(const Eigen::MatrixXd &X, int k, uint64_t seed) {
	core::ValidateClusterCount(k, static_cast<long long>(X.rows()));

	// Partial Fisher-Yates: the first k entries become a uniform sample without replacement
	std::vector<Eigen::Index> indices(static_cast<size_t>(X.rows()));
	std::iota(indices.begin(), indices.end(), static_cast<Eigen::Index>(0));
	std::mt19937_64 rng(seed);
	for (size_t i = 0; i < static_cast<size_t>(k); i++) {
		std::uniform_int_distribution<size_t> pick(i, indices.size() - 1);
		std::swap(indices[i], indices[pick(rng)]);
	}

	Eigen::MatrixXd centroids(k, X.cols());
	for (int c = 0; c < k; c++) {
		centroids.row(c) = X.row(indices[static_cast<size_t>(c)]);
	}
	return centroids;
}

inline KMeansResult KMeans::Fit(const Eigen::MatrixXd &X, int k, const core::KMeansOptions &options) {
	options.Validate();
	ValidateData(X);
	core::ValidateClusterCount(k, static_cast<long long>(X.rows()));

	KMeansResult best;
	for (size_t run = 0; run < options.n_init; run++) {
		KMeansResult current =
		    RunLloyd(X, RandomCentroids(X, k, options.seed + static_cast<uint64_t>(run)), options.max_iterations);
		STATKIT_DEBUG("kmeans run " << run << ": inertia=" << current.inertia << " iterations=" << current.iterations);
		if (run == 0 || current.inertia < best.inertia) {
			best = std::move(current);
		}
	}
	return best;
}

inline KMeansResult KMeans::Fit(const Eigen::MatrixXd &X, const Eigen::MatrixXd &initial_centroids,
                                const core::KMeansOptions &options) {
	options.Validate();
	ValidateData(X);
	core::ValidateClusterCount(static_cast<long long>(initial_centroids.rows()), static_cast<long long>(X.rows()));
	if (initial_centroids.cols() != X.cols()) {
		throw core::ShapeMismatchError("initial centroids have " + std::to_string(initial_centroids.cols()) +
		                               " columns, data has " + std::to_string(X.cols()));
	}
	if (!initial_centroids.allFinite()) {
		throw core::InvalidInputError("initial centroids contain non-finite values");
	}

	return RunLloyd(X, initial_centroids, options.max_iterations);
}

inline bool KMeans::AssignStep(const Eigen::MatrixXd &X, const Eigen::MatrixXd &centroids,
                               std::vector<int> &assignment) {
	bool changed = false;
	for (Eigen::Index i = 0; i < X.rows(); i++) {
		const int label = detail::NearestCentroid(X.row(i), centroids);
		if (label != assignment[static_cast<size_t>(i)]) {
			assignment[static_cast<size_t>(i)] = label;
			changed = true;
		}
	}
	return changed;
}

inline void KMeans::UpdateStep(const Eigen::MatrixXd &X, const std::vector<int> &assignment,
                               Eigen::MatrixXd &centroids, std::vector<size_t> &sizes) {
	Eigen::MatrixXd sums = Eigen::MatrixXd::Zero(centroids.rows(), centroids.cols());
	std::fill(sizes.begin(), sizes.end(), 0);
	for (Eigen::Index i = 0; i < X.rows(); i++) {
		const auto c = static_cast<size_t>(assignment[static_cast<size_t>(i)]);
		sums.row(static_cast<Eigen::Index>(c)) += X.row(i);
		sizes[c]++;
	}

	for (Eigen::Index c = 0; c < centroids.rows(); c++) {
		const size_t s = sizes[static_cast<size_t>(c)];
		// Empty clusters keep their previous position
		if (s > 0) {
			centroids.row(c) = sums.row(c) / static_cast<double>(s);
		}
	}
}

inline KMeansResult KMeans::RunLloyd(const Eigen::MatrixXd &X, Eigen::MatrixXd centroids, size_t max_iterations) {
	const auto n = static_cast<size_t>(X.rows());
	const auto k = static_cast<size_t>(centroids.rows());

	std::vector<int> assignment(n, -1);
	std::vector<size_t> sizes(k, 0);
	size_t iterations = 0;
	bool converged = false;

	for (;;) {
		if (!AssignStep(X, centroids, assignment)) {
			converged = true;
			break;
		}
		if (iterations >= max_iterations) {
			break;
		}
		UpdateStep(X, assignment, centroids, sizes);
		iterations++;
	}

	KMeansResult result;
	result.iterations = iterations;
	result.converged = converged;

	std::fill(sizes.begin(), sizes.end(), 0);
	double inertia = 0.0;
	for (size_t i = 0; i < n; i++) {
		const auto c = static_cast<Eigen::Index>(assignment[i]);
		sizes[static_cast<size_t>(c)]++;
		inertia += (X.row(static_cast<Eigen::Index>(i)) - centroids.row(c)).squaredNorm();
	}
	result.inertia = inertia;

	if (!converged) {
		result.status = KMeansStatus::MAX_ITERATIONS;
		STATKIT_WARN("k-means did not converge within " << max_iterations
		                                                << " iterations; returning last state (inertia " << inertia
		                                                << ")");
	} else if (std::find(sizes.begin(), sizes.end(), static_cast<size_t>(0)) != sizes.end()) {
		result.status = KMeansStatus::EMPTY_CLUSTER;
	} else {
		result.status = KMeansStatus::SUCCESS;
	}

	result.centroids = std::move(centroids);
	result.assignment = std::move(assignment);
	result.sizes = std::move(sizes);
	return result;
}

} // namespace clustering
} // namespace statkit
