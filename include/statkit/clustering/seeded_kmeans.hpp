#pragma once

#include "statkit/clustering/kmeans.hpp"
#include "statkit/clustering/ward_linkage.hpp"
#include "statkit/core/clustering_options.hpp"
#include "statkit/core/errors.hpp"
#include "statkit/utils/tracing.hpp"
#include <Eigen/Dense>
#include <vector>

namespace statkit {
namespace clustering {

/**
 * Result of the Ward-seeded K-Means pipeline
 *
 * The seed assignment (from the Ward cut) and the final K-Means assignment
 * are independent and need not agree.
 */
struct SeededKMeansResult {
	/// Ward merge tree over the input
	Dendrogram dendrogram;

	/// Flat Ward clustering with k labels
	std::vector<int> seed_assignment;

	/// Per-label means of the Ward clusters, in first-appearance order
	Eigen::MatrixXd seed_centroids;

	/// K-Means run started from seed_centroids
	KMeansResult kmeans;
};

/**
 * K-Means initialized from an agglomerative (Ward) clustering
 *
 *   Linkage(X) -> Cut(k) -> ClusterMeans -> KMeans::Fit(X, means)
 *
 * The hierarchical seed is deterministic for a given input order and is
 * usually close to a good local optimum, so a single K-Means run suffices.
 */
class SeededKMeans {
public:
	/**
	 * @throws EmptyInputError if X has no rows or no columns
	 * @throws InvalidKError if k < 1 or k > n
	 */
	static SeededKMeansResult Fit(const Eigen::MatrixXd &X, int k,
	                              const core::KMeansOptions &options = core::KMeansOptions()) {
		options.Validate();
		if (X.rows() == 0 || X.cols() == 0) {
			throw core::EmptyInputError("cannot cluster an empty dataset");
		}
		core::ValidateClusterCount(k, static_cast<long long>(X.rows()));

		SeededKMeansResult result;
		result.dendrogram = WardLinkage::Linkage(X);
		result.seed_assignment = WardLinkage::Cut(result.dendrogram, k);
		result.seed_centroids = WardLinkage::ClusterMeans(X, result.seed_assignment);
		result.kmeans = KMeans::Fit(X, result.seed_centroids, options);

		STATKIT_DEBUG("seeded kmeans: k=" << k << " iterations=" << result.kmeans.iterations
		                                  << " inertia=" << result.kmeans.inertia);
		return result;
	}
};

} // namespace clustering
} // namespace statkit
