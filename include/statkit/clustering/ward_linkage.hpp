#pragma once

#include "statkit/core/errors.hpp"
#include "statkit/utils/tracing.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <string>
#include <vector>

namespace statkit {
namespace clustering {

/**
 * One agglomeration step
 *
 * Cluster ids: 0..n-1 are the original observations, the cluster created by
 * step s has id n + s. cluster_a < cluster_b.
 */
struct MergeStep {
	size_t cluster_a;
	size_t cluster_b;

	/// Ward distance between the two clusters at the time of merging
	double distance;

	/// Number of observations in the merged cluster
	size_t size;
};

/**
 * Hierarchical merge tree over n observations (n - 1 merge steps)
 */
struct Dendrogram {
	size_t n_obs = 0;
	std::vector<MergeStep> merges;

	/**
	 * @throws InvalidInputError if the merge list does not describe a tree over n_obs points
	 */
	void Validate() const {
		const size_t expected = n_obs == 0 ? 0 : n_obs - 1;
		if (merges.size() != expected) {
			throw core::InvalidInputError("dendrogram over " + std::to_string(n_obs) + " observations must have " +
			                              std::to_string(expected) + " merges (got " +
			                              std::to_string(merges.size()) + ")");
		}
		// Each cluster id may be absorbed by at most one later merge
		std::vector<bool> consumed(merges.size() + n_obs, false);
		for (size_t s = 0; s < merges.size(); s++) {
			const size_t limit = n_obs + s;
			if (merges[s].cluster_a >= limit || merges[s].cluster_b >= limit ||
			    merges[s].cluster_a == merges[s].cluster_b) {
				throw core::InvalidInputError("merge step " + std::to_string(s) + " references an invalid cluster");
			}
			if (consumed[merges[s].cluster_a] || consumed[merges[s].cluster_b]) {
				throw core::InvalidInputError("merge step " + std::to_string(s) +
				                              " reuses a cluster that was already merged");
			}
			consumed[merges[s].cluster_a] = true;
			consumed[merges[s].cluster_b] = true;
		}
	}
};

/**
 * Agglomerative clustering with Ward's criterion
 *
 * Starting from n singletons, repeatedly merges the pair of clusters whose
 * union least increases the total within-cluster sum of squares. The merge
 * distance uses the Lance-Williams convention
 *
 *   d(u, v) = sqrt(2 |u| |v| / (|u| + |v|)) * ||c_u - c_v||
 *
 * so the first merges are plain Euclidean distances and merge distances are
 * non-decreasing.
 *
 * Ties: among equal-cost pairs the one with the lowest (slot_i, slot_j) in
 * lexicographic order wins. A merged cluster keeps the lower slot, which is
 * always the lowest observation index it contains.
 *
 * Cost: O(n^2) memory, O(n^3) time.
 */
class WardLinkage {
public:
	/**
	 * Build the Ward merge tree
	 *
	 * @param X Observations (n × d)
	 * @return Dendrogram with n - 1 merges
	 *
	 * @throws EmptyInputError if X has no rows or no columns
	 * @throws InvalidInputError if X contains NaN or infinite values
	 */
	static Dendrogram Linkage(const Eigen::MatrixXd &X);

	/**
	 * Flatten the tree into exactly k clusters
	 *
	 * Replays the first n - k merges. Labels are 0..k-1, numbered in order of
	 * first appearance along the observation sequence.
	 *
	 * @throws InvalidKError if k < 1 or k > n
	 */
	static std::vector<int> Cut(const Dendrogram &dendrogram, int k);

	/**
	 * Per-label mean of the observations
	 *
	 * Rows of the result follow the order in which labels first appear in
	 * the assignment; K-Means consumes them positionally.
	 *
	 * @throws EmptyInputError if X has no rows
	 * @throws ShapeMismatchError if assignment.size() != X.rows()
	 */
	static Eigen::MatrixXd ClusterMeans(const Eigen::MatrixXd &X, const std::vector<int> &assignment);

	/// Number of distinct labels in an assignment
	static size_t CountLabels(const std::vector<int> &assignment);

private:
	static double WardDistanceSquared(const Eigen::VectorXd &c_u, size_t n_u, const Eigen::VectorXd &c_v,
	                                  size_t n_v);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double WardLinkage::WardDistanceSquared(const Eigen::VectorXd &c_u, size_t n_u, const Eigen::VectorXd &c_v,
                                               size_t n_v) {
	const double nu = static_cast<double>(n_u);
	const double nv = static_cast<double>(n_v);
	return 2.0 * nu * nv / (nu + nv) * (c_u - c_v).squaredNorm();
}

inline Dendrogram WardLinkage::Linkage(const Eigen::MatrixXd &X) {
	const size_t n = static_cast<size_t>(X.rows());
	if (n == 0 || X.cols() == 0) {
		throw core::EmptyInputError("cannot build a linkage over an empty dataset");
	}
	if (!X.allFinite()) {
		throw core::InvalidInputError("cannot build a linkage over non-finite values");
	}

	STATKIT_TIMING_START();

	Dendrogram dendrogram;
	dendrogram.n_obs = n;
	dendrogram.merges.reserve(n - 1);

	// Slot i holds the cluster whose lowest observation index is i
	std::vector<Eigen::VectorXd> centroids(n);
	std::vector<size_t> sizes(n, 1);
	std::vector<size_t> cluster_ids(n);
	std::vector<bool> active(n, true);
	for (size_t i = 0; i < n; i++) {
		centroids[i] = X.row(static_cast<Eigen::Index>(i)).transpose();
		cluster_ids[i] = i;
	}

	// Squared Ward distances, upper triangle used
	Eigen::MatrixXd dist = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(n));
	for (size_t i = 0; i < n; i++) {
		for (size_t j = i + 1; j < n; j++) {
			dist(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
			    WardDistanceSquared(centroids[i], 1, centroids[j], 1);
		}
	}

	for (size_t step = 0; step + 1 < n; step++) {
		size_t best_i = 0;
		size_t best_j = 0;
		double best = std::numeric_limits<double>::infinity();
		for (size_t i = 0; i < n; i++) {
			if (!active[i]) {
				continue;
			}
			for (size_t j = i + 1; j < n; j++) {
				if (!active[j]) {
					continue;
				}
				const double d = dist(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
				if (d < best) {
					best = d;
					best_i = i;
					best_j = j;
				}
			}
		}

		MergeStep merge;
		merge.cluster_a = std::min(cluster_ids[best_i], cluster_ids[best_j]);
		merge.cluster_b = std::max(cluster_ids[best_i], cluster_ids[best_j]);
		merge.distance = std::sqrt(best);
		merge.size = sizes[best_i] + sizes[best_j];
		dendrogram.merges.push_back(merge);

		// Fold slot j into slot i
		const double wi = static_cast<double>(sizes[best_i]);
		const double wj = static_cast<double>(sizes[best_j]);
		centroids[best_i] = (wi * centroids[best_i] + wj * centroids[best_j]) / (wi + wj);
		sizes[best_i] = merge.size;
		cluster_ids[best_i] = n + step;
		active[best_j] = false;

		for (size_t other = 0; other < n; other++) {
			if (!active[other] || other == best_i) {
				continue;
			}
			const double d = WardDistanceSquared(centroids[best_i], sizes[best_i], centroids[other], sizes[other]);
			const size_t lo = std::min(best_i, other);
			const size_t hi = std::max(best_i, other);
			dist(static_cast<Eigen::Index>(lo), static_cast<Eigen::Index>(hi)) = d;
		}

		STATKIT_TRACE("ward merge " << step << ": " << merge.cluster_a << " + " << merge.cluster_b
		                            << " d=" << merge.distance);
	}

	STATKIT_TIMING_END("Ward linkage over " + std::to_string(n) + " observations");
	return dendrogram;
}

inline std::vector<int> WardLinkage::Cut(const Dendrogram &dendrogram, int k) {
	const size_t n = dendrogram.n_obs;
	core::ValidateClusterCount(k, static_cast<long long>(n));
	dendrogram.Validate();

	// Union-find over observations; rep maps a cluster id to one of its members
	std::vector<size_t> parent(n);
	std::iota(parent.begin(), parent.end(), static_cast<size_t>(0));
	auto find = [&parent](size_t x) {
		while (parent[x] != x) {
			parent[x] = parent[parent[x]];
			x = parent[x];
		}
		return x;
	};

	std::vector<size_t> rep(2 * n - 1);
	std::iota(rep.begin(), rep.begin() + static_cast<std::ptrdiff_t>(n), static_cast<size_t>(0));

	const size_t n_merges = n - static_cast<size_t>(k);
	for (size_t s = 0; s < n_merges; s++) {
		const MergeStep &merge = dendrogram.merges[s];
		const size_t ra = find(rep[merge.cluster_a]);
		const size_t rb = find(rep[merge.cluster_b]);
		const size_t root = std::min(ra, rb);
		parent[std::max(ra, rb)] = root;
		rep[n + s] = root;
	}

	std::vector<int> assignment(n, -1);
	std::map<size_t, int> root_labels;
	for (size_t i = 0; i < n; i++) {
		const size_t root = find(i);
		auto it = root_labels.find(root);
		if (it == root_labels.end()) {
			it = root_labels.emplace(root, static_cast<int>(root_labels.size())).first;
		}
		assignment[i] = it->second;
	}
	return assignment;
}

inline size_t WardLinkage::CountLabels(const std::vector<int> &assignment) {
	std::map<int, size_t> seen;
	for (int label : assignment) {
		seen[label]++;
	}
	return seen.size();
}

inline Eigen::MatrixXd WardLinkage::ClusterMeans(const Eigen::MatrixXd &X, const std::vector<int> &assignment) {
	if (X.rows() == 0) {
		throw core::EmptyInputError("cannot compute cluster means of an empty dataset");
	}
	if (assignment.size() != static_cast<size_t>(X.rows())) {
		throw core::ShapeMismatchError("assignment has " + std::to_string(assignment.size()) +
		                               " labels but dataset has " + std::to_string(X.rows()) + " rows");
	}

	// Pass 1: label -> output row, by first appearance
	std::map<int, Eigen::Index> label_rows;
	std::vector<Eigen::Index> rows(assignment.size());
	for (size_t i = 0; i < assignment.size(); i++) {
		auto it = label_rows.find(assignment[i]);
		if (it == label_rows.end()) {
			it = label_rows.emplace(assignment[i], static_cast<Eigen::Index>(label_rows.size())).first;
		}
		rows[i] = it->second;
	}

	// Pass 2: one reduction into the centroid set
	const auto k = static_cast<Eigen::Index>(label_rows.size());
	Eigen::MatrixXd sums = Eigen::MatrixXd::Zero(k, X.cols());
	Eigen::VectorXd counts = Eigen::VectorXd::Zero(k);
	for (size_t i = 0; i < rows.size(); i++) {
		sums.row(rows[i]) += X.row(static_cast<Eigen::Index>(i));
		counts(rows[i]) += 1.0;
	}
	for (Eigen::Index c = 0; c < k; c++) {
		sums.row(c) /= counts(c);
	}
	return sums;
}

} // namespace clustering
} // namespace statkit
