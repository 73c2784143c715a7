#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <stdexcept>

namespace statkit {
namespace core {

/**
 * Configuration options for K-Means (Lloyd iterations)
 */
struct KMeansOptions {
	/// Hard cap on centroid relocation steps
	/// Reaching it is reported through KMeansResult, not thrown.
	/// Default: 300
	size_t max_iterations = 300;

	/// Seed for random initialization (std::mt19937_64)
	/// Ignored when initial centroids are supplied.
	/// Default: 42
	uint64_t seed = 42;

	/// Number of random initializations; the run with the lowest inertia is
	/// kept. Run r uses seed + r. Ignored when initial centroids are supplied.
	/// Default: 1
	size_t n_init = 1;

	KMeansOptions() = default;

	static KMeansOptions WithSeed(uint64_t seed_, size_t max_iterations_ = 300) {
		KMeansOptions opts;
		opts.seed = seed_;
		opts.max_iterations = max_iterations_;
		return opts;
	}

	/**
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (max_iterations == 0) {
			throw std::invalid_argument("max_iterations must be positive");
		}
		if (n_init == 0) {
			throw std::invalid_argument("n_init must be positive");
		}
	}
};

} // namespace core
} // namespace statkit
