#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <stdexcept>

namespace statkit {
namespace core {

/**
 * What StandardScaler does with a zero-variance (constant) column
 */
enum class DegeneratePolicy {
	/// Fit throws DegenerateFeatureError naming the column
	REJECT,
	/// Column is flagged and copied through Transform() unchanged
	PASS_THROUGH
};

/**
 * Configuration options for StandardScaler
 */
struct ScalerOptions {
	/// Delta degrees of freedom for the standard deviation
	/// - ddof = 0: population standard deviation (divide by n)
	/// - ddof = 1: sample standard deviation (divide by n - 1)
	/// Default: 0
	size_t ddof = 0;

	/// Columns with std <= zero_tolerance are degenerate
	/// Default: 0.0 (only exactly constant columns)
	double zero_tolerance = 0.0;

	/// Handling of degenerate columns
	/// Default: REJECT
	DegeneratePolicy degenerate_policy = DegeneratePolicy::REJECT;

	ScalerOptions() = default;

	/// Population std, reject constant columns
	static ScalerOptions Strict() {
		return ScalerOptions();
	}

	/// Population std, pass constant columns through unscaled
	static ScalerOptions PassThrough() {
		ScalerOptions opts;
		opts.degenerate_policy = DegeneratePolicy::PASS_THROUGH;
		return opts;
	}

	/**
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (ddof > 1) {
			throw std::invalid_argument("ddof must be 0 or 1 (got " + std::to_string(ddof) + ")");
		}
		if (zero_tolerance < 0.0) {
			throw std::invalid_argument("zero_tolerance must be non-negative (got " + std::to_string(zero_tolerance) +
			                            ")");
		}
	}
};

} // namespace core
} // namespace statkit
