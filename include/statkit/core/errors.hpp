#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace statkit {
namespace core {

/**
 * Error categories raised by statkit
 *
 * Every failure of a statkit operation is fatal to the call and
 * deterministic for identical inputs. No partial results are returned.
 */
enum class ErrorCode {
	SHAPE_MISMATCH,     ///< Operand dimensions are inconsistent
	SINGULAR_MATRIX,    ///< Normal-equations matrix is not invertible
	DEGENERATE_FEATURE, ///< Zero-variance column during standardization
	EMPTY_INPUT,        ///< Zero-length input where data is required
	INVALID_K,          ///< Cluster count outside [1, n]
	INVALID_INPUT       ///< Other degenerate argument (e.g. silhouette with 1 label)
};

inline const char *ErrorCodeName(ErrorCode code) {
	switch (code) {
	case ErrorCode::SHAPE_MISMATCH:
		return "ShapeMismatch";
	case ErrorCode::SINGULAR_MATRIX:
		return "SingularMatrix";
	case ErrorCode::DEGENERATE_FEATURE:
		return "DegenerateFeature";
	case ErrorCode::EMPTY_INPUT:
		return "EmptyInput";
	case ErrorCode::INVALID_K:
		return "InvalidK";
	case ErrorCode::INVALID_INPUT:
		return "InvalidInput";
	default:
		return "Unknown";
	}
}

/**
 * Common base of all statkit errors
 *
 * Not derived from std::exception: each concrete error below has exactly one
 * std::exception base, so `catch (const std::exception &)` stays unambiguous
 * while `catch (const StatkitError &)` catches every library failure.
 */
class StatkitError {
public:
	explicit StatkitError(ErrorCode code) : code_(code) {
	}
	virtual ~StatkitError() = default;

	ErrorCode Code() const {
		return code_;
	}

	/// Message of the concrete error (same as its std::exception::what())
	virtual const char *Message() const noexcept = 0;

private:
	ErrorCode code_;
};

namespace detail {

inline std::string FormatError(ErrorCode code, const std::string &message) {
	return std::string(ErrorCodeName(code)) + ": " + message;
}

} // namespace detail

/// Operand dimensions inconsistent (rows vs. target length, fit vs. transform columns, ...)
class ShapeMismatchError : public std::invalid_argument, public StatkitError {
public:
	explicit ShapeMismatchError(const std::string &message)
	    : std::invalid_argument(detail::FormatError(ErrorCode::SHAPE_MISMATCH, message)),
	      StatkitError(ErrorCode::SHAPE_MISMATCH) {
	}
	const char *Message() const noexcept override {
		return what();
	}
};

/// X'X is not invertible (rank-deficient design or p > n)
class SingularMatrixError : public std::runtime_error, public StatkitError {
public:
	explicit SingularMatrixError(const std::string &message)
	    : std::runtime_error(detail::FormatError(ErrorCode::SINGULAR_MATRIX, message)),
	      StatkitError(ErrorCode::SINGULAR_MATRIX) {
	}
	const char *Message() const noexcept override {
		return what();
	}
};

/// Zero-variance feature where scaling was required
class DegenerateFeatureError : public std::invalid_argument, public StatkitError {
public:
	DegenerateFeatureError(const std::string &message, size_t feature_index)
	    : std::invalid_argument(detail::FormatError(ErrorCode::DEGENERATE_FEATURE, message)),
	      StatkitError(ErrorCode::DEGENERATE_FEATURE), feature_index_(feature_index) {
	}
	const char *Message() const noexcept override {
		return what();
	}

	/// Index of the offending column
	size_t FeatureIndex() const {
		return feature_index_;
	}

private:
	size_t feature_index_;
};

class EmptyInputError : public std::invalid_argument, public StatkitError {
public:
	explicit EmptyInputError(const std::string &message)
	    : std::invalid_argument(detail::FormatError(ErrorCode::EMPTY_INPUT, message)),
	      StatkitError(ErrorCode::EMPTY_INPUT) {
	}
	const char *Message() const noexcept override {
		return what();
	}
};

class InvalidKError : public std::invalid_argument, public StatkitError {
public:
	explicit InvalidKError(const std::string &message)
	    : std::invalid_argument(detail::FormatError(ErrorCode::INVALID_K, message)),
	      StatkitError(ErrorCode::INVALID_K) {
	}
	const char *Message() const noexcept override {
		return what();
	}
};

class InvalidInputError : public std::invalid_argument, public StatkitError {
public:
	explicit InvalidInputError(const std::string &message)
	    : std::invalid_argument(detail::FormatError(ErrorCode::INVALID_INPUT, message)),
	      StatkitError(ErrorCode::INVALID_INPUT) {
	}
	const char *Message() const noexcept override {
		return what();
	}
};

// ============================================================================
// Shared argument checks
// ============================================================================

/// Throws InvalidKError unless 1 <= k <= n
inline void ValidateClusterCount(long long k, long long n) {
	if (k < 1 || k > n) {
		throw InvalidKError("k must be in [1, " + std::to_string(n) + "] (got " + std::to_string(k) + ")");
	}
}

} // namespace core
} // namespace statkit
