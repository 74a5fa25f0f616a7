#pragma once

#include <stdexcept>
#include <string>

namespace libsamplestat {
namespace core {

/**
 * Input that cannot be analyzed at all
 *
 * Raised when a sample has fewer than the minimum number of values or
 * contains NaN/Inf. No partial report is produced.
 */
class InvalidInputError : public std::invalid_argument {
public:
	explicit InvalidInputError(const std::string &what) : std::invalid_argument(what) {}
};

/**
 * Sample without spread (all values identical)
 *
 * Every std-dependent quantity (z-scores, CV, intervals, tests) is undefined,
 * so the analysis of this sample is refused instead of emitting NaN/Inf.
 */
class DegenerateSampleError : public std::domain_error {
public:
	explicit DegenerateSampleError(const std::string &what) : std::domain_error(what) {}
};

} // namespace core
} // namespace libsamplestat
