#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace libsamplestat {
namespace core {

/**
 * Outcome of one normality criterion
 *
 * A criterion either produced a decision (available == true) or could not be
 * evaluated for this sample (available == false, reason explains why). An
 * unavailable result never carries a statistic that should be displayed.
 *
 * Design notes:
 * - p_value is set for p-value based tests (Shapiro-Wilk, chi-square, KS, JB)
 * - critical_value is set for table/threshold based tests (Smirnov, Romanovsky)
 * - inconclusive marks a computed statistic that cannot be judged
 *   (chi-square with df <= 0); such a result reports is_normal == false
 */
struct NormalityTestResult {
	/// Map key, e.g. "shapiro", "chi2"
	std::string key;

	/// Human-readable criterion name
	std::string name;

	/// Test statistic
	double statistic = 0.0;

	/// p-value (p-value based tests only)
	std::optional<double> p_value;

	/// Critical value the statistic is compared to (threshold based tests only)
	std::optional<double> critical_value;

	/// Degrees of freedom (chi-square and Jarque-Bera)
	std::optional<int> degrees_of_freedom;

	/// Decision: true if normality is not rejected
	bool is_normal = false;

	/// Statistic computed but no decision possible
	bool inconclusive = false;

	/// False when the criterion could not be evaluated
	bool available = true;

	/// Why the criterion is unavailable or inconclusive
	std::string reason;

	// ========================================================================
	// Constructors
	// ========================================================================

	NormalityTestResult() = default;

	/// Result decided by a p-value: normal iff p > alpha
	static NormalityTestResult FromPValue(const std::string &key_, const std::string &name_, double statistic_,
	                                      double p_value_, double alpha) {
		NormalityTestResult result;
		result.key = key_;
		result.name = name_;
		result.statistic = statistic_;
		result.p_value = p_value_;
		result.is_normal = p_value_ > alpha;
		return result;
	}

	/// Result decided by comparing the statistic to a critical value
	static NormalityTestResult FromCritical(const std::string &key_, const std::string &name_, double statistic_,
	                                        double critical_, bool is_normal_) {
		NormalityTestResult result;
		result.key = key_;
		result.name = name_;
		result.statistic = statistic_;
		result.critical_value = critical_;
		result.is_normal = is_normal_;
		return result;
	}

	/// Criterion that could not be evaluated
	static NormalityTestResult Unavailable(const std::string &key_, const std::string &name_,
	                                       const std::string &reason_) {
		NormalityTestResult result;
		result.key = key_;
		result.name = name_;
		result.available = false;
		result.is_normal = false;
		result.reason = reason_;
		return result;
	}
};

/**
 * Outcome of one outlier criterion
 *
 * indices refer to positions in the original (unsorted) sample; values are
 * the corresponding observations in the same order.
 */
struct OutlierResult {
	/// Map key, e.g. "iqr", "grubbs"
	std::string key;

	/// Human-readable criterion name
	std::string name;

	/// Original indices of flagged observations (ascending)
	std::vector<size_t> indices;

	/// Flagged observations, parallel to indices
	std::vector<double> values;

	/// Lower acceptance bound (fence / limit), when the method has one
	std::optional<double> lower_bound;

	/// Upper acceptance bound (fence / limit), when the method has one
	std::optional<double> upper_bound;

	/// Test statistic (max |z| for Grubbs, max gap ratio for Irwin)
	std::optional<double> statistic;

	/// Critical value or threshold the statistic is compared to
	std::optional<double> critical_value;

	/// Any observation flagged
	bool has_outliers = false;

	/// False when the criterion could not be evaluated
	bool available = true;

	/// Why the criterion is unavailable
	std::string reason;

	/// Number of flagged observations
	size_t count() const {
		return indices.size();
	}

	OutlierResult() = default;

	OutlierResult(const std::string &key_, const std::string &name_) : key(key_), name(name_) {}

	/// Criterion that could not be evaluated
	static OutlierResult Unavailable(const std::string &key_, const std::string &name_, const std::string &reason_) {
		OutlierResult result(key_, name_);
		result.available = false;
		result.reason = reason_;
		return result;
	}
};

/// Normality results keyed by criterion key
using NormalityResults = std::map<std::string, NormalityTestResult>;

/// Outlier results keyed by method key
using OutlierResults = std::map<std::string, OutlierResult>;

} // namespace core
} // namespace libsamplestat
