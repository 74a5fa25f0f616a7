#pragma once

#include "libsamplestat/core/errors.hpp"
#include "libsamplestat/core/sample.hpp"
#include "libsamplestat/utils/distributions.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace libsamplestat {
namespace descriptive {

/**
 * Pustylnik classification of the range-to-std ratio R/s
 */
enum class SpreadClass { COMPRESSED, NORMAL, STRETCHED };

inline std::string SpreadClassName(SpreadClass spread) {
	switch (spread) {
	case SpreadClass::COMPRESSED:
		return "compressed";
	case SpreadClass::NORMAL:
		return "normal";
	case SpreadClass::STRETCHED:
		return "stretched";
	default:
		return "unknown";
	}
}

/**
 * Descriptive statistics of one sample
 *
 * Snapshot computed once by Compute() and never modified afterwards.
 *
 * Shape statistics use the biased central moments m_k = (1/n) sum (x - mean)^k:
 * - skewness g1 = m3 / m2^(3/2)
 * - excess kurtosis g2 = m4 / m2^2 - 3 (Fisher)
 * The *_adjusted variants are the bias-corrected spreadsheet estimators
 * G1 = g1 * sqrt(n(n-1)) / (n-2) and G2 = ((n+1) g2 + 6)(n-1) / ((n-2)(n-3)).
 *
 * Quartiles and median use linear interpolation at position p*(n-1) of the
 * sorted sample.
 *
 * Fields that are undefined for the sample are std::nullopt, never NaN:
 * - harmonic_mean, geometric_mean and majorant_ordering_holds need all values > 0
 * - mode needs at least one repeated value
 */
struct DescriptiveStatistics {
	// ========================================================================
	// Location
	// ========================================================================

	size_t n = 0;
	double sum = 0.0;
	double mean = 0.0;
	double median = 0.0;
	std::optional<double> mode;

	// ========================================================================
	// Dispersion
	// ========================================================================

	/// Sample standard deviation (n - 1 denominator)
	double std_dev = 0.0;

	/// Population standard deviation (n denominator)
	double std_dev_population = 0.0;

	double variance = 0.0;
	double variance_population = 0.0;
	double min = 0.0;
	double max = 0.0;
	double range = 0.0;
	double q1 = 0.0;
	double q3 = 0.0;
	double iqr = 0.0;

	/// s / sqrt(n)
	double standard_error = 0.0;

	/// 100 * s / mean, 0 when mean == 0
	double coefficient_of_variation = 0.0;

	/// R / s and its Pustylnik class (< 4 compressed, 4..6 normal, > 6 stretched)
	double range_to_std_ratio = 0.0;
	SpreadClass spread_class = SpreadClass::NORMAL;

	// ========================================================================
	// Shape
	// ========================================================================

	double skewness = 0.0;
	double kurtosis = 0.0;
	double skewness_adjusted = 0.0;
	double kurtosis_adjusted = 0.0;

	// ========================================================================
	// Power means
	// ========================================================================

	std::optional<double> harmonic_mean;
	std::optional<double> geometric_mean;
	double quadratic_mean = 0.0;
	double cubic_mean = 0.0;

	/// min <= harmonic <= geometric <= mean <= quadratic <= cubic <= max
	std::optional<bool> majorant_ordering_holds;

	// ========================================================================
	// Confidence intervals
	// ========================================================================

	double confidence_level = 0.95;

	/// t_{1-alpha/2, n-1}
	double t_critical = 0.0;
	double ci_mean_lower = 0.0;
	double ci_mean_upper = 0.0;

	/// chi2_{alpha/2, n-1} and chi2_{1-alpha/2, n-1}
	double chi2_lower_quantile = 0.0;
	double chi2_upper_quantile = 0.0;
	double ci_std_lower = 0.0;
	double ci_std_upper = 0.0;

	// ========================================================================
	// Computation
	// ========================================================================

	/**
	 * Compute every statistic of a sample
	 *
	 * @param sample Validated sample
	 * @param alpha Significance level for the confidence intervals (default 0.05)
	 * @return Statistics snapshot
	 * @throws DegenerateSampleError if all values are identical
	 * @throws std::invalid_argument if alpha is outside (0, 1)
	 */
	static DescriptiveStatistics Compute(const core::Sample &sample, double alpha = 0.05);

	/**
	 * Standardized scores (x - mean) / s in original sample order
	 *
	 * @throws DegenerateSampleError if the standard deviation is zero
	 */
	Eigen::VectorXd ZScores(const core::Sample &sample) const;

	/**
	 * Linear-interpolation percentile of sorted data
	 *
	 * @param sorted Ascending data (non-empty)
	 * @param p Fraction in [0, 1]
	 */
	static double Percentile(const Eigen::VectorXd &sorted, double p);

	static SpreadClass ClassifySpread(double range_to_std_ratio);

private:
	static std::optional<double> FindMode(const core::Sample &sample);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double DescriptiveStatistics::Percentile(const Eigen::VectorXd &sorted, double p) {
	const auto last = sorted.size() - 1;
	const double pos = p * static_cast<double>(last);
	auto lower = static_cast<Eigen::Index>(std::floor(pos));
	if (lower < 0) {
		lower = 0;
	}
	if (lower >= last) {
		return sorted[last];
	}
	const double fraction = pos - static_cast<double>(lower);
	return sorted[lower] + (sorted[lower + 1] - sorted[lower]) * fraction;
}

inline SpreadClass DescriptiveStatistics::ClassifySpread(double range_to_std_ratio) {
	if (range_to_std_ratio < 4.0) {
		return SpreadClass::COMPRESSED;
	}
	if (range_to_std_ratio <= 6.0) {
		return SpreadClass::NORMAL;
	}
	return SpreadClass::STRETCHED;
}

inline std::optional<double> DescriptiveStatistics::FindMode(const core::Sample &sample) {
	const Eigen::VectorXd &sorted = sample.sorted();
	const std::vector<size_t> &order = sample.sorted_order();
	const auto n = sorted.size();

	// Most frequent value; ties go to the value seen first in input order
	size_t best_count = 1;
	size_t best_first_index = 0;
	double best_value = 0.0;

	Eigen::Index run_start = 0;
	while (run_start < n) {
		Eigen::Index run_end = run_start + 1;
		size_t first_index = order[static_cast<size_t>(run_start)];
		while (run_end < n && sorted[run_end] == sorted[run_start]) {
			first_index = std::min(first_index, order[static_cast<size_t>(run_end)]);
			run_end++;
		}
		const auto count = static_cast<size_t>(run_end - run_start);
		if (count > best_count || (count == best_count && count > 1 && first_index < best_first_index)) {
			best_count = count;
			best_first_index = first_index;
			best_value = sorted[run_start];
		}
		run_start = run_end;
	}

	if (best_count < 2) {
		return std::nullopt;
	}
	return best_value;
}

inline DescriptiveStatistics DescriptiveStatistics::Compute(const core::Sample &sample, double alpha) {
	if (!(alpha > 0.0 && alpha < 1.0)) {
		throw std::invalid_argument("alpha must be in (0, 1) (got " + std::to_string(alpha) + ")");
	}

	const Eigen::VectorXd &x = sample.values();
	const Eigen::VectorXd &sorted = sample.sorted();
	const size_t n = sample.size();
	const auto nd = static_cast<double>(n);

	DescriptiveStatistics stats;
	stats.n = n;
	stats.min = sample.min();
	stats.max = sample.max();
	stats.range = stats.max - stats.min;

	if (stats.range == 0.0) {
		throw core::DegenerateSampleError("All " + std::to_string(n) +
		                                  " values are identical; standard deviation is zero");
	}

	stats.sum = x.sum();
	stats.mean = stats.sum / nd;

	// Central moments of the deviations scaled into [-1, 1]; the shape ratios are scale-free
	const Eigen::ArrayXd dev = x.array() - stats.mean;
	const double dev_scale = dev.abs().maxCoeff();
	const Eigen::ArrayXd u = dev / dev_scale;
	const Eigen::ArrayXd u2 = u.square();
	const double m2 = u2.sum() / nd;
	const double m3 = (u2 * u).sum() / nd;
	const double m4 = u2.square().sum() / nd;

	stats.std_dev = dev_scale * std::sqrt(u2.sum() / (nd - 1.0));
	stats.std_dev_population = dev_scale * std::sqrt(m2);
	stats.variance = stats.std_dev * stats.std_dev;
	stats.variance_population = stats.std_dev_population * stats.std_dev_population;

	if (!(stats.std_dev > 0.0)) {
		throw core::DegenerateSampleError("Standard deviation is zero");
	}

	stats.median = Percentile(sorted, 0.5);
	stats.q1 = Percentile(sorted, 0.25);
	stats.q3 = Percentile(sorted, 0.75);
	stats.iqr = stats.q3 - stats.q1;
	stats.mode = FindMode(sample);

	stats.skewness = m3 / std::pow(m2, 1.5);
	stats.kurtosis = m4 / (m2 * m2) - 3.0;
	stats.skewness_adjusted = stats.skewness * std::sqrt(nd * (nd - 1.0)) / (nd - 2.0);
	stats.kurtosis_adjusted = ((nd + 1.0) * stats.kurtosis + 6.0) * (nd - 1.0) / ((nd - 2.0) * (nd - 3.0));

	stats.standard_error = stats.std_dev / std::sqrt(nd);
	stats.coefficient_of_variation = (stats.mean != 0.0) ? stats.std_dev / stats.mean * 100.0 : 0.0;
	stats.range_to_std_ratio = stats.range / stats.std_dev;
	stats.spread_class = ClassifySpread(stats.range_to_std_ratio);

	// Power means, taken on x / max|x| and scaled back
	const double magnitude = x.array().abs().maxCoeff();
	const Eigen::ArrayXd r = x.array() / magnitude;
	stats.quadratic_mean = magnitude * std::sqrt(r.square().sum() / nd);
	stats.cubic_mean = magnitude * std::cbrt(r.cube().sum() / nd);
	if (stats.min > 0.0) {
		stats.harmonic_mean = magnitude * (nd / r.inverse().sum());
		stats.geometric_mean = std::exp(x.array().log().sum() / nd);

		// Tolerance absorbs rounding between means that agree mathematically
		const double tol = 1e-12 * std::fabs(stats.mean);
		const double chain[] = {stats.min,        *stats.harmonic_mean, *stats.geometric_mean, stats.mean,
		                        stats.quadratic_mean, stats.cubic_mean, stats.max};
		bool holds = true;
		for (size_t i = 0; i + 1 < sizeof(chain) / sizeof(chain[0]); i++) {
			if (chain[i] > chain[i + 1] + tol) {
				holds = false;
			}
		}
		stats.majorant_ordering_holds = holds;
	}

	// Confidence intervals
	const double df = nd - 1.0;
	stats.confidence_level = 1.0 - alpha;
	stats.t_critical = utils::student_t_critical(alpha, df);
	stats.ci_mean_lower = stats.mean - stats.t_critical * stats.standard_error;
	stats.ci_mean_upper = stats.mean + stats.t_critical * stats.standard_error;

	stats.chi2_lower_quantile = utils::ChiSquaredCDF::Quantile(0.5 * alpha, df);
	stats.chi2_upper_quantile = utils::ChiSquaredCDF::Quantile(1.0 - 0.5 * alpha, df);
	stats.ci_std_lower = stats.std_dev * std::sqrt(df / stats.chi2_upper_quantile);
	stats.ci_std_upper = stats.std_dev * std::sqrt(df / stats.chi2_lower_quantile);

	return stats;
}

inline Eigen::VectorXd DescriptiveStatistics::ZScores(const core::Sample &sample) const {
	if (!(std_dev > 0.0)) {
		throw core::DegenerateSampleError("Cannot standardize: standard deviation is zero");
	}
	return (sample.values().array() - mean) / std_dev;
}

} // namespace descriptive
} // namespace libsamplestat
