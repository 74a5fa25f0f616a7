#pragma once

#include "libsamplestat/core/analysis_options.hpp"
#include "libsamplestat/core/criterion_results.hpp"
#include "libsamplestat/core/sample.hpp"
#include "libsamplestat/descriptive/descriptive_statistics.hpp"
#include "libsamplestat/utils/distributions.hpp"
#include "libsamplestat/utils/tracing.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace libsamplestat {
namespace outliers {

/**
 * Outlier criteria for one sample
 *
 * Methods (result map keys):
 * - "iqr": Tukey fences [Q1 - k*IQR, Q3 + k*IQR]
 * - "3sigma": Wright limits mean +/- 3s
 * - "grubbs": max |z| against the two-sided Grubbs critical value (one point at most)
 * - "sharlie": Charlier count of |z| > 3
 * - "irwin": widest adjacent gap of the sorted sample in units of s
 * - "chauvenet": n * P(|Z| >= |z|) < 0.5
 *
 * All methods share one z-score vector computed from the sample mean and
 * sample standard deviation. Reported indices are positions in the original
 * sample, ascending.
 */
class OutlierDetector {
public:
	/**
	 * Run the methods selected in options.outlier_methods
	 *
	 * @param sample Validated sample
	 * @param stats Descriptive statistics of the same sample
	 * @param options Analysis options
	 * @return Results keyed by method key
	 * @throws std::invalid_argument if options are invalid
	 */
	static core::OutlierResults Detect(const core::Sample &sample, const descriptive::DescriptiveStatistics &stats,
	                                   const core::AnalysisOptions &options = core::AnalysisOptions());

	// ========================================================================
	// Individual methods
	// ========================================================================

	static core::OutlierResult Iqr(const core::Sample &sample, const descriptive::DescriptiveStatistics &stats,
	                               double multiplier);

	static core::OutlierResult ThreeSigma(const core::Sample &sample, const descriptive::DescriptiveStatistics &stats,
	                                      const Eigen::VectorXd &z, double sigma_multiplier);

	static core::OutlierResult Grubbs(const core::Sample &sample, const Eigen::VectorXd &z, double alpha);

	static core::OutlierResult Charlier(const core::Sample &sample, const Eigen::VectorXd &z, double threshold);

	static core::OutlierResult Irwin(const core::Sample &sample, const descriptive::DescriptiveStatistics &stats,
	                                 double critical);

	static core::OutlierResult Chauvenet(const core::Sample &sample, const descriptive::DescriptiveStatistics &stats,
	                                     const Eigen::VectorXd &z, double threshold);

	/**
	 * Two-sided Grubbs critical value
	 *
	 * G_crit = (n-1) t / sqrt(n (n-2+t^2)), t = t_{1-alpha/(2n), n-2}
	 *
	 * @return NaN for n < 3
	 */
	static double GrubbsCritical(size_t n, double alpha);

private:
	static void Flag(core::OutlierResult &result, const core::Sample &sample, size_t index);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void OutlierDetector::Flag(core::OutlierResult &result, const core::Sample &sample, size_t index) {
	result.indices.push_back(index);
	result.values.push_back(sample[index]);
	result.has_outliers = true;
}

inline core::OutlierResults OutlierDetector::Detect(const core::Sample &sample,
                                                    const descriptive::DescriptiveStatistics &stats,
                                                    const core::AnalysisOptions &options) {
	options.Validate();

	const Eigen::VectorXd z = stats.ZScores(sample);
	core::OutlierResults results;

	for (const auto method : options.outlier_methods) {
		core::OutlierResult result;
		switch (method) {
		case core::OutlierMethod::IQR:
			result = Iqr(sample, stats, options.iqr_multiplier);
			break;
		case core::OutlierMethod::THREE_SIGMA:
			result = ThreeSigma(sample, stats, z, options.sigma_multiplier);
			break;
		case core::OutlierMethod::GRUBBS:
			result = Grubbs(sample, z, options.alpha);
			break;
		case core::OutlierMethod::CHARLIER:
			result = Charlier(sample, z, options.sigma_multiplier);
			break;
		case core::OutlierMethod::IRWIN:
			result = Irwin(sample, stats, options.irwin_critical);
			break;
		case core::OutlierMethod::CHAUVENET:
			result = Chauvenet(sample, stats, z, options.chauvenet_threshold);
			break;
		}

		if (!result.available) {
			SAMPLESTAT_WARN(result.name << " unavailable: " << result.reason);
		} else {
			SAMPLESTAT_DEBUG(result.name << ": " << result.count() << " outlier(s)");
		}
		const std::string key = result.key;
		results[key] = std::move(result);
	}
	return results;
}

inline core::OutlierResult OutlierDetector::Iqr(const core::Sample &sample,
                                                 const descriptive::DescriptiveStatistics &stats, double multiplier) {
	core::OutlierResult result(core::OutlierMethodKey(core::OutlierMethod::IQR), "Interquartile range");
	const double lower = stats.q1 - multiplier * stats.iqr;
	const double upper = stats.q3 + multiplier * stats.iqr;
	result.lower_bound = lower;
	result.upper_bound = upper;
	result.critical_value = multiplier;

	for (size_t i = 0; i < sample.size(); i++) {
		if (sample[i] < lower || sample[i] > upper) {
			Flag(result, sample, i);
		}
	}
	return result;
}

inline core::OutlierResult OutlierDetector::ThreeSigma(const core::Sample &sample,
                                                        const descriptive::DescriptiveStatistics &stats,
                                                        const Eigen::VectorXd &z, double sigma_multiplier) {
	core::OutlierResult result(core::OutlierMethodKey(core::OutlierMethod::THREE_SIGMA), "Three sigma (Wright)");
	result.lower_bound = stats.mean - sigma_multiplier * stats.std_dev;
	result.upper_bound = stats.mean + sigma_multiplier * stats.std_dev;
	result.critical_value = sigma_multiplier;

	for (size_t i = 0; i < sample.size(); i++) {
		if (std::fabs(z[static_cast<Eigen::Index>(i)]) > sigma_multiplier) {
			Flag(result, sample, i);
		}
	}
	return result;
}

inline double OutlierDetector::GrubbsCritical(size_t n, double alpha) {
	if (n < 3) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const auto nd = static_cast<double>(n);
	const double t = utils::student_t_quantile(1.0 - alpha / (2.0 * nd), nd - 2.0);
	return (nd - 1.0) * t / std::sqrt(nd * (nd - 2.0 + t * t));
}

inline core::OutlierResult OutlierDetector::Grubbs(const core::Sample &sample, const Eigen::VectorXd &z,
                                                    double alpha) {
	const std::string key = core::OutlierMethodKey(core::OutlierMethod::GRUBBS);
	const std::string name = "Grubbs";

	const double critical = GrubbsCritical(sample.size(), alpha);
	if (!std::isfinite(critical)) {
		return core::OutlierResult::Unavailable(key, name, "critical value could not be computed");
	}

	Eigen::Index extreme = 0;
	const double g = z.cwiseAbs().maxCoeff(&extreme);

	core::OutlierResult result(key, name);
	result.statistic = g;
	result.critical_value = critical;
	if (g > critical) {
		Flag(result, sample, static_cast<size_t>(extreme));
	}
	return result;
}

inline core::OutlierResult OutlierDetector::Charlier(const core::Sample &sample, const Eigen::VectorXd &z,
                                                      double threshold) {
	core::OutlierResult result(core::OutlierMethodKey(core::OutlierMethod::CHARLIER), "Charlier");
	result.critical_value = threshold;
	result.statistic = z.cwiseAbs().maxCoeff();

	for (size_t i = 0; i < sample.size(); i++) {
		if (std::fabs(z[static_cast<Eigen::Index>(i)]) > threshold) {
			Flag(result, sample, i);
		}
	}
	return result;
}

inline core::OutlierResult OutlierDetector::Irwin(const core::Sample &sample,
                                                   const descriptive::DescriptiveStatistics &stats, double critical) {
	core::OutlierResult result(core::OutlierMethodKey(core::OutlierMethod::IRWIN), "Irwin");
	const Eigen::VectorXd &sorted = sample.sorted();

	// Widest adjacent gap; the first one wins ties
	Eigen::Index widest = 0;
	const Eigen::VectorXd gaps = sorted.tail(sorted.size() - 1) - sorted.head(sorted.size() - 1);
	const double lambda = gaps.maxCoeff(&widest) / stats.std_dev;

	result.statistic = lambda;
	result.critical_value = critical;
	if (lambda > critical) {
		const double below = sorted[widest];
		const double above = sorted[widest + 1];
		const Eigen::Index pick =
		    (std::fabs(above - stats.mean) >= std::fabs(below - stats.mean)) ? widest + 1 : widest;
		Flag(result, sample, sample.sorted_order()[static_cast<size_t>(pick)]);
	}
	return result;
}

inline core::OutlierResult OutlierDetector::Chauvenet(const core::Sample &sample,
                                                       const descriptive::DescriptiveStatistics &stats,
                                                       const Eigen::VectorXd &z, double threshold) {
	core::OutlierResult result(core::OutlierMethodKey(core::OutlierMethod::CHAUVENET), "Chauvenet");
	const auto nd = static_cast<double>(sample.size());

	// |z| at which n * P(|Z| >= |z|) equals the threshold
	const double z_limit = utils::normal_quantile(1.0 - threshold / (2.0 * nd));
	if (std::isfinite(z_limit)) {
		result.critical_value = z_limit;
		result.lower_bound = stats.mean - z_limit * stats.std_dev;
		result.upper_bound = stats.mean + z_limit * stats.std_dev;
	}

	for (size_t i = 0; i < sample.size(); i++) {
		const double p = utils::normal_two_tailed(z[static_cast<Eigen::Index>(i)]);
		if (nd * p < threshold) {
			Flag(result, sample, i);
		}
	}
	return result;
}

} // namespace outliers
} // namespace libsamplestat
