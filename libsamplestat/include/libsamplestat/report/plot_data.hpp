#pragma once

#include "libsamplestat/core/analysis_options.hpp"
#include "libsamplestat/core/sample.hpp"
#include "libsamplestat/descriptive/descriptive_statistics.hpp"
#include "libsamplestat/normality/normality_tester.hpp"
#include "libsamplestat/utils/binning.hpp"
#include "libsamplestat/utils/distributions.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <vector>

namespace libsamplestat {
namespace report {

/**
 * Histogram on Sturges bins (not clamped) with the fitted normal curve
 */
struct Histogram {
	std::vector<double> edges;
	std::vector<double> midpoints;
	std::vector<size_t> counts;
	std::vector<double> relative_frequencies;

	/// count / (n * width)
	std::vector<double> densities;

	/// N(mean, s) density at each midpoint
	std::vector<double> normal_density;

	double bin_width = 0.0;

	size_t bin_count() const {
		return counts.size();
	}
};

/**
 * Normal Q-Q plot with its least-squares line
 *
 * theoretical[i] = Phi^-1((i + 0.5) / n) for the i-th smallest observation.
 * For normal data the fitted slope approaches s and the intercept the mean.
 */
struct QQPlot {
	std::vector<double> theoretical;
	std::vector<double> observed;
	double slope = 0.0;
	double intercept = 0.0;
	double r_squared = 0.0;
};

/**
 * Sample summary after dropping observations outside mean +/- k*s
 */
struct CleanedSummary {
	std::vector<size_t> excluded_indices;
	size_t count = 0;
	double mean = 0.0;
	double std_dev = 0.0;
};

/**
 * Chart-ready data derived from one analysis
 */
struct PlotData {
	Histogram histogram;
	QQPlot qq;
	normality::FrequencyTable chi_square_table;
	CleanedSummary cleaned;

	/**
	 * Build every plot series
	 *
	 * @param sample Validated sample
	 * @param stats Descriptive statistics of the same sample
	 * @param options sigma_multiplier drives the cleaned summary, min_expected_frequency the chi-square table
	 */
	static PlotData Build(const core::Sample &sample, const descriptive::DescriptiveStatistics &stats,
	                      const core::AnalysisOptions &options);

	static Histogram BuildHistogram(const core::Sample &sample, const descriptive::DescriptiveStatistics &stats);

	static QQPlot BuildQQPlot(const core::Sample &sample);

	static CleanedSummary BuildCleanedSummary(const core::Sample &sample,
	                                          const descriptive::DescriptiveStatistics &stats,
	                                          double sigma_multiplier);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline PlotData PlotData::Build(const core::Sample &sample, const descriptive::DescriptiveStatistics &stats,
                                const core::AnalysisOptions &options) {
	PlotData plots;
	plots.histogram = BuildHistogram(sample, stats);
	plots.qq = BuildQQPlot(sample);
	plots.chi_square_table =
	    normality::NormalityTester::ChiSquareFrequencies(sample, stats, options.min_expected_frequency);
	plots.cleaned = BuildCleanedSummary(sample, stats, options.sigma_multiplier);
	return plots;
}

inline Histogram PlotData::BuildHistogram(const core::Sample &sample,
                                          const descriptive::DescriptiveStatistics &stats) {
	const size_t n = sample.size();
	const auto nd = static_cast<double>(n);
	const utils::EqualWidthBins bins = utils::BinSorted(sample.sorted(), utils::SturgesBinCount(n));

	Histogram hist;
	hist.edges = bins.edges;
	hist.counts = bins.counts;
	hist.bin_width = bins.width;
	for (size_t i = 0; i < bins.bin_count(); i++) {
		const double mid = 0.5 * (bins.edges[i] + bins.edges[i + 1]);
		const auto count = static_cast<double>(bins.counts[i]);
		hist.midpoints.push_back(mid);
		hist.relative_frequencies.push_back(count / nd);
		hist.densities.push_back(bins.width > 0.0 ? count / (nd * bins.width) : 0.0);
		hist.normal_density.push_back(utils::normal_pdf((mid - stats.mean) / stats.std_dev) / stats.std_dev);
	}
	return hist;
}

inline QQPlot PlotData::BuildQQPlot(const core::Sample &sample) {
	const size_t n = sample.size();
	const auto rows = static_cast<Eigen::Index>(n);
	const Eigen::VectorXd &y = sample.sorted();

	QQPlot qq;
	Eigen::MatrixXd X(rows, 2);
	for (Eigen::Index i = 0; i < rows; i++) {
		const double q = utils::normal_quantile((static_cast<double>(i) + 0.5) / static_cast<double>(n));
		X(i, 0) = 1.0;
		X(i, 1) = q;
		qq.theoretical.push_back(q);
		qq.observed.push_back(y[i]);
	}

	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
	const Eigen::VectorXd beta = qr.solve(y);
	qq.intercept = beta[0];
	qq.slope = beta[1];

	const Eigen::VectorXd residuals = y - X * beta;
	const double ss_res = residuals.squaredNorm();
	const double ss_tot = (y.array() - y.mean()).square().sum();
	qq.r_squared = (ss_tot > 0.0) ? 1.0 - ss_res / ss_tot : 0.0;
	return qq;
}

inline CleanedSummary PlotData::BuildCleanedSummary(const core::Sample &sample,
                                                    const descriptive::DescriptiveStatistics &stats,
                                                    double sigma_multiplier) {
	const Eigen::VectorXd z = stats.ZScores(sample);

	CleanedSummary cleaned;
	std::vector<double> kept;
	for (size_t i = 0; i < sample.size(); i++) {
		if (std::fabs(z[static_cast<Eigen::Index>(i)]) > sigma_multiplier) {
			cleaned.excluded_indices.push_back(i);
		} else {
			kept.push_back(sample[i]);
		}
	}

	cleaned.count = kept.size();
	if (kept.empty()) {
		return cleaned;
	}
	const Eigen::Map<const Eigen::VectorXd> v(kept.data(), static_cast<Eigen::Index>(kept.size()));
	cleaned.mean = v.mean();
	if (kept.size() > 1) {
		cleaned.std_dev =
		    std::sqrt((v.array() - cleaned.mean).square().sum() / static_cast<double>(kept.size() - 1));
	}
	return cleaned;
}

} // namespace report
} // namespace libsamplestat
