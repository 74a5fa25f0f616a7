#pragma once

#include "libsamplestat/core/analysis_options.hpp"
#include "libsamplestat/core/criterion_results.hpp"
#include "libsamplestat/core/critical_values.hpp"
#include "libsamplestat/core/sample.hpp"
#include "libsamplestat/descriptive/descriptive_statistics.hpp"
#include "libsamplestat/normality/shapiro_wilk.hpp"
#include "libsamplestat/utils/binning.hpp"
#include "libsamplestat/utils/distributions.hpp"
#include "libsamplestat/utils/kolmogorov.hpp"
#include "libsamplestat/utils/tracing.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace libsamplestat {
namespace normality {

/**
 * Observed and expected frequencies of the chi-square goodness-of-fit test
 *
 * One entry per bin after sparse bins were merged. lower/upper are the
 * bin boundaries; a merged bin spans the boundaries of its parts.
 */
struct FrequencyTable {
	/// Sturges bin count before merging (clamped to [kMinBins, kMaxBins])
	size_t initial_bins = 0;

	std::vector<double> lower;
	std::vector<double> upper;
	std::vector<double> observed;
	std::vector<double> expected;

	size_t bin_count() const {
		return observed.size();
	}
};

/**
 * Battery of normality criteria for one sample
 *
 * Criteria (result map keys):
 * - "shapiro": Shapiro-Wilk W, p-value per Royston (n in [3, 5000])
 * - "chi2": Pearson chi-square on Sturges bins, sparse bins merged, df = bins - 3
 * - "ks": Kolmogorov-Smirnov D against N(mean, s), exact Kolmogorov p-value
 * - "smirnov": the same D against the tabulated Smirnov critical value
 * - "romanovsky": |g1| / sqrt(6/n) against 3 (only for n <= romanovsky_max_n)
 * - "jarque_bera": n/6 (g1^2 + g2^2/4), chi-square(2) p-value
 *
 * Every criterion is independent. A criterion that cannot be evaluated yields
 * an unavailable result; the others are unaffected.
 */
class NormalityTester {
public:
	static constexpr size_t kMinBins = 5;
	static constexpr size_t kMaxBins = 20;

	/**
	 * Run every criterion
	 *
	 * @param sample Validated sample
	 * @param stats Descriptive statistics of the same sample
	 * @param options Analysis options (alpha, chi-square and Romanovsky settings)
	 * @return Results keyed by criterion key
	 */
	static core::NormalityResults Run(const core::Sample &sample, const descriptive::DescriptiveStatistics &stats,
	                                  const core::AnalysisOptions &options = core::AnalysisOptions());

	// ========================================================================
	// Individual criteria
	// ========================================================================

	static core::NormalityTestResult ShapiroWilkTest(const core::Sample &sample, const core::AnalysisOptions &options);

	static core::NormalityTestResult ChiSquareTest(const core::Sample &sample,
	                                               const descriptive::DescriptiveStatistics &stats,
	                                               const core::AnalysisOptions &options);

	static core::NormalityTestResult KolmogorovSmirnovTest(const core::Sample &sample,
	                                                       const descriptive::DescriptiveStatistics &stats,
	                                                       const core::AnalysisOptions &options);

	static core::NormalityTestResult SmirnovTest(const core::Sample &sample,
	                                             const descriptive::DescriptiveStatistics &stats);

	static core::NormalityTestResult RomanovskyTest(const descriptive::DescriptiveStatistics &stats,
	                                                const core::AnalysisOptions &options);

	static core::NormalityTestResult JarqueBeraTest(const descriptive::DescriptiveStatistics &stats,
	                                                const core::AnalysisOptions &options);

	// ========================================================================
	// Building blocks
	// ========================================================================

	/**
	 * Binned frequencies for the chi-square test
	 *
	 * Expected counts are n * (Phi(z_upper) - Phi(z_lower)) with the sample
	 * mean and standard deviation. While any expected count is below
	 * min_expected and more than two bins remain, the bin with the smallest
	 * expected count is folded into a neighbour (first into next, otherwise
	 * into previous).
	 */
	static FrequencyTable ChiSquareFrequencies(const core::Sample &sample,
	                                           const descriptive::DescriptiveStatistics &stats,
	                                           double min_expected);

	/// Merge sparse bins in place (see ChiSquareFrequencies)
	static void MergeSparseBins(FrequencyTable &table, double min_expected);

	/**
	 * Largest distance between the empirical CDF and N(mean, s)
	 *
	 * D = max_i max(i/n - Phi(z_(i)), Phi(z_(i)) - (i-1)/n)
	 */
	static double EcdfDistance(const core::Sample &sample, const descriptive::DescriptiveStatistics &stats);

private:
	static void Record(core::NormalityResults &results, core::NormalityTestResult result);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void NormalityTester::Record(core::NormalityResults &results, core::NormalityTestResult result) {
	if (!result.available) {
		SAMPLESTAT_WARN(result.name << " unavailable: " << result.reason);
	} else if (result.inconclusive) {
		SAMPLESTAT_WARN(result.name << " inconclusive: " << result.reason);
	} else {
		SAMPLESTAT_DEBUG(result.name << ": statistic=" << result.statistic
		                             << (result.p_value ? ", p=" + std::to_string(*result.p_value) : std::string())
		                             << ", normal=" << (result.is_normal ? "yes" : "no"));
	}
	const std::string key = result.key;
	results[key] = std::move(result);
}

inline core::NormalityResults NormalityTester::Run(const core::Sample &sample,
                                                   const descriptive::DescriptiveStatistics &stats,
                                                   const core::AnalysisOptions &options) {
	core::NormalityResults results;
	Record(results, ShapiroWilkTest(sample, options));
	if (sample.size() <= options.romanovsky_max_n) {
		Record(results, RomanovskyTest(stats, options));
	}
	Record(results, ChiSquareTest(sample, stats, options));
	Record(results, KolmogorovSmirnovTest(sample, stats, options));
	Record(results, SmirnovTest(sample, stats));
	Record(results, JarqueBeraTest(stats, options));
	return results;
}

inline core::NormalityTestResult NormalityTester::ShapiroWilkTest(const core::Sample &sample,
                                                                  const core::AnalysisOptions &options) {
	const std::string key = "shapiro";
	const std::string name = "Shapiro-Wilk";
	const size_t n = sample.size();
	if (n < ShapiroWilk::kMinN || n > ShapiroWilk::kMaxN) {
		return core::NormalityTestResult::Unavailable(key, name,
		                                              "sample size " + std::to_string(n) + " outside [" +
		                                                  std::to_string(ShapiroWilk::kMinN) + ", " +
		                                                  std::to_string(ShapiroWilk::kMaxN) + "]");
	}

	const ShapiroWilkResult sw = ShapiroWilk::Test(sample.sorted());
	if (!sw.valid || !std::isfinite(sw.w) || !std::isfinite(sw.p_value)) {
		return core::NormalityTestResult::Unavailable(key, name, "W statistic could not be computed");
	}
	return core::NormalityTestResult::FromPValue(key, name, sw.w, sw.p_value, options.alpha);
}

inline FrequencyTable NormalityTester::ChiSquareFrequencies(const core::Sample &sample,
                                                            const descriptive::DescriptiveStatistics &stats,
                                                            double min_expected) {
	const size_t n = sample.size();
	const auto nd = static_cast<double>(n);

	FrequencyTable table;
	table.initial_bins = utils::SturgesBinCount(n, kMinBins, kMaxBins);
	const utils::EqualWidthBins bins = utils::BinSorted(sample.sorted(), table.initial_bins);

	for (size_t i = 0; i < bins.bin_count(); i++) {
		const double lo = bins.edges[i];
		const double hi = bins.edges[i + 1];
		const double p_lo = utils::normal_cdf((lo - stats.mean) / stats.std_dev);
		const double p_hi = utils::normal_cdf((hi - stats.mean) / stats.std_dev);
		table.lower.push_back(lo);
		table.upper.push_back(hi);
		table.observed.push_back(static_cast<double>(bins.counts[i]));
		table.expected.push_back(nd * (p_hi - p_lo));
	}

	MergeSparseBins(table, min_expected);
	return table;
}

inline void NormalityTester::MergeSparseBins(FrequencyTable &table, double min_expected) {
	auto has_sparse = [&]() {
		return std::any_of(table.expected.begin(), table.expected.end(),
		                   [min_expected](double e) { return e < min_expected; });
	};

	while (table.bin_count() > 2 && has_sparse()) {
		const auto smallest = static_cast<size_t>(
		    std::min_element(table.expected.begin(), table.expected.end()) - table.expected.begin());

		// Bin that absorbs the sparse one
		const size_t target = (smallest == 0) ? 1 : smallest - 1;
		table.observed[target] += table.observed[smallest];
		table.expected[target] += table.expected[smallest];
		table.lower[target] = std::min(table.lower[target], table.lower[smallest]);
		table.upper[target] = std::max(table.upper[target], table.upper[smallest]);

		const auto offset = static_cast<std::ptrdiff_t>(smallest);
		table.observed.erase(table.observed.begin() + offset);
		table.expected.erase(table.expected.begin() + offset);
		table.lower.erase(table.lower.begin() + offset);
		table.upper.erase(table.upper.begin() + offset);
	}
}

inline core::NormalityTestResult NormalityTester::ChiSquareTest(const core::Sample &sample,
                                                                const descriptive::DescriptiveStatistics &stats,
                                                                const core::AnalysisOptions &options) {
	const std::string key = "chi2";
	const std::string name = "Pearson chi-square";

	const FrequencyTable table = ChiSquareFrequencies(sample, stats, options.min_expected_frequency);
	const size_t bins = table.bin_count();
	if (bins < 3) {
		return core::NormalityTestResult::Unavailable(
		    key, name, "only " + std::to_string(bins) + " bins left after merging sparse bins");
	}

	double statistic = 0.0;
	for (size_t i = 0; i < bins; i++) {
		const double e = table.expected[i];
		if (!(e > 0.0)) {
			return core::NormalityTestResult::Unavailable(key, name, "zero expected frequency");
		}
		const double diff = table.observed[i] - e;
		statistic += diff * diff / e;
	}

	const int df = static_cast<int>(bins) - 3;
	if (df <= 0) {
		core::NormalityTestResult result;
		result.key = key;
		result.name = name;
		result.statistic = statistic;
		result.degrees_of_freedom = df;
		result.is_normal = false;
		result.inconclusive = true;
		result.reason = "no degrees of freedom left (" + std::to_string(bins) + " bins, 2 estimated parameters)";
		return result;
	}

	const double p_value = utils::ChiSquaredCDF::ComplementaryCDF(statistic, static_cast<double>(df));
	if (!std::isfinite(statistic) || !std::isfinite(p_value)) {
		return core::NormalityTestResult::Unavailable(key, name, "statistic is not finite");
	}
	auto result = core::NormalityTestResult::FromPValue(key, name, statistic, p_value, options.alpha);
	result.degrees_of_freedom = df;
	return result;
}

inline double NormalityTester::EcdfDistance(const core::Sample &sample,
                                            const descriptive::DescriptiveStatistics &stats) {
	const Eigen::VectorXd &sorted = sample.sorted();
	const auto nd = static_cast<double>(sample.size());
	double d = 0.0;
	for (Eigen::Index i = 0; i < sorted.size(); i++) {
		const double f = utils::normal_cdf((sorted[i] - stats.mean) / stats.std_dev);
		const double above = static_cast<double>(i + 1) / nd - f;
		const double below = f - static_cast<double>(i) / nd;
		d = std::max(d, std::max(above, below));
	}
	return d;
}

inline core::NormalityTestResult
NormalityTester::KolmogorovSmirnovTest(const core::Sample &sample, const descriptive::DescriptiveStatistics &stats,
                                       const core::AnalysisOptions &options) {
	const std::string key = "ks";
	const std::string name = "Kolmogorov-Smirnov";

	const double d = EcdfDistance(sample, stats);
	const double p_value = utils::kolmogorov_pvalue(sample.size(), d);
	if (!std::isfinite(d) || !std::isfinite(p_value)) {
		return core::NormalityTestResult::Unavailable(key, name, "Kolmogorov distribution could not be evaluated");
	}
	return core::NormalityTestResult::FromPValue(key, name, d, p_value, options.alpha);
}

inline core::NormalityTestResult NormalityTester::SmirnovTest(const core::Sample &sample,
                                                              const descriptive::DescriptiveStatistics &stats) {
	const std::string key = "smirnov";
	const std::string name = "Smirnov";

	const double d = EcdfDistance(sample, stats);
	const double critical = core::critical_values::SmirnovCritical(sample.size());
	if (!std::isfinite(d)) {
		return core::NormalityTestResult::Unavailable(key, name, "statistic is not finite");
	}
	return core::NormalityTestResult::FromCritical(key, name, d, critical, d <= critical);
}

inline core::NormalityTestResult NormalityTester::RomanovskyTest(const descriptive::DescriptiveStatistics &stats,
                                                                 const core::AnalysisOptions &options) {
	const std::string key = "romanovsky";
	const std::string name = "Romanovsky";

	const double statistic = std::fabs(stats.skewness) / std::sqrt(6.0 / static_cast<double>(stats.n));
	if (!std::isfinite(statistic)) {
		return core::NormalityTestResult::Unavailable(key, name, "skewness is not finite");
	}
	return core::NormalityTestResult::FromCritical(key, name, statistic, options.romanovsky_critical,
	                                               statistic < options.romanovsky_critical);
}

inline core::NormalityTestResult NormalityTester::JarqueBeraTest(const descriptive::DescriptiveStatistics &stats,
                                                                 const core::AnalysisOptions &options) {
	const std::string key = "jarque_bera";
	const std::string name = "Jarque-Bera";

	const double g1 = stats.skewness;
	const double g2 = stats.kurtosis;
	const double statistic = static_cast<double>(stats.n) / 6.0 * (g1 * g1 + g2 * g2 / 4.0);
	if (!std::isfinite(statistic)) {
		return core::NormalityTestResult::Unavailable(key, name, "moments are not finite");
	}
	const double p_value = utils::ChiSquaredCDF::ComplementaryCDF(statistic, 2.0);
	auto result = core::NormalityTestResult::FromPValue(key, name, statistic, p_value, options.alpha);
	result.degrees_of_freedom = 2;
	return result;
}

} // namespace normality
} // namespace libsamplestat
