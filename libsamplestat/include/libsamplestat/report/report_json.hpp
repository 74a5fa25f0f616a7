#pragma once

#include "libsamplestat/core/criterion_results.hpp"
#include "libsamplestat/descriptive/descriptive_statistics.hpp"
#include "libsamplestat/report/analysis_report.hpp"
#include "libsamplestat/report/plot_data.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace libsamplestat {
namespace report {

/**
 * JSON serialization of an analysis report
 *
 * Layout:
 *   { "sample": {...}, "options": {...}, "descriptive": {...},
 *     "normality": {key: {...}}, "outliers": {key: {...}},
 *     "summary": {...}, "plots": {...} | null }
 *
 * Absent optional values are written as null. Criteria that could not be
 * evaluated keep their key with "available": false and a "reason".
 */

namespace detail {

template <typename T>
inline nlohmann::json OptionalToJson(const std::optional<T> &value) {
	if (value) {
		return nlohmann::json(*value);
	}
	return nlohmann::json(nullptr);
}

} // namespace detail

inline nlohmann::json ToJson(const descriptive::DescriptiveStatistics &stats) {
	nlohmann::json j;
	j["n"] = stats.n;
	j["sum"] = stats.sum;
	j["mean"] = stats.mean;
	j["median"] = stats.median;
	j["mode"] = detail::OptionalToJson(stats.mode);
	j["std_dev"] = stats.std_dev;
	j["std_dev_population"] = stats.std_dev_population;
	j["variance"] = stats.variance;
	j["variance_population"] = stats.variance_population;
	j["min"] = stats.min;
	j["max"] = stats.max;
	j["range"] = stats.range;
	j["q1"] = stats.q1;
	j["q3"] = stats.q3;
	j["iqr"] = stats.iqr;
	j["standard_error"] = stats.standard_error;
	j["coefficient_of_variation"] = stats.coefficient_of_variation;
	j["range_to_std_ratio"] = stats.range_to_std_ratio;
	j["spread_class"] = descriptive::SpreadClassName(stats.spread_class);
	j["skewness"] = stats.skewness;
	j["kurtosis"] = stats.kurtosis;
	j["skewness_adjusted"] = stats.skewness_adjusted;
	j["kurtosis_adjusted"] = stats.kurtosis_adjusted;
	j["harmonic_mean"] = detail::OptionalToJson(stats.harmonic_mean);
	j["geometric_mean"] = detail::OptionalToJson(stats.geometric_mean);
	j["quadratic_mean"] = stats.quadratic_mean;
	j["cubic_mean"] = stats.cubic_mean;
	j["majorant_ordering_holds"] = detail::OptionalToJson(stats.majorant_ordering_holds);
	j["confidence_level"] = stats.confidence_level;
	j["t_critical"] = stats.t_critical;
	j["ci_mean"] = {stats.ci_mean_lower, stats.ci_mean_upper};
	j["chi2_quantiles"] = {stats.chi2_lower_quantile, stats.chi2_upper_quantile};
	j["ci_std"] = {stats.ci_std_lower, stats.ci_std_upper};
	return j;
}

inline nlohmann::json ToJson(const core::NormalityTestResult &result) {
	nlohmann::json j;
	j["name"] = result.name;
	j["available"] = result.available;
	if (!result.available) {
		j["statistic"] = nullptr;
		j["p_value"] = nullptr;
		j["critical_value"] = nullptr;
		j["degrees_of_freedom"] = nullptr;
		j["is_normal"] = nullptr;
		j["reason"] = result.reason;
		return j;
	}
	j["statistic"] = result.statistic;
	j["p_value"] = detail::OptionalToJson(result.p_value);
	j["critical_value"] = detail::OptionalToJson(result.critical_value);
	j["degrees_of_freedom"] = detail::OptionalToJson(result.degrees_of_freedom);
	j["inconclusive"] = result.inconclusive;
	j["is_normal"] = result.is_normal;
	j["reason"] = result.reason.empty() ? nlohmann::json(nullptr) : nlohmann::json(result.reason);
	return j;
}

inline nlohmann::json ToJson(const core::OutlierResult &result) {
	nlohmann::json j;
	j["name"] = result.name;
	j["available"] = result.available;
	j["indices"] = result.indices;
	j["values"] = result.values;
	j["count"] = result.count();
	j["has_outliers"] = result.has_outliers;
	j["lower_bound"] = detail::OptionalToJson(result.lower_bound);
	j["upper_bound"] = detail::OptionalToJson(result.upper_bound);
	j["statistic"] = detail::OptionalToJson(result.statistic);
	j["critical_value"] = detail::OptionalToJson(result.critical_value);
	j["reason"] = result.reason.empty() ? nlohmann::json(nullptr) : nlohmann::json(result.reason);
	return j;
}

inline nlohmann::json ToJson(const PlotData &plots) {
	nlohmann::json j;

	const Histogram &hist = plots.histogram;
	j["histogram"] = {{"edges", hist.edges},
	                  {"midpoints", hist.midpoints},
	                  {"counts", hist.counts},
	                  {"relative_frequencies", hist.relative_frequencies},
	                  {"densities", hist.densities},
	                  {"normal_density", hist.normal_density},
	                  {"bin_width", hist.bin_width}};

	j["qq"] = {{"theoretical", plots.qq.theoretical},
	           {"observed", plots.qq.observed},
	           {"slope", plots.qq.slope},
	           {"intercept", plots.qq.intercept},
	           {"r_squared", plots.qq.r_squared}};

	const normality::FrequencyTable &table = plots.chi_square_table;
	j["chi_square_table"] = {{"initial_bins", table.initial_bins},
	                         {"lower", table.lower},
	                         {"upper", table.upper},
	                         {"observed", table.observed},
	                         {"expected", table.expected}};

	j["cleaned"] = {{"excluded_indices", plots.cleaned.excluded_indices},
	                {"count", plots.cleaned.count},
	                {"mean", plots.cleaned.mean},
	                {"std_dev", plots.cleaned.std_dev}};
	return j;
}

inline nlohmann::json ToJson(const core::AnalysisOptions &options) {
	nlohmann::json methods = nlohmann::json::array();
	for (const auto method : options.outlier_methods) {
		methods.push_back(core::OutlierMethodKey(method));
	}
	return {{"alpha", options.alpha},
	        {"outlier_methods", methods},
	        {"iqr_multiplier", options.iqr_multiplier},
	        {"sigma_multiplier", options.sigma_multiplier},
	        {"irwin_critical", options.irwin_critical},
	        {"chauvenet_threshold", options.chauvenet_threshold},
	        {"min_expected_frequency", options.min_expected_frequency},
	        {"romanovsky_max_n", options.romanovsky_max_n},
	        {"romanovsky_critical", options.romanovsky_critical},
	        {"compute_plot_data", options.compute_plot_data}};
}

/**
 * Serialize a complete report
 */
inline nlohmann::json ToJson(const AnalysisReport &report) {
	const ReportContents &contents = report.Read();

	nlohmann::json j;
	j["sample"] = {{"n", contents.sample.size()}, {"values", contents.sample.ToVector()}};
	j["options"] = ToJson(contents.options);
	j["descriptive"] = ToJson(contents.descriptive);

	j["normality"] = nlohmann::json::object();
	for (const auto &entry : contents.normality) {
		j["normality"][entry.first] = ToJson(entry.second);
	}

	j["outliers"] = nlohmann::json::object();
	for (const auto &entry : contents.outliers) {
		j["outliers"][entry.first] = ToJson(entry.second);
	}

	const ReportSummary summary = report.Summarize();
	j["summary"] = {{"normality_evaluated", summary.normality_evaluated},
	                {"normality_passed", summary.normality_passed},
	                {"methods_with_outliers", summary.methods_with_outliers},
	                {"flagged_indices", summary.flagged_indices}};

	j["plots"] = contents.plots ? ToJson(*contents.plots) : nlohmann::json(nullptr);
	return j;
}

} // namespace report
} // namespace libsamplestat
