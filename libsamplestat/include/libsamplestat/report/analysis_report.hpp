#pragma once

#include "libsamplestat/core/analysis_options.hpp"
#include "libsamplestat/core/criterion_results.hpp"
#include "libsamplestat/core/sample.hpp"
#include "libsamplestat/descriptive/descriptive_statistics.hpp"
#include "libsamplestat/report/plot_data.hpp"
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace libsamplestat {
namespace report {

/**
 * Everything computed for one sample
 */
struct ReportContents {
	core::Sample sample;
	descriptive::DescriptiveStatistics descriptive;
	core::NormalityResults normality;
	core::OutlierResults outliers;

	/// Absent when options.compute_plot_data is false
	std::optional<PlotData> plots;

	core::AnalysisOptions options;
};

/**
 * Overall verdict across criteria
 */
struct ReportSummary {
	/// Normality criteria that reached a decision
	size_t normality_evaluated = 0;

	/// Of those, criteria that did not reject normality
	size_t normality_passed = 0;

	/// Keys of outlier methods that flagged at least one observation
	std::vector<std::string> methods_with_outliers;

	/// Original indices flagged by any method
	std::set<size_t> flagged_indices;
};

/**
 * Read-only analysis report of one sample
 *
 * Created once by SampleAnalyzer and never modified; safe to share between
 * threads.
 */
class AnalysisReport {
public:
	explicit AnalysisReport(ReportContents contents) : contents_(std::move(contents)) {}

	/// Full report contents
	const ReportContents &Read() const {
		return contents_;
	}

	/// Count passed normality criteria and collect flagged observations
	ReportSummary Summarize() const {
		ReportSummary summary;
		for (const auto &entry : contents_.normality) {
			const auto &result = entry.second;
			if (!result.available || result.inconclusive) {
				continue;
			}
			summary.normality_evaluated++;
			if (result.is_normal) {
				summary.normality_passed++;
			}
		}
		for (const auto &entry : contents_.outliers) {
			const auto &result = entry.second;
			if (!result.has_outliers) {
				continue;
			}
			summary.methods_with_outliers.push_back(entry.first);
			summary.flagged_indices.insert(result.indices.begin(), result.indices.end());
		}
		return summary;
	}

private:
	ReportContents contents_;
};

} // namespace report
} // namespace libsamplestat
