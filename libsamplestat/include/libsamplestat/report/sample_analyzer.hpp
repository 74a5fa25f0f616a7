#pragma once

#include "libsamplestat/core/analysis_options.hpp"
#include "libsamplestat/core/errors.hpp"
#include "libsamplestat/core/sample.hpp"
#include "libsamplestat/descriptive/descriptive_statistics.hpp"
#include "libsamplestat/normality/normality_tester.hpp"
#include "libsamplestat/outliers/outlier_detector.hpp"
#include "libsamplestat/report/analysis_report.hpp"
#include "libsamplestat/report/plot_data.hpp"
#include "libsamplestat/utils/tracing.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace libsamplestat {
namespace report {

/**
 * Full analysis pipeline for one sample
 *
 * Sample -> DescriptiveStatistics -> {NormalityTester, OutlierDetector} -> PlotData
 *
 * Stateless; independent samples may be analyzed concurrently.
 */
class SampleAnalyzer {
public:
	/**
	 * Analyze raw values
	 *
	 * @param values Observations in input order
	 * @param options Analysis options
	 * @return Complete report
	 * @throws std::invalid_argument if options are invalid
	 * @throws InvalidInputError if fewer than 5 values or any value is not finite
	 * @throws DegenerateSampleError if all values are identical
	 */
	static AnalysisReport Analyze(const std::vector<double> &values,
	                              const core::AnalysisOptions &options = core::AnalysisOptions()) {
		options.Validate();
		return Analyze(core::Sample(values), options);
	}

	/// Analyze an already validated sample
	static AnalysisReport Analyze(const core::Sample &sample,
	                              const core::AnalysisOptions &options = core::AnalysisOptions()) {
		options.Validate();
		SAMPLESTAT_TIMING_START();
		SAMPLESTAT_INFO("Analyzing sample of " << sample.size() << " values");

		descriptive::DescriptiveStatistics stats;
		try {
			stats = descriptive::DescriptiveStatistics::Compute(sample, options.alpha);
		} catch (const core::DegenerateSampleError &e) {
			SAMPLESTAT_ERROR("Sample rejected: " << e.what());
			throw;
		}
		SAMPLESTAT_DEBUG("mean=" << stats.mean << " s=" << stats.std_dev << " skewness=" << stats.skewness
		                         << " kurtosis=" << stats.kurtosis);

		core::NormalityResults normality_results = normality::NormalityTester::Run(sample, stats, options);
		core::OutlierResults outlier_results = outliers::OutlierDetector::Detect(sample, stats, options);

		std::optional<PlotData> plots;
		if (options.compute_plot_data) {
			plots = PlotData::Build(sample, stats, options);
		}

		ReportContents contents {sample, std::move(stats), std::move(normality_results), std::move(outlier_results),
		                         std::move(plots), options};
		AnalysisReport report(std::move(contents));

		const ReportSummary summary = report.Summarize();
		SAMPLESTAT_INFO("Normality: " << summary.normality_passed << " of " << summary.normality_evaluated
		                              << " criteria passed; " << summary.flagged_indices.size()
		                              << " observation(s) flagged as outliers");
		SAMPLESTAT_TIMING_END("SampleAnalyzer::Analyze");
		return report;
	}
};

} // namespace report
} // namespace libsamplestat
