#include <catch2/catch.hpp>

#include <libsamplestat/core/analysis_options.hpp>
#include <libsamplestat/core/sample.hpp>
#include <libsamplestat/descriptive/descriptive_statistics.hpp>
#include <libsamplestat/outliers/outlier_detector.hpp>
#include <libsamplestat/utils/distributions.hpp>
#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>

using namespace libsamplestat;
using namespace libsamplestat::core;
using namespace libsamplestat::descriptive;
using namespace libsamplestat::outliers;

const double TOLERANCE = 1e-6;

namespace {

const std::vector<double> kMeasurements11 = {100.71, 100.56, 98.97,  100.63, 100.58, 100.87,
                                             100.78, 102.51, 99.97, 101.11, 100.02};

const std::vector<double> kMeasurements48 = {
    101.09, 100.65, 100.93, 101.06, 100.57, 100.98, 99.37,  100.71, 100.51, 100.58, 101.01, 100.49,
    100.72, 100.67, 100.24, 100.34, 100.23, 100.63, 99.66,  100.31, 100.43, 100.18, 99.79,  100.26,
    100.77, 100.93, 100.36, 100.03, 100.87, 100.51, 100.34, 100.53, 100.20, 102.37, 101.42, 101.08,
    100.46, 101.17, 100.56, 98.97,  100.63, 100.85, 100.87, 100.78, 102.51, 99.97,  101.11, 100.02};

const std::vector<double> kWithOutlier = {100.2, 99.8, 100.5, 99.5,  100.1, 99.9,  100.3,
                                          99.7,  100.0, 100.4, 99.6, 100.2, 99.8,  100.1,
                                          99.9,  100.3, 99.7, 100.0, 100.6, 99.4,  500.0};

OutlierResults DetectAll(const std::vector<double> &values, const AnalysisOptions &options = AnalysisOptions()) {
	Sample sample(values);
	auto stats = DescriptiveStatistics::Compute(sample, options.alpha);
	return OutlierDetector::Detect(sample, stats, options);
}

} // namespace

TEST_CASE("Outliers: All Methods Run By Default", "[outliers]") {
	auto results = DetectAll(kMeasurements11);

	REQUIRE(results.size() == 6);
	for (auto method : AllOutlierMethods()) {
		const std::string key = OutlierMethodKey(method);
		REQUIRE(results.count(key) == 1);
		REQUIRE(results.at(key).key == key);
		REQUIRE(results.at(key).available);
	}
	REQUIRE(results.at("sharlie").name == "Charlier");
	REQUIRE(results.at("3sigma").name == "Three sigma (Wright)");
}

TEST_CASE("Outliers: Method Selection", "[outliers]") {
	auto results = DetectAll(kMeasurements11, AnalysisOptions::WithMethods({OutlierMethod::GRUBBS}));
	REQUIRE(results.size() == 1);
	REQUIRE(results.count("grubbs") == 1);

	auto none = DetectAll(kMeasurements11, AnalysisOptions::WithMethods({}));
	REQUIRE(none.empty());
}

TEST_CASE("Outliers: Invalid Options", "[outliers][validation]") {
	Sample sample(kMeasurements11);
	auto stats = DescriptiveStatistics::Compute(sample);

	AnalysisOptions opts;
	opts.sigma_multiplier = -3.0;
	REQUIRE_THROWS_AS(OutlierDetector::Detect(sample, stats, opts), std::invalid_argument);
}

TEST_CASE("Outliers: Small Measurement Sample", "[outliers]") {
	auto results = DetectAll(kMeasurements11);

	const auto &iqr = results.at("iqr");
	REQUIRE_THAT(*iqr.lower_bound, Catch::Matchers::WithinAbs(99.4875, 1e-9));
	REQUIRE_THAT(*iqr.upper_bound, Catch::Matchers::WithinAbs(101.6275, 1e-9));
	std::vector<size_t> iqr_indices = {2, 7};
	std::vector<double> iqr_values = {98.97, 102.51};
	REQUIRE(iqr.indices == iqr_indices);
	REQUIRE(iqr.values == iqr_values);
	REQUIRE(iqr.has_outliers);

	REQUIRE_FALSE(results.at("3sigma").has_outliers);
	REQUIRE_FALSE(results.at("sharlie").has_outliers);

	const auto &grubbs = results.at("grubbs");
	REQUIRE_THAT(*grubbs.statistic, Catch::Matchers::WithinAbs(2.2060832, 1e-6));
	REQUIRE_THAT(*grubbs.critical_value, Catch::Matchers::WithinAbs(2.3547301, 1e-6));
	REQUIRE_FALSE(grubbs.has_outliers);

	const auto &irwin = results.at("irwin");
	REQUIRE_THAT(*irwin.statistic, Catch::Matchers::WithinAbs(1.6255350, 1e-6));
	REQUIRE(*irwin.critical_value == 1.7);
	REQUIRE_FALSE(irwin.has_outliers);

	const auto &chauvenet = results.at("chauvenet");
	REQUIRE_THAT(*chauvenet.critical_value, Catch::Matchers::WithinAbs(2.0004235691, 1e-6));
	REQUIRE(chauvenet.indices == std::vector<size_t>{7});
}

TEST_CASE("Outliers: Reference Sample Of 48", "[outliers]") {
	auto results = DetectAll(kMeasurements48);

	const auto &iqr = results.at("iqr");
	REQUIRE_THAT(*iqr.lower_bound, Catch::Matchers::WithinAbs(99.41625, 1e-9));
	REQUIRE_THAT(*iqr.upper_bound, Catch::Matchers::WithinAbs(101.76625, 1e-9));
	std::vector<size_t> iqr_indices = {6, 33, 39, 44};
	REQUIRE(iqr.indices == iqr_indices);

	REQUIRE(results.at("3sigma").indices == std::vector<size_t>{44});
	REQUIRE(results.at("sharlie").indices == std::vector<size_t>{44});

	const auto &grubbs = results.at("grubbs");
	REQUIRE_THAT(*grubbs.statistic, Catch::Matchers::WithinAbs(3.1415264, 1e-6));
	REQUIRE_THAT(*grubbs.critical_value, Catch::Matchers::WithinAbs(3.1117965, 1e-6));
	REQUIRE(grubbs.indices == std::vector<size_t>{44});
	REQUIRE(grubbs.values == std::vector<double>{102.51});

	const auto &irwin = results.at("irwin");
	REQUIRE_THAT(*irwin.statistic, Catch::Matchers::WithinAbs(1.5611770, 1e-6));
	REQUIRE_FALSE(irwin.has_outliers);

	std::vector<size_t> chauvenet_indices = {33, 39, 44};
	REQUIRE(results.at("chauvenet").indices == chauvenet_indices);
	REQUIRE_THAT(*results.at("chauvenet").critical_value, Catch::Matchers::WithinAbs(2.5616819, 1e-6));
}

TEST_CASE("Outliers: Gross Outlier Found By Every Method", "[outliers]") {
	auto results = DetectAll(kWithOutlier);

	for (const auto &entry : results) {
		INFO("method " << entry.first);
		REQUIRE(entry.second.indices == std::vector<size_t>{20});
		REQUIRE(entry.second.values == std::vector<double>{500.0});
	}

	REQUIRE_THAT(*results.at("iqr").lower_bound, Catch::Matchers::WithinAbs(99.05, 1e-9));
	REQUIRE_THAT(*results.at("iqr").upper_bound, Catch::Matchers::WithinAbs(101.05, 1e-9));
	REQUIRE_THAT(*results.at("grubbs").statistic, Catch::Matchers::WithinAbs(4.3643277, 1e-6));
	REQUIRE_THAT(*results.at("grubbs").critical_value, Catch::Matchers::WithinAbs(2.7337804, 1e-6));
	REQUIRE_THAT(*results.at("irwin").statistic, Catch::Matchers::WithinAbs(4.5756703, 1e-6));
}

TEST_CASE("Outliers: Normal Scores Have No Outliers", "[outliers]") {
	std::vector<double> values(40);
	for (size_t i = 0; i < values.size(); i++) {
		values[i] = 50.0 + 2.0 * utils::normal_quantile((static_cast<double>(i) + 0.5) / 40.0);
	}
	auto results = DetectAll(values);

	for (const auto &entry : results) {
		INFO("method " << entry.first);
		REQUIRE_FALSE(entry.second.has_outliers);
		REQUIRE(entry.second.count() == 0);
	}
	REQUIRE_THAT(*results.at("grubbs").statistic, Catch::Matchers::WithinAbs(2.2486, 1e-3));
	REQUIRE_THAT(*results.at("grubbs").critical_value, Catch::Matchers::WithinAbs(3.036097384511198, 1e-6));
	REQUIRE_THAT(*results.at("irwin").statistic, Catch::Matchers::WithinAbs(0.4624, 1e-3));
}

TEST_CASE("Outliers: Irwin Flags The Member Farther From The Mean", "[outliers][irwin]") {
	std::vector<double> high = {1.0, 2.0, 3.0, 4.0, 5.0, 20.0};
	auto high_result = DetectAll(high, AnalysisOptions::WithMethods({OutlierMethod::IRWIN})).at("irwin");
	REQUIRE(high_result.indices == std::vector<size_t>{5});

	std::vector<double> low = {3.0, -20.0, 1.0, 5.0, 2.0, 4.0};
	auto low_result = DetectAll(low, AnalysisOptions::WithMethods({OutlierMethod::IRWIN})).at("irwin");
	REQUIRE(low_result.indices == std::vector<size_t>{1});
	REQUIRE(low_result.values == std::vector<double>{-20.0});
}

TEST_CASE("Outliers: Grubbs Critical Values", "[outliers][grubbs]") {
	REQUIRE_THAT(OutlierDetector::GrubbsCritical(11, 0.05), Catch::Matchers::WithinAbs(2.3547301, 1e-6));
	REQUIRE_THAT(OutlierDetector::GrubbsCritical(21, 0.05), Catch::Matchers::WithinAbs(2.7337804, 1e-6));
	REQUIRE_THAT(OutlierDetector::GrubbsCritical(48, 0.05), Catch::Matchers::WithinAbs(3.1117965, 1e-6));
	REQUIRE(std::isnan(OutlierDetector::GrubbsCritical(2, 0.05)));

	// Stricter alpha raises the bar
	REQUIRE(OutlierDetector::GrubbsCritical(48, 0.01) > OutlierDetector::GrubbsCritical(48, 0.05));
}

TEST_CASE("Outliers: Grubbs Flags At Most One Point", "[outliers][grubbs][property]") {
	std::vector<double> values = kMeasurements48;
	values.push_back(150.0);
	values.push_back(50.0);
	auto results = DetectAll(values, AnalysisOptions::WithMethods({OutlierMethod::GRUBBS}));
	REQUIRE(results.at("grubbs").count() == 1);
}

TEST_CASE("Outliers: IQR Count Grows As The Fence Narrows", "[outliers][iqr][property]") {
	std::mt19937 rng(7);
	std::student_t_distribution<double> dist(3.0);

	for (int trial = 0; trial < 20; trial++) {
		std::vector<double> values(60);
		for (auto &v : values) {
			v = dist(rng);
		}
		Sample sample(values);
		auto stats = DescriptiveStatistics::Compute(sample);

		size_t previous = 0;
		for (double k : {3.0, 2.5, 2.0, 1.5, 1.0, 0.5, 0.0}) {
			auto result = OutlierDetector::Iqr(sample, stats, k);
			REQUIRE(result.count() >= previous);
			previous = result.count();
		}
	}
}

TEST_CASE("Outliers: Indices Ascend And Match Values", "[outliers][property]") {
	auto results = DetectAll(kMeasurements48);
	Sample sample(kMeasurements48);

	for (const auto &entry : results) {
		const auto &result = entry.second;
		REQUIRE(result.indices.size() == result.values.size());
		REQUIRE(result.has_outliers == !result.indices.empty());
		for (size_t i = 0; i < result.indices.size(); i++) {
			REQUIRE(result.indices[i] < sample.size());
			REQUIRE(result.values[i] == sample[result.indices[i]]);
			if (i > 0) {
				REQUIRE(result.indices[i - 1] < result.indices[i]);
			}
		}
	}
}
