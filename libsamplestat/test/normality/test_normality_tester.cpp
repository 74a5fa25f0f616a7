#include <catch2/catch.hpp>

#include <libsamplestat/core/analysis_options.hpp>
#include <libsamplestat/core/sample.hpp>
#include <libsamplestat/descriptive/descriptive_statistics.hpp>
#include <libsamplestat/normality/normality_tester.hpp>
#include <libsamplestat/utils/distributions.hpp>
#include <cmath>
#include <numeric>
#include <vector>

using namespace libsamplestat;
using namespace libsamplestat::core;
using namespace libsamplestat::descriptive;
using namespace libsamplestat::normality;

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

// Normal scores: 50 + 2 * Phi^-1((i + 0.5) / n)
std::vector<double> NormalScores(size_t n) {
	std::vector<double> values(n);
	for (size_t i = 0; i < n; i++) {
		values[i] = 50.0 + 2.0 * utils::normal_quantile((static_cast<double>(i) + 0.5) / static_cast<double>(n));
	}
	return values;
}

// exp(i / 5) for i = 1..n: long right tail
std::vector<double> Exponential(size_t n) {
	std::vector<double> values(n);
	for (size_t i = 0; i < n; i++) {
		values[i] = std::exp(static_cast<double>(i + 1) / 5.0);
	}
	return values;
}

} // namespace

TEST_CASE("Normality: Criteria Keys", "[normality]") {
	Sample sample(kMeasurements11);
	auto stats = DescriptiveStatistics::Compute(sample);
	auto results = NormalityTester::Run(sample, stats);

	REQUIRE(results.size() == 6);
	for (const char *key : {"shapiro", "romanovsky", "chi2", "ks", "smirnov", "jarque_bera"}) {
		REQUIRE(results.count(key) == 1);
		REQUIRE(results.at(key).key == key);
	}
	REQUIRE(results.at("shapiro").name == "Shapiro-Wilk");
	REQUIRE(results.at("chi2").name == "Pearson chi-square");
}

TEST_CASE("Normality: Small Measurement Sample", "[normality]") {
	Sample sample(kMeasurements11);
	auto stats = DescriptiveStatistics::Compute(sample);
	auto results = NormalityTester::Run(sample, stats);

	const auto &shapiro = results.at("shapiro");
	REQUIRE(shapiro.available);
	REQUIRE(shapiro.is_normal);
	REQUIRE_THAT(shapiro.statistic, Catch::Matchers::WithinAbs(0.9065159898, TOLERANCE));
	REQUIRE_THAT(*shapiro.p_value, Catch::Matchers::WithinAbs(0.2216592789, 1e-5));

	const auto &ks = results.at("ks");
	REQUIRE(ks.is_normal);
	REQUIRE_THAT(ks.statistic, Catch::Matchers::WithinAbs(0.20412520743168633, TOLERANCE));
	REQUIRE_THAT(*ks.p_value, Catch::Matchers::WithinAbs(0.6777170221764639, 1e-6));

	const auto &smirnov = results.at("smirnov");
	REQUIRE(smirnov.is_normal);
	REQUIRE(*smirnov.critical_value == 0.294);
	REQUIRE_FALSE(smirnov.p_value.has_value());

	const auto &romanovsky = results.at("romanovsky");
	REQUIRE(romanovsky.is_normal);
	REQUIRE_THAT(romanovsky.statistic, Catch::Matchers::WithinAbs(0.4732304908, TOLERANCE));
	REQUIRE(*romanovsky.critical_value == 3.0);

	const auto &jb = results.at("jarque_bera");
	REQUIRE(jb.is_normal);
	REQUIRE(*jb.degrees_of_freedom == 2);
	REQUIRE_THAT(jb.statistic, Catch::Matchers::WithinAbs(0.8020085455, TOLERANCE));
	REQUIRE_THAT(*jb.p_value, Catch::Matchers::WithinAbs(0.6696471998, TOLERANCE));
}

TEST_CASE("Normality: Chi-Square Unavailable When Bins Collapse", "[normality][chi2]") {
	Sample sample(kMeasurements11);
	auto stats = DescriptiveStatistics::Compute(sample);

	FrequencyTable table = NormalityTester::ChiSquareFrequencies(sample, stats, 5.0);
	REQUIRE(table.initial_bins == 5);
	REQUIRE(table.bin_count() == 2);
	REQUIRE(std::accumulate(table.observed.begin(), table.observed.end(), 0.0) == 11.0);

	auto chi2 = NormalityTester::ChiSquareTest(sample, stats, AnalysisOptions());
	REQUIRE_FALSE(chi2.available);
	REQUIRE_FALSE(chi2.is_normal);
	REQUIRE_FALSE(chi2.p_value.has_value());
	REQUIRE_FALSE(chi2.reason.empty());
}

TEST_CASE("Normality: Reference Sample Of 48", "[normality]") {
	Sample sample(kMeasurements48);
	auto stats = DescriptiveStatistics::Compute(sample);
	auto results = NormalityTester::Run(sample, stats);

	const auto &shapiro = results.at("shapiro");
	REQUIRE_THAT(shapiro.statistic, Catch::Matchers::WithinAbs(0.9289491350, TOLERANCE));
	REQUIRE_THAT(*shapiro.p_value, Catch::Matchers::WithinAbs(0.0062380397, 1e-5));
	REQUIRE_FALSE(shapiro.is_normal);

	const auto &chi2 = results.at("chi2");
	REQUIRE(chi2.available);
	REQUIRE_FALSE(chi2.inconclusive);
	REQUIRE(*chi2.degrees_of_freedom == 1);
	REQUIRE_THAT(chi2.statistic, Catch::Matchers::WithinAbs(3.954051540555901, 1e-5));
	REQUIRE_THAT(*chi2.p_value, Catch::Matchers::WithinAbs(0.046758661292230386, 1e-5));
	REQUIRE_FALSE(chi2.is_normal);

	const auto &ks = results.at("ks");
	REQUIRE_THAT(ks.statistic, Catch::Matchers::WithinAbs(0.11688420009307332, TOLERANCE));
	REQUIRE_THAT(*ks.p_value, Catch::Matchers::WithinAbs(0.49197, 1e-4));
	REQUIRE(ks.is_normal);

	const auto &smirnov = results.at("smirnov");
	REQUIRE_THAT(*smirnov.critical_value, Catch::Matchers::WithinAbs(0.19629909152447275, 1e-9));
	REQUIRE(smirnov.is_normal);

	REQUIRE_THAT(results.at("romanovsky").statistic, Catch::Matchers::WithinAbs(1.4890304156, TOLERANCE));

	const auto &jb = results.at("jarque_bera");
	REQUIRE_THAT(jb.statistic, Catch::Matchers::WithinAbs(15.3378919369, 1e-5));
	REQUIRE_FALSE(jb.is_normal);
}

TEST_CASE("Normality: Chi-Square Frequency Table After Merging", "[normality][chi2]") {
	Sample sample(kMeasurements48);
	auto stats = DescriptiveStatistics::Compute(sample);
	FrequencyTable table = NormalityTester::ChiSquareFrequencies(sample, stats, 5.0);

	// Seven Sturges bins; both tails and the sparse upper bin fold inwards
	REQUIRE(table.initial_bins == 7);
	REQUIRE(table.bin_count() == 4);

	std::vector<double> observed = {5.0, 13.0, 21.0, 9.0};
	REQUIRE(table.observed == observed);

	REQUIRE_THAT(table.expected[0], Catch::Matchers::WithinAbs(1.3825634290337054 + 5.895000575214311, 1e-6));
	REQUIRE_THAT(table.expected[3],
	             Catch::Matchers::WithinAbs(9.065590409096982 + 2.836095689433142 + 0.4603631020408425, 1e-6));
	for (double e : table.expected) {
		REQUIRE(e >= 5.0);
	}

	// Merged bins span the full sample range
	REQUIRE(table.lower.front() == stats.min);
	REQUIRE(table.upper.back() == stats.max);
	for (size_t i = 1; i < table.bin_count(); i++) {
		REQUIRE(table.lower[i] == table.upper[i - 1]);
	}
}

TEST_CASE("Normality: Merge Sparse Bins", "[normality][chi2]") {
	FrequencyTable table;
	table.lower = {0.0, 1.0, 2.0, 3.0, 4.0};
	table.upper = {1.0, 2.0, 3.0, 4.0, 5.0};
	table.observed = {2.0, 5.0, 8.0, 6.0, 1.0};
	table.expected = {1.0, 6.0, 7.0, 8.0, 2.0};

	NormalityTester::MergeSparseBins(table, 5.0);

	// First bin folds into the next, last bin into the previous
	std::vector<double> expected = {7.0, 7.0, 10.0};
	std::vector<double> observed = {7.0, 8.0, 7.0};
	std::vector<double> lower = {0.0, 2.0, 3.0};
	std::vector<double> upper = {2.0, 3.0, 5.0};
	REQUIRE(table.expected == expected);
	REQUIRE(table.observed == observed);
	REQUIRE(table.lower == lower);
	REQUIRE(table.upper == upper);
}

TEST_CASE("Normality: Merge Stops At Two Bins", "[normality][chi2]") {
	FrequencyTable table;
	table.lower = {0.0, 1.0, 2.0};
	table.upper = {1.0, 2.0, 3.0};
	table.observed = {1.0, 1.0, 1.0};
	table.expected = {1.0, 0.5, 1.5};

	NormalityTester::MergeSparseBins(table, 5.0);

	REQUIRE(table.bin_count() == 2);
	REQUIRE(table.expected[0] == 1.5);
	REQUIRE(table.expected[1] == 1.5);
}

TEST_CASE("Normality: Chi-Square Without Degrees Of Freedom", "[normality][chi2]") {
	// Six bins, the three sparse upper ones fold into one
	std::vector<double> values = Exponential(25);
	Sample sample(values);
	auto stats = DescriptiveStatistics::Compute(sample);

	auto chi2 = NormalityTester::ChiSquareTest(sample, stats, AnalysisOptions());
	REQUIRE(chi2.available);
	REQUIRE(chi2.inconclusive);
	REQUIRE_FALSE(chi2.is_normal);
	REQUIRE(*chi2.degrees_of_freedom == 0);
	REQUIRE_FALSE(chi2.p_value.has_value());
	REQUIRE_THAT(chi2.statistic, Catch::Matchers::WithinAbs(23.631250043813267, 1e-5));
}

TEST_CASE("Normality: Gross Outlier Rejects Normality", "[normality]") {
	Sample sample(kWithOutlier);
	auto stats = DescriptiveStatistics::Compute(sample);
	auto results = NormalityTester::Run(sample, stats);

	REQUIRE_FALSE(results.at("shapiro").is_normal);
	REQUIRE(*results.at("shapiro").p_value < 1e-6);

	REQUIRE_THAT(results.at("ks").statistic, Catch::Matchers::WithinAbs(0.5360709690549897, TOLERANCE));
	REQUIRE_FALSE(results.at("ks").is_normal);
	REQUIRE_FALSE(results.at("smirnov").is_normal);
	REQUIRE(*results.at("smirnov").critical_value == 0.242);

	REQUIRE_FALSE(results.at("romanovsky").is_normal);
	REQUIRE(results.at("romanovsky").statistic > 7.9);

	REQUIRE_FALSE(results.at("jarque_bera").is_normal);
	REQUIRE(results.at("jarque_bera").statistic > 280.0);

	// Almost everything lands in the first bin
	REQUIRE_FALSE(results.at("chi2").available);
}

TEST_CASE("Normality: Normal Scores Pass Every Criterion", "[normality]") {
	std::vector<double> values = NormalScores(40);
	Sample sample(values);
	auto stats = DescriptiveStatistics::Compute(sample);
	auto results = NormalityTester::Run(sample, stats);

	for (const auto &entry : results) {
		INFO("criterion " << entry.first);
		REQUIRE(entry.second.available);
		REQUIRE(entry.second.is_normal);
	}

	REQUIRE_THAT(results.at("shapiro").statistic, Catch::Matchers::WithinAbs(0.999046536961308, 1e-5));
	REQUIRE_THAT(results.at("ks").statistic, Catch::Matchers::WithinAbs(0.013274817402302297, 1e-5));
	REQUIRE_THAT(results.at("jarque_bera").statistic, Catch::Matchers::WithinAbs(0.16543675902467606, 1e-4));

	const auto &chi2 = results.at("chi2");
	REQUIRE(*chi2.degrees_of_freedom == 2);
	REQUIRE_THAT(*chi2.p_value, Catch::Matchers::WithinAbs(0.8977322703191034, 1e-3));
}

TEST_CASE("Normality: Romanovsky Limited To Small Samples", "[normality]") {
	std::vector<double> values = NormalScores(60);
	Sample sample(values);
	auto stats = DescriptiveStatistics::Compute(sample);

	auto results = NormalityTester::Run(sample, stats);
	REQUIRE(results.count("romanovsky") == 0);
	REQUIRE(results.size() == 5);

	AnalysisOptions opts;
	opts.romanovsky_max_n = 100;
	auto extended = NormalityTester::Run(sample, stats, opts);
	REQUIRE(extended.count("romanovsky") == 1);
	REQUIRE(extended.at("romanovsky").is_normal);
}

TEST_CASE("Normality: Alpha Moves The Decision", "[normality]") {
	Sample sample(kMeasurements48);
	auto stats = DescriptiveStatistics::Compute(sample);

	// chi-square p = 0.0468
	auto strict = NormalityTester::ChiSquareTest(sample, stats, AnalysisOptions::WithAlpha(0.01));
	REQUIRE(strict.is_normal);

	auto loose = NormalityTester::ChiSquareTest(sample, stats, AnalysisOptions::WithAlpha(0.05));
	REQUIRE_FALSE(loose.is_normal);
}

TEST_CASE("Normality: ECDF Distance Bounds", "[normality][ks]") {
	std::vector<double> values = NormalScores(40);
	Sample sample(values);
	auto stats = DescriptiveStatistics::Compute(sample);

	double d = NormalityTester::EcdfDistance(sample, stats);
	REQUIRE(d >= 0.5 / 40.0 - 1e-3);
	REQUIRE(d <= 1.0);
}

TEST_CASE("Normality: Kolmogorov-Smirnov On A Large Spiked Sample", "[normality][ks]") {
	// 998 zeros with two far values: D is about 0.51 at n = 1000
	std::vector<double> values(998, 0.0);
	values.push_back(1.0);
	values.push_back(1e6);
	Sample sample(values);
	auto stats = DescriptiveStatistics::Compute(sample);

	auto ks = NormalityTester::KolmogorovSmirnovTest(sample, stats, AnalysisOptions());
	REQUIRE(ks.available);
	REQUIRE_THAT(ks.statistic, Catch::Matchers::WithinAbs(0.5116, 1e-3));
	REQUIRE(ks.p_value.has_value());
	REQUIRE(*ks.p_value < 1e-100);
	REQUIRE_FALSE(ks.is_normal);
}
