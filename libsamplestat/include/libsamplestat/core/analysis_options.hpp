#pragma once

#include "libsamplestat/core/critical_values.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace libsamplestat {
namespace core {

/**
 * Outlier criteria the detector knows how to run
 */
enum class OutlierMethod { IQR, THREE_SIGMA, GRUBBS, CHARLIER, IRWIN, CHAUVENET };

/// Key used for a method in result maps and serialized output
inline std::string OutlierMethodKey(OutlierMethod method) {
	switch (method) {
	case OutlierMethod::IQR:
		return "iqr";
	case OutlierMethod::THREE_SIGMA:
		return "3sigma";
	case OutlierMethod::GRUBBS:
		return "grubbs";
	case OutlierMethod::CHARLIER:
		return "sharlie";
	case OutlierMethod::IRWIN:
		return "irwin";
	case OutlierMethod::CHAUVENET:
		return "chauvenet";
	default:
		return "unknown";
	}
}

/**
 * Parse a method key ("iqr", "3sigma", "grubbs", "sharlie", "irwin", "chauvenet")
 *
 * "charlier" and "wright" are accepted as aliases.
 *
 * @throws std::invalid_argument for an unknown key
 */
inline OutlierMethod ParseOutlierMethod(const std::string &key) {
	std::string k = key;
	for (auto &c : k) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	if (k == "iqr") {
		return OutlierMethod::IQR;
	}
	if (k == "3sigma" || k == "wright") {
		return OutlierMethod::THREE_SIGMA;
	}
	if (k == "grubbs") {
		return OutlierMethod::GRUBBS;
	}
	if (k == "sharlie" || k == "charlier") {
		return OutlierMethod::CHARLIER;
	}
	if (k == "irwin") {
		return OutlierMethod::IRWIN;
	}
	if (k == "chauvenet") {
		return OutlierMethod::CHAUVENET;
	}
	throw std::invalid_argument("unknown outlier method '" + key + "'");
}

/// Every outlier method, in report order
inline std::vector<OutlierMethod> AllOutlierMethods() {
	return {OutlierMethod::IQR,      OutlierMethod::THREE_SIGMA, OutlierMethod::GRUBBS,
	        OutlierMethod::CHARLIER, OutlierMethod::IRWIN,       OutlierMethod::CHAUVENET};
}

/**
 * Configuration options for one sample analysis
 *
 * All options have the defaults of the classical procedure (alpha = 0.05,
 * Tukey fences at 1.5 IQR, three-sigma limits, Irwin critical 1.7).
 *
 * Design notes:
 * - Plain struct with in-class defaults, validated on use
 * - Outlier method selection defaults to every method
 */
struct AnalysisOptions {
	// ========================================================================
	// Significance
	// ========================================================================

	/// Significance level for every test and for the confidence intervals
	/// Default: 0.05 (95% intervals)
	double alpha = 0.05;

	// ========================================================================
	// Outlier detection
	// ========================================================================

	/// Methods to run
	/// Default: all methods
	std::set<OutlierMethod> outlier_methods = {OutlierMethod::IQR,      OutlierMethod::THREE_SIGMA,
	                                           OutlierMethod::GRUBBS,   OutlierMethod::CHARLIER,
	                                           OutlierMethod::IRWIN,    OutlierMethod::CHAUVENET};

	/// Tukey fence multiplier: [Q1 - k*IQR, Q3 + k*IQR]
	/// Default: 1.5
	double iqr_multiplier = 1.5;

	/// Half-width of the Wright limits and the Charlier threshold, in standard deviations
	/// Default: 3.0
	double sigma_multiplier = 3.0;

	/// Critical value for the Irwin gap statistic
	/// The classical 1.7 is tabulated for n around 50; other sizes should override it
	/// Default: 1.7
	double irwin_critical = critical_values::kIrwinCritical;

	/// Chauvenet rejects a point when n * P(|Z| >= |z|) falls below this
	/// Default: 0.5
	double chauvenet_threshold = 0.5;

	// ========================================================================
	// Normality testing
	// ========================================================================

	/// Pearson chi-square: merge bins while any expected count is below this
	/// Default: 5.0
	double min_expected_frequency = 5.0;

	/// Romanovsky criterion is only applied up to this sample size
	/// Default: 50
	size_t romanovsky_max_n = 50;

	/// Romanovsky critical value
	/// Default: 3.0
	double romanovsky_critical = critical_values::kRomanovskyCritical;

	// ========================================================================
	// Report contents
	// ========================================================================

	/// Compute histogram / Q-Q plot data for chart rendering
	/// Default: true
	bool compute_plot_data = true;

	// ========================================================================
	// Constructors
	// ========================================================================

	AnalysisOptions() = default;

	/// Options running only the given outlier methods
	static AnalysisOptions WithMethods(const std::vector<OutlierMethod> &methods) {
		AnalysisOptions opts;
		opts.outlier_methods = std::set<OutlierMethod>(methods.begin(), methods.end());
		return opts;
	}

	/// Options at a different significance level
	static AnalysisOptions WithAlpha(double alpha_) {
		AnalysisOptions opts;
		opts.alpha = alpha_;
		return opts;
	}

	/// Confidence level matching alpha (e.g. 0.95)
	double confidence_level() const {
		return 1.0 - alpha;
	}

	bool RunsMethod(OutlierMethod method) const {
		return outlier_methods.count(method) > 0;
	}

	// ========================================================================
	// Validation
	// ========================================================================

	/**
	 * Validate option values
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (!(alpha > 0.0 && alpha < 1.0)) {
			throw std::invalid_argument("alpha must be in (0, 1) (got " + std::to_string(alpha) + ")");
		}

		if (!(iqr_multiplier >= 0.0 && std::isfinite(iqr_multiplier))) {
			throw std::invalid_argument("iqr_multiplier must be finite and non-negative (got " +
			                            std::to_string(iqr_multiplier) + ")");
		}

		if (!(sigma_multiplier > 0.0 && std::isfinite(sigma_multiplier))) {
			throw std::invalid_argument("sigma_multiplier must be finite and positive (got " +
			                            std::to_string(sigma_multiplier) + ")");
		}

		if (!(irwin_critical > 0.0 && std::isfinite(irwin_critical))) {
			throw std::invalid_argument("irwin_critical must be finite and positive (got " +
			                            std::to_string(irwin_critical) + ")");
		}

		if (!(chauvenet_threshold > 0.0 && std::isfinite(chauvenet_threshold))) {
			throw std::invalid_argument("chauvenet_threshold must be finite and positive (got " +
			                            std::to_string(chauvenet_threshold) + ")");
		}

		if (!(min_expected_frequency > 0.0 && std::isfinite(min_expected_frequency))) {
			throw std::invalid_argument("min_expected_frequency must be finite and positive (got " +
			                            std::to_string(min_expected_frequency) + ")");
		}

		if (!(romanovsky_critical > 0.0 && std::isfinite(romanovsky_critical))) {
			throw std::invalid_argument("romanovsky_critical must be finite and positive (got " +
			                            std::to_string(romanovsky_critical) + ")");
		}
	}
};

} // namespace core
} // namespace libsamplestat
