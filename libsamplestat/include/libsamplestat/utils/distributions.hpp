#pragma once

#include <cmath>
#include <limits>

namespace libsamplestat {
namespace utils {

/**
 * Probability distributions used by the analysis engine
 *
 * - Standard normal: CDF, density, quantile
 * - Student's t: CDF, two-tailed p-value, quantile, critical value
 * - Chi-squared: CDF, survival function, quantile
 * - Supporting special functions: log-gamma, log-beta, regularized
 *   incomplete beta and gamma functions
 *
 * Out-of-domain arguments return NaN; callers check std::isfinite.
 * Quantiles of t and chi-squared are found by bracketed bisection on the CDF,
 * bounded to kMaxBisectionSteps iterations.
 */

constexpr double kPi = 3.14159265358979323846;
constexpr double kSqrt2 = 1.41421356237309504880;
constexpr int kMaxBisectionSteps = 200;
constexpr int kMaxSeriesTerms = 1000;

// ============================================================================
// Special functions
// ============================================================================

/// log(Gamma(x)) for x > 0
inline double log_gamma(double x) {
	if (!(x > 0.0)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return std::lgamma(x);
}

/// log(B(a, b)) = log(Gamma(a)) + log(Gamma(b)) - log(Gamma(a + b))
inline double log_beta(double a, double b) {
	return log_gamma(a) + log_gamma(b) - log_gamma(a + b);
}

namespace detail {

constexpr double kTiny = 1e-300;
constexpr double kEpsilon = 1e-15;

/// Continued fraction for the incomplete beta function (modified Lentz)
inline double beta_continued_fraction(double x, double a, double b) {
	const double qab = a + b;
	const double qap = a + 1.0;
	const double qam = a - 1.0;
	double c = 1.0;
	double d = 1.0 - qab * x / qap;
	if (std::fabs(d) < kTiny) {
		d = kTiny;
	}
	d = 1.0 / d;
	double h = d;

	for (int m = 1; m <= kMaxSeriesTerms; m++) {
		const double m2 = 2.0 * m;
		double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
		d = 1.0 + aa * d;
		if (std::fabs(d) < kTiny) {
			d = kTiny;
		}
		c = 1.0 + aa / c;
		if (std::fabs(c) < kTiny) {
			c = kTiny;
		}
		d = 1.0 / d;
		h *= d * c;

		aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
		d = 1.0 + aa * d;
		if (std::fabs(d) < kTiny) {
			d = kTiny;
		}
		c = 1.0 + aa / c;
		if (std::fabs(c) < kTiny) {
			c = kTiny;
		}
		d = 1.0 / d;
		const double delta = d * c;
		h *= delta;
		if (std::fabs(delta - 1.0) < kEpsilon) {
			break;
		}
	}
	return h;
}

/// Series for the lower regularized incomplete gamma P(a, x), x < a + 1
inline double gamma_series(double a, double x) {
	double ap = a;
	double sum = 1.0 / a;
	double delta = sum;
	for (int i = 0; i < kMaxSeriesTerms; i++) {
		ap += 1.0;
		delta *= x / ap;
		sum += delta;
		if (std::fabs(delta) < std::fabs(sum) * kEpsilon) {
			break;
		}
	}
	return sum * std::exp(-x + a * std::log(x) - log_gamma(a));
}

/// Continued fraction for the upper regularized incomplete gamma Q(a, x), x >= a + 1
inline double gamma_continued_fraction(double a, double x) {
	double b = x + 1.0 - a;
	double c = 1.0 / kTiny;
	double d = 1.0 / b;
	double h = d;
	for (int i = 1; i <= kMaxSeriesTerms; i++) {
		const double an = -i * (i - a);
		b += 2.0;
		d = an * d + b;
		if (std::fabs(d) < kTiny) {
			d = kTiny;
		}
		c = b + an / c;
		if (std::fabs(c) < kTiny) {
			c = kTiny;
		}
		d = 1.0 / d;
		const double delta = d * c;
		h *= delta;
		if (std::fabs(delta - 1.0) < kEpsilon) {
			break;
		}
	}
	return std::exp(-x + a * std::log(x) - log_gamma(a)) * h;
}

/**
 * Smallest x >= lo with cdf(x) >= p, by bracketing then bisection
 *
 * The upper bracket starts at hi and doubles until it covers p.
 */
template <typename Cdf>
inline double invert_increasing_cdf(const Cdf &cdf, double p, double lo, double hi) {
	int expansions = 0;
	while (cdf(hi) < p && expansions < 1100) {
		lo = hi;
		hi *= 2.0;
		expansions++;
	}
	for (int step = 0; step < kMaxBisectionSteps; step++) {
		const double mid = 0.5 * (lo + hi);
		if (cdf(mid) < p) {
			lo = mid;
		} else {
			hi = mid;
		}
		if (hi - lo <= 1e-14 * std::fmax(1.0, std::fabs(mid))) {
			break;
		}
	}
	return 0.5 * (lo + hi);
}

} // namespace detail

/**
 * Regularized incomplete beta function I_x(a, b)
 *
 * @param x Evaluation point in [0, 1]
 * @param a Shape parameter (> 0)
 * @param b Shape parameter (> 0)
 */
inline double beta_inc_reg(double x, double a, double b) {
	if (!(a > 0.0) || !(b > 0.0) || std::isnan(x)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (x <= 0.0) {
		return 0.0;
	}
	if (x >= 1.0) {
		return 1.0;
	}

	const double log_front = a * std::log(x) + b * std::log(1.0 - x) - log_beta(a, b);

	// Use the continued fraction where it converges fastest, symmetry otherwise
	if (x < (a + 1.0) / (a + b + 2.0)) {
		return std::exp(log_front) * detail::beta_continued_fraction(x, a, b) / a;
	}
	return 1.0 - std::exp(log_front) * detail::beta_continued_fraction(1.0 - x, b, a) / b;
}

/// Lower regularized incomplete gamma function P(a, x)
inline double gamma_inc_reg(double a, double x) {
	if (!(a > 0.0) || std::isnan(x)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (x <= 0.0) {
		return 0.0;
	}
	if (x < a + 1.0) {
		return detail::gamma_series(a, x);
	}
	return 1.0 - detail::gamma_continued_fraction(a, x);
}

/// Upper regularized incomplete gamma function Q(a, x) = 1 - P(a, x)
inline double gamma_inc_reg_upper(double a, double x) {
	if (!(a > 0.0) || std::isnan(x)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (x <= 0.0) {
		return 1.0;
	}
	if (x < a + 1.0) {
		return 1.0 - detail::gamma_series(a, x);
	}
	return detail::gamma_continued_fraction(a, x);
}

// ============================================================================
// Standard normal distribution
// ============================================================================

/// Phi(x)
inline double normal_cdf(double x) {
	return 0.5 * std::erfc(-x / kSqrt2);
}

/// phi(x)
inline double normal_pdf(double x) {
	return std::exp(-0.5 * x * x) / std::sqrt(2.0 * kPi);
}

/// Two-tailed tail probability P(|Z| >= |z|)
inline double normal_two_tailed(double z) {
	return std::erfc(std::fabs(z) / kSqrt2);
}

/**
 * Inverse of Phi
 *
 * Acklam's rational approximation (relative error < 1.2e-9), refined with one
 * Halley step against erfc, which brings it to full double precision.
 *
 * @param p Probability in (0, 1); 0 and 1 map to -inf / +inf
 */
inline double normal_quantile(double p) {
	if (std::isnan(p) || p < 0.0 || p > 1.0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (p == 0.0) {
		return -std::numeric_limits<double>::infinity();
	}
	if (p == 1.0) {
		return std::numeric_limits<double>::infinity();
	}

	static const double a[] = {-3.969683028665376e+01, 2.209460984245205e+02, -2.759285104469687e+02,
	                           1.383577518672690e+02,  -3.066479806614716e+01, 2.506628277459239e+00};
	static const double b[] = {-5.447609879822406e+01, 1.615858368580409e+02, -1.556989798598866e+02,
	                           6.680131188771972e+01,  -1.328068155288572e+01};
	static const double c[] = {-7.784894002430293e-03, -3.223964580411365e-01, -2.400758277161838e+00,
	                           -2.549732539343734e+00, 4.374664141464968e+00,  2.938163982698783e+00};
	static const double d[] = {7.784695709041462e-03, 3.224671290700398e-01, 2.445134137142996e+00,
	                           3.754408661907416e+00};
	const double p_low = 0.02425;

	double x;
	if (p < p_low) {
		const double q = std::sqrt(-2.0 * std::log(p));
		x = (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
		    ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
	} else if (p <= 1.0 - p_low) {
		const double q = p - 0.5;
		const double r = q * q;
		x = (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
		    (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
	} else {
		const double q = std::sqrt(-2.0 * std::log(1.0 - p));
		x = -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
		    ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
	}

	// Halley refinement
	const double e = normal_cdf(x) - p;
	const double u = e * std::sqrt(2.0 * kPi) * std::exp(0.5 * x * x);
	x = x - u / (1.0 + 0.5 * x * u);
	return x;
}

// ============================================================================
// Student's t distribution
// ============================================================================

/**
 * Student's t CDF
 *
 * P(T <= t) = 1 - 0.5 * I_{df/(df+t^2)}(df/2, 1/2) for t > 0
 *
 * @param t t-statistic
 * @param df Degrees of freedom (> 0)
 */
inline double student_t_cdf(double t, double df) {
	if (!(df > 0.0) || std::isnan(t)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (std::isinf(t)) {
		return t > 0.0 ? 1.0 : 0.0;
	}
	const double x = df / (df + t * t);
	const double tail = 0.5 * beta_inc_reg(x, 0.5 * df, 0.5);
	return t > 0.0 ? 1.0 - tail : tail;
}

/// Two-tailed p-value P(|T| >= |t|)
inline double student_t_pvalue(double t, double df) {
	if (!(df > 0.0) || std::isnan(t)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double x = df / (df + t * t);
	return beta_inc_reg(x, 0.5 * df, 0.5);
}

/**
 * Quantile of Student's t: smallest t with P(T <= t) >= p
 *
 * @param p Probability in (0, 1)
 * @param df Degrees of freedom (> 0)
 */
inline double student_t_quantile(double p, double df) {
	if (!(df > 0.0) || !(p > 0.0) || !(p < 1.0)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (p == 0.5) {
		return 0.0;
	}
	if (p < 0.5) {
		return -student_t_quantile(1.0 - p, df);
	}
	return detail::invert_increasing_cdf([df](double t) { return student_t_cdf(t, df); }, p, 0.0, 1.0);
}

/**
 * Two-sided critical value t_{1 - alpha/2, df}
 *
 * @param alpha Two-sided significance level
 * @param df Degrees of freedom
 */
inline double student_t_critical(double alpha, double df) {
	return student_t_quantile(1.0 - 0.5 * alpha, df);
}

// ============================================================================
// Chi-squared distribution
// ============================================================================

/**
 * Chi-squared distribution chi2(df)
 *
 * All members return NaN for df <= 0 or a NaN argument.
 */
struct ChiSquaredCDF {
	/// P(X <= x)
	static double CDF(double x, double df);

	/// P(X > x), accurate in the far right tail
	static double ComplementaryCDF(double x, double df);

	/**
	 * Smallest x with P(X <= x) >= p
	 *
	 * @param p Probability in (0, 1)
	 * @param df Degrees of freedom (> 0)
	 */
	static double Quantile(double p, double df);
};

inline double ChiSquaredCDF::CDF(double x, double df) {
	if (!(df > 0.0) || std::isnan(x)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return gamma_inc_reg(0.5 * df, 0.5 * x);
}

inline double ChiSquaredCDF::ComplementaryCDF(double x, double df) {
	if (!(df > 0.0) || std::isnan(x)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return gamma_inc_reg_upper(0.5 * df, 0.5 * x);
}

inline double ChiSquaredCDF::Quantile(double p, double df) {
	if (!(df > 0.0) || !(p > 0.0) || !(p < 1.0)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return detail::invert_increasing_cdf([df](double x) { return CDF(x, df); }, p, 0.0, std::fmax(1.0, df));
}

} // namespace utils
} // namespace libsamplestat
