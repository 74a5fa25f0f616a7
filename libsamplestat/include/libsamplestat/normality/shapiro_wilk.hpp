#pragma once

#include "libsamplestat/utils/distributions.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace libsamplestat {
namespace normality {

/**
 * Shapiro-Wilk W statistic and p-value
 */
struct ShapiroWilkResult {
	double w = std::numeric_limits<double>::quiet_NaN();
	double p_value = std::numeric_limits<double>::quiet_NaN();
	bool valid = false;
};

/**
 * Shapiro-Wilk test, Royston (1995) algorithm AS R94
 *
 * Coefficients a_i come from the normal order-statistic approximations
 * m_i = Phi^-1((i - 0.375) / (n + 0.25)) with polynomial corrections for the
 * two outermost weights. The p-value uses Royston's normalizing transform of
 * log(1 - W): a gamma-adjusted form for n <= 11 and a log(n) polynomial fit
 * above. n == 3 has an exact distribution.
 *
 * Valid for kMinN <= n <= kMaxN.
 */
class ShapiroWilk {
public:
	static constexpr size_t kMinN = 3;
	static constexpr size_t kMaxN = 5000;

	/**
	 * Antisymmetric weights a_1..a_{n/2} (a_1 applies to the extreme pair)
	 *
	 * @param n Sample size in [kMinN, kMaxN]
	 */
	static std::vector<double> Coefficients(size_t n);

	/**
	 * Compute W and its p-value
	 *
	 * @param sorted Observations in ascending order
	 * @return Result; valid == false when n is out of range or the data has no spread
	 */
	static ShapiroWilkResult Test(const Eigen::VectorXd &sorted);

private:
	/// c[0] + c[1]*x + ... + c[k]*x^k
	static double Poly(const double *c, int count, double x);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double ShapiroWilk::Poly(const double *c, int count, double x) {
	double result = c[0];
	if (count > 1) {
		double p = x * c[count - 1];
		for (int j = count - 2; j > 0; j--) {
			p = (p + c[j]) * x;
		}
		result += p;
	}
	return result;
}

inline std::vector<double> ShapiroWilk::Coefficients(size_t n) {
	static const double c1[] = {0.0, 0.221157, -0.147981, -2.07119, 4.434685, -2.706056};
	static const double c2[] = {0.0, 0.042981, -0.293762, -1.752461, 5.682633, -3.582633};

	const size_t half = n / 2;
	std::vector<double> a(half, 0.0);
	if (n == 3) {
		a[0] = std::sqrt(0.5);
		return a;
	}

	const auto nd = static_cast<double>(n);
	double summ2 = 0.0;
	for (size_t i = 0; i < half; i++) {
		a[i] = utils::normal_quantile((static_cast<double>(i + 1) - 0.375) / (nd + 0.25));
		summ2 += a[i] * a[i];
	}
	summ2 *= 2.0;
	const double ssumm2 = std::sqrt(summ2);
	const double rsn = 1.0 / std::sqrt(nd);
	const double a1 = Poly(c1, 6, rsn) - a[0] / ssumm2;

	// Outer weights come from the polynomial fits, the rest are rescaled m_i
	size_t first_scaled;
	double fac;
	if (n > 5) {
		first_scaled = 2;
		const double a2 = -a[1] / ssumm2 + Poly(c2, 6, rsn);
		fac = std::sqrt((summ2 - 2.0 * a[0] * a[0] - 2.0 * a[1] * a[1]) / (1.0 - 2.0 * a1 * a1 - 2.0 * a2 * a2));
		a[1] = a2;
	} else {
		first_scaled = 1;
		fac = std::sqrt((summ2 - 2.0 * a[0] * a[0]) / (1.0 - 2.0 * a1 * a1));
	}
	a[0] = a1;
	for (size_t i = first_scaled; i < half; i++) {
		a[i] /= -fac;
	}
	return a;
}

inline ShapiroWilkResult ShapiroWilk::Test(const Eigen::VectorXd &sorted) {
	static const double c3[] = {0.544, -0.39978, 0.025054, -6.714e-4};
	static const double c4[] = {1.3822, -0.77857, 0.062767, -0.0020322};
	static const double c5[] = {-1.5861, -0.31082, -0.083751, 0.0038915};
	static const double c6[] = {-0.4803, -0.082676, 0.0030302};
	static const double g[] = {-2.273, 0.459};

	ShapiroWilkResult result;
	const auto n = static_cast<size_t>(sorted.size());
	if (n < kMinN || n > kMaxN) {
		return result;
	}

	const double mean = sorted.mean();
	const double ss = (sorted.array() - mean).square().sum();
	if (!(ss > 0.0)) {
		return result;
	}

	const std::vector<double> a = Coefficients(n);
	double numerator = 0.0;
	for (size_t i = 0; i < a.size(); i++) {
		const auto lo = static_cast<Eigen::Index>(i);
		const auto hi = static_cast<Eigen::Index>(n - 1 - i);
		numerator += a[i] * (sorted[hi] - sorted[lo]);
	}
	// Rounding can push W marginally above 1
	const double w = std::fmin(1.0, numerator * numerator / ss);
	result.w = w;
	result.valid = true;

	if (n == 3) {
		const double pi6 = 1.90985931710274;  // 6 / pi
		const double stqr = 1.04719755119660; // asin(sqrt(3/4))
		result.p_value = std::fmax(0.0, pi6 * (std::asin(std::sqrt(w)) - stqr));
		return result;
	}

	const auto nd = static_cast<double>(n);
	const double w1 = 1.0 - w;
	if (w1 <= 0.0) {
		result.p_value = 1.0;
		return result;
	}

	double y = std::log(w1);
	double m;
	double s;
	if (n <= 11) {
		const double gamma = Poly(g, 2, nd);
		if (y >= gamma) {
			result.p_value = 1e-99;
			return result;
		}
		y = -std::log(gamma - y);
		m = Poly(c3, 4, nd);
		s = std::exp(Poly(c4, 4, nd));
	} else {
		const double xx = std::log(nd);
		m = Poly(c5, 4, xx);
		s = std::exp(Poly(c6, 3, xx));
	}
	result.p_value = 1.0 - utils::normal_cdf((y - m) / s);
	return result;
}

} // namespace normality
} // namespace libsamplestat
