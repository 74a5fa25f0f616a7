#pragma once

#include <cmath>
#include <cstddef>

namespace libsamplestat {
namespace core {

/**
 * Fixed critical values used by the table-driven criteria
 *
 * These are the values of the classical hand-calculation procedure at
 * alpha = 0.05. They are approximations with limited accuracy outside the
 * sample sizes they were tabulated for and are reproduced as-is.
 */
namespace critical_values {

/// Smirnov D critical value step table at alpha = 0.05
struct SmirnovTableEntry {
	size_t max_n;
	double critical;
};

constexpr SmirnovTableEntry kSmirnovTable[] = {
    {20, 0.294},
    {30, 0.242},
    {40, 0.210},
};

/// Large-sample Smirnov coefficient: D_crit = 1.36 / sqrt(n)
constexpr double kSmirnovAsymptoticCoefficient = 1.36;

/// Irwin lambda critical value, tabulated for n near 50
constexpr double kIrwinCritical = 1.7;

/// Romanovsky skewness-ratio threshold
constexpr double kRomanovskyCritical = 3.0;

/// Smirnov critical value for sample size n
inline double SmirnovCritical(size_t n) {
	for (const auto &entry : kSmirnovTable) {
		if (n <= entry.max_n) {
			return entry.critical;
		}
	}
	return kSmirnovAsymptoticCoefficient / std::sqrt(static_cast<double>(n));
}

} // namespace critical_values

} // namespace core
} // namespace libsamplestat
