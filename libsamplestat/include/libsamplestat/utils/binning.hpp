#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace libsamplestat {
namespace utils {

/**
 * Equal-width histogram over [min, max]
 *
 * Bins are half-open [e_i, e_{i+1}) except the last, which is closed so the
 * maximum is counted. edges has bin_count + 1 entries.
 */
struct EqualWidthBins {
	std::vector<double> edges;
	std::vector<size_t> counts;
	double width = 0.0;

	size_t bin_count() const {
		return counts.size();
	}
};

/**
 * Sturges' rule: ceil(1 + 3.322 * log10(n))
 */
inline size_t SturgesBinCount(size_t n) {
	if (n < 2) {
		return 1;
	}
	return static_cast<size_t>(std::ceil(1.0 + 3.322 * std::log10(static_cast<double>(n))));
}

/**
 * Sturges' rule clamped to [min_bins, max_bins]
 */
inline size_t SturgesBinCount(size_t n, size_t min_bins, size_t max_bins) {
	return std::max(min_bins, std::min(SturgesBinCount(n), max_bins));
}

/**
 * Count sorted observations into k equal-width bins
 *
 * @param sorted Observations in ascending order
 * @param k Number of bins (>= 1)
 * @return Edges and counts; for a zero-width range all values land in bin 0
 */
inline EqualWidthBins BinSorted(const Eigen::VectorXd &sorted, size_t k) {
	EqualWidthBins bins;
	if (k == 0 || sorted.size() == 0) {
		return bins;
	}

	const double lo = sorted[0];
	const double hi = sorted[sorted.size() - 1];
	bins.width = (hi - lo) / static_cast<double>(k);
	bins.edges.resize(k + 1);
	for (size_t i = 0; i < k; i++) {
		bins.edges[i] = lo + static_cast<double>(i) * bins.width;
	}
	bins.edges[k] = hi;
	bins.counts.assign(k, 0);

	for (Eigen::Index j = 0; j < sorted.size(); j++) {
		const double v = sorted[j];
		size_t idx = 0;
		if (bins.width > 0.0) {
			idx = static_cast<size_t>((v - lo) / bins.width);
			if (idx >= k) {
				idx = k - 1;
			}
			// Correct for rounding at the edges
			while (idx > 0 && v < bins.edges[idx]) {
				idx--;
			}
			while (idx < k - 1 && v >= bins.edges[idx + 1]) {
				idx++;
			}
		}
		bins.counts[idx]++;
	}
	return bins;
}

} // namespace utils
} // namespace libsamplestat
