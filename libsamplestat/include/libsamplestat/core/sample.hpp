#pragma once

#include "libsamplestat/core/errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <vector>

namespace libsamplestat {
namespace core {

/**
 * Sample: validated, immutable sequence of measurements
 *
 * Holds the observations in input order together with a sorted copy and the
 * permutation that maps sorted positions back to original indices, so that
 * criteria working on order statistics can report original positions.
 *
 * Invariants:
 * - size() >= kMinSize
 * - every value is finite
 * - sorted()[k] == values()[sorted_order()[k]]
 */
class Sample {
public:
	/// Smallest sample the engine will analyze
	static constexpr size_t kMinSize = 5;

	/**
	 * Build a sample from raw values
	 *
	 * @param values Observations in input order
	 * @throws InvalidInputError if fewer than kMinSize values or any value is NaN/Inf
	 */
	explicit Sample(const std::vector<double> &values) : Sample(ToEigen(values)) {}

	explicit Sample(const Eigen::VectorXd &values) : values_(values) {
		Validate();
		BuildSortedView();
	}

	/// Number of observations
	size_t size() const {
		return static_cast<size_t>(values_.size());
	}

	/// Observations in input order
	const Eigen::VectorXd &values() const {
		return values_;
	}

	/// Observations in ascending order
	const Eigen::VectorXd &sorted() const {
		return sorted_;
	}

	/// Original index of the k-th smallest observation
	const std::vector<size_t> &sorted_order() const {
		return sorted_order_;
	}

	double operator[](size_t i) const {
		return values_[static_cast<Eigen::Index>(i)];
	}

	double min() const {
		return sorted_[0];
	}

	double max() const {
		return sorted_[sorted_.size() - 1];
	}

	/// Copy of the observations as a std::vector (for serialization)
	std::vector<double> ToVector() const {
		return std::vector<double>(values_.data(), values_.data() + values_.size());
	}

private:
	static Eigen::VectorXd ToEigen(const std::vector<double> &values) {
		Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
		for (size_t i = 0; i < values.size(); i++) {
			v[static_cast<Eigen::Index>(i)] = values[i];
		}
		return v;
	}

	void Validate() const {
		if (values_.size() < static_cast<Eigen::Index>(kMinSize)) {
			throw InvalidInputError("Sample needs at least " + std::to_string(kMinSize) + " values (got " +
			                        std::to_string(values_.size()) + ")");
		}
		for (Eigen::Index i = 0; i < values_.size(); i++) {
			if (!std::isfinite(values_[i])) {
				throw InvalidInputError("Sample value at index " + std::to_string(i) + " is not finite");
			}
		}
	}

	void BuildSortedView() {
		const size_t n = size();
		sorted_order_.resize(n);
		std::iota(sorted_order_.begin(), sorted_order_.end(), size_t(0));
		// Stable so ties keep input order
		std::stable_sort(sorted_order_.begin(), sorted_order_.end(), [this](size_t a, size_t b) {
			return values_[static_cast<Eigen::Index>(a)] < values_[static_cast<Eigen::Index>(b)];
		});

		sorted_.resize(values_.size());
		for (size_t k = 0; k < n; k++) {
			sorted_[static_cast<Eigen::Index>(k)] = values_[static_cast<Eigen::Index>(sorted_order_[k])];
		}
	}

	Eigen::VectorXd values_;
	Eigen::VectorXd sorted_;
	std::vector<size_t> sorted_order_;
};

} // namespace core
} // namespace libsamplestat
