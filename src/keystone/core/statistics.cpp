#include "statistics.hpp"

#include <cmath>
#include <numeric>

namespace keystone::core {

SampleStats describe(const std::vector<double>& values) {
	SampleStats stats{};
	if (values.empty()) {
		return stats;
	}

	const auto n = static_cast<double>(values.size());
	stats.mean   = std::accumulate(values.begin(), values.end(), 0.0) / n;

	double sumSq = 0.0;
	for (double v: values) {
		const double d = v - stats.mean;
		sumSq += d * d;
	}
	stats.stddev = std::sqrt(sumSq / n); // population, not sample
	return stats;
}

} // namespace keystone::core
