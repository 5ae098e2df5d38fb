#pragma once

#include <vector>

namespace keystone::core {

//! Mean and population standard deviation of a sample.
struct SampleStats {
	double mean{0.0};
	double stddev{0.0};
};

SampleStats describe(const std::vector<double>& values);

} // namespace keystone::core
