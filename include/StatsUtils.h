#pragma once

#include <vector>

namespace StatsUtils {
double runningMean(const std::vector<double>& values);

// Linear interpolation between closest ranks (Hyndman-Fan type 7).
// sorted must be ascending and non-empty.
double percentileSorted(const std::vector<double>& sorted, double q);
}
