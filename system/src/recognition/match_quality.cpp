// ============= src/recognition/match_quality.cpp =============
#include "recognition/match_quality.hpp"
#include "config.hpp"
#include <algorithm>
#include <cmath>

double match_quality(double distance, double threshold) {
    if (!std::isfinite(threshold) || threshold <= 0.0) {
        threshold = Config::FALLBACK_QUALITY_THRESHOLD;
    }
    if (!std::isfinite(distance) || distance < 0.0) {
        return 0.0;
    }

    // exp(-ln2 * d/t) is 0.5 at d == t
    double quality = 100.0 * std::exp(-std::log(2.0) * (distance / threshold));
    return std::clamp(quality, 0.0, 100.0);
}
