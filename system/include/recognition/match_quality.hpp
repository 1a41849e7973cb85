#pragma once

// Maps a classifier distance (lower is better) to a 0-100 display value,
// calibrated on the decision threshold:
//   distance = 0         -> 100
//   distance = threshold -> 50
// Non-positive threshold falls back to 100. Negative or non-finite distance -> 0.
double match_quality(double distance, double threshold);
