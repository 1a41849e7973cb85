// ============= src/recognition/temporal_stabilizer.cpp =============
#include "recognition/temporal_stabilizer.hpp"
#include <algorithm>
#include <numeric>

TemporalStabilizer::TemporalStabilizer(int stable_frames, int stable_window,
                                       std::set<int> known_labels)
    : stable_frames(std::max(1, stable_frames)),
      window(static_cast<size_t>(std::max(1, stable_window))),
      known(std::move(known_labels))
{
}

void TemporalStabilizer::observe(int label, double distance) {
    if (!is_known(label)) return;

    labels.push_back(label);
    if (labels.size() > window) labels.pop_front();

    auto& ring = distances[label];
    ring.push_back(distance);
    if (ring.size() > window) ring.pop_front();
}

StableDecision TemporalStabilizer::decide(int raw_label, double raw_distance) const {
    StableDecision raw{raw_label, raw_distance, false};

    if (stable_frames <= 1 || labels.size() < static_cast<size_t>(stable_frames)) {
        return raw;
    }

    std::map<int, int> counts;
    for (int l : labels) counts[l]++;

    int max_count = 0;
    for (const auto& kv : counts) max_count = std::max(max_count, kv.second);

    if (max_count < stable_frames) return raw;

    // Newest occurrence wins among equally frequent labels.
    int candidate = labels.back();
    for (auto it = labels.rbegin(); it != labels.rend(); ++it) {
        if (counts[*it] == max_count) {
            candidate = *it;
            break;
        }
    }

    auto found = distances.find(candidate);
    if (found == distances.end() || found->second.empty()) return raw;

    const auto& ring = found->second;
    double mean = std::accumulate(ring.begin(), ring.end(), 0.0) / ring.size();
    return {candidate, mean, true};
}

void TemporalStabilizer::reset() {
    labels.clear();
    distances.clear();
}

std::deque<double> TemporalStabilizer::distances_for(int label) const {
    auto it = distances.find(label);
    return it != distances.end() ? it->second : std::deque<double>{};
}
