// ============= include/recognition/temporal_stabilizer.hpp =============
/*
 * Temporal Stabilizer - per-session label smoothing
 *
 * Single-frame LBPH output jitters with pose and lighting. The stabilizer
 * keeps the last `stable_window` recognized labels and, per label, the last
 * `stable_window` distances. A label is trusted once it appears at least
 * `stable_frames` times in the window; its distance is then the mean of its
 * own distance window only.
 *
 * TIE-BREAK:
 * - When several labels share the maximum count, the one whose latest
 *   occurrence is newest wins (window scanned newest -> oldest).
 *
 * Not thread-safe: owned by one session loop.
 */

#pragma once
#include <deque>
#include <map>
#include <set>
#include <cstddef>
#include <utility>

struct StableDecision {
    int label;
    double distance;
    bool stable;      // true when produced by quorum, false on raw fallback
};

class TemporalStabilizer {
public:
    TemporalStabilizer(int stable_frames, int stable_window,
                       std::set<int> known_labels = {});

    // Recognized labels only; others are ignored.
    void observe(int label, double distance);

    StableDecision decide(int raw_label, double raw_distance) const;

    void reset();

    void set_known_labels(std::set<int> labels) { known = std::move(labels); }
    bool is_known(int label) const { return known.count(label) > 0; }

    size_t window_size() const { return labels.size(); }
    size_t capacity() const { return window; }
    int quorum() const { return stable_frames; }

    // Distances currently retained for `label` (oldest first); empty if unseen.
    std::deque<double> distances_for(int label) const;

private:
    int stable_frames;
    size_t window;
    std::set<int> known;

    std::deque<int> labels;
    std::map<int, std::deque<double>> distances;
};
