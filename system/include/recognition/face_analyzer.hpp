#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

constexpr int UNKNOWN_LABEL = -1;

// One face region with the classifier's tentative answer.
struct Detection {
    cv::Rect box;
    int label = UNKNOWN_LABEL;   // identity id or UNKNOWN_LABEL
    double distance = 0.0;       // >= 0, lower is better
};

// Detector + classifier collaborator. Implementations own their models.
class FaceAnalyzer {
public:
    virtual ~FaceAnalyzer() = default;

    virtual bool is_ready() const = 0;
    virtual std::string not_ready_reason() const { return ""; }

    virtual std::vector<Detection> analyze(const cv::Mat& frame) = 0;
};
