// ============= include/recognition/lbph_face_analyzer.hpp =============
/*
 * Haar cascade + LBPH classifier (opencv_face)
 *
 * PIPELINE:
 * - BGR -> gray
 * - detectMultiScale (scale 1.1, 6 neighbors, min 80x80)
 * - crop, resize to 200x200, LBPH predict -> (label, distance)
 *
 * LBPH parameters must match the ones used at training time
 * (radius 2, neighbors 8, grid 8x8).
 */

#pragma once
#include "recognition/face_analyzer.hpp"
#include <opencv2/face.hpp>
#include <opencv2/objdetect.hpp>
#include <string>

class LbphFaceAnalyzer : public FaceAnalyzer {
public:
    struct Options {
        std::string model_path;
        std::string cascade_path;
        int face_size = 200;
        double scale_factor = 1.1;
        int min_neighbors = 6;
        int min_face = 80;
    };

    explicit LbphFaceAnalyzer(const Options& opt);

    bool is_ready() const override { return ready; }
    std::string not_ready_reason() const override { return reason; }

    std::vector<Detection> analyze(const cv::Mat& frame) override;

private:
    Options opt;
    bool ready = false;
    std::string reason;

    cv::CascadeClassifier cascade;
    cv::Ptr<cv::face::LBPHFaceRecognizer> recognizer;
};
