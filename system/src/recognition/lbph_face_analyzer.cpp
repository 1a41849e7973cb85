// ============= src/recognition/lbph_face_analyzer.cpp =============
#include "recognition/lbph_face_analyzer.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>

LbphFaceAnalyzer::LbphFaceAnalyzer(const Options& opt) : opt(opt)
{
    if (!std::filesystem::exists(opt.model_path)) {
        reason = "Trained model not found (" + opt.model_path + "). Enroll, then train, then retry.";
        spdlog::error("{}", reason);
        return;
    }
    if (!std::filesystem::exists(opt.cascade_path)) {
        reason = "Face cascade not found (" + opt.cascade_path + ").";
        spdlog::error("{}", reason);
        return;
    }

    try {
        if (!cascade.load(opt.cascade_path)) {
            reason = "Cannot load face cascade " + opt.cascade_path;
            spdlog::error("{}", reason);
            return;
        }

        recognizer = cv::face::LBPHFaceRecognizer::create(2, 8, 8, 8);
        recognizer->read(opt.model_path);
        ready = true;
    } catch (const cv::Exception& e) {
        reason = std::string("Cannot read LBPH model: ") + e.what();
        spdlog::error("{}", reason);
        return;
    }

    spdlog::info("LBPH analyzer ready");
    spdlog::info("   Model: {}", opt.model_path);
    spdlog::info("   Cascade: {}", opt.cascade_path);
}

std::vector<Detection> LbphFaceAnalyzer::analyze(const cv::Mat& frame) {
    std::vector<Detection> out;
    if (!ready || frame.empty()) return out;

    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = frame;
    }

    std::vector<cv::Rect> faces;
    cascade.detectMultiScale(gray, faces, opt.scale_factor, opt.min_neighbors, 0,
                             cv::Size(opt.min_face, opt.min_face));

    for (const auto& rect : faces) {
        cv::Rect safe = rect & cv::Rect(0, 0, gray.cols, gray.rows);
        if (safe.area() <= 0) continue;

        cv::Mat roi;
        cv::resize(gray(safe), roi, cv::Size(opt.face_size, opt.face_size));

        Detection d;
        d.box = safe;
        try {
            int label = UNKNOWN_LABEL;
            double distance = 0.0;
            recognizer->predict(roi, label, distance);
            d.label = label;
            d.distance = distance;
        } catch (const cv::Exception& e) {
            spdlog::warn("LBPH predict failed: {}", e.what());
            continue;
        }
        out.push_back(d);
    }

    return out;
}
