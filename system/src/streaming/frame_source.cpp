// ============= src/streaming/frame_source.cpp =============
#include "streaming/frame_source.hpp"
#include "config.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>

CameraFrameSource::CameraFrameSource(int camera_index, int width, int height)
    : camera_index(camera_index), width(width), height(height),
      retries(Config::CAMERA_OPEN_RETRIES)
{
}

CameraFrameSource::CameraFrameSource(const std::string& uri)
    : camera_index(-1), uri(uri),
      width(Config::DEFAULT_FRAME_WIDTH), height(Config::DEFAULT_FRAME_HEIGHT),
      retries(Config::CAMERA_OPEN_RETRIES)
{
}

CameraFrameSource::~CameraFrameSource() {
    release();
}

std::string CameraFrameSource::name() const {
    return uri.empty() ? "camera:" + std::to_string(camera_index) : uri;
}

bool CameraFrameSource::open_once() {
    try {
        if (uri.empty()) {
            cap.open(camera_index);
        } else {
            cap.open(uri);
        }
    } catch (const cv::Exception& e) {
        spdlog::error("Exception opening {}: {}", name(), e.what());
        return false;
    }

    if (!cap.isOpened()) return false;

    if (uri.empty()) {
        cap.set(cv::CAP_PROP_FRAME_WIDTH, width);
        cap.set(cv::CAP_PROP_FRAME_HEIGHT, height);
    }
    cap.set(cv::CAP_PROP_BUFFERSIZE, 1);

    // Make sure frames actually arrive before reporting success.
    cv::Mat test_frame;
    for (int i = 0; i < 3; i++) {
        if (cap.read(test_frame) && !test_frame.empty()) {
            spdlog::info("Source {} open - {}x{}", name(), test_frame.cols, test_frame.rows);
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(Config::RETRY_DELAY_MS));
    }

    spdlog::warn("Source {} opened but no frame could be read", name());
    cap.release();
    return false;
}

bool CameraFrameSource::open() {
    if (cap.isOpened()) return true;

    for (int attempt = 0; attempt < retries; attempt++) {
        spdlog::info("Opening {} (attempt {}/{})", name(), attempt + 1, retries);
        if (open_once()) return true;

        if (attempt < retries - 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(Config::RETRY_DELAY_MS * (attempt + 1)));
        }
    }

    spdlog::error("Cannot open {} after {} attempts", name(), retries);
    return false;
}

bool CameraFrameSource::read(cv::Mat& frame) {
    if (!cap.isOpened()) return false;
    return cap.read(frame) && !frame.empty();
}

void CameraFrameSource::release() {
    if (cap.isOpened()) {
        cap.release();
        spdlog::info("Source {} released", name());
    }
}
