#pragma once
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <atomic>
#include <string>

// Frame producer owned exclusively by one session at a time.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool open() = 0;
    // Blocks up to one frame interval. false -> source stopped yielding frames.
    virtual bool read(cv::Mat& frame) = 0;
    virtual void release() = 0;
    virtual bool is_open() const = 0;
    virtual std::string name() const = 0;

    // Exclusive ownership for a session; false if already claimed.
    bool claim() {
        bool expected = false;
        return claimed.compare_exchange_strong(expected, true);
    }
    void unclaim() { claimed = false; }
    bool is_claimed() const { return claimed.load(); }

private:
    std::atomic<bool> claimed{false};
};

// Local camera (by index) or a URL/file via cv::VideoCapture.
class CameraFrameSource : public FrameSource {
public:
    explicit CameraFrameSource(int camera_index,
                               int width = 640, int height = 480);
    explicit CameraFrameSource(const std::string& uri);
    ~CameraFrameSource() override;

    bool open() override;
    bool read(cv::Mat& frame) override;
    void release() override;
    bool is_open() const override { return cap.isOpened(); }
    std::string name() const override;

    void set_retries(int n) { retries = n; }

private:
    int camera_index;
    std::string uri;
    int width;
    int height;
    int retries;
    cv::VideoCapture cap;

    bool open_once();
};
