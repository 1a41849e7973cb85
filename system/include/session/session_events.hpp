#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>

using StatusCallback = std::function<void(const std::string& message)>;
using LogCallback = std::function<void(const std::string& name, const std::string& time_str)>;

struct SessionEvent {
    enum class Type { Status, Log };

    Type type;
    std::string message;    // Status
    std::string name;       // Log
    std::string time_str;   // Log
};

// Hands session notifications from the session thread to an observer thread.
class SessionEventQueue {
private:
    std::queue<SessionEvent> queue;
    std::mutex mutex;
    std::condition_variable cv;

public:
    void push(SessionEvent event) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            queue.push(std::move(event));
        }
        cv.notify_one();
    }

    bool pop(SessionEvent& event, int timeout_ms = 100) {
        std::unique_lock<std::mutex> lock(mutex);
        if (cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return !queue.empty(); })) {
            event = std::move(queue.front());
            queue.pop();
            return true;
        }
        return false;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex);
        return queue.size();
    }

    StatusCallback status_callback() {
        return [this](const std::string& message) {
            push({SessionEvent::Type::Status, message, "", ""});
        };
    }

    LogCallback log_callback() {
        return [this](const std::string& name, const std::string& time_str) {
            push({SessionEvent::Type::Log, "", name, time_str});
        };
    }
};
