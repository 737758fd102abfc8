#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

// Single-line status spinner. On a terminal a background thread redraws
// "<frame> <status>" every SPINNER_FRAME_MS; otherwise start() and stop()
// print plain lines and status updates are dropped.
class Spinner {
public:
    explicit Spinner(bool animate);
    ~Spinner();

    Spinner(const Spinner&) = delete;
    Spinner& operator=(const Spinner&) = delete;

    void start(const std::string& message);

    // Replace the status text. Safe from any thread.
    void update(const std::string& status);

    // Stop animating and leave "<status> done" on the line.
    void stop();

private:
    void spin_loop();
    void draw(const std::string& text);

    bool animate_;
    std::string message_;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex status_mutex_;
    std::string status_;
    size_t prev_len_ = 0;
};
