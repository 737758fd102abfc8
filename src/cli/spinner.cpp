#include "spinner.hpp"
#include "report.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <iostream>

Spinner::Spinner(bool animate) : animate_(animate) {}

Spinner::~Spinner() {
    stop();
}

void Spinner::start(const std::string& message) {
    if (running_) return;
    message_ = message;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_ = message;
    }
    running_ = true;

    if (!animate_) {
        std::cout << message << "...\n" << std::flush;
        return;
    }
    thread_ = std::thread(&Spinner::spin_loop, this);
}

void Spinner::update(const std::string& status) {
    if (!animate_) return;
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_ = status;
}

void Spinner::stop() {
    if (!running_) return;
    running_ = false;

    if (!animate_) {
        std::cout << message_ << " done\n" << std::flush;
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    draw(message_ + " done");
    std::cout << "\n" << std::flush;
}

void Spinner::draw(const std::string& text) {
    std::string line = truncate_status(text);
    std::string padding = prev_len_ > line.size() ? std::string(prev_len_ - line.size(), ' ') : "";
    std::cout << "\r" << line << padding << std::flush;
    prev_len_ = line.size();
}

void Spinner::spin_loop() {
    static const char* frames[] = {"|", "/", "-", "\\"};
    size_t frame = 0;
    while (running_) {
        std::string status;
        {
            std::lock_guard<std::mutex> lock(status_mutex_);
            status = status_;
        }
        draw(std::string(frames[frame++ % 4]) + " " + status);
        platform::sleep_ms(SPINNER_FRAME_MS);
    }
}
