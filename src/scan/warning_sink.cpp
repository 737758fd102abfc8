#include "warning_sink.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

void WarningSink::warn(const fs::path& path, const std::string& message) {
    devstrip_log(fmt::format("warning: {}: {}", path.string(), message));
    std::lock_guard<std::mutex> lock(mutex_);
    warnings_.push_back({path, message});
}

void WarningSink::warn(const fs::path& path, const std::string& action,
                       const std::error_code& ec) {
    warn(path, fmt::format("{}: {}", action, ec.message()));
}

std::vector<ScanWarning> WarningSink::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ScanWarning> out;
    out.swap(warnings_);
    return out;
}

size_t WarningSink::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_.size();
}
