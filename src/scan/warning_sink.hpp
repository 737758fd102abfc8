#pragma once

#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>

// Collects recoverable I/O problems from the walker and the size workers.
// Every warning is also written to the debug log.
class WarningSink {
public:
    void warn(const fs::path& path, const std::string& message);

    // Convenience for std::error_code failures.
    void warn(const fs::path& path, const std::string& action, const std::error_code& ec);

    std::vector<ScanWarning> drain();
    size_t count() const;

private:
    std::vector<ScanWarning> warnings_;
    mutable std::mutex mutex_;
};
