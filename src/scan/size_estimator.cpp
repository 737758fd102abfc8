#include "size_estimator.hpp"
#include <fmt/format.h>
#include <limits>
#include <vector>

static uint64_t saturating_add(uint64_t a, uint64_t b) {
    uint64_t max = std::numeric_limits<uint64_t>::max();
    return (max - a < b) ? max : a + b;
}

Result<uint64_t> size_of(const fs::path& path, WarningSink& warnings,
                         const std::atomic<bool>* cancel) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec) {
        return Result<uint64_t>::Err(fmt::format("cannot stat: {}", ec.message()));
    }
    if (fs::is_symlink(status)) {
        return Result<uint64_t>::Ok(0);
    }
    if (fs::is_regular_file(status)) {
        uint64_t size = fs::file_size(path, ec);
        if (ec) {
            return Result<uint64_t>::Err(fmt::format("cannot size: {}", ec.message()));
        }
        return Result<uint64_t>::Ok(size);
    }
    if (!fs::is_directory(status)) {
        return Result<uint64_t>::Ok(0);
    }

    // Explicit stack of pending directories; only the running total is kept
    uint64_t total = 0;
    std::vector<fs::path> pending{path};

    while (!pending.empty()) {
        if (cancel && cancel->load()) break;

        fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code dir_ec;
        fs::directory_iterator it(dir, dir_ec);
        fs::directory_iterator end;
        for (; !dir_ec && it != end; it.increment(dir_ec)) {
            std::error_code entry_ec;
            auto entry_status = it->symlink_status(entry_ec);
            if (entry_ec) {
                warnings.warn(it->path(), "cannot stat entry", entry_ec);
                continue;
            }
            if (fs::is_symlink(entry_status)) {
                continue;
            }
            if (fs::is_directory(entry_status)) {
                pending.push_back(it->path());
            } else if (fs::is_regular_file(entry_status)) {
                uint64_t size = it->file_size(entry_ec);
                if (entry_ec) {
                    warnings.warn(it->path(), "cannot size file", entry_ec);
                    continue;
                }
                total = saturating_add(total, size);
            }
        }
        if (dir_ec) {
            warnings.warn(dir, "cannot read directory", dir_ec);
        }
    }

    return Result<uint64_t>::Ok(total);
}
