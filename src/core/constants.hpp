#pragma once

#include <cstdint>

constexpr const char* DEVSTRIP_VERSION = "0.4.0";

// ── Scan defaults ───────────────────────────────────────────
constexpr int DEFAULT_MIN_AGE_DAYS        = 2;
constexpr int DEFAULT_MAX_DEPTH           = 5;
constexpr int DEFAULT_KEEP_LATEST_DERIVED = 1;
constexpr int DEFAULT_KEEP_LATEST_CACHE   = 1;

// Location anchors are listed once so their children are classified
constexpr int LOCATION_ANCHOR_DEPTH       = 0;

// ── Limits ──────────────────────────────────────────────────
constexpr int64_t SECONDS_PER_DAY         = 86400;
constexpr int64_t MAX_MIN_AGE_DAYS        = 36500;   // 100 years
constexpr int MAX_JOBS                    = 256;

// Directories under $HOME scanned by default when they exist
constexpr const char* DEFAULT_HOME_PROJECT_DIRS[] = {
    "Projects", "workspace", "Work", "Developer",
};

// ── Report layout ───────────────────────────────────────────
constexpr int STATUS_TRUNCATE_CHARS       = 80;
constexpr int REASON_COLUMN_WIDTH         = 48;
constexpr int LAST_USED_COLUMN_WIDTH      = 16;
constexpr int PROGRESS_BAR_WIDTH          = 28;
constexpr int SPINNER_FRAME_MS            = 100;

// ── Size color thresholds ───────────────────────────────────
constexpr uint64_t KIB = 1ULL << 10;
constexpr uint64_t MIB = 1ULL << 20;
constexpr uint64_t GIB = 1ULL << 30;
constexpr uint64_t TIB = 1ULL << 40;

// ── Paths ───────────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME   = ".devstrip";
constexpr const char* CONFIG_FILE_NAME  = "config.yaml";
constexpr const char* DEBUG_LOG_NAME    = "devstrip_debug.log";
