#include "report.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <set>
#include <sstream>

std::string humanize_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB", "EB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return fmt::format("{} B", bytes);
    }
    std::string number = fmt::format("{:.1f}", value);
    if (StringUtils::ends_with(number, ".0")) {
        number.resize(number.size() - 2);
    }
    return number + " " + units[unit];
}

// Byte offsets of each UTF-8 code point in `text`.
static std::vector<size_t> code_point_offsets(const std::string& text) {
    std::vector<size_t> offsets;
    for (size_t i = 0; i < text.size(); ++i) {
        auto byte = static_cast<unsigned char>(text[i]);
        if ((byte & 0xC0) != 0x80) offsets.push_back(i);
    }
    return offsets;
}

std::string truncate_middle(const std::string& text, size_t max_len) {
    if (max_len == 0) {
        return "";
    }
    auto offsets = code_point_offsets(text);
    size_t chars = offsets.size();
    if (chars <= max_len) {
        return text;
    }
    if (max_len == 1) {
        return "\xe2\x80\xa6";
    }
    size_t head = (max_len - 1) / 2;
    size_t tail = max_len - 1 - head;
    return text.substr(0, offsets[head]) + "\xe2\x80\xa6" + text.substr(offsets[chars - tail]);
}

std::string truncate_status(const std::string& text) {
    auto offsets = code_point_offsets(text);
    size_t limit = static_cast<size_t>(STATUS_TRUNCATE_CHARS);
    if (offsets.size() <= limit) {
        return text;
    }
    return text.substr(0, offsets[limit - 3]) + "...";
}

std::string render_progress_bar(size_t position, size_t total, size_t width) {
    if (total == 0 || width == 0) {
        return "";
    }
    size_t filled = std::min(width, (position * width + total - 1) / total);
    return std::string(filled, '#') + std::string(width - filled, '-');
}

std::string colorize_size(uint64_t bytes, const std::string& text) {
    if (bytes >= TIB) return theme::cyan(text);
    if (bytes >= GIB) return theme::yellow(text);
    if (bytes >= MIB) return theme::blue(text);
    if (bytes >= KIB) return theme::green(text);
    return theme::dim(text);
}

// Pad by code points so UTF-8 text lines up.
static std::string pad_right(const std::string& text, size_t width) {
    size_t chars = code_point_offsets(text).size();
    return chars >= width ? text : text + std::string(width - chars, ' ');
}

static std::string pad_left(const std::string& text, size_t width) {
    size_t chars = code_point_offsets(text).size();
    return chars >= width ? text : std::string(width - chars, ' ') + text;
}

std::string format_plan_report(const Plan& plan) {
    std::ostringstream out;

    size_t index_width = std::max<size_t>(2, std::to_string(plan.size()).size());
    size_t category_width = 8;
    size_t size_width = 4;
    for (const auto& c : plan.items()) {
        category_width = std::max(category_width, std::string(category_group(c.category)).size());
        size_width = std::max(size_width, humanize_bytes(c.bytes()).size());
    }
    size_t last_used_width = static_cast<size_t>(LAST_USED_COLUMN_WIDTH);
    size_t reason_width = static_cast<size_t>(REASON_COLUMN_WIDTH);

    out << "  "
        << theme::bold(pad_right("#", index_width + 2)) << " "
        << theme::bold(pad_right("Category", category_width)) << " "
        << theme::bold(pad_left("Size", size_width)) << " "
        << theme::bold(pad_right("Last Used", last_used_width)) << " "
        << theme::bold(pad_right("Reason", reason_width)) << "    "
        << theme::bold("Path") << "\n";

    for (size_t i = 0; i < plan.size(); ++i) {
        const auto& c = plan[i];
        std::string label = fmt::format("[{:0{}}]", i + 1, index_width);
        out << "  "
            << theme::dim(label) << " "
            << theme::cyan(pad_right(category_group(c.category), category_width)) << " "
            << colorize_size(c.bytes(), pad_left(humanize_bytes(c.bytes()), size_width)) << " "
            << theme::dim(pad_right(format_system_time(c.mtime), last_used_width)) << " "
            << theme::dim(pad_right(truncate_middle(c.reason, reason_width), reason_width))
            << " -> " << c.path.string() << "\n";
    }

    out << "\n" << theme::kv("Reclaimable", theme::bold(humanize_bytes(plan.total_bytes())));
    out << theme::kv("Items", std::to_string(plan.size()));
    return out.str();
}

std::string format_kept(const std::vector<Candidate>& kept, TimePoint now) {
    std::ostringstream out;
    for (const auto& c : kept) {
        out << theme::log(fmt::format("Keeping newest {} ({} old): {}",
                                      category_label(c.category),
                                      format_age(c.mtime, now), c.path.string()));
    }
    return out.str();
}

std::string format_skipped_recent(const std::vector<Candidate>& recent,
                                  std::chrono::seconds min_age) {
    if (recent.empty()) {
        return "";
    }
    long long window_days = min_age.count() / SECONDS_PER_DAY;
    return theme::log(fmt::format("Skipped {} recent item(s) modified within the last {} day(s).",
                                  recent.size(), window_days));
}

std::string format_warnings(const std::vector<ScanWarning>& warnings) {
    if (warnings.empty()) {
        return "";
    }
    std::ostringstream out;
    out << theme::section(fmt::format("Warnings ({})", warnings.size()));
    for (const auto& w : warnings) {
        out << theme::warn(fmt::format("{}: {}", w.path.string(), w.message));
    }
    return out.str();
}

std::string format_deletion_summary(const DeletionReport& report) {
    std::ostringstream out;
    out << theme::ok(fmt::format("Removed {} item(s); reclaimed approximately {}.",
                                 report.succeeded(), humanize_bytes(report.bytes_freed)));
    if (report.has_failures()) {
        out << theme::fail("Failed to remove the following targets:");
        for (const auto& o : report.outcomes) {
            if (o.success) continue;
            std::string reason = o.error.empty() ? "unknown error" : o.error;
            out << theme::step(fmt::format("{}: {}", o.candidate.path.string(), reason));
        }
    }
    return out.str();
}

// Parse "N" or "A-B" (one-based) into zero-based indices.
static bool parse_range(const std::string& token, size_t count, std::set<size_t>& out) {
    auto dash = token.find('-');
    std::string first = StringUtils::trim(token.substr(0, dash));
    std::string last = dash == std::string::npos ? first : StringUtils::trim(token.substr(dash + 1));

    auto lo = parse_non_negative(first, "item", static_cast<long long>(count));
    auto hi = parse_non_negative(last, "item", static_cast<long long>(count));
    if (lo.is_err() || hi.is_err() || lo.value == 0 || hi.value < lo.value) {
        return false;
    }
    for (long long i = lo.value; i <= hi.value; ++i) {
        out.insert(static_cast<size_t>(i - 1));
    }
    return true;
}

std::optional<Selection> parse_selection(const std::string& input, size_t count) {
    std::string answer = StringUtils::to_lower(StringUtils::trim(input));

    if (answer == "yes" || answer == "all") {
        return Selection{true, {}};
    }
    if (answer.empty() || answer == "n" || answer == "no") {
        return Selection{false, {}};
    }

    std::set<size_t> chosen;
    for (const auto& raw : StringUtils::split(answer, ',')) {
        std::string token = StringUtils::trim(raw);
        if (token.empty()) continue;
        if (!parse_range(token, count, chosen)) {
            return std::nullopt;
        }
    }
    if (chosen.empty()) {
        return std::nullopt;
    }
    return Selection{true, std::vector<size_t>(chosen.begin(), chosen.end())};
}
