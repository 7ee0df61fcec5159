#include "Schedule.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <sstream>

namespace geotrack {

namespace {

bool parseRange(const std::string& text, char separator, std::string& first, std::string& second) {
    auto pos = text.find(separator);
    if (pos == std::string::npos || text.find(separator, pos + 1) != std::string::npos) {
        return false;
    }
    first = text.substr(0, pos);
    second = text.substr(pos + 1);
    return !first.empty() && !second.empty();
}

// Fields are a weekday, an hour or a minute: at most two digits.
bool parseInt(const std::string& text, int& value) {
    if (text.empty() || text.size() > 2 || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    value = std::stoi(text);
    return true;
}

std::optional<int> parseClock(const std::string& text) {
    std::string hours, minutes;
    int h = 0, m = 0;
    if (!parseRange(text, ':', hours, minutes) || !parseInt(hours, h) || !parseInt(minutes, m)) {
        return std::nullopt;
    }
    if (m > 59 || h > 24 || (h == 24 && m != 0)) {
        return std::nullopt;
    }
    return h * 60 + m;
}

} // namespace

std::optional<ScheduleWindow> ScheduleWindow::parse(const std::string& entry) {
    std::istringstream stream(entry);
    std::string days, times, extra;
    if (!(stream >> days >> times) || (stream >> extra)) {
        return std::nullopt;
    }

    std::string d1, d2, t1, t2;
    if (!parseRange(days, '-', d1, d2) || !parseRange(times, '-', t1, t2)) {
        return std::nullopt;
    }

    ScheduleWindow window;
    if (!parseInt(d1, window.dayStart) || !parseInt(d2, window.dayEnd)) {
        return std::nullopt;
    }
    if (window.dayStart < 1 || window.dayEnd > 7 || window.dayStart > window.dayEnd) {
        return std::nullopt;
    }

    auto start = parseClock(t1);
    auto end = parseClock(t2);
    if (!start || !end || *start >= *end) {
        return std::nullopt;
    }
    window.startMinute = *start;
    window.endMinute = *end;
    return window;
}

bool ScheduleWindow::contains(int isoWeekday, int minuteOfDay) const {
    return isoWeekday >= dayStart && isoWeekday <= dayEnd &&
           minuteOfDay >= startMinute && minuteOfDay < endMinute;
}

Schedule::Schedule(std::vector<ScheduleWindow> windows, bool useUtc)
    : windows_(std::move(windows)), useUtc_(useUtc) {
}

Schedule Schedule::fromEntries(const std::vector<std::string>& entries, bool useUtc) {
    std::vector<ScheduleWindow> windows;
    for (const auto& entry : entries) {
        auto window = ScheduleWindow::parse(entry);
        if (!window) {
            throw TrackingError(ErrorKind::ConfigInvalid, "schedule entry '" + entry + "' is not 'D1-D2 HH:MM-HH:MM'");
        }
        windows.push_back(*window);
    }
    return Schedule(std::move(windows), useUtc);
}

Schedule::CalendarPosition Schedule::locate(TimePoint time) const {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm tm_buf{};
#ifdef _WIN32
    if (useUtc_) {
        gmtime_s(&tm_buf, &time_t);
    } else {
        localtime_s(&tm_buf, &time_t);
    }
#else
    if (useUtc_) {
        gmtime_r(&time_t, &tm_buf);
    } else {
        localtime_r(&time_t, &tm_buf);
    }
#endif
    CalendarPosition position;
    position.isoWeekday = tm_buf.tm_wday == 0 ? 7 : tm_buf.tm_wday;
    position.secondOfDay = tm_buf.tm_hour * 3600 + tm_buf.tm_min * 60 + tm_buf.tm_sec;
    return position;
}

bool Schedule::isActive(TimePoint time) const {
    auto position = locate(time);
    int minuteOfDay = position.secondOfDay / 60;
    return std::any_of(windows_.begin(), windows_.end(), [&](const ScheduleWindow& window) {
        return window.contains(position.isoWeekday, minuteOfDay);
    });
}

std::optional<TimePoint> Schedule::nextTransition(TimePoint time) const {
    if (windows_.empty()) {
        return std::nullopt;
    }

    // Edges are evaluated on whole-second day offsets; DST shifts inside the
    // week are not compensated.
    auto position = locate(time);
    auto wholeSeconds = std::chrono::time_point_cast<std::chrono::seconds>(time);
    if (wholeSeconds > time) {
        wholeSeconds -= std::chrono::seconds(1);
    }
    TimePoint midnight = wholeSeconds - std::chrono::seconds(position.secondOfDay);

    bool active = isActive(time);
    std::optional<TimePoint> best;
    for (int dayOffset = 0; dayOffset <= 7; ++dayOffset) {
        int weekday = (position.isoWeekday - 1 + dayOffset) % 7 + 1;
        TimePoint dayBase = midnight + std::chrono::hours(24 * dayOffset);
        for (const auto& window : windows_) {
            if (weekday < window.dayStart || weekday > window.dayEnd) {
                continue;
            }
            for (int minute : {window.startMinute, window.endMinute}) {
                TimePoint edge = dayBase + std::chrono::minutes(minute);
                if (edge <= time || (best && edge >= *best)) {
                    continue;
                }
                if (isActive(edge) != active) {
                    best = edge;
                }
            }
        }
        if (best) {
            break;
        }
    }
    return best;
}

} // namespace geotrack
