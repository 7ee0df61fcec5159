#pragma once

#include "Model.hpp"
#include <optional>
#include <string>
#include <vector>

namespace geotrack {

// One "D1-D2 HH:MM-HH:MM" entry. Days are ISO (1 = Monday .. 7 = Sunday).
struct ScheduleWindow {
    int dayStart = 1;
    int dayEnd = 7;
    int startMinute = 0;    // minute of day, inclusive
    int endMinute = 0;      // minute of day, exclusive

    static std::optional<ScheduleWindow> parse(const std::string& entry);
    bool contains(int isoWeekday, int minuteOfDay) const;
};

class Schedule {
public:
    Schedule() = default;
    Schedule(std::vector<ScheduleWindow> windows, bool useUtc);

    /// @throws TrackingError{ConfigInvalid} for an unparseable entry
    static Schedule fromEntries(const std::vector<std::string>& entries, bool useUtc);

    bool empty() const { return windows_.empty(); }
    bool isActive(TimePoint time) const;

    // Next instant after `time` at which isActive() flips, if any window exists.
    std::optional<TimePoint> nextTransition(TimePoint time) const;

    const std::vector<ScheduleWindow>& windows() const { return windows_; }

private:
    struct CalendarPosition {
        int isoWeekday = 1;
        int secondOfDay = 0;
    };

    CalendarPosition locate(TimePoint time) const;

    std::vector<ScheduleWindow> windows_;
    bool useUtc_ = false;
};

} // namespace geotrack
