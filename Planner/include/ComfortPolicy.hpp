#pragma once
#include <optional>
#include <string>
#include <vector>
#include "PlanIssues.hpp"

enum class OptimizationMode { Economy, Balanced, Comfort };

const char* modeName(OptimizationMode mode);
std::optional<OptimizationMode> parseMode(const std::string& name);

struct ComfortWindow {
    enum class Kind { Daily, Absolute };

    Kind kind = Kind::Daily;

    // Daily: local minute-of-day range [startMinute, endMinute).
    // end < start wraps midnight, end == start covers the whole day.
    int startMinute = 0;
    int endMinute   = 0;

    // Absolute: [start, end) in UTC.
    Timestamp start = 0;
    Timestamp end   = 0;

    double minC     = 19.0;
    double maxC     = 23.0;
    int    priority = 0;
    std::string label;

    bool contains(Timestamp t, int utcOffsetMin) const;
};

// Manual "boost": supersedes everything until it expires.
struct ComfortOverride {
    double      minC    = 21.0;
    double      maxC    = 24.0;
    Timestamp   from    = 0;
    Timestamp   expires = 0;
    std::string label   = "boost";
};

// Setback while away; the schedule resumes preHeatHours before the end.
struct VacationSpec {
    Timestamp start        = 0;
    Timestamp end          = 0;
    double    targetC      = 15.0;
    double    preHeatHours = 4.0;
};

struct ComfortBounds {
    enum class Source { Default, Schedule, Vacation, Override };

    double      minC = 0.0;
    double      maxC = 0.0;
    std::string label;
    Source      source = Source::Default;
};

class ComfortPolicy {
public:
    // Throws std::invalid_argument if the default window is malformed.
    explicit ComfortPolicy(ComfortWindow defaultWindow,
                           int utcOffsetMin = 0,
                           double freezeFloorC = 5.0);

    void addWindow(const ComfortWindow& w);
    const std::vector<ComfortWindow>& windows() const { return windows_; }
    const ComfortWindow& defaultWindow() const { return default_; }

    // Total over all timestamps.
    ComfortBounds boundsAt(Timestamp t) const;

    void setOverride(const ComfortOverride& o);
    void clearOverride();
    // True if an override lapsed at or before now.
    bool expireOverrides(Timestamp now);
    std::optional<ComfortOverride> activeOverride(Timestamp now) const;

    void setVacation(const VacationSpec& v);
    void clearVacation();
    const std::optional<VacationSpec>& vacation() const { return vacation_; }

    void setMode(OptimizationMode m);
    OptimizationMode mode() const { return mode_; }

    double freezeFloorC() const { return freeze_floor_c_; }
    int utcOffsetMin() const { return utc_offset_min_; }

    // Bumped on every change that can alter boundsAt().
    long revision() const { return revision_; }

private:
    ComfortBounds applyMode_(ComfortBounds b) const;
    static void validate_(const ComfortWindow& w);

    ComfortWindow default_;
    std::vector<ComfortWindow> windows_;
    std::optional<ComfortOverride> override_;
    std::optional<VacationSpec> vacation_;
    OptimizationMode mode_ = OptimizationMode::Balanced;
    int    utc_offset_min_;
    double freeze_floor_c_;
    long   revision_ = 0;
};
