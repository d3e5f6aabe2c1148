#include "ComfortPolicy.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
constexpr double kVacationBandC = 2.0;
constexpr double kMinBandC      = 0.2;
}

const char* modeName(OptimizationMode mode) {
    switch (mode) {
        case OptimizationMode::Economy:  return "economy";
        case OptimizationMode::Balanced: return "balanced";
        case OptimizationMode::Comfort:  return "comfort";
    }
    return "balanced";
}

std::optional<OptimizationMode> parseMode(const std::string& name) {
    if (name == "economy")  return OptimizationMode::Economy;
    if (name == "balanced") return OptimizationMode::Balanced;
    if (name == "comfort")  return OptimizationMode::Comfort;
    return std::nullopt;
}

bool ComfortWindow::contains(Timestamp t, int utcOffsetMin) const {
    if (kind == Kind::Absolute) {
        return t >= start && t < end;
    }
    const Timestamp local = t + static_cast<Timestamp>(utcOffsetMin) * 60;
    const int minute = static_cast<int>(((local % 86400) + 86400) % 86400 / 60);
    if (startMinute == endMinute) return true;
    if (startMinute < endMinute) return minute >= startMinute && minute < endMinute;
    return minute >= startMinute || minute < endMinute;
}

ComfortPolicy::ComfortPolicy(ComfortWindow defaultWindow, int utcOffsetMin, double freezeFloorC)
    : default_(std::move(defaultWindow)),
      utc_offset_min_(utcOffsetMin),
      freeze_floor_c_(freezeFloorC) {
    validate_(default_);
    // The fallback covers every instant regardless of what was passed in.
    default_.kind        = ComfortWindow::Kind::Daily;
    default_.startMinute = 0;
    default_.endMinute   = 0;
    default_.priority    = -1;
    if (default_.label.empty()) default_.label = "default";
}

void ComfortPolicy::validate_(const ComfortWindow& w) {
    if (!std::isfinite(w.minC) || !std::isfinite(w.maxC) || w.minC >= w.maxC) {
        throw std::invalid_argument("comfort window '" + w.label + "': min must be below max");
    }
    if (w.kind == ComfortWindow::Kind::Daily) {
        if (w.startMinute < 0 || w.startMinute >= 1440 || w.endMinute < 0 || w.endMinute >= 1440) {
            throw std::invalid_argument("comfort window '" + w.label + "': minute of day out of range");
        }
    } else if (w.end <= w.start) {
        throw std::invalid_argument("comfort window '" + w.label + "': end must be after start");
    }
}

void ComfortPolicy::addWindow(const ComfortWindow& w) {
    validate_(w);
    windows_.push_back(w);
    ++revision_;
}

ComfortBounds ComfortPolicy::boundsAt(Timestamp t) const {
    if (override_ && t >= override_->from && t < override_->expires) {
        ComfortBounds b;
        b.minC   = std::max(override_->minC, freeze_floor_c_);
        b.maxC   = std::max(override_->maxC, b.minC + kMinBandC);
        b.label  = override_->label;
        b.source = ComfortBounds::Source::Override;
        return b;
    }

    if (vacation_) {
        const Timestamp resume = vacation_->end -
            static_cast<Timestamp>(vacation_->preHeatHours * 3600.0);
        if (t >= vacation_->start && t < resume) {
            ComfortBounds b;
            b.minC   = std::max(vacation_->targetC, freeze_floor_c_);
            b.maxC   = b.minC + kVacationBandC;
            b.label  = "vacation";
            b.source = ComfortBounds::Source::Vacation;
            return b;
        }
    }

    // Highest priority wins; on a tie the later-declared window.
    const ComfortWindow* best = nullptr;
    for (const auto& w : windows_) {
        if (!w.contains(t, utc_offset_min_)) continue;
        if (!best || w.priority >= best->priority) best = &w;
    }

    ComfortBounds b;
    if (best) {
        b.minC   = best->minC;
        b.maxC   = best->maxC;
        b.label  = best->label;
        b.source = ComfortBounds::Source::Schedule;
    } else {
        b.minC   = default_.minC;
        b.maxC   = default_.maxC;
        b.label  = default_.label;
        b.source = ComfortBounds::Source::Default;
    }
    return applyMode_(b);
}

ComfortBounds ComfortPolicy::applyMode_(ComfortBounds b) const {
    switch (mode_) {
        case OptimizationMode::Economy:  b.minC -= 1.0; break;
        case OptimizationMode::Comfort:  b.minC = std::min(b.minC + 0.5, b.maxC - kMinBandC); break;
        case OptimizationMode::Balanced: break;
    }
    b.minC = std::max(b.minC, freeze_floor_c_);
    b.maxC = std::max(b.maxC, b.minC + kMinBandC);
    return b;
}

void ComfortPolicy::setOverride(const ComfortOverride& o) {
    if (o.expires <= o.from) {
        throw std::invalid_argument("override '" + o.label + "' must expire after it starts");
    }
    if (!(o.minC < o.maxC)) {
        throw std::invalid_argument("override '" + o.label + "': min must be below max");
    }
    override_ = o;
    ++revision_;
}

void ComfortPolicy::clearOverride() {
    if (override_) {
        override_.reset();
        ++revision_;
    }
}

bool ComfortPolicy::expireOverrides(Timestamp now) {
    if (override_ && now >= override_->expires) {
        override_.reset();
        ++revision_;
        return true;
    }
    return false;
}

std::optional<ComfortOverride> ComfortPolicy::activeOverride(Timestamp now) const {
    if (override_ && now >= override_->from && now < override_->expires) return override_;
    return std::nullopt;
}

void ComfortPolicy::setVacation(const VacationSpec& v) {
    if (v.end <= v.start) {
        throw std::invalid_argument("vacation must end after it starts");
    }
    vacation_ = v;
    ++revision_;
}

void ComfortPolicy::clearVacation() {
    if (vacation_) {
        vacation_.reset();
        ++revision_;
    }
}

void ComfortPolicy::setMode(OptimizationMode m) {
    if (m != mode_) {
        mode_ = m;
        ++revision_;
    }
}
