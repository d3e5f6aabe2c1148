#include "ActionPlan.hpp"

#include <cmath>
#include <sstream>

ActionPlan::ActionPlan(std::vector<PlannedAction> actions, PlanMetadata meta)
    : actions_(std::move(actions)), meta_(std::move(meta)) {}

Timestamp ActionPlan::start() const {
    return actions_.empty() ? 0 : actions_.front().time;
}

Timestamp ActionPlan::end() const {
    return actions_.empty() ? 0 : actions_.back().time + meta_.stepSeconds;
}

std::optional<PlannedAction> ActionPlan::actionAt(Timestamp t) const {
    if (actions_.empty() || meta_.stepSeconds <= 0) return std::nullopt;
    if (t < start() || t >= end()) return std::nullopt;
    return actions_[static_cast<std::size_t>((t - start()) / meta_.stepSeconds)];
}

std::optional<double> ActionPlan::predictedAt(Timestamp t) const {
    if (actions_.empty() || meta_.stepSeconds <= 0) return std::nullopt;
    if (t < start() || t > end()) return std::nullopt;
    const std::size_t idx = static_cast<std::size_t>((t - start()) / meta_.stepSeconds);
    if (idx >= actions_.size()) return actions_.back().predictedC;

    const double fromC = idx == 0 ? meta_.startTempC : actions_[idx - 1].predictedC;
    const Timestamp elapsed = t - actions_[idx].time;
    if (elapsed == 0) return fromC;
    const PlannedAction& a = actions_[idx];
    return ThermalModel::stepWith(meta_.params, fromC, a.level, a.outdoorC, elapsed / 3600.0);
}

std::optional<PlannedAction> ActionPlan::nextChangeAfter(Timestamp t) const {
    auto cur = actionAt(t);
    if (!cur) return std::nullopt;
    for (const auto& a : actions_) {
        if (a.time <= t) continue;
        if (std::fabs(a.level - cur->level) > 1e-9) return a;
    }
    return std::nullopt;
}

std::vector<std::string> ActionPlan::describe() const {
    std::vector<std::string> out;
    for (const auto& i : meta_.issues) {
        std::ostringstream oss;
        oss << issueKindName(i.kind) << ": " << i.detail;
        if (i.magnitude != 0.0) oss << " (" << i.magnitude << ")";
        out.push_back(oss.str());
    }
    for (const auto& r : meta_.relaxations) {
        std::ostringstream oss;
        oss << "relaxed '" << r.window << "' by " << r.magnitudeC << " C from "
            << r.from << " to " << r.until << ": " << r.reason;
        out.push_back(oss.str());
    }
    return out;
}
