#include "ThermalGroup.hpp"

#include <algorithm>

ThermalGroup::ThermalGroup(std::string id, ModelSettings settings)
    : id_(std::move(id)), model_(settings) {}

void ThermalGroup::addMember(const std::string& zoneId) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (std::find(members_.begin(), members_.end(), zoneId) == members_.end()) {
        members_.push_back(zoneId);
    }
}

std::vector<std::string> ThermalGroup::members() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return members_;
}

bool ThermalGroup::hasMember(const std::string& zoneId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return std::find(members_.begin(), members_.end(), zoneId) != members_.end();
}

FitReport ThermalGroup::learn(const std::string& zoneId, const ThermalHistory& history) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (std::find(members_.begin(), members_.end(), zoneId) == members_.end()) {
        FitReport rep;
        rep.usingDefaults = model_.usingDefaults();
        rep.lowConfidence = model_.lowConfidence();
        rep.reason = "zone " + zoneId + " is not a member of group " + id_;
        return rep;
    }

    histories_.insert_or_assign(zoneId, history);

    std::vector<const ThermalHistory*> all;
    all.reserve(histories_.size());
    for (const auto& kv : histories_) all.push_back(&kv.second);
    return model_.update(all);
}

ThermalModel ThermalGroup::model() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return model_;
}

void ThermalGroup::restore(const ThermalModel& m) {
    std::lock_guard<std::mutex> lock(mtx_);
    model_ = m;
}
