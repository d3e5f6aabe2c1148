#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "ThermalModel.hpp"

// Zones that share one thermal response (e.g. an open-plan floor).
// The group owns the model and a copy of each member's latest history;
// members hold a shared_ptr to the group, never to each other.
class ThermalGroup {
public:
    ThermalGroup(std::string id, ModelSettings settings = {});

    const std::string& id() const { return id_; }

    void addMember(const std::string& zoneId);
    std::vector<std::string> members() const;
    bool hasMember(const std::string& zoneId) const;

    // Replace the member's history and refit on the union of all members.
    // Histories from zones that are not members are ignored.
    FitReport learn(const std::string& zoneId, const ThermalHistory& history);

    // Snapshot of the shared model (copy, so planning runs lock-free).
    ThermalModel model() const;
    void restore(const ThermalModel& m);

private:
    std::string id_;
    mutable std::mutex mtx_;
    ThermalModel model_;
    std::vector<std::string> members_;
    std::map<std::string, ThermalHistory> histories_;
};
