#pragma once
#include <string>
#include <vector>
#include "ActionPlan.hpp"
#include "SavingsTracker.hpp"
#include "ThermalHistory.hpp"
#include "ThermalModel.hpp"

// File persistence keyed by zone id:
//   <root>/<zone>/history.csv   time,temp_c,level,outdoor_c
//   <root>/<zone>/savings.csv   one SavingsRecord per line
//   <root>/<zone>/model.txt     "key value" lines
//   <root>/<zone>/plan.csv      latest committed plan (write only)
// Missing files load as empty; I/O failures throw std::runtime_error.
class ZoneStore {
public:
    explicit ZoneStore(std::string root);

    const std::string& root() const { return root_; }
    std::string zoneDir(const std::string& zoneId) const;

    void saveHistory(const std::string& zoneId, const ThermalHistory& history);
    ThermalHistory loadHistory(const std::string& zoneId, double retentionDays) const;

    void saveSavings(const std::string& zoneId, const std::vector<SavingsRecord>& ledger);
    std::vector<SavingsRecord> loadSavings(const std::string& zoneId) const;

    void saveModel(const std::string& zoneId, const ThermalModel& model);
    // False if nothing was stored for the zone.
    bool loadModel(const std::string& zoneId, ThermalModel& model) const;

    void savePlan(const std::string& zoneId, const ActionPlan& plan);

private:
    std::string ensureZoneDir_(const std::string& zoneId);

    std::string root_;
};
