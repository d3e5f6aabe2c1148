#pragma once
#include <optional>
#include <string>
#include <vector>
#include "ThermalHistory.hpp"

// First-order RC response of a zone:
//   dT/dt = k (T_out - T) + gain * level + offset
// k in 1/h, gain and offset in C/h. level is the fraction of rated heat.
struct ThermalParams {
    double k_per_h        = 0.10;
    double gain_c_per_h   = 2.0;
    double offset_c_per_h = 0.0;
};

struct ModelSettings {
    int    minSamples      = 24;    // usable sample pairs needed before fitting
    double halfLifeH       = 72.0;  // exponential weighting of older samples
    double maxGapH         = 3.0;   // consecutive samples further apart are not paired
    double defaultOutdoorC = 5.0;   // used when no outdoor value was ever seen
};

struct Trajectory {
    std::vector<double> tempsC;     // end-of-step temperatures
    bool degraded      = false;     // some exogenous input was carried forward
    int  missingInputs = 0;
};

struct FitReport {
    bool        fitted        = false;  // parameters changed by this call
    bool        usingDefaults = false;
    bool        lowConfidence = false;
    int         samples       = 0;
    double      rmseC         = 0.0;
    std::string reason;
};

class ThermalModel {
public:
    explicit ThermalModel(ModelSettings settings = {});

    // Documented conservative defaults: slow heating, moderate loss, no free heat.
    static ThermalParams defaults();

    // Exact discretisation of the RC equation over `hours`.
    static double stepWith(const ThermalParams& p, double tempC, double level,
                           double outdoorC, double hours);

    double step(double tempC, double level, double outdoorC, double hours) const {
        return stepWith(params_, tempC, level, outdoorC, hours);
    }

    // Pure function of the current parameters.
    Trajectory predict(double currentTempC,
                       const std::vector<double>& levels,
                       const std::vector<std::optional<double>>& outdoorC,
                       double stepHours) const;

    // Refit from one or more histories (several for a shared group).
    // Never throws on bad data; keeps the previous parameters instead.
    FitReport update(const ThermalHistory& history);
    FitReport update(const std::vector<const ThermalHistory*>& histories);

    // Restore persisted parameters.
    void restore(const ThermalParams& p, bool usingDefaults, bool lowConfidence,
                 double accuracyC, int observations);

    const ThermalParams& params() const { return params_; }
    const ModelSettings& settings() const { return settings_; }
    bool usingDefaults() const { return using_defaults_; }
    bool lowConfidence() const { return low_confidence_; }
    bool degraded() const { return using_defaults_ || low_confidence_; }
    double accuracyC() const { return accuracy_c_; }
    int observations() const { return observations_; }

private:
    ModelSettings settings_;
    ThermalParams params_;
    bool   using_defaults_ = true;
    bool   low_confidence_ = true;
    double accuracy_c_     = 0.0;
    int    observations_   = 0;
};
