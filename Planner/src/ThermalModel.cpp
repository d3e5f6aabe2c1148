#include "ThermalModel.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

namespace {

struct Sample {
    Timestamp time;
    double hours;
    double t0, t1;
    double level;
    double outdoor;
};

// Pair consecutive entries of one history into derivative samples.
// Until an outdoor value is known, defaultOutdoor stands in and the pair is
// counted in `assumed`.
void collectSamples(const ThermalHistory& h, double maxGapH, double defaultOutdoor,
                    std::vector<Sample>& out, int& assumed) {
    const auto& e = h.entries();
    std::optional<double> lastOutdoor;
    for (std::size_t i = 0; i + 1 < e.size(); ++i) {
        if (e[i].outdoorC) lastOutdoor = e[i].outdoorC;
        const double hours = static_cast<double>(e[i + 1].time - e[i].time) / 3600.0;
        if (hours <= 0.0 || hours > maxGapH) continue;
        if (!std::isfinite(e[i].tempC) || !std::isfinite(e[i + 1].tempC)) continue;
        if (!lastOutdoor) ++assumed;
        out.push_back({e[i].time, hours, e[i].tempC, e[i + 1].tempC, e[i].level,
                       lastOutdoor ? *lastOutdoor : defaultOutdoor});
    }
}

// Solve the 3x3 system A x = b with partial pivoting. False if singular.
bool solve3(std::array<std::array<double, 3>, 3> A, std::array<double, 3> b,
            std::array<double, 3>& x) {
    for (int col = 0; col < 3; ++col) {
        int piv = col;
        for (int r = col + 1; r < 3; ++r) {
            if (std::fabs(A[r][col]) > std::fabs(A[piv][col])) piv = r;
        }
        if (std::fabs(A[piv][col]) < 1e-9) return false;
        std::swap(A[piv], A[col]);
        std::swap(b[piv], b[col]);
        for (int r = col + 1; r < 3; ++r) {
            const double f = A[r][col] / A[col][col];
            for (int c = col; c < 3; ++c) A[r][c] -= f * A[col][c];
            b[r] -= f * b[col];
        }
    }
    for (int r = 2; r >= 0; --r) {
        double s = b[r];
        for (int c = r + 1; c < 3; ++c) s -= A[r][c] * x[c];
        x[r] = s / A[r][r];
    }
    return std::isfinite(x[0]) && std::isfinite(x[1]) && std::isfinite(x[2]);
}

double rmseOf(const ThermalParams& p, const std::vector<Sample>& samples) {
    if (samples.empty()) return 0.0;
    double sq = 0.0;
    for (const auto& s : samples) {
        const double pred = ThermalModel::stepWith(p, s.t0, s.level, s.outdoor, s.hours);
        sq += (s.t1 - pred) * (s.t1 - pred);
    }
    return std::sqrt(sq / static_cast<double>(samples.size()));
}

} // namespace

ThermalModel::ThermalModel(ModelSettings settings)
    : settings_(settings), params_(defaults()) {}

ThermalParams ThermalModel::defaults() {
    ThermalParams p;
    p.k_per_h        = 0.10;
    p.gain_c_per_h   = 2.0;
    p.offset_c_per_h = 0.0;
    return p;
}

double ThermalModel::stepWith(const ThermalParams& p, double tempC, double level,
                              double outdoorC, double hours) {
    const double k   = std::max(p.k_per_h, 1e-4);
    const double teq = outdoorC + (p.gain_c_per_h * level + p.offset_c_per_h) / k;
    return teq + (tempC - teq) * std::exp(-k * hours);
}

Trajectory ThermalModel::predict(double currentTempC,
                                 const std::vector<double>& levels,
                                 const std::vector<std::optional<double>>& outdoorC,
                                 double stepHours) const {
    Trajectory tr;
    tr.tempsC.reserve(levels.size());

    std::optional<double> last;
    double t = currentTempC;
    for (std::size_t i = 0; i < levels.size(); ++i) {
        double out;
        if (i < outdoorC.size() && outdoorC[i]) {
            out  = *outdoorC[i];
            last = out;
        } else {
            out = last ? *last : settings_.defaultOutdoorC;
            ++tr.missingInputs;
        }
        t = step(t, levels[i], out, stepHours);
        tr.tempsC.push_back(t);
    }
    tr.degraded = tr.missingInputs > 0;
    return tr;
}

FitReport ThermalModel::update(const ThermalHistory& history) {
    return update(std::vector<const ThermalHistory*>{&history});
}

FitReport ThermalModel::update(const std::vector<const ThermalHistory*>& histories) {
    FitReport rep;

    std::vector<Sample> samples;
    int assumed = 0;
    for (const auto* h : histories) {
        if (h) collectSamples(*h, settings_.maxGapH, settings_.defaultOutdoorC, samples, assumed);
    }
    rep.samples   = static_cast<int>(samples.size());
    observations_ = rep.samples;

    if (rep.samples < settings_.minSamples && !using_defaults_) {
        // Configured or persisted parameters stand until there is enough
        // data to replace them.
        rep.fitted        = false;
        rep.usingDefaults = false;
        rep.lowConfidence = low_confidence_;
        rep.rmseC         = accuracy_c_;
        rep.reason = "only " + std::to_string(rep.samples) + " of " +
                     std::to_string(settings_.minSamples) + " samples; keeping current parameters";
        return rep;
    }
    if (rep.samples < settings_.minSamples) {
        params_         = defaults();
        using_defaults_ = true;
        low_confidence_ = true;
        accuracy_c_     = rmseOf(params_, samples);
        rep.fitted        = true;
        rep.usingDefaults = true;
        rep.lowConfidence = true;
        rep.rmseC         = accuracy_c_;
        rep.reason = "only " + std::to_string(rep.samples) + " of " +
                     std::to_string(settings_.minSamples) + " samples; using defaults";
        return rep;
    }

    auto keepPrevious = [&](const std::string& why) {
        low_confidence_   = true;
        rep.fitted        = false;
        rep.usingDefaults = using_defaults_;
        rep.lowConfidence = true;
        rep.rmseC         = accuracy_c_;
        rep.reason        = why + "; keeping previous parameters";
        return rep;
    };

    Timestamp newest = samples.front().time;
    for (const auto& s : samples) newest = std::max(newest, s.time);

    // Weighted means for the variance checks.
    double sw = 0.0, m1 = 0.0, m2 = 0.0, mh = 0.0;
    std::vector<double> w(samples.size());
    for (std::size_t i = 0; i < samples.size(); ++i) {
        const double ageH = static_cast<double>(newest - samples[i].time) / 3600.0;
        w[i] = std::pow(0.5, ageH / std::max(settings_.halfLifeH, 1e-3));
        sw += w[i];
        m1 += w[i] * (samples[i].outdoor - samples[i].t0);
        m2 += w[i] * samples[i].level;
        mh += w[i] * samples[i].hours;
    }
    if (sw <= 0.0) return keepPrevious("sample weights vanished");
    m1 /= sw; m2 /= sw; mh /= sw;

    double v1 = 0.0, v2 = 0.0;
    for (std::size_t i = 0; i < samples.size(); ++i) {
        const double d1 = (samples[i].outdoor - samples[i].t0) - m1;
        const double d2 = samples[i].level - m2;
        v1 += w[i] * d1 * d1;
        v2 += w[i] * d2 * d2;
    }
    v1 /= sw; v2 /= sw;
    if (v1 < 1e-6) return keepPrevious("no variance in indoor/outdoor spread");
    if (v2 < 1e-6) return keepPrevious("heating level never changed");

    std::array<std::array<double, 3>, 3> A{};
    std::array<double, 3> b{};
    for (std::size_t i = 0; i < samples.size(); ++i) {
        const auto& s = samples[i];
        const std::array<double, 3> x{s.outdoor - s.t0, s.level, 1.0};
        const double y = (s.t1 - s.t0) / s.hours;
        for (int r = 0; r < 3; ++r) {
            for (int c = 0; c < 3; ++c) A[r][c] += w[i] * x[r] * x[c];
            b[r] += w[i] * x[r] * y;
        }
    }

    std::array<double, 3> sol{};
    if (!solve3(A, b, sol)) return keepPrevious("singular normal equations");

    // The regression sees Euler slopes over the mean gap; convert to the
    // exact-exponential rate while keeping the fitted equilibrium.
    const double kEuler = sol[0];
    const double a = kEuler * mh;
    if (kEuler <= 0.0 || a >= 0.95) return keepPrevious("non-physical loss rate");

    ThermalParams p;
    p.k_per_h = -std::log(1.0 - a) / mh;
    const double scale = p.k_per_h / kEuler;
    p.gain_c_per_h   = sol[1] * scale;
    p.offset_c_per_h = sol[2] * scale;

    if (p.k_per_h < 0.001 || p.k_per_h > 2.0 ||
        p.gain_c_per_h <= 0.0 || p.gain_c_per_h > 20.0 ||
        std::fabs(p.offset_c_per_h) > 5.0) {
        return keepPrevious("non-physical fit");
    }

    params_         = p;
    using_defaults_ = false;
    accuracy_c_     = rmseOf(params_, samples);
    low_confidence_ = accuracy_c_ > 1.0 || assumed > 0;

    rep.fitted        = true;
    rep.usingDefaults = false;
    rep.lowConfidence = low_confidence_;
    rep.rmseC         = accuracy_c_;
    rep.reason        = "fitted on " + std::to_string(rep.samples) + " samples";
    if (assumed > 0) {
        rep.reason += " (" + std::to_string(assumed) + " with assumed outdoor " +
                      std::to_string(settings_.defaultOutdoorC) + " C)";
    }
    return rep;
}

void ThermalModel::restore(const ThermalParams& p, bool usingDefaults, bool lowConfidence,
                           double accuracyC, int observations) {
    params_         = p;
    using_defaults_ = usingDefaults;
    low_confidence_ = lowConfidence;
    accuracy_c_     = accuracyC;
    observations_   = observations;
}
