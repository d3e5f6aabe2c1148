#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>

#include "ThermalGroup.hpp"
#include "ThermalHistory.hpp"
#include "ThermalModel.hpp"
#include "test_common.hpp"

static bool near(double a, double b, double tol) { return std::fabs(a - b) <= tol; }

// Hourly samples generated with the exact RC response, switching the level
// every three hours and swinging the outdoor temperature.
static ThermalHistory synth_history(const ThermalParams& truth, int hours, Timestamp start,
                                    double startC = 19.0) {
    ThermalHistory h(30.0);
    double t = startC;
    for (int i = 0; i <= hours; ++i) {
        ThermalState s;
        s.time     = start + static_cast<Timestamp>(i) * HOUR;
        s.tempC    = t;
        s.level    = ((i / 3) % 2 == 0) ? 1.0 : 0.0;
        s.outdoorC = 5.0 + 5.0 * std::sin(i * 0.26);
        h.append(s);
        t = ThermalModel::stepWith(truth, t, s.level, *s.outdoorC, 1.0);
    }
    return h;
}

// Test 1: fresh model sits on documented defaults
void test_defaults() {
    ThermalModel m;
    assert(m.usingDefaults());
    assert(m.degraded());
    assert(near(m.params().k_per_h, ThermalModel::defaults().k_per_h, 1e-12));
    assert(near(m.params().gain_c_per_h, 2.0, 1e-12));
    std::cout << "[PASS] Defaults.\n";
}

// Test 2: exact step and equilibrium
void test_step() {
    ThermalParams p;
    p.k_per_h = 0.1; p.gain_c_per_h = 4.0; p.offset_c_per_h = 0.0;
    const double t1 = ThermalModel::stepWith(p, 20.0, 0.0, 5.0, 1.0);
    assert(near(t1, 5.0 + 15.0 * std::exp(-0.1), 1e-9));

    // Long enough to settle at outdoor + gain * level / k
    const double ss = ThermalModel::stepWith(p, 20.0, 0.5, 5.0, 500.0);
    assert(near(ss, 25.0, 1e-6));
    std::cout << "[PASS] Exact step.\n";
}

// Test 3: predict is pure and carries missing outdoor values forward
void test_predict() {
    ThermalModel m;
    const std::vector<double> levels{1.0, 1.0, 0.0, 0.0};
    const std::vector<std::optional<double>> out{3.0, std::nullopt, std::nullopt, 3.0};

    const Trajectory a = m.predict(18.0, levels, out, 1.0);
    const Trajectory b = m.predict(18.0, levels, out, 1.0);
    assert(a.tempsC.size() == 4);
    assert(a.tempsC == b.tempsC);
    assert(a.degraded);
    assert(a.missingInputs == 2);

    // The same trajectory with the gaps filled in explicitly
    const Trajectory c = m.predict(18.0, levels, {3.0, 3.0, 3.0, 3.0}, 1.0);
    assert(!c.degraded);
    for (std::size_t i = 0; i < 4; ++i) assert(near(a.tempsC[i], c.tempsC[i], 1e-12));
    assert(a.tempsC[1] > a.tempsC[0]);
    assert(a.tempsC[3] < a.tempsC[2]);
    std::cout << "[PASS] Predict.\n";
}

// Test 4: learning recovers the parameters that generated the data
void test_fit_recovers_truth() {
    ThermalParams truth;
    truth.k_per_h = 0.2; truth.gain_c_per_h = 3.0; truth.offset_c_per_h = 0.1;
    const ThermalHistory h = synth_history(truth, 72, T0);

    ThermalModel m;
    const FitReport r = m.update(h);
    assert(r.fitted);
    assert(!r.usingDefaults);
    assert(!m.usingDefaults());
    assert(!m.lowConfidence());
    assert(r.samples == 72);
    assert(near(m.params().k_per_h, 0.2, 1e-3));
    assert(near(m.params().gain_c_per_h, 3.0, 1e-2));
    assert(near(m.params().offset_c_per_h, 0.1, 1e-2));
    assert(m.accuracyC() < 0.01);
    std::cout << "[PASS] Fit recovers truth.\n";
}

// Test 5: too few samples means defaults, flagged
void test_few_samples_use_defaults() {
    ThermalParams truth;
    truth.k_per_h = 0.3; truth.gain_c_per_h = 5.0;
    const ThermalHistory h = synth_history(truth, 10, T0);

    ThermalModel m;
    const FitReport r = m.update(h);
    assert(r.usingDefaults);
    assert(r.lowConfidence);
    assert(m.usingDefaults());
    assert(!r.reason.empty());
    assert(near(m.params().k_per_h, ThermalModel::defaults().k_per_h, 1e-12));
    std::cout << "[PASS] Few samples keep defaults.\n";
}

// Test 5b: no outdoor sensor; pairs use the default outdoor temperature
void test_fit_without_outdoor() {
    ThermalParams truth;
    truth.k_per_h = 0.12; truth.gain_c_per_h = 2.8; truth.offset_c_per_h = 0.1;

    ModelSettings ms;                    // defaultOutdoorC = 5
    ThermalHistory h(30.0);
    double t = 18.0;
    for (int i = 0; i <= 96; ++i) {
        ThermalState s;
        s.time  = T0 + static_cast<Timestamp>(i) * HOUR;
        s.tempC = t;
        s.level = (i % 2 == 0) ? 1.0 : 0.0;
        h.append(s);                     // outdoorC never set
        t = ThermalModel::stepWith(truth, t, s.level, ms.defaultOutdoorC, 1.0);
    }

    ThermalModel m(ms);
    const FitReport r = m.update(h);
    assert(r.samples == 96);
    assert(r.fitted);
    assert(!r.usingDefaults);
    assert(r.lowConfidence);
    assert(m.lowConfidence());
    assert(near(m.params().k_per_h, 0.12, 1e-3));
    assert(near(m.params().gain_c_per_h, 2.8, 1e-2));
    std::cout << "[PASS] Fit without outdoor readings.\n";
}

// Test 5c: configured parameters survive a refit on too little data
void test_few_samples_keep_configured() {
    ThermalParams cfg;
    cfg.k_per_h = 0.15; cfg.gain_c_per_h = 3.0; cfg.offset_c_per_h = 0.2;

    ThermalParams truth;
    truth.k_per_h = 0.3; truth.gain_c_per_h = 5.0;
    const ThermalHistory shortHistory = synth_history(truth, 10, T0);

    ThermalModel m;
    m.restore(cfg, false, true, 0.0, 0);
    const FitReport r = m.update(shortHistory);
    assert(!r.fitted);
    assert(!r.usingDefaults);
    assert(!m.usingDefaults());
    assert(near(m.params().k_per_h, 0.15, 1e-12));
    assert(near(m.params().gain_c_per_h, 3.0, 1e-12));
    assert(near(m.params().offset_c_per_h, 0.2, 1e-12));

    // Same for a shared group model
    ThermalGroup g("upstairs");
    g.addMember("study");
    g.restore(m);
    const FitReport gr = g.learn("study", shortHistory);
    assert(!gr.usingDefaults);
    assert(!g.model().usingDefaults());
    assert(near(g.model().params().k_per_h, 0.15, 1e-12));
    std::cout << "[PASS] Few samples keep configured parameters.\n";
}

// Test 6: a degenerate history keeps the previous parameters
void test_degenerate_keeps_previous() {
    ThermalParams truth;
    truth.k_per_h = 0.2; truth.gain_c_per_h = 3.0;
    ThermalModel m;
    m.update(synth_history(truth, 72, T0));
    const ThermalParams before = m.params();

    ThermalHistory flat(30.0);
    double t = 20.0;
    for (int i = 0; i <= 48; ++i) {
        ThermalState s;
        s.time = T0 + 100 * HOUR + static_cast<Timestamp>(i) * HOUR;
        s.tempC = t;
        s.level = 0.5;                 // never changes
        s.outdoorC = 5.0 + 3.0 * std::cos(i * 0.3);
        flat.append(s);
        t = ThermalModel::stepWith(truth, t, 0.5, *s.outdoorC, 1.0);
    }
    const FitReport r = m.update(flat);
    assert(!r.fitted);
    assert(r.lowConfidence);
    assert(!m.usingDefaults());
    assert(near(m.params().k_per_h, before.k_per_h, 1e-12));
    assert(near(m.params().gain_c_per_h, before.gain_c_per_h, 1e-12));
    std::cout << "[PASS] Degenerate data keeps previous fit.\n";
}

// Test 7: history ordering and retention
void test_history() {
    ThermalHistory h(1.0);
    ThermalState s;
    s.time = T0; s.tempC = 20.0;
    assert(h.append(s));
    s.time = T0;                         // not newer
    assert(!h.append(s));
    s.time = T0 - 60;                    // older
    assert(!h.append(s));
    assert(h.size() == 1);

    s.time = T0 + 2 * 86400;             // pushes the first one out of the window
    assert(h.append(s));
    assert(h.size() == 1);
    assert(h.back().time == T0 + 2 * 86400);
    std::cout << "[PASS] History ordering and retention.\n";
}

// Test 8: a group fits on the union of its members only
void test_group() {
    ThermalParams truth;
    truth.k_per_h = 0.15; truth.gain_c_per_h = 2.5;

    ModelSettings ms;
    ms.minSamples = 40;
    ThermalGroup g("open_plan", ms);
    g.addMember("kitchen");
    g.addMember("living");
    assert(g.hasMember("living"));
    assert(!g.hasMember("bedroom"));

    // 30 samples each: neither alone is enough, together they are.
    const FitReport a = g.learn("kitchen", synth_history(truth, 30, T0, 18.0));
    assert(a.usingDefaults);
    const FitReport b = g.learn("living", synth_history(truth, 30, T0, 21.0));
    assert(!b.usingDefaults);
    assert(b.samples == 60);
    assert(near(g.model().params().k_per_h, 0.15, 1e-3));

    // Non-members never touch the shared model
    ThermalParams other;
    other.k_per_h = 0.5; other.gain_c_per_h = 8.0;
    const FitReport c = g.learn("bedroom", synth_history(other, 72, T0));
    assert(!c.fitted);
    assert(near(g.model().params().k_per_h, 0.15, 1e-3));
    std::cout << "[PASS] Thermal group.\n";
}

int main() {
    setup_test_logging("thermal_model");
    test_defaults();
    test_step();
    test_predict();
    test_fit_recovers_truth();
    test_few_samples_use_defaults();
    test_fit_without_outdoor();
    test_few_samples_keep_configured();
    test_degenerate_keeps_previous();
    test_history();
    test_group();
    std::cout << "All thermal model tests passed.\n";
    return 0;
}
