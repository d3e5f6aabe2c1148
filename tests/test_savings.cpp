#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>

#include "ComfortPolicy.hpp"
#include "Scheduler.hpp"
#include "SavingsTracker.hpp"
#include "test_common.hpp"

static ThermalModel fitted_model(double k, double g) {
    ThermalModel m;
    ThermalParams p;
    p.k_per_h = k; p.gain_c_per_h = g; p.offset_c_per_h = 0.0;
    m.restore(p, false, false, 0.1, 200);
    return m;
}

static ExecutedStep idle_step(Timestamp t, double price, double startC) {
    ExecutedStep s;
    s.time = t;
    s.stepSeconds = HOUR;
    s.level = 0.0;
    s.energyKwh = 0.0;
    s.price = price;
    s.startTempC = startC;
    s.outdoorC = 0.0;
    s.minC = 19.0;
    s.maxC = 21.0;
    return s;
}

// Test 1: steps accumulate in the open period and settle at its end
void test_period_settlement() {
    const ThermalModel m = fitted_model(0.1, 4.0);
    SavingsTracker tr("z1", 24.0, 2.0);

    for (int h = 0; h < 24; ++h) {
        auto settled = tr.record(idle_step(T0 + h * HOUR, 1.0, 20.0), m);
        assert(settled.empty());
    }
    assert(tr.ledger().empty());
    // Nothing heated, so the thermostat baseline is pure saving.
    assert(tr.openPeriodSavings(m) > 0.0);

    assert(!tr.settle(T0 + 23 * HOUR, m));
    auto rec = tr.settle(T0 + 24 * HOUR, m);
    assert(rec);
    assert(rec->periodStart == T0);
    assert(rec->periodEnd == T0 + 24 * HOUR);
    assert(rec->realizedCost == 0.0);
    assert(rec->baselineCost > 0.0);
    assert(std::fabs(rec->delta - rec->baselineCost) < 1e-12);
    assert(!rec->degraded);
    assert(tr.ledger().size() == 1);
    assert(tr.openPeriodSavings(m) == 0.0);

    // A step in a later period settles anything still open first.
    tr.record(idle_step(T0 + 30 * HOUR, 1.0, 20.0), m);
    auto settled = tr.record(idle_step(T0 + 50 * HOUR, 1.0, 20.0), m);
    assert(settled.size() == 1);
    assert(settled[0].periodStart == T0 + 24 * HOUR);
    std::cout << "[PASS] Period settlement.\n";
}

// Test 2: an optimized schedule beats the thermostat baseline
void test_plan_beats_baseline() {
    const ThermalModel m = fitted_model(0.1, 3.0);
    ComfortWindow w;
    w.minC = 18.0; w.maxC = 22.0; w.label = "day";
    const ComfortPolicy comfort(w, 0, 5.0);

    std::vector<PricePoint> pts;
    const std::vector<double> prices = {1, 1, 10, 10, 1, 1, 1, 1, 10, 10, 1, 1};
    for (std::size_t i = 0; i < prices.size(); ++i) {
        pts.push_back({T0 + static_cast<Timestamp>(i) * HOUR, prices[i]});
    }
    const PriceCurve curve(pts, HOUR);

    PlanRequest r;
    r.zoneId = "z2";
    r.model = m;
    r.comfort = &comfort;
    r.levels = {0.0, 0.25, 0.5, 0.75, 1.0};
    r.ratedKw = 2.0;
    r.stepSeconds = HOUR;
    r.currentTempC = 20.0;
    r.outdoorC.assign(prices.size(), 5.0);
    auto plan = Scheduler().plan(r, curve, T0, T0 + 12 * HOUR);
    assert(plan);

    SavingsTracker tr("z2", 24.0, r.ratedKw);
    double t = r.currentTempC;
    for (const auto& a : plan->actions()) {
        ExecutedStep s;
        s.time = a.time;
        s.level = a.level;
        s.energyKwh = a.energyKwh;
        s.price = a.price;
        s.startTempC = t;
        s.outdoorC = 5.0;
        s.minC = 18.0;
        s.maxC = 22.0;
        tr.record(s, m);
        t = a.predictedC;
    }
    auto rec = tr.settleOpen(m);
    assert(rec);
    assert(std::fabs(rec->realizedCost - plan->metadata().totalCost) < 1e-9);
    assert(rec->delta > 0.0);
    assert(tr.totalSavings() == rec->delta);
    std::cout << "[PASS] Plan beats thermostat baseline.\n";
}

// Test 3: late prices append a correction that supersedes the original
void test_reprice_correction() {
    const ThermalModel m = fitted_model(0.1, 4.0);
    SavingsTracker tr("z3", 24.0, 2.0);
    for (int h = 0; h < 24; ++h) {
        ExecutedStep s = idle_step(T0 + h * HOUR, 1.0, 20.0);
        s.level = 0.25;
        s.energyKwh = 0.5;
        tr.record(s, m);
    }
    auto orig = tr.settle(T0 + 24 * HOUR, m);
    assert(orig);
    const double before = tr.totalSavings();

    std::vector<PricePoint> pts;
    for (int h = 0; h < 24; ++h) pts.push_back({T0 + h * HOUR, 2.0});
    auto corr = tr.reprice(0, PriceCurve(pts, HOUR), m);
    assert(corr);
    assert(corr->correctionOf == 0);
    assert(corr->periodStart == orig->periodStart);
    assert(std::fabs(corr->realizedCost - 2.0 * orig->realizedCost) < 1e-9);

    assert(tr.ledger().size() == 2);
    assert(tr.ledger()[0].delta == orig->delta);      // original untouched
    assert(std::fabs(tr.totalSavings() - corr->delta) < 1e-12);
    assert(std::fabs(tr.totalSavings() - 2.0 * before) < 1e-9);

    // Nothing kept for an unknown entry
    assert(!tr.reprice(7, PriceCurve(pts, HOUR), m));
    std::cout << "[PASS] Reprice correction.\n";
}

// Test 4: a baseline computed on default parameters is flagged
void test_degraded_baseline() {
    const ThermalModel fresh;
    SavingsTracker tr("z4");
    tr.record(idle_step(T0, 1.0, 20.0), fresh);
    auto rec = tr.settleOpen(fresh);
    assert(rec);
    assert(rec->degraded);
    assert(rec->periodEnd == T0 + HOUR);

    // A restored ledger carries no step data.
    SavingsTracker other("z4");
    other.restore(tr.ledger());
    assert(other.ledger().size() == 1);
    assert(!other.reprice(0, PriceCurve({{T0, 1.0}}, HOUR), fresh));
    std::cout << "[PASS] Degraded baseline flagged.\n";
}

int main() {
    setup_test_logging("savings");
    test_period_settlement();
    test_plan_beats_baseline();
    test_reprice_correction();
    test_degraded_baseline();
    std::cout << "All savings tests passed.\n";
    return 0;
}
