#undef NDEBUG
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "ComfortPolicy.hpp"
#include "test_common.hpp"

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

static ComfortWindow daily(int startMin, int endMin, double lo, double hi,
                           int prio, const std::string& label) {
    ComfortWindow w;
    w.kind = ComfortWindow::Kind::Daily;
    w.startMinute = startMin;
    w.endMinute = endMin;
    w.minC = lo;
    w.maxC = hi;
    w.priority = prio;
    w.label = label;
    return w;
}

static ComfortPolicy make_policy(int utcOffsetMin = 0) {
    ComfortWindow def;
    def.minC = 17.0;
    def.maxC = 23.0;
    ComfortPolicy p(def, utcOffsetMin, 5.0);
    p.addWindow(daily(6 * 60, 9 * 60, 20.0, 22.0, 1, "morning"));
    p.addWindow(daily(22 * 60, 6 * 60, 16.0, 19.0, 1, "night"));   // wraps midnight
    return p;
}

// Test 1: every instant resolves to valid bounds
void test_total_coverage() {
    ComfortPolicy p = make_policy(90);
    p.addWindow(daily(7 * 60, 8 * 60, 21.0, 23.0, 5, "shower"));

    ComfortOverride o;
    o.minC = 22.0; o.maxC = 24.0; o.from = T0 + 30 * HOUR; o.expires = T0 + 33 * HOUR;
    p.setOverride(o);

    VacationSpec v;
    v.start = T0 + 40 * HOUR; v.end = T0 + 60 * HOUR; v.targetC = 3.0;   // below the floor
    p.setVacation(v);

    for (Timestamp t = T0 - 86400; t < T0 + 4 * 86400; t += 15 * 60) {
        const ComfortBounds b = p.boundsAt(t);
        assert(b.minC < b.maxC);
        assert(b.minC >= p.freezeFloorC());
        assert(!b.label.empty());
    }
    std::cout << "[PASS] Bounds defined everywhere.\n";
}

// Test 2: windows, midnight wrap, priority and tie-break
void test_window_resolution() {
    ComfortPolicy p = make_policy();

    ComfortBounds b = p.boundsAt(T0 + 7 * HOUR);
    assert(b.label == "morning");
    assert(b.source == ComfortBounds::Source::Schedule);
    assert(near(b.minC, 20.0));

    b = p.boundsAt(T0 + 12 * HOUR);
    assert(b.source == ComfortBounds::Source::Default);
    assert(near(b.minC, 17.0));

    b = p.boundsAt(T0 + 23 * HOUR);
    assert(b.label == "night");
    b = p.boundsAt(T0 + 2 * HOUR);
    assert(b.label == "night");

    // Same priority: the later-declared window wins
    p.addWindow(daily(7 * 60, 8 * 60, 19.0, 21.0, 1, "late"));
    assert(p.boundsAt(T0 + 7 * HOUR + 1800).label == "late");
    // Higher priority wins regardless of order
    p.addWindow(daily(7 * 60, 8 * 60, 18.0, 20.0, 0, "low"));
    assert(p.boundsAt(T0 + 7 * HOUR + 1800).label == "late");

    // End is exclusive
    assert(p.boundsAt(T0 + 9 * HOUR).source == ComfortBounds::Source::Default);
    std::cout << "[PASS] Window resolution.\n";
}

// Test 3: local time offset shifts daily windows
void test_utc_offset() {
    ComfortPolicy p = make_policy(120);   // UTC+2
    // 05:00 UTC is 07:00 local
    assert(p.boundsAt(T0 + 5 * HOUR).label == "morning");
    assert(p.boundsAt(T0 + 7 * HOUR).source == ComfortBounds::Source::Default);
    std::cout << "[PASS] UTC offset.\n";
}

// Test 4: override supersedes everything and lapses on its own
void test_override() {
    ComfortPolicy p = make_policy();
    const long rev0 = p.revision();

    ComfortOverride o;
    o.minC = 23.0; o.maxC = 25.0; o.from = T0 + 6 * HOUR; o.expires = T0 + 8 * HOUR;
    p.setOverride(o);
    assert(p.revision() > rev0);

    ComfortBounds b = p.boundsAt(T0 + 7 * HOUR);
    assert(b.source == ComfortBounds::Source::Override);
    assert(near(b.minC, 23.0));
    assert(p.activeOverride(T0 + 7 * HOUR).has_value());
    assert(p.boundsAt(T0 + 8 * HOUR).label == "morning");

    assert(!p.expireOverrides(T0 + 7 * HOUR));
    const long rev1 = p.revision();
    assert(p.expireOverrides(T0 + 8 * HOUR));
    assert(p.revision() > rev1);
    assert(!p.activeOverride(T0 + 7 * HOUR).has_value());

    // Malformed overrides are refused
    ComfortOverride bad = o;
    bad.expires = bad.from;
    bool threw = false;
    try { p.setOverride(bad); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    std::cout << "[PASS] Override.\n";
}

// Test 5: vacation setback, pre-heat resume, freeze floor
void test_vacation() {
    ComfortPolicy p = make_policy();
    VacationSpec v;
    v.start = T0; v.end = T0 + 3 * 86400; v.targetC = 12.0; v.preHeatHours = 4.0;
    p.setVacation(v);

    ComfortBounds b = p.boundsAt(T0 + 86400 + 7 * HOUR);
    assert(b.source == ComfortBounds::Source::Vacation);
    assert(near(b.minC, 12.0));

    // Within the pre-heat window the schedule is back
    b = p.boundsAt(v.end - 2 * HOUR);
    assert(b.source != ComfortBounds::Source::Vacation);

    v.targetC = 2.0;
    p.setVacation(v);
    assert(near(p.boundsAt(T0 + HOUR).minC, p.freezeFloorC()));

    p.clearVacation();
    assert(p.boundsAt(T0 + 7 * HOUR).label == "morning");
    std::cout << "[PASS] Vacation.\n";
}

// Test 6: optimization mode offsets
void test_modes() {
    ComfortPolicy p = make_policy();
    const Timestamp t = T0 + 7 * HOUR;           // morning 20-22

    p.setMode(OptimizationMode::Economy);
    assert(near(p.boundsAt(t).minC, 19.0));
    p.setMode(OptimizationMode::Comfort);
    assert(near(p.boundsAt(t).minC, 20.5));
    p.setMode(OptimizationMode::Balanced);
    assert(near(p.boundsAt(t).minC, 20.0));

    // Economy never goes below the floor
    ComfortWindow cold;
    cold.minC = 5.5; cold.maxC = 8.0;
    ComfortPolicy q(cold, 0, 5.0);
    q.setMode(OptimizationMode::Economy);
    assert(near(q.boundsAt(T0).minC, 5.0));

    assert(parseMode("economy") == OptimizationMode::Economy);
    assert(!parseMode("turbo"));
    std::cout << "[PASS] Optimization modes.\n";
}

// Test 7: malformed windows are rejected
void test_invalid_windows() {
    bool threw = false;
    ComfortWindow inverted;
    inverted.minC = 22.0; inverted.maxC = 20.0;
    try { ComfortPolicy p(inverted); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    ComfortPolicy p = make_policy();
    threw = false;
    try { p.addWindow(daily(0, 1500, 18.0, 20.0, 0, "bad")); }
    catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    std::cout << "[PASS] Invalid windows rejected.\n";
}

int main() {
    setup_test_logging("comfort_policy");
    test_total_coverage();
    test_window_resolution();
    test_utc_offset();
    test_override();
    test_vacation();
    test_modes();
    test_invalid_windows();
    std::cout << "All comfort policy tests passed.\n";
    return 0;
}
