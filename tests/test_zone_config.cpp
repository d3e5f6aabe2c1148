#undef NDEBUG
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "ZoneConfig.hpp"
#include "ZoneStore.hpp"
#include "test_common.hpp"

static const char* kDeck = R"(# test deck
step_minutes 30
horizon_hours 12
mode economy
freeze_floor_c 6
bogus_key 4
drift_threshold_c abc

zone living
  sensor s.living
  actuator a.living
  group ground
  heating_type hydronic
  rated_kw 3.5
  levels 1 0 0.5
  min_dwell_min 60
  comfort default 18 22
  comfort daily 06:30 09:00 20 22 2 morning
  comfort daily 22:00 06:00 16 19
  model_params 0.15 3 0.2
end

zone attic
  sensor s.attic
  # no actuator
  comfort default 17 21
end

zone bath
  sensor s.bath
  actuator a.bath
  levels 0 2
end

zone living
  sensor s.other
  actuator a.other
end

zone cellar
  sensor s.cellar
  actuator a.cellar
  auto_control off
  comfort absolute 1700000000 1700086400 10 12 5 frost
end
)";

// Test 1: globals, zones and rejected zones from one deck
void test_parse_deck() {
    std::istringstream in(kDeck);
    const DeckConfig deck = parse_zone_deck(in, "test.deck");

    assert(deck.settings.stepMinutes == 30);
    assert(deck.settings.stepSeconds() == 1800);
    assert(deck.settings.horizonSteps() == 24);
    assert(deck.settings.mode == OptimizationMode::Economy);
    assert(deck.settings.freezeFloorC == 6.0);
    assert(deck.settings.driftThresholdC == 1.0);     // malformed line skipped

    assert(deck.zones.size() == 2);
    assert(deck.rejected.size() == 3);

    const ZoneConfig& living = deck.zones[0];
    assert(living.zoneId == "living");
    assert(living.group == "ground");
    assert(living.heatingType == HeatingType::Hydronic);
    assert(living.ratedKw == 3.5);
    assert((living.actionLevels == std::vector<double>{0.0, 0.5, 1.0}));
    assert(living.minDwellMinutes == 60);
    assert(living.defaultWindow.minC == 18.0);
    assert(living.comfortWindows.size() == 2);
    assert(living.comfortWindows[0].startMinute == 390);
    assert(living.comfortWindows[0].priority == 2);
    assert(living.comfortWindows[0].label == "morning");
    assert(living.comfortWindows[1].endMinute == 360);
    assert(living.initialParams && living.initialParams->k_per_h == 0.15);

    const ZoneConfig& cellar = deck.zones[1];
    assert(!cellar.autoControl);
    assert(cellar.comfortWindows.size() == 1);
    assert(cellar.comfortWindows[0].kind == ComfortWindow::Kind::Absolute);
    assert(cellar.comfortWindows[0].label == "frost");

    bool attic = false, bath = false, dup = false;
    for (const auto& r : deck.rejected) {
        if (r.find("attic") != std::string::npos) attic = true;
        if (r.find("bath") != std::string::npos) bath = true;
        if (r.find("duplicate") != std::string::npos) dup = true;
    }
    assert(attic && bath && dup);
    std::cout << "[PASS] Deck parsing.\n";
}

// Test 2: bad global values fall back to defaults
void test_global_clamps() {
    std::istringstream in("step_minutes 7\nreplan_every_min -5\nhorizon_hours 0.1\n");
    const DeckConfig deck = parse_zone_deck(in, "clamp.deck");
    assert(deck.settings.stepMinutes == 60);
    assert(deck.settings.replanEveryMinutes == 60);
    assert(deck.settings.horizonHours == 24.0);
    assert(deck.zones.empty());
    std::cout << "[PASS] Global clamps.\n";
}

// Test 3: validation names the zone and the problem
void test_validate_zone() {
    ZoneConfig z;
    z.zoneId = "z";
    z.sensorRef = "s";
    z.actuatorRef = "a";
    validate_zone(z);

    auto rejects = [](ZoneConfig bad, const std::string& needle) {
        try {
            validate_zone(bad);
        } catch (const ConfigInvalidError& e) {
            assert(e.zone() == bad.zoneId);
            assert(std::string(e.what()).find(needle) != std::string::npos);
            return;
        }
        assert(false && "zone should have been rejected");
    };

    ZoneConfig bad = z;
    bad.ratedKw = 0.0;
    rejects(bad, "rated_kw");

    bad = z;
    bad.actionLevels = {0.5};
    rejects(bad, "two action levels");

    bad = z;
    bad.actionLevels = {0.0, 0.5, 0.5};
    rejects(bad, "duplicate");

    bad = z;
    bad.defaultWindow.minC = 23.0;
    bad.defaultWindow.maxC = 20.0;
    rejects(bad, "min must be below max");

    bad = z;
    bad.model.minSamples = 1;
    rejects(bad, "min_samples");

    bad = z;
    ThermalParams p;
    p.gain_c_per_h = -1.0;
    bad.initialParams = p;
    rejects(bad, "model_params");
    std::cout << "[PASS] Zone validation.\n";
}

// Test 4: time-of-day parsing
void test_minute_of_day() {
    assert(parse_minute_of_day("00:00") == 0);
    assert(parse_minute_of_day("06:30") == 390);
    assert(parse_minute_of_day("23:59") == 1439);
    assert(parse_minute_of_day("24:00") == 0);
    for (const char* bad : {"630", "25:00", "12:60", "ab:cd", "24:30"}) {
        bool threw = false;
        try { parse_minute_of_day(bad); }
        catch (const std::invalid_argument&) { threw = true; }
        assert(threw);
    }
    std::cout << "[PASS] Minute of day.\n";
}

// Test 5: a deck that cannot be opened is fatal
void test_missing_deck() {
    bool threw = false;
    try { load_zone_deck("/nonexistent/heatplan/zones.deck"); }
    catch (const std::runtime_error&) { threw = true; }
    assert(threw);
    std::cout << "[PASS] Missing deck.\n";
}

// Test 6: store round trip for history, model and savings
void test_zone_store() {
    const std::string root = scratch_dir("zone_store");
    ZoneStore store(root);

    ThermalHistory h(14.0);
    h.append({T0, 20.0, 1.0, 4.0});
    h.append({T0 + HOUR, 21.0, 0.0, std::nullopt});
    store.saveHistory("den", h);

    ThermalModel m;
    ThermalParams p;
    p.k_per_h = 0.12; p.gain_c_per_h = 2.5; p.offset_c_per_h = 0.3;
    m.restore(p, false, true, 0.25, 48);
    store.saveModel("den", m);

    SavingsRecord r;
    r.periodStart = T0; r.periodEnd = T0 + 24 * HOUR;
    r.realizedCost = 3.5; r.baselineCost = 5.0; r.delta = 1.5;
    r.correctionOf = -1; r.degraded = true;
    store.saveSavings("den", {r});

    const ThermalHistory h2 = store.loadHistory("den", 14.0);
    assert(h2.size() == 2);
    assert(h2.entries()[0].outdoorC && *h2.entries()[0].outdoorC == 4.0);
    assert(!h2.entries()[1].outdoorC);

    ThermalModel m2;
    assert(store.loadModel("den", m2));
    assert(std::fabs(m2.params().gain_c_per_h - 2.5) < 1e-9);
    assert(!m2.usingDefaults());
    assert(m2.lowConfidence());
    assert(m2.observations() == 48);

    const auto ledger = store.loadSavings("den");
    assert(ledger.size() == 1);
    assert(ledger[0].delta == 1.5);
    assert(ledger[0].degraded);

    // Unknown zone: empty, not an error
    ThermalModel m3;
    assert(!store.loadModel("nobody", m3));
    assert(store.loadHistory("nobody", 14.0).empty());
    assert(store.loadSavings("nobody").empty());

    // Malformed history lines are skipped
    {
        std::ofstream out(store.zoneDir("den") + "/history.csv", std::ios::app);
        out << "not,a,number,\n";
    }
    assert(store.loadHistory("den", 14.0).size() == 2);

    bool threw = false;
    try { ZoneStore bad(""); }
    catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    std::cout << "[PASS] Zone store.\n";
}

int main() {
    setup_test_logging("zone_config");
    test_parse_deck();
    test_global_clamps();
    test_validate_zone();
    test_minute_of_day();
    test_missing_deck();
    test_zone_store();
    std::cout << "All zone config tests passed.\n";
    return 0;
}
