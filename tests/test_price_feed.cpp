#undef NDEBUG
#include <cassert>
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "PriceCurve.hpp"
#include "PriceFeed.hpp"
#include "test_common.hpp"

static std::vector<PricePoint> hourly(Timestamp start, const std::vector<double>& prices) {
    std::vector<PricePoint> pts;
    for (std::size_t i = 0; i < prices.size(); ++i) {
        pts.push_back({start + static_cast<Timestamp>(i) * HOUR, prices[i]});
    }
    return pts;
}

static std::vector<double> ramp(int n, double base) {
    std::vector<double> v;
    for (int i = 0; i < n; ++i) v.push_back(base + 0.01 * i);
    return v;
}

// Source that fails on demand.
class FlakySource : public PriceSource {
public:
    std::vector<PricePoint> points;
    bool fail = false;
    int calls = 0;

    std::vector<PricePoint> fetchPrices(Timestamp, Timestamp) override {
        ++calls;
        if (fail) throw DataUnavailableError("upstream timeout");
        return points;
    }
};

// Test 1: curve invariants and lookups
void test_curve() {
    PriceCurve c(hourly(T0, {1.0, 2.0, 3.0}));
    assert(c.stepSeconds() == HOUR);
    assert(c.start() == T0);
    assert(c.end() == T0 + 3 * HOUR);
    assert(*c.priceAt(T0 + HOUR + 59) == 2.0);
    assert(!c.priceAt(T0 + 3 * HOUR));
    assert(c.priceLevel(T0) == "cheap");
    assert(c.priceLevel(T0 + HOUR) == "normal");
    assert(c.priceLevel(T0 + 2 * HOUR) == "expensive");

    bool threw = false;
    try { PriceCurve bad({{T0, 1.0}, {T0 + HOUR, 1.0}, {T0 + 3 * HOUR, 1.0}}); }
    catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    threw = false;
    try { PriceCurve bad({{T0, 1.0}, {T0, 1.0}}, HOUR); }
    catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    std::cout << "[PASS] Price curve invariants.\n";
}

// Test 2: a complete fetch, and revisions only move on real changes
void test_revisions() {
    PriceFeed feed(HOUR);
    auto a = feed.ingest(hourly(T0, ramp(24, 1.0)), T0, T0 + 24 * HOUR);
    assert(a->curve.size() == 24);
    assert(a->filledSteps == 0);
    assert(a->issues.empty());
    assert(!a->stale);

    auto b = feed.ingest(hourly(T0, ramp(24, 1.0)), T0, T0 + 24 * HOUR);
    assert(b->revision == a->revision);

    auto changed = ramp(24, 1.0);
    changed[5] = 9.0;
    auto c = feed.ingest(hourly(T0, changed), T0, T0 + 24 * HOUR);
    assert(c->revision == a->revision + 1);
    assert(feed.latest() == c);
    std::cout << "[PASS] Revisions.\n";
}

// Test 3: the back half of the horizon is missing with nothing cached
void test_missing_back_half() {
    PriceFeed feed(HOUR, 0.5);
    auto s = feed.ingest(hourly(T0, ramp(12, 1.0)), T0, T0 + 24 * HOUR);
    assert(s->curve.size() == 24);
    assert(s->curve.covers(T0 + 23 * HOUR));
    assert(s->filledSteps == 12);
    assert(hasIssue(s->issues, IssueKind::DataUnavailable));
    // Carried forward from the last real price, not the default
    assert(std::fabs(*s->curve.priceAt(T0 + 20 * HOUR) - (1.0 + 0.11)) < 1e-12);
    std::cout << "[PASS] Missing back half carried forward.\n";
}

// Test 4: gaps are filled from yesterday's cached prices
void test_fill_from_yesterday() {
    PriceFeed feed(HOUR);
    feed.ingest(hourly(T0, ramp(24, 2.0)), T0, T0 + 24 * HOUR);

    const Timestamp day2 = T0 + 86400;
    auto s = feed.ingest(hourly(day2, ramp(6, 5.0)), day2, day2 + 24 * HOUR);
    assert(s->curve.size() == 24);
    assert(s->filledSteps == 18);
    assert(std::fabs(*s->curve.priceAt(day2 + 2 * HOUR) - 5.02) < 1e-12);
    // Hour 10 comes from the same hour one day earlier
    assert(std::fabs(*s->curve.priceAt(day2 + 10 * HOUR) - 2.10) < 1e-12);
    std::cout << "[PASS] Fill from yesterday.\n";
}

// Test 5: a failing source falls back to the cached curve, flagged stale
void test_source_failure() {
    FlakySource src;
    src.points = hourly(T0, ramp(24, 1.0));
    PriceFeed feed(HOUR);

    auto ok = feed.refresh(src, T0, T0 + 24 * HOUR);
    assert(!ok->stale);

    src.fail = true;
    auto s = feed.refresh(src, T0 + 2 * HOUR, T0 + 26 * HOUR);
    assert(src.calls == 2);
    assert(s->stale);
    assert(hasIssue(s->issues, IssueKind::DataUnavailable));
    assert(s->curve.size() == 24);
    assert(std::fabs(*s->curve.priceAt(T0 + 3 * HOUR) - 1.03) < 1e-12);
    std::cout << "[PASS] Source failure uses cache.\n";
}

// Test 6: nothing known at all gives the default price, flagged
void test_defaults_only() {
    FlakySource src;
    src.fail = true;
    PriceFeed feed(HOUR, 0.42);
    auto s = feed.refresh(src, T0, T0 + 4 * HOUR);
    assert(s->curve.size() == 4);
    assert(s->filledSteps == 4);
    assert(*s->curve.priceAt(T0) == 0.42);
    std::cout << "[PASS] Default price fallback.\n";
}

// Test 7: sub-hourly planning over hourly prices
void test_resample() {
    PriceFeed feed(15 * 60);
    auto s = feed.ingest(hourly(T0, {1.0, 3.0}), T0, T0 + 2 * HOUR);
    assert(s->curve.size() == 8);
    assert(s->filledSteps == 0);
    assert(*s->curve.priceAt(T0 + 45 * 60) == 1.0);
    assert(*s->curve.priceAt(T0 + 60 * 60) == 3.0);
    std::cout << "[PASS] Resampling to the planning step.\n";
}

// Test 8: CSV source
void test_csv_source() {
    const std::string dir = scratch_dir("price_feed");
    const std::string path = dir + "/prices.csv";
    {
        std::ofstream out(path);
        out << "# epoch_s,price\n";
        out << T0 << ",0.30\n";
        out << "garbage line\n";
        out << T0 + HOUR << ",0.10\n";
    }
    CsvPriceSource src(path);
    auto pts = src.fetchPrices(T0, T0 + 2 * HOUR);
    assert(pts.size() == 2);
    assert(pts[1].price == 0.10);

    bool threw = false;
    try { src.fetchPrices(T0 + 10 * 86400, T0 + 11 * 86400); }
    catch (const DataUnavailableError&) { threw = true; }
    assert(threw);

    threw = false;
    try { CsvPriceSource::readFile(dir + "/missing.csv"); }
    catch (const DataUnavailableError&) { threw = true; }
    assert(threw);
    std::cout << "[PASS] CSV price source.\n";
}

int main() {
    setup_test_logging("price_feed");
    test_curve();
    test_revisions();
    test_missing_back_half();
    test_fill_from_yesterday();
    test_source_failure();
    test_defaults_only();
    test_resample();
    test_csv_source();
    std::cout << "All price feed tests passed.\n";
    return 0;
}
