#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "PriceCurve.hpp"

// External price boundary.
class PriceSource {
public:
    virtual ~PriceSource() = default;

    // Ordered points covering as much of [start, end) as the source knows.
    // Throws DataUnavailableError when the source cannot answer right now.
    virtual std::vector<PricePoint> fetchPrices(Timestamp start, Timestamp end) = 0;
};

// Reads "epoch_s,price" lines ('#' comments) from a file on every fetch,
// so a file rewritten by an external fetcher is picked up on refresh.
class CsvPriceSource : public PriceSource {
public:
    explicit CsvPriceSource(std::string path) : path_(std::move(path)) {}

    std::vector<PricePoint> fetchPrices(Timestamp start, Timestamp end) override;

    static std::vector<PricePoint> readFile(const std::string& path);

private:
    std::string path_;
};

// A complete curve for one horizon, with how it was obtained.
struct PriceSnapshot {
    PriceCurve curve;               // contiguous over the requested horizon
    long       revision    = 0;     // bumped whenever the prices changed
    bool       stale       = false; // last fetch failed, cache used
    int        filledSteps = 0;     // steps not supplied by the latest fetch
    std::vector<PlanIssue> issues;
};

// Caches every price it has seen and turns fetches into horizon snapshots.
// Gaps are filled from the cache (same timestamp, then the same time of day
// one day earlier), then by carrying the last known price forward, and as a
// last resort with defaultPrice. Every fill is flagged DataUnavailable.
class PriceFeed {
public:
    explicit PriceFeed(int stepSeconds, double defaultPrice = 1.0, int retainDays = 7);

    // Fetch from the source; on DataUnavailableError fall back to the cache.
    std::shared_ptr<const PriceSnapshot> refresh(PriceSource& source,
                                                 Timestamp start, Timestamp end);

    // Same as refresh() with points obtained elsewhere (e.g. broadcast).
    std::shared_ptr<const PriceSnapshot> ingest(const std::vector<PricePoint>& fetched,
                                                Timestamp start, Timestamp end);

    std::shared_ptr<const PriceSnapshot> latest() const;
    int stepSeconds() const { return step_s_; }

private:
    std::shared_ptr<const PriceSnapshot> build_(const std::vector<PricePoint>* fetched,
                                                const std::string& failure,
                                                Timestamp start, Timestamp end);

    int    step_s_;
    double default_price_;
    int    retain_days_;

    mutable std::mutex mtx_;
    std::map<Timestamp, double> cache_;   // at step resolution, fetched values only
    std::shared_ptr<const PriceSnapshot> latest_;
    long revision_ = 0;
};
