#include "PriceFeed.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

// ---------------------------------------------------------------------------
// CsvPriceSource
// ---------------------------------------------------------------------------
std::vector<PricePoint> CsvPriceSource::readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw DataUnavailableError("price file " + path + " cannot be opened");
    }

    std::vector<PricePoint> pts;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (line.empty() || line[0] == '#') continue;
        std::replace(line.begin(), line.end(), ',', ' ');
        std::istringstream iss(line);
        PricePoint p;
        if (!(iss >> p.time >> p.price) || !std::isfinite(p.price)) {
            Logger::instance().warn("CsvPriceSource",
                path + " line " + std::to_string(lineno) + " malformed, skipping");
            continue;
        }
        pts.push_back(p);
    }
    std::sort(pts.begin(), pts.end(),
              [](const PricePoint& a, const PricePoint& b) { return a.time < b.time; });
    return pts;
}

std::vector<PricePoint> CsvPriceSource::fetchPrices(Timestamp start, Timestamp end) {
    std::vector<PricePoint> all = readFile(path_);
    std::vector<PricePoint> out;
    for (const auto& p : all) {
        if (p.time < end && p.time >= start - 24 * 3600) out.push_back(p);
    }
    if (out.empty()) {
        throw DataUnavailableError("no prices in " + path_ + " for the requested horizon");
    }
    return out;
}

// ---------------------------------------------------------------------------
// PriceFeed
// ---------------------------------------------------------------------------
namespace {

// Native span of a fetched series: smallest positive gap, or fallback.
int inferSpan(const std::vector<PricePoint>& pts, int fallback) {
    int span = 0;
    for (std::size_t i = 1; i < pts.size(); ++i) {
        const Timestamp gap = pts[i].time - pts[i - 1].time;
        if (gap > 0 && (span == 0 || gap < span)) span = static_cast<int>(gap);
    }
    return span > 0 ? span : fallback;
}

// Price whose [time, time + span) contains t.
const PricePoint* lookup(const std::vector<PricePoint>& pts, Timestamp t, int span) {
    auto it = std::upper_bound(pts.begin(), pts.end(), t,
        [](Timestamp v, const PricePoint& p) { return v < p.time; });
    if (it == pts.begin()) return nullptr;
    --it;
    if (t - it->time < span) return &*it;
    return nullptr;
}

} // namespace

PriceFeed::PriceFeed(int stepSeconds, double defaultPrice, int retainDays)
    : step_s_(stepSeconds), default_price_(defaultPrice), retain_days_(retainDays) {
    if (step_s_ <= 0) {
        throw std::invalid_argument("PriceFeed: step must be positive");
    }
}

std::shared_ptr<const PriceSnapshot> PriceFeed::refresh(PriceSource& source,
                                                        Timestamp start, Timestamp end) {
    std::vector<PricePoint> fetched;
    try {
        fetched = source.fetchPrices(start, end);
    } catch (const DataUnavailableError& e) {
        Logger::instance().warn("PriceFeed", std::string("fetch failed, using cache: ") + e.what());
        return build_(nullptr, e.what(), start, end);
    }
    return build_(&fetched, "", start, end);
}

std::shared_ptr<const PriceSnapshot> PriceFeed::ingest(const std::vector<PricePoint>& fetched,
                                                       Timestamp start, Timestamp end) {
    return build_(&fetched, "", start, end);
}

std::shared_ptr<const PriceSnapshot> PriceFeed::latest() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return latest_;
}

std::shared_ptr<const PriceSnapshot> PriceFeed::build_(const std::vector<PricePoint>* fetched,
                                                       const std::string& failure,
                                                       Timestamp start, Timestamp end) {
    std::lock_guard<std::mutex> lock(mtx_);

    // Align the horizon to the step grid.
    start -= ((start % step_s_) + step_s_) % step_s_;
    if (end <= start) end = start + step_s_;

    std::vector<PricePoint> sorted;
    int span = step_s_;
    if (fetched) {
        sorted = *fetched;
        std::sort(sorted.begin(), sorted.end(),
                  [](const PricePoint& a, const PricePoint& b) { return a.time < b.time; });
        span = inferSpan(sorted, step_s_);
    }

    auto snap = std::make_shared<PriceSnapshot>();
    snap->stale = (fetched == nullptr);

    std::vector<PricePoint> pts;
    int fromCache = 0, carried = 0, defaulted = 0;
    bool haveLast = false;
    double last = default_price_;

    // Seed carry-forward with the newest cached price before the horizon.
    auto seed = cache_.lower_bound(start);
    if (seed != cache_.begin()) {
        --seed;
        last = seed->second;
        haveLast = true;
    }

    for (Timestamp t = start; t < end; t += step_s_) {
        double price = 0.0;
        const PricePoint* hit = fetched ? lookup(sorted, t, span) : nullptr;
        if (hit) {
            price = hit->price;
            cache_[t] = price;
        } else if (auto c = cache_.find(t); c != cache_.end()) {
            price = c->second;
            ++fromCache;
        } else if (auto y = cache_.find(t - 24 * 3600); y != cache_.end()) {
            price = y->second;
            ++fromCache;
        } else if (haveLast) {
            price = last;
            ++carried;
        } else {
            price = default_price_;
            ++defaulted;
        }
        last = price;
        haveLast = true;
        pts.push_back({t, price});
    }

    // Trim the cache to the retention window.
    const Timestamp cutoff = start - static_cast<Timestamp>(retain_days_) * 24 * 3600;
    cache_.erase(cache_.begin(), cache_.lower_bound(cutoff));

    snap->curve = PriceCurve(std::move(pts), step_s_);
    snap->filledSteps = fromCache + carried + defaulted;

    if (snap->stale) {
        snap->issues.push_back({IssueKind::DataUnavailable,
            "price fetch failed (" + failure + "); using cached curve", 0.0});
    }
    if (fromCache > 0) {
        snap->issues.push_back({IssueKind::DataUnavailable,
            std::to_string(fromCache) + " price step(s) taken from the cached curve",
            static_cast<double>(fromCache)});
    }
    if (carried > 0) {
        snap->issues.push_back({IssueKind::DataUnavailable,
            std::to_string(carried) + " price step(s) carried forward from the last known price",
            static_cast<double>(carried)});
    }
    if (defaulted > 0) {
        snap->issues.push_back({IssueKind::DataUnavailable,
            std::to_string(defaulted) + " price step(s) set to the default price",
            static_cast<double>(defaulted)});
    }

    // Revision only moves when the prices themselves changed.
    bool changed = !latest_ || latest_->curve.size() != snap->curve.size() ||
                   latest_->curve.start() != snap->curve.start();
    if (!changed) {
        const auto& a = latest_->curve.points();
        const auto& b = snap->curve.points();
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (std::fabs(a[i].price - b[i].price) > 1e-12) { changed = true; break; }
        }
    }
    if (changed) ++revision_;
    snap->revision = revision_;

    latest_ = snap;
    return latest_;
}
