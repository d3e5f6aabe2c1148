#pragma once
#include <optional>
#include <string>
#include <vector>
#include "PlanIssues.hpp"

struct PricePoint {
    Timestamp time  = 0;
    double    price = 0.0;   // currency per kWh
};

// Ordered, gap-free price series at a fixed step.
// Each point prices the interval [time, time + step).
class PriceCurve {
public:
    PriceCurve() = default;

    // Throws std::invalid_argument unless timestamps are strictly increasing
    // and contiguous at stepSeconds. stepSeconds == 0 infers the step from
    // the first two points (a single point then needs an explicit step).
    explicit PriceCurve(std::vector<PricePoint> points, int stepSeconds = 0);

    bool empty() const { return points_.empty(); }
    std::size_t size() const { return points_.size(); }
    int stepSeconds() const { return step_s_; }

    Timestamp start() const;
    Timestamp end() const;            // exclusive
    bool covers(Timestamp t) const;

    std::optional<double> priceAt(Timestamp t) const;
    const std::vector<PricePoint>& points() const { return points_; }

    double average() const;
    double minPrice() const;
    double maxPrice() const;

    // "cheap" below 85% of the curve average, "expensive" above 115%.
    std::string priceLevel(Timestamp t) const;

private:
    std::vector<PricePoint> points_;
    int step_s_ = 0;
};
