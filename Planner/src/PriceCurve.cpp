#include "PriceCurve.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

PriceCurve::PriceCurve(std::vector<PricePoint> points, int stepSeconds)
    : points_(std::move(points)), step_s_(stepSeconds) {
    if (points_.empty()) return;

    if (step_s_ <= 0) {
        if (points_.size() < 2) {
            throw std::invalid_argument("PriceCurve: single point needs an explicit step");
        }
        step_s_ = static_cast<int>(points_[1].time - points_[0].time);
        if (step_s_ <= 0) {
            throw std::invalid_argument("PriceCurve: timestamps must be strictly increasing");
        }
    }

    for (std::size_t i = 1; i < points_.size(); ++i) {
        const Timestamp gap = points_[i].time - points_[i - 1].time;
        if (gap <= 0) {
            throw std::invalid_argument(
                "PriceCurve: timestamps must be strictly increasing (index " +
                std::to_string(i) + ")");
        }
        if (gap != step_s_) {
            throw std::invalid_argument(
                "PriceCurve: gap of " + std::to_string(gap) + " s at index " +
                std::to_string(i) + ", expected " + std::to_string(step_s_) + " s");
        }
    }
}

Timestamp PriceCurve::start() const {
    return points_.empty() ? 0 : points_.front().time;
}

Timestamp PriceCurve::end() const {
    return points_.empty() ? 0 : points_.back().time + step_s_;
}

bool PriceCurve::covers(Timestamp t) const {
    return !points_.empty() && t >= start() && t < end();
}

std::optional<double> PriceCurve::priceAt(Timestamp t) const {
    if (!covers(t)) return std::nullopt;
    const std::size_t idx = static_cast<std::size_t>((t - start()) / step_s_);
    return points_[idx].price;
}

double PriceCurve::average() const {
    if (points_.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& p : points_) sum += p.price;
    return sum / static_cast<double>(points_.size());
}

double PriceCurve::minPrice() const {
    if (points_.empty()) return 0.0;
    return std::min_element(points_.begin(), points_.end(),
        [](const PricePoint& a, const PricePoint& b) { return a.price < b.price; })->price;
}

double PriceCurve::maxPrice() const {
    if (points_.empty()) return 0.0;
    return std::max_element(points_.begin(), points_.end(),
        [](const PricePoint& a, const PricePoint& b) { return a.price < b.price; })->price;
}

std::string PriceCurve::priceLevel(Timestamp t) const {
    auto p = priceAt(t);
    if (!p) return "unknown";
    const double avg = average();
    if (*p < 0.85 * avg) return "cheap";
    if (*p > 1.15 * avg) return "expensive";
    return "normal";
}
