#pragma once

#include <cstddef>
#include <deque>
#include <vector>

namespace streamready {
namespace stats {

/**
 * Fixed-capacity FIFO of the most recent observations for one metric.
 * Pushing onto a full window evicts the oldest element first.
 */
template <typename T>
class RollingWindow {
public:
    explicit RollingWindow(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    void push(const T& value) {
        values_.push_back(value);
        if (values_.size() > capacity_) {
            values_.pop_front();
        }
    }

    void clear() { values_.clear(); }

    size_t size() const { return values_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return values_.empty(); }
    bool full() const { return values_.size() == capacity_; }

    const T& front() const { return values_.front(); }
    const T& back() const { return values_.back(); }
    const T& operator[](size_t index) const { return values_[index]; }

    // Oldest first
    std::vector<T> values() const { return std::vector<T>(values_.begin(), values_.end()); }

private:
    size_t capacity_;
    std::deque<T> values_;
};

// All helpers are total: they never return NaN and never throw.

// Arithmetic mean; 0 for an empty input
double mean(const std::vector<double>& values);

// Population standard deviation (divides by N); 0 for fewer than 2 points
double stdDev(const std::vector<double>& values);

// Mean absolute deviation from the mean; 0 for fewer than 2 points
double meanAbsoluteDeviation(const std::vector<double>& values);

/**
 * Rank percentile on a sorted copy: element at index floor(N * p / 100),
 * clamped to the last element. p is in [0, 100]. 0 for an empty input.
 */
double percentile(const std::vector<double>& values, double p);

// Median with midpoint averaging for even counts; 0 for an empty input
double median(const std::vector<double>& values);

/**
 * Slope between the newest point and the point (points - 1) positions
 * earlier: (x[n-1] - x[n-points]) / (points - 1). Positive means the
 * quantity is increasing. points == 0 uses the whole input. Returns 0 when
 * the input holds fewer than max(points, 2) values.
 */
double trendSlope(const std::vector<double>& values, size_t points = 0);

template <typename T>
std::vector<double> toDoubles(const RollingWindow<T>& window) {
    std::vector<double> out;
    out.reserve(window.size());
    for (size_t i = 0; i < window.size(); ++i) {
        out.push_back(static_cast<double>(window[i]));
    }
    return out;
}

double clamp01(double value);

} // namespace stats
} // namespace streamready
