#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace vita {

// ─── Intensity History ─────────────────────────────────────────
// Fixed-capacity ring of recent per-tick maximum intensities.
// Smoothing is a pure function of the current contents.

class IntensityHistory {
public:
    explicit IntensityHistory(size_t capacity = 16)
        : capacity_(std::max<size_t>(capacity, 1)) {
        values_.reserve(capacity_);
    }

    void push(double intensity) {
        if (values_.size() < capacity_) {
            values_.push_back(intensity);
        } else {
            values_[head_] = intensity;
        }
        head_ = (head_ + 1) % capacity_;
    }

    /// Values oldest first.
    std::vector<double> values() const {
        if (values_.size() < capacity_) return values_;
        std::vector<double> ordered;
        ordered.reserve(capacity_);
        for (size_t i = 0; i < capacity_; i++) {
            ordered.push_back(values_[(head_ + i) % capacity_]);
        }
        return ordered;
    }

    /// Exponentially weighted mean, newest value weighted by `alpha`.
    double smoothed(double alpha) const {
        auto ordered = values();
        if (ordered.empty()) return 0.0;
        double s = ordered.front();
        for (size_t i = 1; i < ordered.size(); i++) {
            s = alpha * ordered[i] + (1.0 - alpha) * s;
        }
        return s;
    }

    /// Largest |intensity| currently held.
    double peak() const {
        double p = 0.0;
        for (double v : values_) p = std::max(p, std::abs(v));
        return p;
    }

    size_t size() const { return values_.size(); }
    size_t capacity() const { return capacity_; }
    void clear() { values_.clear(); head_ = 0; }

private:
    size_t capacity_;
    size_t head_ = 0;
    std::vector<double> values_;
};

} // namespace vita
