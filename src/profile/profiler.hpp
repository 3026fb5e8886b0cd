#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "config/diag_config.hpp"
#include "profile/reservoir.hpp"
#include "util/errors.hpp"

namespace csvdx {

inline double median_sorted(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    const std::size_t mid = v.size() / 2;
    if (v.size() % 2 == 1) return v[mid];
    return v[mid - 1] + (v[mid] - v[mid - 1]) / 2.0;
}

// ---------- numeric ----------
// Welford mean/variance, min/max, and a reservoir for median/MAD. The robust
// center and scale come from the reservoir only, so extreme values cannot
// inflate the scale used to judge them.
class numeric_accumulator {
public:
    numeric_accumulator(std::size_t reservoir_capacity, std::uint64_t seed)
        : sample_(reservoir_capacity, seed) {}

    void add_null() { open_check(); ++null_count_; }

    void update(double x) {
        open_check();
        ++count_;
        if (count_ == 1) { min_ = max_ = x; }
        else {
            if (x < min_) min_ = x;
            if (x > max_) max_ = x;
        }
        const double delta = x - mean_;
        mean_ += delta / static_cast<double>(count_);
        const double delta2 = x - mean_;
        m2_ += delta * delta2;
        sample_.add(x);
    }

    // Parallel-variance merge of a partial built over later rows.
    void merge(const numeric_accumulator& o) {
        open_check();
        if (o.closed_) throw usage_error("cannot merge a finalized numeric accumulator");
        null_count_ += o.null_count_;
        sample_.merge(o.sample_);
        if (o.count_ == 0) return;
        if (count_ == 0) {
            count_ = o.count_; mean_ = o.mean_; m2_ = o.m2_; min_ = o.min_; max_ = o.max_;
            return;
        }
        const double na = static_cast<double>(count_);
        const double nb = static_cast<double>(o.count_);
        const double n  = na + nb;
        const double delta = o.mean_ - mean_;
        mean_ += delta * (nb / n);
        m2_   += o.m2_ + delta * delta * (na * nb / n);
        count_ += o.count_;
        if (o.min_ < min_) min_ = o.min_;
        if (o.max_ > max_) max_ = o.max_;
    }

    void finalize(const diag_config& cfg) {
        open_check();
        closed_ = true;

        std::vector<double>& v = sample_.values();
        std::sort(v.begin(), v.end());
        if (v.empty()) return;

        median_ = median_sorted(v);
        std::vector<double> dev;
        dev.reserve(v.size());
        for (double x : v) dev.push_back(std::fabs(x - median_));
        std::sort(dev.begin(), dev.end());
        mad_ = median_sorted(dev);
        scale_ = mad_ * cfg.mad_consistency;

        if (!(scale_ > 0.0)) {
            // More than half the sample sits on the median.
            double sum = 0.0;
            for (double d : dev) sum += d;
            scale_ = (sum / static_cast<double>(dev.size())) * cfg.meanad_consistency;
        }
        if (!(scale_ > 0.0)) return;

        std::uint64_t flagged = 0;
        for (double x : v) {
            if (std::fabs(x - median_) / scale_ >= cfg.outlier_robust_z) ++flagged;
        }
        sample_outliers_ = flagged;
        if (sample_.exact()) {
            outliers_ = flagged;
        } else {
            const double rate = static_cast<double>(sample_.seen()) / static_cast<double>(v.size());
            outliers_ = static_cast<std::uint64_t>(std::llround(static_cast<double>(flagged) * rate));
        }
    }

    bool closed() const noexcept { return closed_; }

    std::uint64_t count() const noexcept { return count_; }
    std::uint64_t null_count() const noexcept { return null_count_; }
    double mean() const noexcept { return count_ > 0 ? mean_ : std::numeric_limits<double>::quiet_NaN(); }
    double m2() const noexcept { return m2_; }
    double variance() const noexcept {
        return count_ > 1 ? m2_ / static_cast<double>(count_ - 1) : std::numeric_limits<double>::quiet_NaN();
    }
    double stddev() const noexcept { return std::sqrt(variance()); }
    double min() const noexcept { return min_; }
    double max() const noexcept { return max_; }

    // Valid after finalize.
    double median() const noexcept { return median_; }
    double mad() const noexcept { return mad_; }
    double robust_scale() const noexcept { return scale_; }
    std::uint64_t outlier_count() const noexcept { return outliers_; }
    std::uint64_t sample_outlier_count() const noexcept { return sample_outliers_; }
    bool sampled() const noexcept { return !sample_.exact(); }
    const reservoir& sample() const noexcept { return sample_; }

private:
    void open_check() const {
        if (closed_) throw usage_error("numeric accumulator used after finalize");
    }

    std::uint64_t null_count_ = 0;
    std::uint64_t count_ = 0;
    double mean_ = 0.0, m2_ = 0.0;
    double min_ = 0.0, max_ = 0.0;
    reservoir sample_;

    double median_ = 0.0, mad_ = 0.0, scale_ = 0.0;
    std::uint64_t outliers_ = 0, sample_outliers_ = 0;
    bool closed_ = false;
};

// ---------- categorical ----------
// Exact value -> frequency map. The modal value is tracked incrementally;
// on equal frequency the value first seen (lowest row index) wins.
class categorical_accumulator {
public:
    struct entry {
        std::uint64_t count = 0;
        std::uint64_t first_seen = 0;
    };

    void add_null() { open_check(); ++null_count_; }

    void update(std::string_view value, std::uint64_t row_index) {
        open_check();
        ++non_null_count_;
        auto [it, inserted] = freq_.try_emplace(std::string(value));
        if (inserted) it->second.first_seen = row_index;
        ++it->second.count;
        consider(it->first, it->second);
    }

    void merge(const categorical_accumulator& o) {
        open_check();
        if (o.closed_) throw usage_error("cannot merge a finalized categorical accumulator");
        null_count_     += o.null_count_;
        non_null_count_ += o.non_null_count_;
        for (const auto& [value, e] : o.freq_) {
            auto [it, inserted] = freq_.try_emplace(value, e);
            if (!inserted) {
                it->second.count += e.count;
                it->second.first_seen = std::min(it->second.first_seen, e.first_seen);
            }
        }
        // The tie-break is a total order, so scan order does not matter.
        has_mode_ = false;
        for (const auto& [value, e] : freq_) consider(value, e);
    }

    void finalize() {
        open_check();
        closed_ = true;
        if (non_null_count_ > 0) {
            const double n = static_cast<double>(non_null_count_);
            distinct_ratio_ = static_cast<double>(freq_.size()) / n;
            modal_fraction_ = static_cast<double>(modal_.count) / n;
        }
    }

    bool closed() const noexcept { return closed_; }

    std::uint64_t null_count() const noexcept { return null_count_; }
    std::uint64_t non_null_count() const noexcept { return non_null_count_; }
    std::uint64_t distinct_count() const noexcept { return freq_.size(); }
    const std::string& modal_value() const noexcept { return modal_value_; }
    std::uint64_t modal_frequency() const noexcept { return modal_.count; }
    std::uint64_t frequency(const std::string& value) const {
        auto it = freq_.find(value);
        return it == freq_.end() ? 0 : it->second.count;
    }

    // Valid after finalize.
    double distinct_ratio() const noexcept { return distinct_ratio_; }
    double modal_fraction() const noexcept { return modal_fraction_; }

private:
    void open_check() const {
        if (closed_) throw usage_error("categorical accumulator used after finalize");
    }

    void consider(const std::string& value, const entry& e) {
        if (!has_mode_ || e.count > modal_.count ||
            (e.count == modal_.count && e.first_seen < modal_.first_seen)) {
            if (!has_mode_ || modal_value_ != value) modal_value_ = value;
            modal_ = e;
            has_mode_ = true;
        }
    }

    std::uint64_t null_count_ = 0;
    std::uint64_t non_null_count_ = 0;
    std::unordered_map<std::string, entry> freq_;

    bool has_mode_ = false;
    std::string modal_value_;
    entry modal_{};

    double distinct_ratio_ = 0.0;
    double modal_fraction_ = 0.0;
    bool closed_ = false;
};

}
