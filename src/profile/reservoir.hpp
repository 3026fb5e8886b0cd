#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

namespace csvdx {

// Fixed-capacity uniform sample of a stream of doubles (Algorithm R).
// seen() counts every value offered, retained or not.
class reservoir {
public:
    reservoir(std::size_t capacity, std::uint64_t seed)
        : capacity_(capacity), rng_(seed)
    {
        if (capacity_ == 0) throw std::invalid_argument("reservoir capacity == 0");
    }

    void add(double x) {
        ++seen_;
        if (values_.size() < capacity_) { values_.push_back(x); return; }
        std::uniform_int_distribution<std::uint64_t> pick(0, seen_ - 1);
        const std::uint64_t j = pick(rng_);
        if (j < capacity_) values_[static_cast<std::size_t>(j)] = x;
    }

    // Combines with a reservoir built over a disjoint part of the stream.
    // Each retained value stands for seen/size stream values, so slots are
    // drawn without replacement with those weights; the global seen count is kept.
    void merge(const reservoir& o) {
        if (o.seen_ == 0) return;
        if (values_.size() + o.values_.size() <= capacity_ && exact() && o.exact()) {
            values_.insert(values_.end(), o.values_.begin(), o.values_.end());
            seen_ += o.seen_;
            return;
        }

        std::vector<double> a = std::move(values_);
        std::vector<double> b = o.values_;
        const double wa = a.empty() ? 0.0 : static_cast<double>(seen_)   / static_cast<double>(a.size());
        const double wb = b.empty() ? 0.0 : static_cast<double>(o.seen_) / static_cast<double>(b.size());
        std::size_t na = a.size(), nb = b.size();

        values_.clear();
        values_.reserve(std::min(capacity_, na + nb));
        while (values_.size() < capacity_ && na + nb > 0) {
            const double ma = wa * static_cast<double>(na);
            const double mb = wb * static_cast<double>(nb);
            std::uniform_real_distribution<double> side(0.0, ma + mb);
            const bool from_a = nb == 0 || (na > 0 && side(rng_) < ma);

            std::vector<double>& src = from_a ? a : b;
            std::size_t& n = from_a ? na : nb;
            std::uniform_int_distribution<std::size_t> pick(0, n - 1);
            const std::size_t k = pick(rng_);
            values_.push_back(src[k]);
            src[k] = src[n - 1];
            --n;
        }
        seen_ += o.seen_;
    }

    // True while every value seen is still retained.
    bool exact() const noexcept { return seen_ == values_.size(); }

    std::size_t capacity() const noexcept { return capacity_; }
    std::uint64_t seen() const noexcept { return seen_; }
    const std::vector<double>& values() const noexcept { return values_; }
    std::vector<double>& values() noexcept { return values_; }

private:
    std::size_t capacity_;
    std::uint64_t seen_ = 0;
    std::vector<double> values_;
    std::mt19937_64 rng_;
};

}
