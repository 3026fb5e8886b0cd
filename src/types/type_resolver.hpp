#pragma once
#include <cstdint>

#include "types/infer.hpp"
#include "util/errors.hpp"

namespace csvdx {

enum class column_type { numeric, categorical, boolean, mixed };

// Which accumulator's state a finalized column reports from.
enum class accumulation_kind { numeric, categorical };

inline const char* to_string(column_type t) {
    switch (t) {
        case column_type::numeric:     return "numeric";
        case column_type::boolean:     return "boolean";
        case column_type::mixed:       return "mixed";
        default:                       return "categorical";
    }
}

// Counts per-row tags for one column and resolves the column type once, at
// finalize. Integer and float both vote Numeric, text votes Categorical.
class column_type_resolver {
public:
    void observe(value_tag t) {
        if (closed_) throw usage_error("type resolver updated after finalize");
        switch (t) {
            case value_tag::missing:  ++missing_;  break;
            case value_tag::integer:  ++integer_;  break;
            case value_tag::floating: ++floating_; break;
            case value_tag::boolean:  ++boolean_;  break;
            case value_tag::text:     ++text_;     break;
        }
    }

    // Folds a partial resolver built over a later shard of rows.
    void merge(const column_type_resolver& o) {
        if (closed_ || o.closed_) throw usage_error("cannot merge a finalized type resolver");
        missing_  += o.missing_;
        integer_  += o.integer_;
        floating_ += o.floating_;
        boolean_  += o.boolean_;
        text_     += o.text_;
    }

    void finalize() {
        if (closed_) throw usage_error("type resolver finalized twice");
        closed_ = true;

        const std::uint64_t numeric = integer_ + floating_;
        const std::uint64_t present = non_missing_count();
        std::uint64_t plurality = 0;

        // Ties prefer numeric, then boolean, then categorical.
        if (present == 0) {
            base_ = column_type::categorical;
        } else if (numeric >= boolean_ && numeric >= text_) {
            base_ = column_type::numeric;     plurality = numeric;
        } else if (boolean_ >= text_) {
            base_ = column_type::boolean;     plurality = boolean_;
        } else {
            base_ = column_type::categorical; plurality = text_;
        }
        nonconforming_ = present - plurality;

        type_ = (present > 0 && plurality * 2 <= present) ? column_type::mixed : base_;

        switch (base_) {
            case column_type::numeric:
                kind_ = accumulation_kind::numeric;
                break;
            case column_type::boolean:
                // A contaminated boolean column reports numeric stats when
                // numbers make up most of the contamination.
                kind_ = numeric > text_
                            ? accumulation_kind::numeric : accumulation_kind::categorical;
                break;
            default:
                kind_ = accumulation_kind::categorical;
        }
    }

    bool closed() const noexcept { return closed_; }

    column_type       type() const { require_closed(); return type_; }
    column_type       plurality_type() const { require_closed(); return base_; }
    accumulation_kind kind() const { require_closed(); return kind_; }
    std::uint64_t     nonconforming_count() const { require_closed(); return nonconforming_; }

    // Every non-missing value was an Integer.
    bool integral() const noexcept {
        return integer_ > 0 && floating_ == 0 && boolean_ == 0 && text_ == 0;
    }

    std::uint64_t missing_count() const noexcept { return missing_; }
    std::uint64_t non_missing_count() const noexcept { return integer_ + floating_ + boolean_ + text_; }
    std::uint64_t integer_count() const noexcept { return integer_; }
    std::uint64_t float_count() const noexcept { return floating_; }
    std::uint64_t boolean_count() const noexcept { return boolean_; }
    std::uint64_t text_count() const noexcept { return text_; }

private:
    void require_closed() const {
        if (!closed_) throw usage_error("column type read before finalize");
    }

    std::uint64_t missing_ = 0, integer_ = 0, floating_ = 0, boolean_ = 0, text_ = 0;
    std::uint64_t nonconforming_ = 0;
    column_type base_ = column_type::categorical;
    column_type type_ = column_type::categorical;
    accumulation_kind kind_ = accumulation_kind::categorical;
    bool closed_ = false;
};

}
