#pragma once
#include <mustache.hpp>
#include <fmt/format.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "engine/engine.hpp"

namespace csvdx {

// Built-in text template. Free text (names, values, messages) is emitted
// with {{&...}} so it is not HTML-escaped.
inline const char* default_report_template() {
    return
R"(datainspect: {{&source}}
rows: {{rows}}  columns: {{column_count}}  malformed rows: {{malformed}}
{{#types}}

Types:
{{#columns}}
  - {{&name}}: {{type}}
{{/columns}}
{{/types}}
{{#summary}}

Summary:
{{#columns}}
  - {{&name}} ({{type}}): rows={{rows}} missing={{missing}}{{#numeric}} count={{count}} min={{min}} max={{max}} mean={{mean}} stddev={{stddev}} median={{median}} mad={{mad}} outliers={{outliers}}{{#distinct}} distinct={{distinct}} distinct_ratio={{distinct_ratio}}{{/distinct}}{{/numeric}}{{#categorical}} distinct={{distinct}} distinct_ratio={{distinct_ratio}} mode={{&mode}} ({{mode_freq}}){{/categorical}}
{{/columns}}
{{/summary}}
{{#diagnose}}

Diagnostics:
{{#columns}}
  {{&name}}:{{^has_findings}} ok{{/has_findings}}
{{#findings}}
    [{{severity}}] {{kind}}: {{&message}}
{{/findings}}
{{/columns}}

Findings: {{critical}} critical, {{warning}} warning, {{info}} info
{{/diagnose}}
)";
}

struct render_options {
    std::string source;
    bool types    = false;
    bool summary  = true;
    bool diagnose = true;
};

namespace detail {

inline std::string num(double v) { return fmt::format("{:.6g}", v); }

inline kainjow::mustache::data column_data(const column_report& c, const std::vector<finding>& findings) {
    using kainjow::mustache::data;
    data col;
    col.set("name", c.name);
    col.set("type", to_string(c.inferred_type));
    col.set("rows", std::to_string(c.row_count));
    col.set("missing", std::to_string(c.missing_count));

    if (const numeric_summary* n = c.numeric()) {
        data d;
        d.set("count", std::to_string(n->count));
        d.set("min", n->count ? num(n->min) : "-");
        d.set("max", n->count ? num(n->max) : "-");
        d.set("mean", n->count ? num(n->mean) : "-");
        d.set("stddev", n->has_stddev ? num(n->stddev) : "-");
        d.set("median", n->count ? num(n->median) : "-");
        d.set("mad", n->count ? num(n->mad) : "-");
        d.set("outliers", (n->sampled ? "~" : "") + std::to_string(n->outlier_count));
        if (n->integral) {
            d.set("distinct", std::to_string(n->distinct_count));
            d.set("distinct_ratio", fmt::format("{:.3f}", n->distinct_ratio));
        } else {
            d.set("distinct", data(false));
        }
        col.set("numeric", d);
        col.set("categorical", data(false));
    } else if (const categorical_summary* k = c.categorical()) {
        data d;
        d.set("distinct", std::to_string(k->distinct_count));
        d.set("distinct_ratio", fmt::format("{:.3f}", k->distinct_ratio));
        d.set("mode", k->non_missing_count ? k->modal_value : "-");
        d.set("mode_freq", std::to_string(k->modal_frequency));
        col.set("categorical", d);
        col.set("numeric", data(false));
    }

    data list{data::type::list};
    for (const auto& f : findings) {
        if (f.column_index != c.index) continue;
        data fd;
        fd.set("severity", to_string(f.level));
        fd.set("kind", to_string(f.kind));
        fd.set("message", f.message);
        list.push_back(fd);
    }
    col.set("has_findings", data(!list.list_value().empty()));
    col.set("findings", list);
    return col;
}

}

// Renders the text report for --types / --summary / --diagnose.
inline std::string render_text_report(const dataset_report& r, const render_options& opt,
                                      const std::string& tmpl = default_report_template()) {
    using kainjow::mustache::data;
    kainjow::mustache::mustache m{tmpl};
    if (!m.is_valid()) throw std::runtime_error("Mustache template parse error: " + m.error_message());

    data ctx;
    ctx.set("source", opt.source);
    ctx.set("rows", std::to_string(r.rows));
    ctx.set("column_count", std::to_string(r.columns.size()));
    ctx.set("malformed", std::to_string(r.malformed_rows));
    ctx.set("types", data(opt.types));
    ctx.set("summary", data(opt.summary));
    ctx.set("diagnose", data(opt.diagnose));

    data cols{data::type::list};
    for (const auto& c : r.columns) cols.push_back(detail::column_data(c, r.findings));
    ctx.set("columns", cols);

    std::uint64_t crit = 0, warn = 0, info = 0;
    for (const auto& f : r.findings) {
        if (f.level == severity::critical) ++crit;
        else if (f.level == severity::warning) ++warn;
        else ++info;
    }
    ctx.set("critical", std::to_string(crit));
    ctx.set("warning", std::to_string(warn));
    ctx.set("info", std::to_string(info));

    return m.render(ctx);
}

// Loads a user template; throws when it cannot be read.
inline std::string load_template(const std::filesystem::path& p) {
    std::ifstream tf(p, std::ios::binary);
    if (!tf) throw std::runtime_error("Failed to read template: " + p.string());
    std::ostringstream tss; tss << tf.rdbuf();
    return tss.str();
}

}
