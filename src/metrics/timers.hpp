#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace csvdx {

struct WallTimer {
    using clock = std::chrono::steady_clock;
    clock::time_point t0, t1;
    void start() { t0 = clock::now(); }
    void stop()  { t1 = clock::now(); }
    double ms() const { return std::chrono::duration<double,std::milli>(t1 - t0).count(); }
};

// Named pass stage (read, profile, render) for --verbose timing lines.
struct StageTimer {
    std::string   name;
    std::uint64_t calls = 0;
    WallTimer     wt{};
    double        total_ms = 0.0;

    explicit StageTimer(const char* n) : name(n ? n : "(stage)") {}
    void start() { wt.start(); }
    void stop()  { wt.stop(); total_ms += wt.ms(); ++calls; }
};

}
