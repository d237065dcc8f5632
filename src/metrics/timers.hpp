#pragma once
#include <chrono>

namespace gsynth {

struct WallTimer {
    using clock = std::chrono::steady_clock;
    clock::time_point t0, t1;
    bool running = false;
    void start() { t0 = clock::now(); running = true; }
    void stop()  { t1 = clock::now(); running = false; }
    // While running, measures up to now.
    double ms() const {
        const auto end = running ? clock::now() : t1;
        return std::chrono::duration<double, std::milli>(end - t0).count();
    }
    double secs() const { return ms() / 1000.0; }
};

}
