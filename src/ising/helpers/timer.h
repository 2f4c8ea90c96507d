#ifndef ISING_HELPERS_TIMER_H
#define ISING_HELPERS_TIMER_H

#include <chrono>

// Wall clock time since construction.
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    // seconds
    double elapsed_time() const {
      return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

#endif //ISING_HELPERS_TIMER_H
