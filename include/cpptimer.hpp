#ifndef CPPTIMER_H
#define CPPTIMER_H

#include <iostream>
#include <string>
#include <chrono>

#ifndef PLCP_ENABLE_TIMER
#define PLCP_ENABLE_TIMER 1
#endif

/**
 * @brief   Prints the time spent in a scope on destruction:
 *          `[TIMER] <name>: <t> μs`, indented by nesting level.
 *
 * Output is suppressed when compiled with `PLCP_ENABLE_TIMER=0`.
 */
struct timed_section {

    using clock_type = std::chrono::steady_clock;
    using time_point = clock_type::time_point;
    using precision = std::chrono::microseconds;

    time_point ts;
    std::string name;
    int mylevel;

    timed_section(const std::string& name) : name(name) {
        mylevel = level();
        level()++;
        start();
    }

    inline void print_prefix() {
        std::cerr << "[TIMER] ";
        for (int i = 0; i < mylevel; ++i) {
          std::cerr << "    ";
        }
    }

    inline void start() {
        ts = clock_type::now();
    }

    inline void print_time(const time_point::duration& dur) {
#if PLCP_ENABLE_TIMER
        print_prefix();
        auto d = std::chrono::duration_cast<precision>(dur).count();
        std::cerr << name << ": " << d << " μs" << std::endl;
#else
        (void)dur;
#endif
    }

    inline void new_section(const std::string& name) {
        // print out previous section, then start new
        auto ets = clock_type::now();
        print_time(ets - ts);
        this->name = name;
        start();
    }

    inline void end() {
        auto ets = clock_type::now();
        print_time(ets - ts);
    }

    static int& level() {
      static int level = 0;
      return level;
    }

    virtual ~timed_section() {
        end();
        level()--;
    }
};

/// tic/toc timer accumulating the total time of all measured intervals
struct timer {
    using clock_type = std::chrono::steady_clock;
    using time_point = clock_type::time_point;
    using duration = time_point::duration;

    time_point ts;
    duration elapsed;
    duration total;

    timer() : ts(), elapsed(0), total(0) {}

    inline void tic() {
      ts = clock_type::now();
    }

    inline void toc() {
      elapsed = clock_type::now() - ts;
      total += elapsed;
    }

    template <typename precision>
    inline typename precision::rep get_time() const {
      return std::chrono::duration_cast<precision>(elapsed).count();
    }

    inline std::chrono::nanoseconds::rep get_ns() const {
      return get_time<std::chrono::nanoseconds>();
    }

    /// last measured interval in milliseconds
    inline double get_ms() const {
      return std::chrono::duration<double, std::milli>(elapsed).count();
    }

    /// sum of all measured intervals in milliseconds
    inline double get_total_ms() const {
      return std::chrono::duration<double, std::milli>(total).count();
    }
};

#endif // CPPTIMER_H
