#pragma once
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace bench
{

struct Stats
{
    double mean_us = 0.0;
    double stddev_us = 0.0;
    double min_us = 0.0;
};

// Run `func()` `nWarm + nIters` times; statistics cover the last nIters only (µs)
template <typename F> Stats run(const F& func, int nIters = 10, int nWarm = 1)
{
    using clock = std::chrono::steady_clock;
    for (int i = 0; i < nWarm; ++i)
        func();

    std::vector<double> samples;
    samples.reserve(nIters);
    for (int i = 0; i < nIters; ++i)
    {
        auto t0 = clock::now();
        func();
        auto t1 = clock::now();
        samples.push_back(std::chrono::duration<double, std::micro>(t1 - t0).count());
    }

    Stats s;
    double sum = 0.0;
    for (double x : samples)
        sum += x;
    s.mean_us = sum / samples.size();

    double var = 0.0;
    for (double x : samples)
        var += (x - s.mean_us) * (x - s.mean_us);
    s.stddev_us = samples.size() > 1 ? std::sqrt(var / (samples.size() - 1)) : 0.0;
    s.min_us = *std::min_element(samples.begin(), samples.end());
    return s;
}

// Print result in a CTest-friendly key=value format; `items` adds a throughput column
inline void report(const std::string& name, const Stats& s, double items = 0)
{
    std::cout << name << " mean_us=" << s.mean_us << " stddev_us=" << s.stddev_us
              << " min_us=" << s.min_us;
    if (items > 0)
        std::cout << " items=" << items << " Mitems_per_s=" << (items / 1e6) / (s.mean_us * 1e-6);
    std::cout << '\n';
}

} // namespace bench
