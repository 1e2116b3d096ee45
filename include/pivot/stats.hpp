#pragma once

#include <cstddef>
#include <span>

namespace pivot::stats {

    // All functions return 0 for empty input.

    double mean(std::span<const double> values);

    // average of the two middle elements for even sizes
    double median(std::span<const double> values);

    // population standard deviation
    double stddev(std::span<const double> values);

    // nearest rank: rank = ceil(p/100 * N), clamped to [1, N]
    double percentile(std::span<const double> values, double p);

    // two-sample Kolmogorov-Smirnov D statistic
    double ks_statistic(std::span<const double> lhs, std::span<const double> rhs);

    // asymptotic p-value of D for sample sizes n and m; 1 when D is 0 or either side is empty
    double ks_pvalue(double d, size_t n, size_t m);

    // P(failure rate < max_failure_rate) under a uniform Beta prior after observing the counts
    double pass_posterior(size_t passed, size_t failed, double max_failure_rate = 0.1);

}  // namespace pivot::stats
