#include "pivot/stats.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <numeric>
#include <vector>

namespace pivot::stats {

    namespace detail {

        static std::vector<double> sorted_copy(std::span<const double> values) {
            std::vector<double> out{values.begin(), values.end()};
            std::ranges::sort(out);
            return out;
        }

        // Kolmogorov distribution tail Q(lambda); the small-lambda form converges where the
        // alternating series does not
        static double kolmogorov_q(double lambda) {
            if (lambda < 1e-3) {
                return 1.0;
            }
            if (lambda < 1.18) {
                auto y = std::exp(-(std::numbers::pi * std::numbers::pi) / (8.0 * lambda * lambda));
                auto y8 = std::pow(y, 8.0);
                auto sum = y * (1.0 + y8 * (1.0 + y8 * y8 * (1.0 + y8 * y8 * y8)));
                return 1.0 - (std::sqrt(2.0 * std::numbers::pi) / lambda) * sum;
            }
            double sum = 0.0;
            double sign = 1.0;
            for (int j = 1; j <= 100; ++j) {
                auto term = std::exp(-2.0 * j * j * lambda * lambda);
                sum += sign * term;
                if (term < 1e-12) {
                    break;
                }
                sign = -sign;
            }
            return 2.0 * sum;
        }

    }  // namespace detail

    double mean(std::span<const double> values) {
        if (values.empty()) {
            return 0.0;
        }
        return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    }

    double median(std::span<const double> values) {
        if (values.empty()) {
            return 0.0;
        }
        auto sorted = detail::sorted_copy(values);
        auto mid = sorted.size() / 2U;
        if (sorted.size() % 2U == 0U) {
            return (sorted[mid - 1U] + sorted[mid]) / 2.0;
        }
        return sorted[mid];
    }

    double stddev(std::span<const double> values) {
        if (values.empty()) {
            return 0.0;
        }
        auto m = mean(values);
        double acc = 0.0;
        for (auto v : values) {
            acc += (v - m) * (v - m);
        }
        return std::sqrt(acc / static_cast<double>(values.size()));
    }

    double percentile(std::span<const double> values, double p) {
        if (values.empty()) {
            return 0.0;
        }
        auto sorted = detail::sorted_copy(values);
        auto n = static_cast<double>(sorted.size());
        auto rank = static_cast<size_t>(std::ceil(std::clamp(p, 0.0, 100.0) / 100.0 * n));
        rank = std::clamp<size_t>(rank, 1U, sorted.size());
        return sorted[rank - 1U];
    }

    double ks_statistic(std::span<const double> lhs, std::span<const double> rhs) {
        if (lhs.empty() || rhs.empty()) {
            return 0.0;
        }
        auto a = detail::sorted_copy(lhs);
        auto b = detail::sorted_copy(rhs);
        auto na = static_cast<double>(a.size());
        auto nb = static_cast<double>(b.size());

        size_t i = 0U;
        size_t j = 0U;
        double d = 0.0;
        while (i < a.size() && j < b.size()) {
            auto x = std::min(a[i], b[j]);
            while (i < a.size() && a[i] <= x) {
                ++i;
            }
            while (j < b.size() && b[j] <= x) {
                ++j;
            }
            d = std::max(d, std::abs(static_cast<double>(i) / na - static_cast<double>(j) / nb));
        }
        return d;
    }

    double ks_pvalue(double d, size_t n, size_t m) {
        if (d <= 0.0 || n == 0U || m == 0U) {
            return 1.0;
        }
        auto ne = static_cast<double>(n) * static_cast<double>(m) / static_cast<double>(n + m);
        auto root = std::sqrt(ne);
        auto lambda = (root + 0.12 + 0.11 / root) * d;
        return std::clamp(detail::kolmogorov_q(lambda), 0.0, 1.0);
    }

    double pass_posterior(size_t passed, size_t failed, double max_failure_rate) {
        // failure rate ~ Beta(failed + 1, passed + 1); for integer parameters the regularized
        // incomplete beta is a binomial tail over n + 1 trials
        auto x = std::clamp(max_failure_rate, 0.0, 1.0);
        if (x <= 0.0) {
            return 0.0;
        }
        if (x >= 1.0) {
            return 1.0;
        }
        auto trials = static_cast<double>(passed + failed + 1U);
        double below = 0.0;
        for (size_t k = 0U; k <= failed; ++k) {
            auto kd = static_cast<double>(k);
            auto log_term = std::lgamma(trials + 1.0) - std::lgamma(kd + 1.0) - std::lgamma(trials - kd + 1.0) +
                            kd * std::log(x) + (trials - kd) * std::log1p(-x);
            below += std::exp(log_term);
        }
        return std::clamp(1.0 - below, 0.0, 1.0);
    }

}  // namespace pivot::stats
