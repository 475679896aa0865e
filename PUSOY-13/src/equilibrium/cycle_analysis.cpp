#include "cycle_analysis.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace Equilibrium {

// CONFIGURATION

const double PAYOFF_TOLERANCE = 1e-6;
const double OSCILLATION_TOLERANCE = 2.0;
const size_t MIN_CYCLE_LENGTH = 2;
const size_t OSCILLATION_REPEATS = 3;

const double MEAN_WEIGHT = 0.4;
const double MIN_WEIGHT = 0.4;
const double VARIANCE_WEIGHT = 0.2;

namespace {

template <typename Values>
double meanOf(const Values& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / values.size();
}

// two-pass, divided by n (not n - 1)
template <typename Values>
double populationVariance(const Values& values, double mean) {
    if (values.empty()) return 0.0;
    double sumOfSqDifferences = 0.0;
    for (double v : values) {
        double difference = v - mean;
        sumOfSqDifferences += difference * difference;
    }
    return sumOfSqDifferences / values.size();
}

}

bool isExactCycle(const std::vector<HistoryEntry>& history, size_t length) {
    const size_t n = history.size();
    if (length == 0 || n < 2 * length) return false;

    for (size_t i = 0; i < length; ++i) {
        const HistoryEntry& curr = history[n - 1 - i];
        const HistoryEntry& prev = history[n - 1 - i - length];

        if (curr.profile != prev.profile) return false;
        for (int p = 0; p < NUM_PLAYERS; ++p) {
            if (std::fabs(curr.payoffs[p] - prev.payoffs[p]) > PAYOFF_TOLERANCE) return false;
        }
    }
    return true;
}

bool isOscillating(const std::vector<HistoryEntry>& history, size_t length) {
    const size_t n = history.size();
    const size_t span = OSCILLATION_REPEATS * length;
    if (length == 0 || n < span) return false;

    const size_t first = n - span;
    for (int p = 0; p < NUM_PLAYERS; ++p) {
        for (size_t offset = 0; offset < length; ++offset) {
            double lo = history[first + offset].payoffs[p];
            double hi = lo;
            for (size_t k = first + offset; k < n; k += length) {
                lo = std::min(lo, history[k].payoffs[p]);
                hi = std::max(hi, history[k].payoffs[p]);
            }
            if (hi - lo > OSCILLATION_TOLERANCE) return false;
        }
    }
    return true;
}

std::optional<CycleWindow> detectCycle(const std::vector<HistoryEntry>& history) {
    const size_t n = history.size();

    for (size_t length = MIN_CYCLE_LENGTH; length <= n / 2; ++length) {
        if (isExactCycle(history, length) || isOscillating(history, length)) {
            return CycleWindow{n - length, length};
        }
    }
    return std::nullopt;
}

CycleStats analyzeCycle(const std::vector<HistoryEntry>& history, const CycleWindow& window) {
    if (window.length == 0 || window.start + window.length > history.size()) {
        throw std::out_of_range("Cycle window lies outside the history");
    }

    auto begin = history.begin() + window.start;
    auto end = begin + window.length;

    CycleStats stats;
    stats.length = window.length;

    std::set<Profile> profiles;
    for (auto it = begin; it != end; ++it) profiles.insert(it->profile);
    stats.uniqueProfiles = profiles.size();

    for (int p = 0; p < NUM_PLAYERS; ++p) {
        std::vector<double> values;
        values.reserve(window.length);
        for (auto it = begin; it != end; ++it) values.push_back(it->payoffs[p]);

        double sum = 0.0;
        for (double v : values) sum += v;

        stats.total[p] = sum;
        stats.mean[p] = sum / values.size();
        stats.min[p] = *std::min_element(values.begin(), values.end());
        stats.max[p] = *std::max_element(values.begin(), values.end());
        stats.variance[p] = populationVariance(values, stats.mean[p]);
    }
    return stats;
}

double profileScore(const Payoffs& payoffs) {
    double mean = meanOf(payoffs);
    double lowest = *std::min_element(payoffs.begin(), payoffs.end());
    double variance = populationVariance(payoffs, mean);
    return MEAN_WEIGHT * mean + MIN_WEIGHT * lowest - VARIANCE_WEIGHT * variance;
}

const HistoryEntry& selectBestInCycle(const std::vector<HistoryEntry>& history, const CycleWindow& window) {
    if (window.length == 0 || window.start + window.length > history.size()) {
        throw std::out_of_range("Cycle window lies outside the history");
    }

    size_t best = window.start;
    double bestScore = profileScore(history[best].payoffs);

    for (size_t i = window.start + 1; i < window.start + window.length; ++i) {
        double score = profileScore(history[i].payoffs);
        if (score > bestScore) {
            bestScore = score;
            best = i;
        }
    }
    return history[best];
}

}
