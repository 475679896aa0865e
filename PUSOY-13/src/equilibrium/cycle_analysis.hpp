#pragma once

#include "game_state.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace Equilibrium {

// the last `length` history entries, starting at history[start]
struct CycleWindow {
    size_t start;
    size_t length;
};

struct CycleStats {
    size_t length = 0;
    size_t uniqueProfiles = 0;
    Payoffs mean{};
    Payoffs min{};
    Payoffs max{};
    Payoffs variance{};  // population variance
    Payoffs total{};
};

/*
Exact repetition: the last `length` entries have the same profiles as the `length`
entries before them, payoffs equal within 1e-6.
*/
bool isExactCycle(const std::vector<HistoryEntry>& history, size_t length);

/*
Payoff oscillation with period `length`: needs at least 3 * length entries.
 for every player and every phase 0..length-1, the payoffs at that phase over the
 last 3 * length entries stay within 2.0 of each other
*/
bool isOscillating(const std::vector<HistoryEntry>& history, size_t length);

// shortest period 2..n/2 that is an exact cycle or an oscillation, window = the last period
std::optional<CycleWindow> detectCycle(const std::vector<HistoryEntry>& history);

CycleStats analyzeCycle(const std::vector<HistoryEntry>& history, const CycleWindow& window);

// 0.4 * mean + 0.4 * min - 0.2 * variance over the four players of one payoff vector
double profileScore(const Payoffs& payoffs);

// window entry with the highest profileScore, earliest one on ties
const HistoryEntry& selectBestInCycle(const std::vector<HistoryEntry>& history, const CycleWindow& window);

}
