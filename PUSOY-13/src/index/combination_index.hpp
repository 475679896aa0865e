#pragma once

#include "eval/score.hpp"
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

/*
Precomputed score of every 3-card and 5-card subset of the deck.

keys are card id sets (ids 0..51, order doesn't matter for the public lookups)
storage is dense: a sorted id set c0 < c1 < ... < c(k-1) lives at slot
 C(c0, 1) + C(c1, 2) + ... + C(c(k-1), k)
(combinatorial number system), so lookups are a handful of table reads

 arity 3: 22,100 slots
 arity 5: 2,598,960 slots

once built the index is never written again, so any number of threads can read it
*/

namespace Index {

// C(n, k) for 0 <= n <= 52, 0 <= k <= 5, 0 outside the table
size_t binomial(int n, int k);

// slot of an ascending id set
size_t combinationRank(const int* sortedIds, int arity);

class CombinationIndex {
public:
    using Entry = std::pair<std::vector<int>, Eval::Score>;

    /*
    Enumerates all C(52, arity) subsets once and evaluates each one.
     arity must be 3 or 5 (std::invalid_argument otherwise)
     verbose prints progress every 100,000 combinations
     runs the outer loop with OpenMP when available, every slot is written by exactly one thread
    */
    static CombinationIndex build(int arity, bool verbose = false);

    /*
    Index from an externally supplied mapping (persistence layer, partial test indices).
     keys may be in any order, a repeated key keeps the last score
     throws std::invalid_argument for a key of the wrong size, with bad or repeated ids,
     or an invalid score
    */
    static CombinationIndex fromEntries(int arity, const std::vector<Entry>& entries);

    // nullopt if the set isn't in the index (also for wrong size, bad or repeated ids)
    std::optional<Eval::Score> find(const std::vector<int>& ids) const;

    // hot path: exactly arity() ids, ascending, all in 0..51
    std::optional<Eval::Score> findSorted(const int* sortedIds) const;

    // same as find(), but a missing set means the index is broken: throws std::out_of_range
    Eval::Score at(const std::vector<int>& ids) const;

    int arity() const { return arity_; }

    // number of present entries
    size_t size() const { return size_; }

    // number of slots, C(52, arity)
    size_t capacity() const { return table_.size(); }

private:
    explicit CombinationIndex(int arity);

    bool canonicalize(const std::vector<int>& ids, int* sorted) const;

    int arity_;
    size_t size_ = 0;
    std::vector<Eval::Score> table_;
};

}
