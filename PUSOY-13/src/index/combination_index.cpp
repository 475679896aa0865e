#include "combination_index.hpp"
#include "cards/card.hpp"
#include "eval/evaluator.hpp"
#include <algorithm>
#include <array>
#include <atomic>
#include <iostream>
#include <stdexcept>
#include <string>

// builds fine without OpenMP, the pragmas are just ignored
#ifdef _OPENMP
#include <omp.h>
#endif

namespace Index {

// CONFIGURATION

const size_t PROGRESS_INTERVAL = 100000;
const int MAX_ARITY = 5;

namespace {

// Pascal's triangle up to C(52, 5)
struct BinomialTable {
    size_t values[Cards::DECK_SIZE + 1][MAX_ARITY + 1];

    BinomialTable() {
        for (int n = 0; n <= Cards::DECK_SIZE; ++n) {
            values[n][0] = 1;
            for (int k = 1; k <= MAX_ARITY; ++k) {
                values[n][k] = (n == 0) ? 0 : values[n - 1][k - 1] + values[n - 1][k];
            }
        }
    }
};

const BinomialTable& binomials() {
    static const BinomialTable table;
    return table;
}

std::array<Cards::Card, Cards::DECK_SIZE> makeDeck() {
    std::array<Cards::Card, Cards::DECK_SIZE> deck;
    for (int id = 0; id < Cards::DECK_SIZE; ++id) {
        deck[id] = Cards::fromId(id);
    }
    return deck;
}

// prints "Processed x/y" whenever a finished block crosses a multiple of the interval
void reportProgress(std::atomic<size_t>& processed, size_t block, size_t total, bool verbose) {
    size_t before = processed.fetch_add(block);
    if (!verbose) return;

    size_t after = before + block;
    if (before / PROGRESS_INTERVAL != after / PROGRESS_INTERVAL) {
        #pragma omp critical(index_progress)
        {
            std::cout << "Processed " << (after / PROGRESS_INTERVAL) * PROGRESS_INTERVAL
                      << "/" << total << " combinations..." << std::endl;
        }
    }
}

}

size_t binomial(int n, int k) {
    if (n < 0 || n > Cards::DECK_SIZE || k < 0 || k > MAX_ARITY) return 0;
    return binomials().values[n][k];
}

size_t combinationRank(const int* sortedIds, int arity) {
    const BinomialTable& table = binomials();
    size_t rank = 0;
    for (int i = 0; i < arity; ++i) {
        rank += table.values[sortedIds[i]][i + 1];
    }
    return rank;
}

CombinationIndex::CombinationIndex(int arity) : arity_(arity) {
    if (arity != 3 && arity != 5) {
        throw std::invalid_argument("Combination index arity must be 3 or 5, got " + std::to_string(arity));
    }
    table_.resize(binomial(Cards::DECK_SIZE, arity));
}

CombinationIndex CombinationIndex::build(int arity, bool verbose) {
    CombinationIndex index(arity);
    const std::array<Cards::Card, Cards::DECK_SIZE> deck = makeDeck();
    const size_t total = index.table_.size();
    std::vector<Eval::Score>& table = index.table_;

    if (verbose) {
        std::cout << "Generating " << arity << "-card combinations..." << std::endl;
    }

    std::atomic<size_t> processed{0};

    // every combination is owned by its highest card, so the top card loop splits the work
    if (arity == 3) {
        #pragma omp parallel for schedule(dynamic)
        for (int c2 = 2; c2 < Cards::DECK_SIZE; ++c2) {
            for (int c1 = 1; c1 < c2; ++c1) {
                for (int c0 = 0; c0 < c1; ++c0) {
                    const int ids[3] = { c0, c1, c2 };
                    table[combinationRank(ids, 3)] = Eval::evaluate3({ deck[c0], deck[c1], deck[c2] });
                }
            }
            reportProgress(processed, binomial(c2, 2), total, verbose);
        }
    } else {
        #pragma omp parallel for schedule(dynamic)
        for (int c4 = 4; c4 < Cards::DECK_SIZE; ++c4) {
            for (int c3 = 3; c3 < c4; ++c3) {
                for (int c2 = 2; c2 < c3; ++c2) {
                    for (int c1 = 1; c1 < c2; ++c1) {
                        for (int c0 = 0; c0 < c1; ++c0) {
                            const int ids[5] = { c0, c1, c2, c3, c4 };
                            table[combinationRank(ids, 5)] = Eval::evaluate5(
                                { deck[c0], deck[c1], deck[c2], deck[c3], deck[c4] });
                        }
                    }
                }
            }
            reportProgress(processed, binomial(c4, 4), total, verbose);
        }
    }

    index.size_ = static_cast<size_t>(std::count_if(table.begin(), table.end(),
                                                    [](const Eval::Score& s) { return s.isValid(); }));

    if (verbose) {
        std::cout << "Generated " << index.size_ << " " << arity << "-card combinations." << std::endl;
    }
    return index;
}

CombinationIndex CombinationIndex::fromEntries(int arity, const std::vector<Entry>& entries) {
    CombinationIndex index(arity);
    int sorted[MAX_ARITY];

    for (const Entry& entry : entries) {
        if (!index.canonicalize(entry.first, sorted)) {
            throw std::invalid_argument("Invalid combination key in index entries");
        }
        if (!entry.second.isValid()) {
            throw std::invalid_argument("Invalid score in index entries");
        }

        Eval::Score& slot = index.table_[combinationRank(sorted, arity)];
        if (!slot.isValid()) index.size_++;
        slot = entry.second;
    }
    return index;
}

bool CombinationIndex::canonicalize(const std::vector<int>& ids, int* sorted) const {
    if (static_cast<int>(ids.size()) != arity_) return false;

    std::copy(ids.begin(), ids.end(), sorted);
    std::sort(sorted, sorted + arity_);

    for (int i = 0; i < arity_; ++i) {
        if (sorted[i] < 0 || sorted[i] >= Cards::DECK_SIZE) return false;
        if (i > 0 && sorted[i] == sorted[i - 1]) return false;
    }
    return true;
}

std::optional<Eval::Score> CombinationIndex::find(const std::vector<int>& ids) const {
    int sorted[MAX_ARITY];
    if (!canonicalize(ids, sorted)) {
        return std::nullopt;
    }
    return findSorted(sorted);
}

std::optional<Eval::Score> CombinationIndex::findSorted(const int* sortedIds) const {
    const Eval::Score& score = table_[combinationRank(sortedIds, arity_)];
    if (!score.isValid()) {
        return std::nullopt;
    }
    return score;
}

Eval::Score CombinationIndex::at(const std::vector<int>& ids) const {
    auto score = find(ids);
    if (!score) {
        throw std::out_of_range("Combination missing from " + std::to_string(arity_) + "-card index");
    }
    return *score;
}

}
