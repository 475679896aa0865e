#include "bit_combinations.hpp"
#include <stdexcept>
#include <string>

namespace Arrange {

BitCombinations::BitCombinations(int n, int r) : n_(n), r_(r) {
    if (n < 0 || n > 31 || r < 0 || r > n) {
        throw std::invalid_argument("BitCombinations needs 0 <= r <= n <= 31, got n=" +
                                    std::to_string(n) + " r=" + std::to_string(r));
    }
    limit_ = 1u << n_;
    reset();
}

void BitCombinations::reset() {
    current_ = (1u << r_) - 1;
    done_ = false;
}

std::optional<uint32_t> BitCombinations::next() {
    if (done_) {
        return std::nullopt;
    }

    uint32_t pattern = current_;

    // choosing nothing has exactly one pattern, and Gosper's hack would divide by zero
    if (pattern == 0) {
        done_ = true;
        return pattern;
    }

    // Gosper's hack: move the lowest block of ones up by one and repack the rest at the bottom
    uint32_t lowest = pattern & (~pattern + 1);
    uint32_t ripple = pattern + lowest;
    uint32_t successor = (((ripple ^ pattern) >> 2) / lowest) | ripple;

    // ripple wraps to 0 once the ones reach bit 31, anything at or past the limit is finished too
    if (ripple == 0 || successor >= limit_) {
        done_ = true;
    } else {
        current_ = successor;
    }
    return pattern;
}

}
