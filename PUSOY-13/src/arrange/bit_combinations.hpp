#pragma once

#include <cstdint>
#include <optional>

namespace Arrange {

/*
Every r-of-n bit pattern, smallest first.
 (1 << r) - 1 is the first pattern, each next() applies Gosper's hack
 (next larger integer with the same popcount) until the pattern leaves the n low bits

 BitCombinations front(13, 3); // 286 patterns: 0b111, 0b1011, 0b1101, 0b1110, 0b10011 ...

the sequence is finite (C(n, r) values) and restartable with reset()
n is limited to 31 so patterns fit a uint32_t
*/
class BitCombinations {
public:
    // throws std::invalid_argument unless 0 <= r <= n <= 31
    BitCombinations(int n, int r);

    // next pattern, nullopt once the sequence is exhausted
    std::optional<uint32_t> next();

    // start over from the first pattern
    void reset();

private:
    int n_;
    int r_;
    uint32_t current_;
    uint32_t limit_;
    bool done_;
};

}
