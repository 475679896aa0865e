#include "arrangement.hpp"
#include <stdexcept>

namespace Arrange {

namespace {

template <size_t N>
std::string rowToString(const std::array<Cards::Card, N>& row) {
    std::string out;
    for (size_t i = 0; i < N; ++i) {
        if (i > 0) out += ' ';
        out += row[i].toString();
    }
    return out;
}

}

const Eval::Score& Arrangement::score(int position) const {
    switch (position) {
        case FRONT:  return frontScore;
        case MIDDLE: return middleScore;
        case BACK:   return backScore;
        default:
            throw std::out_of_range("Arrangement position must be 0..2, got " + std::to_string(position));
    }
}

std::string Arrangement::toString() const {
    return "Front  (" + frontScore.toString() + "): " + rowToString(front) + "\n" +
           "Middle (" + middleScore.toString() + "): " + rowToString(middle) + "\n" +
           "Back   (" + backScore.toString() + "): " + rowToString(back);
}

bool isLegalOrder(const Eval::Score& front, const Eval::Score& middle, const Eval::Score& back) {
    return front < middle && middle <= back;
}

}
