#include "omr/Types.hpp"

#include <algorithm>
#include <numeric>

namespace omr {

RatingScale RatingScale::starRatings() {
    RatingScale scale;
    scale.ratings = {
        {"5_star", 5},
        {"3_star", 3},
        {"1_star", 1}
    };
    return scale;
}

int RatingScale::maxWeight() const {
    int best = 0;
    for (const auto& r : ratings) best = std::max(best, r.weight);
    return best;
}

int RatingScale::indexOf(const std::string& key) const {
    for (std::size_t i = 0; i < ratings.size(); ++i) {
        if (ratings[i].key == key) return static_cast<int>(i);
    }
    return -1;
}

int RatingCounts::total() const {
    return std::accumulate(values.begin(), values.end(), 0);
}

void RatingCounts::increment(std::size_t i) {
    if (i >= values.size()) values.resize(i + 1, 0);
    ++values[i];
}

RatingCounts& RatingCounts::operator+=(const RatingCounts& other) {
    if (other.values.size() > values.size()) values.resize(other.values.size(), 0);
    for (std::size_t i = 0; i < other.values.size(); ++i) {
        values[i] += other.values[i];
    }
    return *this;
}

bool RatingCounts::operator==(const RatingCounts& other) const {
    std::size_t n = std::max(values.size(), other.values.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (at(i) != other.at(i)) return false;
    }
    return true;
}

} // namespace omr
