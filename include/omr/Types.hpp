#ifndef OMR_TYPES_HPP
#define OMR_TYPES_HPP

#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace omr {

// One response level; the column index in a band selects the rating
struct Rating {
    std::string key;   // "5_star", "3_star", ...
    int weight = 0;
};

struct RatingScale {
    std::vector<Rating> ratings;

    // 5_star:5, 3_star:3, 1_star:1
    static RatingScale starRatings();

    std::size_t size() const { return ratings.size(); }
    bool empty() const { return ratings.empty(); }
    const Rating& operator[](std::size_t i) const { return ratings[i]; }

    int maxWeight() const;
    int indexOf(const std::string& key) const;  // -1 if absent
};

// Per-rating counts, aligned with a RatingScale by index
struct RatingCounts {
    std::vector<int> values;

    RatingCounts() = default;
    explicit RatingCounts(std::size_t ratingCount) : values(ratingCount, 0) {}
    RatingCounts(std::initializer_list<int> init) : values(init) {}

    int total() const;
    int at(std::size_t i) const { return i < values.size() ? values[i] : 0; }
    void increment(std::size_t i);
    RatingCounts& operator+=(const RatingCounts& other);

    bool operator==(const RatingCounts& other) const;
    bool operator!=(const RatingCounts& other) const { return !(*this == other); }
};

// Vertical page-fraction range [yStartFrac, yEndFrac) plus bubble columns
struct SubjectBand {
    std::string subject;
    double yStartFrac = 0.0;
    double yEndFrac = 0.0;
    std::vector<double> columnsX;
};

enum class VerdictRule {
    PercentageCutoff,
    ResponseCount
};

struct Verdict {
    bool passed = false;
    std::string label;
    VerdictRule rule = VerdictRule::PercentageCutoff;
};

struct SubjectScore {
    long long weightedScore = 0;
    long long maxScore = 0;
    int markedResponses = 0;   // slots that contributed a rating
    int responses = 0;         // respondents / forms the maximum was built from
    double percentage = 0.0;
    Verdict verdict;
};

} // namespace omr

#endif // OMR_TYPES_HPP
