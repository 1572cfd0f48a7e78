#ifndef OMR_LAYOUT_RESOLVER_HPP
#define OMR_LAYOUT_RESOLVER_HPP

#include "omr/Types.hpp"

#include <map>
#include <string>
#include <vector>

namespace omr {

// A class/stream code family and the subjects printed on its sheet
struct PhaseEntry {
    std::vector<std::string> codes;      // normalized, e.g. "11 jee"
    std::vector<std::string> subjects;
};

struct LayoutConfig {
    double usableStart = 0.12;   // page fraction where the first band may begin
    double usableEnd = 0.96;
    double bandFill = 0.85;      // share of each subject's slice covered by its band
    std::vector<double> columnsX{0.62, 0.74, 0.86};
    std::map<std::string, std::vector<double>> columnOverrides;   // normalized subject -> x fractions
    std::vector<PhaseEntry> phases;
    std::vector<std::string> fallbackSubjects;
};

LayoutConfig defaultLayoutConfig();

enum class LayoutSource {
    Explicit,
    Phase,
    Fallback
};

const char* layoutSourceName(LayoutSource source);

struct Layout {
    std::vector<SubjectBand> bands;
    LayoutSource source = LayoutSource::Explicit;

    std::vector<std::string> subjects() const;
};

class LayoutResolver {
public:
    explicit LayoutResolver(LayoutConfig config = defaultLayoutConfig());

    // A non-blank explicit list wins over the phase code. Throws LayoutError
    // when both are empty.
    Layout resolve(const std::vector<std::string>& subjects, const std::string& phase) const;

    // Never empty: unknown codes resolve to the fallback list
    std::vector<std::string> subjectsForPhase(const std::string& phase, LayoutSource* source = nullptr) const;

    std::vector<SubjectBand> computeBands(const std::vector<std::string>& subjects) const;

    static std::string normalizePhase(const std::string& code);

    const LayoutConfig& config() const { return config_; }

private:
    LayoutConfig config_;
};

} // namespace omr

#endif // OMR_LAYOUT_RESOLVER_HPP
