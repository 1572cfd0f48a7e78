#include "omr/LayoutResolver.hpp"
#include "omr/Errors.hpp"
#include "omr/Logger.hpp"
#include "omr/TextUtil.hpp"

#include <cctype>
#include <set>
#include <sstream>
#include <utility>

namespace omr {

namespace {

bool isOrdinalSuffix(const std::string& s) {
    return s == "st" || s == "nd" || s == "rd" || s == "th";
}

// "11th" -> "11"
std::string stripOrdinal(const std::string& token) {
    if (token.size() < 3) return token;
    std::string suffix = token.substr(token.size() - 2);
    std::string digits = token.substr(0, token.size() - 2);
    if (!isOrdinalSuffix(suffix)) return token;
    for (unsigned char c : digits) {
        if (!std::isdigit(c)) return token;
    }
    return digits;
}

std::string joinNames(const std::vector<std::string>& names) {
    std::ostringstream oss;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << names[i];
    }
    return oss.str();
}

} // namespace

LayoutConfig defaultLayoutConfig() {
    LayoutConfig cfg;

    cfg.phases.push_back({
        {"9", "10"},
        {"Math", "Physics", "Chemistry", "Social", "English", "Language"}
    });
    cfg.phases.push_back({
        {"11 jee", "12 jee"},
        {"Physics", "Chemistry", "Maths", "Computer Science", "English"}
    });
    cfg.phases.push_back({
        {"11 neet", "12 neet"},
        {"Physics", "Chemistry", "Botany", "Zoology", "English"}
    });

    cfg.fallbackSubjects = {"Physics", "Chemistry", "Maths", "English"};
    return cfg;
}

const char* layoutSourceName(LayoutSource source) {
    switch (source) {
        case LayoutSource::Explicit: return "explicit";
        case LayoutSource::Phase:    return "phase";
        case LayoutSource::Fallback: return "fallback";
    }
    return "explicit";
}

std::vector<std::string> Layout::subjects() const {
    std::vector<std::string> out;
    out.reserve(bands.size());
    for (const auto& b : bands) out.push_back(b.subject);
    return out;
}

LayoutResolver::LayoutResolver(LayoutConfig config)
    : config_(std::move(config)) {}

std::string LayoutResolver::normalizePhase(const std::string& code) {
    std::string spaced = toLower(code);
    for (char& c : spaced) {
        if (c == '-' || c == '_' || c == '/') c = ' ';
    }

    std::istringstream iss(spaced);
    std::string token;
    std::vector<std::string> tokens;
    while (iss >> token) {
        if (tokens.empty() && (token == "grade" || token == "class" || token == "std")) continue;
        tokens.push_back(stripOrdinal(token));
    }

    std::string out;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) out.push_back(' ');
        out += tokens[i];
    }
    return out;
}

std::vector<std::string> LayoutResolver::subjectsForPhase(const std::string& phase,
                                                          LayoutSource* source) const {
    std::string key = normalizePhase(phase);

    for (const auto& entry : config_.phases) {
        for (const auto& code : entry.codes) {
            if (normalizePhase(code) == key && !entry.subjects.empty()) {
                if (source) *source = LayoutSource::Phase;
                return entry.subjects;
            }
        }
    }

    logWarning("Unknown phase code '" + phase + "', using default subject list");
    if (source) *source = LayoutSource::Fallback;
    return config_.fallbackSubjects;
}

std::vector<SubjectBand> LayoutResolver::computeBands(const std::vector<std::string>& subjects) const {
    std::vector<SubjectBand> bands;
    if (subjects.empty()) return bands;

    const double span = config_.usableEnd - config_.usableStart;
    const double share = span / static_cast<double>(subjects.size());

    for (size_t i = 0; i < subjects.size(); ++i) {
        SubjectBand band;
        band.subject = subjects[i];
        band.yStartFrac = config_.usableStart + static_cast<double>(i) * share;
        band.yEndFrac = band.yStartFrac + share * config_.bandFill;

        auto it = config_.columnOverrides.find(normalizeKey(subjects[i]));
        band.columnsX = (it != config_.columnOverrides.end()) ? it->second : config_.columnsX;

        bands.push_back(band);
    }
    return bands;
}

Layout LayoutResolver::resolve(const std::vector<std::string>& subjects, const std::string& phase) const {
    // blank names dropped, repeated names (case-insensitive) keep their first band
    std::vector<std::string> cleaned;
    std::set<std::string> seen;
    for (const auto& s : subjects) {
        std::string t = trim(s);
        if (t.empty() || !seen.insert(normalizeKey(t)).second) continue;
        cleaned.push_back(t);
    }

    Layout layout;
    if (!cleaned.empty()) {
        layout.source = LayoutSource::Explicit;
    } else {
        if (trim(phase).empty()) {
            throw LayoutError("no subjects given and no phase code to derive them from");
        }
        cleaned = subjectsForPhase(phase, &layout.source);
    }

    if (cleaned.empty()) {
        throw LayoutError("phase '" + phase + "' resolved to an empty subject list");
    }

    layout.bands = computeBands(cleaned);
    logInfo("Layout (" + std::string(layoutSourceName(layout.source)) + "): " + joinNames(cleaned));
    return layout;
}

} // namespace omr
