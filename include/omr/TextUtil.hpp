#ifndef OMR_TEXT_UTIL_HPP
#define OMR_TEXT_UTIL_HPP

#include <string>
#include <vector>

namespace omr {

std::string toLower(const std::string& s);
std::string trim(const std::string& s);

// Lower-case, trimmed, runs of whitespace collapsed to one space
std::string normalizeKey(const std::string& s);

// Comma separated values with surrounding blanks removed from each token
std::vector<std::string> splitCSV(const std::string& s);

} // namespace omr

#endif // OMR_TEXT_UTIL_HPP
