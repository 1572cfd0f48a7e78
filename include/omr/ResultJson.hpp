#ifndef OMR_RESULT_JSON_HPP
#define OMR_RESULT_JSON_HPP

#include "omr/OmrPipeline.hpp"

#include <string>

namespace omr {

// Serialized result for storage and reporting collaborators
std::string resultToJson(const PipelineResult& result, int indent = 2);

// Returns false (and logs) when the file cannot be written
bool writeResultJson(const PipelineResult& result, const std::string& path);

} // namespace omr

#endif // OMR_RESULT_JSON_HPP
