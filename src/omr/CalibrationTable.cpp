#include "omr/CalibrationTable.hpp"
#include "omr/TextUtil.hpp"

namespace omr {

CalibrationTable::CalibrationTable(const SubjectCalibration& defaults)
    : default_(defaults) {}

void CalibrationTable::setOverride(const std::string& subject, const SubjectCalibration& calib) {
    overrides_[normalizeKey(subject)] = calib;
}

bool CalibrationTable::hasOverride(const std::string& subject) const {
    return overrides_.find(normalizeKey(subject)) != overrides_.end();
}

const SubjectCalibration& CalibrationTable::lookup(const std::string& subject) const {
    auto it = overrides_.find(normalizeKey(subject));
    if (it == overrides_.end()) return default_;
    return it->second;
}

CalibrationTable defaultCalibrationTable() {
    CalibrationTable table(SubjectCalibration{200, 40, false});

    // lighter pencil marks
    table.setOverride("english",  {160, 40, true});
    table.setOverride("language", {160, 40, true});

    table.setOverride("computer science", {240, 36, false});
    table.setOverride("social",           {220, 40, false});

    return table;
}

} // namespace omr
