#ifndef OMR_CALIBRATION_TABLE_HPP
#define OMR_CALIBRATION_TABLE_HPP

#include <map>
#include <string>

namespace omr {

// Detection tuning for one subject; sizes are in pixels of the rasterized page
struct SubjectCalibration {
    int minArea = 200;      // largest ink component must exceed this to count as a mark
    int windowSize = 40;    // side of the square examined around each bubble column
    bool enhance = false;   // close small holes in faint marks before component search
};

class CalibrationTable {
public:
    CalibrationTable() = default;
    explicit CalibrationTable(const SubjectCalibration& defaults);

    void setDefault(const SubjectCalibration& calib) { default_ = calib; }
    const SubjectCalibration& defaults() const { return default_; }

    // Subject names are matched case-insensitively, surrounding blanks ignored
    void setOverride(const std::string& subject, const SubjectCalibration& calib);
    bool hasOverride(const std::string& subject) const;
    const SubjectCalibration& lookup(const std::string& subject) const;

    const std::map<std::string, SubjectCalibration>& overrides() const { return overrides_; }

private:
    SubjectCalibration default_;
    std::map<std::string, SubjectCalibration> overrides_;
};

// Built-in calibration for 300 DPI scans of the feedback sheet
CalibrationTable defaultCalibrationTable();

} // namespace omr

#endif // OMR_CALIBRATION_TABLE_HPP
