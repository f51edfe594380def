/**
 * @file Target.cpp
 * @brief Calibration target geometry
 */

#include "Target.hpp"
#include "Exceptions.hpp"

TargetGeometry::TargetGeometry()
    : cols(9), rows(7), squareSize(0.02) {}

TargetGeometry::TargetGeometry(int c, int r, double s)
    : cols(c), rows(r), squareSize(s) {}

TargetGeometry TargetGeometry::fromConfig(const Config::Target& cfg) {
    TargetGeometry g(cfg.cols, cfg.rows, cfg.squareSize);
    g.validate();
    return g;
}

void TargetGeometry::validate() const {
    require(cols >= 2 && rows >= 2, "target grid must have at least 2x2 corners");
    require(squareSize > 0.0, "target square size must be > 0");
}

std::vector<cv::Point3f> TargetGeometry::objectPoints() const {
    std::vector<cv::Point3f> pattern;
    pattern.reserve(pointCount());
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            pattern.emplace_back(static_cast<float>(x * squareSize),
                                 static_cast<float>(y * squareSize), 0.f);
        }
    }
    return pattern;
}
