/**
 * @file Target.hpp
 * @brief Planar calibration target geometry and per-frame observation types
 * @date 2025
 */

#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <vector>
#include "Config.hpp"

/**
 * @brief Immutable description of the planar grid of corner features
 */
struct TargetGeometry {
    int cols;           // corners per row
    int rows;           // number of rows
    double squareSize;  // spacing between adjacent corners (metres)

    TargetGeometry();
    TargetGeometry(int cols, int rows, double squareSize);

    static TargetGeometry fromConfig(const Config::Target& cfg);

    /**
     * @brief Throws ValidationException unless the grid is at least 2x2 with positive spacing
     */
    void validate() const;

    int pointCount() const { return cols * rows; }
    bool isSquare() const { return cols == rows; }

    /**
     * @brief 3D reference coordinates in canonical row-major order, z = 0
     */
    std::vector<cv::Point3f> objectPoints() const;
};

/**
 * @brief Grid corners in canonical row-major order for one frame
 */
struct Detection {
    std::vector<cv::Point2f> points;
    cv::Size frameSize;
    uint64_t frameSequence = 0;
};

/**
 * @brief Compact geometric summary of a detection
 */
struct SampleDescriptor {
    double x = 0.0;
    double y = 0.0;
    double size = 0.0;
    double skew = 0.0;
};

/**
 * @brief Accepted observation owned by the sample set
 */
struct Sample {
    Detection detection;
    SampleDescriptor descriptor;
    uint64_t order = 0;     // acceptance order, lower is older
};
