/**
 * @file Rectification.hpp
 * @brief Post-calibration straightness check on live detections
 * @date 2025
 */

#pragma once

#include <opencv2/core.hpp>
#include <vector>
#include "Calibration.hpp"
#include "Target.hpp"

/**
 * @brief Maps observed points into the rectified image of a calibration
 *
 * Uses the result's rectification R and the intrinsic part of its projection P.
 */
std::vector<cv::Point2f> undistortDetection(const std::vector<cv::Point2f>& points,
                                            const CalibrationResult& calib);

/**
 * @brief RMS distance of interior row points to the line through each row's end points
 * @return -1 if the point count does not match the target
 */
double linearError(const std::vector<cv::Point2f>& points, const TargetGeometry& target);
