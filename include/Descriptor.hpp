/**
 * @file Descriptor.hpp
 * @brief Reduction of a canonical detection to its (x, y, size, skew) descriptor
 * @date 2025
 */

#pragma once

#include <opencv2/core.hpp>
#include <array>
#include <vector>
#include "Target.hpp"

/**
 * @brief Outer corners of the grid: up-left, up-right, down-right, down-left
 */
std::array<cv::Point2f, 4> outsideCorners(const std::vector<cv::Point2f>& pts, const TargetGeometry& target);

/**
 * @brief Area of a convex quadrilateral, |p x q| / 2 over its diagonals
 */
double quadArea(const std::array<cv::Point2f, 4>& quad);

/**
 * @brief Mean deviation of the four corner angles from 90 degrees, scaled to [0,1]
 */
double quadSkew(const std::array<cv::Point2f, 4>& quad);

/**
 * @brief Builds the sample descriptor of a canonical detection
 *
 * x, y are the centroid as a fraction of the frame width and height, size the
 * outer quadrilateral area as a fraction of the frame area.
 */
SampleDescriptor buildDescriptor(const Detection& detection, const TargetGeometry& target);
