/**
 * @file GridValidator.hpp
 * @brief Validation and canonical ordering of detected corner grids
 * @date 2025
 */

#pragma once

#include <opencv2/core.hpp>
#include <vector>
#include "Config.hpp"
#include "Target.hpp"

/**
 * @brief Per-frame validation outcome. Anything but Valid discards the frame.
 */
enum class GridStatus {
    Valid,
    NotFound,
    WrongCount,
    TouchesBorder,
    SelfIntersecting,
    PoorFit
};

const char* toString(GridStatus status);

struct GridValidation {
    GridStatus status = GridStatus::NotFound;
    Detection detection;
    double fitScore = -1.0;

    bool ok() const { return status == GridStatus::Valid; }
};

/**
 * @brief Checks a raw detection against the target and emits it in canonical order
 * @param raw Points as returned by the detection primitive
 * @param found Whether the primitive reported success
 * @param target Expected grid geometry
 * @param frameSize Frame dimensions in pixels
 * @param cfg Border margin and grid-fit tolerance
 *
 * Canonical order is row-major with target.cols points per row, first point
 * nearest the top-left of the frame. Only proper rotations of the grid are
 * applied, never mirroring.
 */
GridValidation validateGrid(const std::vector<cv::Point2f>& raw, bool found,
                            const TargetGeometry& target, const cv::Size& frameSize,
                            const Config::Sampling& cfg);

/**
 * @brief RMS distance of points to their row/column lines, divided by the median spacing
 */
double gridFitScore(const std::vector<cv::Point2f>& pts, int rows, int width);

/**
 * @brief True if each row and column advances monotonically along its own direction
 */
bool isMonotonicGrid(const std::vector<cv::Point2f>& pts, int rows, int width);

/**
 * @brief Rotates a row-major grid by quarter turns
 *
 * Odd turns swap the layout: the result has width rows of rows points.
 */
std::vector<cv::Point2f> rotateGrid(const std::vector<cv::Point2f>& pts,
                                    int rows, int width, int quarterTurns);

/**
 * @brief Smallest distance between horizontally or vertically adjacent corners
 */
double minNeighbourSpacing(const std::vector<cv::Point2f>& pts, int rows, int width);
