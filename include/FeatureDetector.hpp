/**
 * @file FeatureDetector.hpp
 * @brief Corner-grid detection primitive
 * @date 2025
 */

#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "Target.hpp"

/**
 * @brief Abstract base class for calibration target detectors
 * @details Lets the session run on synthetic detections in tests and on other
 * target kinds without touching the curation logic.
 */
class FeatureDetector {
public:
    virtual ~FeatureDetector() = default;

    /**
     * @brief Detect the target corners in a frame
     * @param frame Input image (BGR or grayscale)
     * @param points Output corners, in the detector's native order
     * @return true if a complete grid was found
     */
    virtual bool detect(const cv::Mat& frame, std::vector<cv::Point2f>& points) = 0;

    /**
     * @brief Get detector type name
     */
    virtual std::string getType() const = 0;
};

/**
 * @brief Checkerboard interior-corner detector
 *
 * Detection runs on a copy downsampled to about VGA; corners are refined
 * there, scaled back up and refined again on the full-size image.
 */
class ChessboardDetector : public FeatureDetector {
private:
    TargetGeometry target;

public:
    explicit ChessboardDetector(const TargetGeometry& target);

    bool detect(const cv::Mat& frame, std::vector<cv::Point2f>& points) override;

    std::string getType() const override { return "Chessboard"; }
};

/**
 * @brief Scale factor that brings a frame down to roughly 640x480 (1 if already smaller)
 */
double downsampleScale(const cv::Size& frameSize);
