/**
 * @file Calibration.hpp
 * @brief Intrinsic calibration result and the bundle-style solver producing it
 * @date 2025
 */

#pragma once

#include <opencv2/core.hpp>
#include <chrono>
#include <string>
#include <utility>
#include <vector>
#include "Config.hpp"
#include "Target.hpp"

/**
 * @brief Camera calibration produced by one full solve
 *
 * Never mutated after the solve returns; a new solve replaces it wholesale.
 */
struct CalibrationResult {
    cv::Mat camera_matrix;          // 3x3, CV_64F
    cv::Mat distortion_coeffs;      // k1, k2, p1, p2, k3
    cv::Mat rectification;          // identity for a single camera
    cv::Mat projection;             // 3x4 rectified projection at the configured alpha
    cv::Size image_size;
    std::vector<cv::Mat> rvecs;
    std::vector<cv::Mat> tvecs;
    std::vector<std::vector<cv::Point2f>> residuals;   // observed - projected, per sample
    std::vector<double> per_sample_error;               // RMS per sample (pixels)
    double reprojection_error;                          // aggregate RMS (pixels)
    int iterations;
    bool converged;
    TargetGeometry target;
    std::string camera_name;
    std::string calibration_method;
    std::chrono::system_clock::time_point calibration_date;
    bool is_valid;

    CalibrationResult();
    bool validateCameraMatrix() const;
    bool validateDistortionCoeffs() const;
    std::pair<double, double> getFieldOfView() const;
    size_t sampleCount() const { return per_sample_error.size(); }
    void printSummary() const;
};

/**
 * @brief Joint refinement of intrinsics, distortion and one pose per view
 * @param imagePoints Canonical detections, one per view
 * @param target Target geometry shared by every view
 * @param imageSize Frame size of every view
 * @param cfg Iteration cap, tolerance, seed and parameter fixing
 * @param minSamples Minimum number of views
 *
 * Throws InsufficientSamplesException when fewer than minSamples views are
 * given and NumericalDivergenceException when the residual is non-finite.
 * Hitting the iteration cap is not an error: the best result is returned with
 * converged = false.
 */
CalibrationResult calibrateFromCorrespondences(const std::vector<std::vector<cv::Point2f>>& imagePoints,
                                               const TargetGeometry& target,
                                               const cv::Size& imageSize,
                                               const Config::Solver& cfg,
                                               size_t minSamples);

/**
 * @brief Calibrates from accepted samples; all must share one frame size
 */
CalibrationResult calibrateSamples(const std::vector<Sample>& samples,
                                   const TargetGeometry& target,
                                   const Config::Solver& cfg,
                                   size_t minSamples,
                                   const std::string& cameraName = "camera");

/**
 * @brief RMS reprojection error of one view under the given model
 */
double viewReprojectionError(const std::vector<cv::Point2f>& observed,
                             const TargetGeometry& target,
                             const cv::Mat& K, const cv::Mat& D,
                             const cv::Mat& rvec, const cv::Mat& tvec);
