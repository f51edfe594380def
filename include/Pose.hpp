#pragma once
#include <opencv2/core.hpp>
#include <vector>

/**
 * @brief Closed-form pose of a planar target from its homography
 * @param obj3 Target points, all with z = 0
 * @param img Observed image points in the same order
 * @param K Intrinsic matrix used to normalize the observations
 * @param D Distortion coefficients (may be empty)
 * @param rvec Output rotation vector
 * @param tvec Output translation vector, target in front of the camera
 * @return false if the homography is degenerate
 */
bool poseFromPlanarHomography(const std::vector<cv::Point3f>& obj3,
                              const std::vector<cv::Point2f>& img,
                              const cv::Mat& K, const cv::Mat& D,
                              cv::Mat& rvec, cv::Mat& tvec);

/**
 * @brief Intrinsic seed from the frame size and a diagonal field of view
 */
cv::Mat cameraMatrixFromFov(const cv::Size& frameSize, double diagonalFovDeg);
