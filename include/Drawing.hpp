#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "Session.hpp"
#include "Target.hpp"

void drawTargetOutline(cv::Mat& frame, const std::vector<cv::Point2f>& pts, const TargetGeometry& target);

void drawCorners(cv::Mat& frame, const std::vector<cv::Point2f>& pts, const TargetGeometry& target);

/**
 * @brief One horizontal bar per descriptor dimension, green once the readiness target is met
 */
void drawCoverageBars(cv::Mat& frame, const CoverageReport& coverage, bool goodEnough, cv::Point origin = {20, 90});

void drawSessionStatus(cv::Mat& frame, const SessionSnapshot& snap);
