#include "FeatureDetector.hpp"
#include "GridValidator.hpp"
#include <opencv2/calib3d.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

double downsampleScale(const cv::Size& frameSize) {
    double scale = std::sqrt(static_cast<double>(frameSize.area()) / (640.0 * 480.0));
    return scale > 1.0 ? scale : 1.0;
}

ChessboardDetector::ChessboardDetector(const TargetGeometry& target) : target(target) {
    target.validate();
}

bool ChessboardDetector::detect(const cv::Mat& frame, std::vector<cv::Point2f>& points) {
    points.clear();
    if (frame.empty()) return false;

    try {
        cv::Mat mono;
        if (frame.channels() == 3) cv::cvtColor(frame, mono, cv::COLOR_BGR2GRAY);
        else if (frame.channels() == 4) cv::cvtColor(frame, mono, cv::COLOR_BGRA2GRAY);
        else mono = frame;

        const double scale = downsampleScale(mono.size());
        cv::Mat small = mono;
        if (scale > 1.0) {
            cv::resize(mono, small, cv::Size(static_cast<int>(mono.cols / scale),
                                             static_cast<int>(mono.rows / scale)),
                       0, 0, cv::INTER_AREA);
        }

        std::vector<cv::Point2f> corners;
        bool found = cv::findChessboardCorners(small, cv::Size(target.cols, target.rows), corners,
                                               cv::CALIB_CB_ADAPTIVE_THRESH | cv::CALIB_CB_NORMALIZE_IMAGE);
        if (!found || static_cast<int>(corners.size()) != target.pointCount()) return false;

        // Half the closest corner spacing: snaps to the right corner without reaching a neighbour
        const cv::TermCriteria crit(cv::TermCriteria::EPS | cv::TermCriteria::MAX_ITER, 30, 0.1);
        double spacing = minNeighbourSpacing(corners, target.rows, target.cols);
        int radius = std::max(1, static_cast<int>(std::ceil(spacing * 0.5)));
        cv::cornerSubPix(small, corners, cv::Size(radius, radius), cv::Size(-1, -1), crit);

        if (scale > 1.0) {
            const float sx = static_cast<float>(mono.cols) / small.cols;
            const float sy = static_cast<float>(mono.rows) / small.rows;
            for (auto& p : corners) { p.x *= sx; p.y *= sy; }
            int upRadius = static_cast<int>(std::ceil(scale));
            cv::cornerSubPix(mono, corners, cv::Size(upRadius, upRadius), cv::Size(-1, -1), crit);
        }

        points = std::move(corners);
        return true;
    } catch (const cv::Exception& e) {
        std::cerr << "Detector: " << e.what() << "\n";
        return false;
    }
}
