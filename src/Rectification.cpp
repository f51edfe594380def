#include "Rectification.hpp"
#include "Exceptions.hpp"
#include <opencv2/calib3d.hpp>
#include <cmath>

std::vector<cv::Point2f> undistortDetection(const std::vector<cv::Point2f>& points,
                                            const CalibrationResult& calib)
{
    std::vector<cv::Point2f> out;
    if (points.empty()) return out;
    require(calib.is_valid, "cannot rectify with an invalid calibration");

    cv::Mat P = calib.projection.empty()
        ? calib.camera_matrix
        : calib.projection(cv::Rect(0, 0, 3, 3));
    try {
        cv::undistortPoints(points, out, calib.camera_matrix, calib.distortion_coeffs,
                            calib.rectification, P);
    } catch (const cv::Exception& e) {
        rethrowCv(e, "undistortPoints");
    }
    return out;
}

double linearError(const std::vector<cv::Point2f>& points, const TargetGeometry& target)
{
    if (static_cast<int>(points.size()) != target.pointCount() || target.cols < 3) return -1.0;

    double sum = 0.0;
    int n = 0;
    for (int r = 0; r < target.rows; ++r) {
        const cv::Point2f& a = points[r * target.cols];
        const cv::Point2f& b = points[r * target.cols + target.cols - 1];
        cv::Point2f dir = b - a;
        double len = cv::norm(dir);
        if (len <= 1e-9) return -1.0;

        for (int c = 1; c < target.cols - 1; ++c) {
            cv::Point2f v = points[r * target.cols + c] - a;
            double d = (dir.x * v.y - dir.y * v.x) / len;   // perpendicular distance
            sum += d * d;
            ++n;
        }
    }
    return std::sqrt(sum / n);
}
