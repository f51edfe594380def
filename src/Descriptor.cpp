/**
 * @file Descriptor.cpp
 * @brief Implementation of sample descriptor computation
 */

#include "Descriptor.hpp"
#include "Exceptions.hpp"
#include <algorithm>
#include <cmath>

std::array<cv::Point2f, 4> outsideCorners(const std::vector<cv::Point2f>& pts, const TargetGeometry& target) {
    require(static_cast<int>(pts.size()) == target.pointCount(), "detection size does not match target");
    const int w = target.cols;
    return {pts[0], pts[w - 1], pts.back(), pts[pts.size() - w]};
}

double quadArea(const std::array<cv::Point2f, 4>& quad) {
    const cv::Point2d ul = quad[0], ur = quad[1], dr = quad[2], dl = quad[3];
    cv::Point2d a = ur - ul;
    cv::Point2d b = dr - ur;
    cv::Point2d c = dl - dr;
    cv::Point2d p = b + c;
    cv::Point2d q = a + b;
    return std::abs(p.x * q.y - p.y * q.x) / 2.0;
}

double quadSkew(const std::array<cv::Point2f, 4>& quad) {
    auto angle = [](const cv::Point2d& a, const cv::Point2d& b, const cv::Point2d& c) {
        cv::Point2d ab = a - b;
        cv::Point2d cb = c - b;
        double n = cv::norm(ab) * cv::norm(cb);
        if (n <= 0.0) return CV_PI / 2.0;
        double cosang = std::max(-1.0, std::min(1.0, ab.dot(cb) / n));
        return std::acos(cosang);
    };

    double deviation = 0.0;
    for (int i = 0; i < 4; ++i) {
        const cv::Point2d prev = quad[(i + 3) % 4];
        const cv::Point2d cur = quad[i];
        const cv::Point2d next = quad[(i + 1) % 4];
        deviation += std::abs(CV_PI / 2.0 - angle(prev, cur, next));
    }
    return std::min(1.0, 2.0 * deviation / 4.0);
}

SampleDescriptor buildDescriptor(const Detection& detection, const TargetGeometry& target) {
    require(detection.frameSize.width > 0 && detection.frameSize.height > 0, "frame size must be positive");
    const double width = detection.frameSize.width;
    const double height = detection.frameSize.height;

    double sx = 0.0, sy = 0.0;
    for (const auto& p : detection.points) {
        sx += p.x;
        sy += p.y;
    }
    const double n = static_cast<double>(detection.points.size());

    auto quad = outsideCorners(detection.points, target);

    SampleDescriptor d;
    d.x = std::min(1.0, std::max(0.0, sx / n / width));
    d.y = std::min(1.0, std::max(0.0, sy / n / height));
    d.size = std::min(1.0, quadArea(quad) / (width * height));
    d.skew = quadSkew(quad);
    return d;
}
