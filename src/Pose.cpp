#include "Pose.hpp"
#include <opencv2/calib3d.hpp>
#include <cmath>

bool poseFromPlanarHomography(const std::vector<cv::Point3f>& obj3,
                              const std::vector<cv::Point2f>& img,
                              const cv::Mat& K, const cv::Mat& D,
                              cv::Mat& rvec, cv::Mat& tvec)
{
    if (obj3.size() < 4 || obj3.size() != img.size()) return false;

    std::vector<cv::Point2f> obj2(obj3.size());
    for (size_t i = 0; i < obj3.size(); ++i) obj2[i] = cv::Point2f(obj3[i].x, obj3[i].y);

    std::vector<cv::Point2f> und;
    cv::undistortPoints(img, und, K, D); // (x/z, y/z)

    cv::Mat H = cv::findHomography(obj2, und, 0); // least squares over all points
    if (H.empty()) return false;

    cv::Mat h1=H.col(0), h2=H.col(1), h3=H.col(2);
    double n1 = cv::norm(h1), n2 = cv::norm(h2);
    if (n1 <= 0.0 || n2 <= 0.0) return false;
    double lambda = 1.0 / ((n1 + n2) * 0.5);

    cv::Mat r1 = lambda*h1, r2 = lambda*h2, t = lambda*h3;
    if (t.at<double>(2) < 0){ r1 = -r1; r2 = -r2; t = -t; }
    cv::Mat r3 = r1.cross(r2);

    cv::Mat R(3,3,CV_64F); r1.copyTo(R.col(0)); r2.copyTo(R.col(1)); r3.copyTo(R.col(2));
    cv::SVD svd(R); R = svd.u * svd.vt;
    if (cv::determinant(R) < 0) return false;

    cv::Rodrigues(R, rvec);
    tvec = t.clone();
    return cv::checkRange(rvec) && cv::checkRange(tvec);
}

cv::Mat cameraMatrixFromFov(const cv::Size& frameSize, double diagonalFovDeg)
{
    double w = static_cast<double>(frameSize.width);
    double h = static_cast<double>(frameSize.height);
    double diagonalPixels = std::sqrt(w * w + h * h);
    double f = diagonalPixels / (2.0 * std::tan(diagonalFovDeg * CV_PI / 360.0));

    return (cv::Mat_<double>(3, 3) <<
        f, 0, w * 0.5,
        0, f, h * 0.5,
        0, 0, 1);
}
