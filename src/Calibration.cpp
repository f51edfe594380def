/**
 * @file Calibration.cpp
 * @brief Implementation of the calibration result and the Levenberg-Marquardt solver
 */

#include "Calibration.hpp"
#include "Exceptions.hpp"
#include "Pose.hpp"
#include <opencv2/calib3d.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>

// ============= CalibrationResult =============
CalibrationResult::CalibrationResult()
    : reprojection_error(0.0), iterations(0), converged(false), is_valid(false) {}

bool CalibrationResult::validateCameraMatrix() const {
    if (camera_matrix.rows != 3 || camera_matrix.cols != 3) return false;
    if (camera_matrix.type() != CV_64F) return false;

    double fx = camera_matrix.at<double>(0, 0);
    double fy = camera_matrix.at<double>(1, 1);
    double cx = camera_matrix.at<double>(0, 2);
    double cy = camera_matrix.at<double>(1, 2);

    return (fx > 0 && fy > 0 && cx > 0 && cy > 0 &&
            cx < image_size.width && cy < image_size.height &&
            cv::checkRange(camera_matrix));
}

bool CalibrationResult::validateDistortionCoeffs() const {
    if (distortion_coeffs.empty()) return true;
    if (distortion_coeffs.type() != CV_64F) return false;

    for (size_t i = 0; i < distortion_coeffs.total(); ++i) {
        double coeff = distortion_coeffs.at<double>(static_cast<int>(i));
        if (!std::isfinite(coeff) || std::abs(coeff) > 10.0) return false;
    }
    return true;
}

std::pair<double, double> CalibrationResult::getFieldOfView() const {
    if (!is_valid) return {0.0, 0.0};

    double fx = camera_matrix.at<double>(0, 0);
    double fy = camera_matrix.at<double>(1, 1);

    double hfov = 2.0 * std::atan(image_size.width / (2.0 * fx)) * 180.0 / CV_PI;
    double vfov = 2.0 * std::atan(image_size.height / (2.0 * fy)) * 180.0 / CV_PI;

    return {hfov, vfov};
}

void CalibrationResult::printSummary() const {
    std::cout << "\n=== CAMERA CALIBRATION SUMMARY ===\n";
    std::cout << "Camera: " << camera_name << "\n";
    std::cout << "Method: " << calibration_method << "\n";
    std::cout << "Image size: " << image_size.width << "x" << image_size.height << "\n";
    std::cout << "Target: " << target.cols << "x" << target.rows
              << " @ " << target.squareSize << " m, " << sampleCount() << " views\n";
    std::cout << "RMS error: " << std::fixed << std::setprecision(3) << reprojection_error << " pixels\n";
    std::cout << "Iterations: " << iterations << (converged ? " (converged)" : " (NOT converged)") << "\n";

    if (is_valid) {
        double fx = camera_matrix.at<double>(0, 0);
        double fy = camera_matrix.at<double>(1, 1);
        double cx = camera_matrix.at<double>(0, 2);
        double cy = camera_matrix.at<double>(1, 2);

        std::cout << "Focal lengths: fx=" << std::setprecision(2) << fx << ", fy=" << fy << "\n";
        std::cout << "Principal point: cx=" << std::setprecision(2) << cx << ", cy=" << cy << "\n";

        auto [hfov, vfov] = getFieldOfView();
        std::cout << "Field of view: " << std::setprecision(1) << hfov << " x " << vfov << " deg\n";

        std::cout << "Distortion coefficients: ";
        for (size_t i = 0; i < distortion_coeffs.total(); ++i) {
            std::cout << std::setprecision(6) << distortion_coeffs.at<double>(static_cast<int>(i));
            if (i + 1 < distortion_coeffs.total()) std::cout << ", ";
        }
        std::cout << "\n";
    }
    std::cout << "Status: " << (is_valid ? "VALID" : "INVALID") << "\n";
    std::cout << "================================\n\n";
    std::cout.unsetf(std::ios::floatfield);
}

// ============= Solver =============
namespace {

constexpr int kIntrinsicCount = 9;   // fx, fy, cx, cy, k1, k2, p1, p2, k3
constexpr int kPoseCount = 6;        // rvec, tvec
constexpr int kViewJacobianCols = kPoseCount + kIntrinsicCount;

enum : int { FX = 0, FY, CX, CY, K1, K2, P1, P2, K3 };

struct Problem {
    std::vector<cv::Point3d> object;
    std::vector<std::vector<cv::Point2d>> observed;
    std::vector<uchar> free;
    double aspect = 0.0;    // fy / fx when tied, 0 otherwise
};

inline int poseOffset(size_t view) {
    return kIntrinsicCount + kPoseCount * static_cast<int>(view);
}

cv::Matx33d intrinsicsOf(const cv::Mat& x) {
    const double* p = x.ptr<double>();
    return cv::Matx33d(p[FX], 0, p[CX],
                       0, p[FY], p[CY],
                       0, 0, 1);
}

// Sum of squared residuals; with JtJ/Jtr also the normal equations at x.
double evaluate(const cv::Mat& x, const Problem& pb, cv::Mat* JtJ, cv::Mat* Jtr,
                std::vector<std::vector<cv::Point2f>>* residuals) {
    const int P = x.rows;
    if (JtJ) {
        *JtJ = cv::Mat::zeros(P, P, CV_64F);
        *Jtr = cv::Mat::zeros(P, 1, CV_64F);
    }
    if (residuals) residuals->assign(pb.observed.size(), {});

    const cv::Matx33d K = intrinsicsOf(x);
    const cv::Mat D = x.rowRange(K1, K3 + 1).clone();
    double total = 0.0;

    std::vector<cv::Point2d> projected;
    cv::Mat J;
    for (size_t v = 0; v < pb.observed.size(); ++v) {
        const int off = poseOffset(v);
        const cv::Mat rvec = x.rowRange(off, off + 3);
        const cv::Mat tvec = x.rowRange(off + 3, off + 6);
        if (JtJ) cv::projectPoints(pb.object, rvec, tvec, K, D, projected, J);
        else     cv::projectPoints(pb.object, rvec, tvec, K, D, projected);

        const auto& obs = pb.observed[v];
        const int n = static_cast<int>(obs.size());
        cv::Mat r(2 * n, 1, CV_64F);
        for (int i = 0; i < n; ++i) {
            double ex = projected[i].x - obs[i].x;
            double ey = projected[i].y - obs[i].y;
            r.at<double>(2 * i) = ex;
            r.at<double>(2 * i + 1) = ey;
            total += ex * ex + ey * ey;
            if (residuals) (*residuals)[v].emplace_back(static_cast<float>(-ex), static_cast<float>(-ey));
        }
        if (!JtJ) continue;

        // projectPoints columns: rvec(3) tvec(3) fx fy cx cy k1 k2 p1 p2 k3
        int idx[kViewJacobianCols];
        for (int k = 0; k < kPoseCount; ++k) idx[k] = off + k;
        idx[6] = FX; idx[7] = FY; idx[8] = CX; idx[9] = CY;
        for (int k = 0; k < 5; ++k) idx[10 + k] = K1 + k;

        if (pb.aspect > 0.0) {
            cv::Mat cfx = J.col(6), cfy = J.col(7);
            cv::Mat tied = cfx + pb.aspect * cfy;
            tied.copyTo(cfx);
        }
        for (int k = 0; k < kViewJacobianCols; ++k) {
            if (!pb.free[idx[k]]) J.col(k).setTo(0);
        }

        cv::Mat JtJv = J.t() * J;
        cv::Mat Jtrv = J.t() * r;
        for (int a = 0; a < kViewJacobianCols; ++a) {
            Jtr->at<double>(idx[a]) += Jtrv.at<double>(a);
            for (int b = 0; b < kViewJacobianCols; ++b)
                JtJ->at<double>(idx[a], idx[b]) += JtJv.at<double>(a, b);
        }
    }
    return total;
}

cv::Mat seedCameraMatrix(const std::vector<std::vector<cv::Point2f>>& imagePoints,
                         const TargetGeometry& target, const cv::Size& imageSize,
                         const Config::Solver& cfg) {
    cv::Mat K = cameraMatrixFromFov(imageSize, cfg.initialFovDeg);
    if (!cfg.refineInitialFocal) return K;

    std::vector<std::vector<cv::Point3f>> objectPoints(imagePoints.size(), target.objectPoints());
    cv::Mat refined;
    try {
        refined = cv::initCameraMatrix2D(objectPoints, imagePoints, imageSize,
                                         cfg.fixAspectRatio ? 1.0 : 0.0);
    } catch (const cv::Exception& e) {
        std::cerr << "Calibration: closed-form focal estimate failed (" << e.what()
                  << "), keeping field-of-view seed\n";
        return K;
    }
    refined.convertTo(refined, CV_64F);
    double fx = refined.at<double>(0, 0);
    double fy = refined.at<double>(1, 1);
    double limit = 100.0 * std::max(imageSize.width, imageSize.height);
    if (!cv::checkRange(refined) || fx <= 0 || fy <= 0 || fx > limit || fy > limit) {
        std::cerr << "Calibration: closed-form focal estimate implausible, keeping field-of-view seed\n";
        return K;
    }
    K.at<double>(0, 0) = fx;
    K.at<double>(1, 1) = fy;
    return K;
}

bool smallStep(const cv::Mat& delta, const cv::Mat& x, double tol) {
    return cv::norm(delta) <= tol * (cv::norm(x) + tol);
}

} // namespace

double viewReprojectionError(const std::vector<cv::Point2f>& observed,
                             const TargetGeometry& target,
                             const cv::Mat& K, const cv::Mat& D,
                             const cv::Mat& rvec, const cv::Mat& tvec) {
    std::vector<cv::Point2f> projected;
    cv::projectPoints(target.objectPoints(), rvec, tvec, K, D, projected);
    if (projected.size() != observed.size() || observed.empty()) return -1.0;
    double sum = 0.0;
    for (size_t i = 0; i < observed.size(); ++i) {
        double e = cv::norm(observed[i] - projected[i]);
        sum += e * e;
    }
    return std::sqrt(sum / observed.size());
}

CalibrationResult calibrateFromCorrespondences(const std::vector<std::vector<cv::Point2f>>& imagePoints,
                                               const TargetGeometry& target,
                                               const cv::Size& imageSize,
                                               const Config::Solver& cfg,
                                               size_t minSamples) {
    if (imagePoints.empty() || imagePoints.size() < minSamples) {
        throw InsufficientSamplesException(imagePoints.size(), std::max<size_t>(minSamples, 1));
    }
    target.validate();
    require(imageSize.width > 0 && imageSize.height > 0, "image size must be positive");
    for (const auto& view : imagePoints) {
        require(static_cast<int>(view.size()) == target.pointCount(),
                "every view must contain " + std::to_string(target.pointCount()) + " points");
    }

    const size_t views = imagePoints.size();
    std::cout << "Calibration: solving with " << views << " views...\n";

    Problem pb;
    for (const auto& p : target.objectPoints()) pb.object.emplace_back(p.x, p.y, p.z);
    pb.observed.resize(views);
    for (size_t v = 0; v < views; ++v) {
        pb.observed[v].assign(imagePoints[v].begin(), imagePoints[v].end());
    }

    const int P = kIntrinsicCount + kPoseCount * static_cast<int>(views);
    cv::Mat x = cv::Mat::zeros(P, 1, CV_64F);
    pb.free.assign(P, 1);

    // Intrinsic seed
    cv::Mat K0 = seedCameraMatrix(imagePoints, target, imageSize, cfg);
    x.at<double>(FX) = K0.at<double>(0, 0);
    x.at<double>(FY) = K0.at<double>(1, 1);
    x.at<double>(CX) = K0.at<double>(0, 2);
    x.at<double>(CY) = K0.at<double>(1, 2);
    if (cfg.fixAspectRatio) {
        pb.aspect = x.at<double>(FY) / x.at<double>(FX);
        pb.free[FY] = 0;
    }
    if (cfg.fixPrincipalPoint) pb.free[CX] = pb.free[CY] = 0;
    if (cfg.zeroTangentDist) pb.free[P1] = pb.free[P2] = 0;
    if (cfg.fixK3) pb.free[K3] = 0;

    // Pose seeds from the planar homography of every view
    const cv::Mat noDistortion = cv::Mat::zeros(5, 1, CV_64F);
    const std::vector<cv::Point3f> object = target.objectPoints();
    for (size_t v = 0; v < views; ++v) {
        cv::Mat rvec, tvec;
        bool ok = false;
        try {
            ok = poseFromPlanarHomography(object, imagePoints[v], K0, noDistortion, rvec, tvec);
            if (!ok) {
                ok = cv::solvePnP(object, imagePoints[v], K0, noDistortion, rvec, tvec, false, cv::SOLVEPNP_IPPE);
            }
        } catch (const cv::Exception& e) {
            rethrowCv(e, "pose initialization of view " + std::to_string(v));
        }
        if (!ok) {
            throw ProcessingException("no initial pose for view " + std::to_string(v));
        }
        rvec.convertTo(rvec, CV_64F);
        tvec.convertTo(tvec, CV_64F);
        const int off = poseOffset(v);
        for (int k = 0; k < 3; ++k) {
            x.at<double>(off + k) = rvec.at<double>(k);
            x.at<double>(off + 3 + k) = tvec.at<double>(k);
        }
    }

    // Levenberg-Marquardt
    cv::Mat JtJ, Jtr;
    double err = 0.0;
    try {
        err = evaluate(x, pb, &JtJ, &Jtr, nullptr);
    } catch (const cv::Exception& e) {
        rethrowCv(e, "initial projection");
    }
    if (!std::isfinite(err)) {
        throw NumericalDivergenceException("initial residual is not finite");
    }

    double lambda = 1e-3;
    int iter = 0;
    bool converged = false;
    while (iter < cfg.maxIterations) {
        ++iter;

        cv::Mat A = JtJ.clone();
        cv::Mat g = -Jtr;
        for (int i = 0; i < P; ++i) {
            if (!pb.free[i]) {
                A.at<double>(i, i) = 1.0;
                g.at<double>(i) = 0.0;
            } else {
                A.at<double>(i, i) += lambda * std::max(JtJ.at<double>(i, i), 1e-12);
            }
        }

        cv::Mat delta;
        if (!cv::solve(A, g, delta, cv::DECOMP_CHOLESKY)) {
            lambda *= 10.0;
            continue;
        }

        cv::Mat trial = x + delta;
        if (pb.aspect > 0.0) trial.at<double>(FY) = pb.aspect * trial.at<double>(FX);

        double trialErr = std::numeric_limits<double>::infinity();
        try {
            trialErr = evaluate(trial, pb, nullptr, nullptr, nullptr);
        } catch (const cv::Exception&) {
            // projection failed for this step, treated as a rejected step
        }

        if (std::isfinite(trialErr) && trialErr < err) {
            x = trial;
            err = trialErr;
            lambda = std::max(lambda * 0.1, 1e-15);
            if (smallStep(delta, x, cfg.tolerance)) {
                converged = true;
                break;
            }
            try {
                evaluate(x, pb, &JtJ, &Jtr, nullptr);
            } catch (const cv::Exception& e) {
                rethrowCv(e, "jacobian at iteration " + std::to_string(iter));
            }
        } else {
            if (smallStep(delta, x, cfg.tolerance)) {
                converged = true;
                break;
            }
            lambda *= 10.0;
        }
    }

    CalibrationResult calib;
    double total = 0.0;
    try {
        total = evaluate(x, pb, nullptr, nullptr, &calib.residuals);
    } catch (const cv::Exception& e) {
        rethrowCv(e, "final residuals");
    }
    if (!std::isfinite(total) || !cv::checkRange(x)) {
        throw NumericalDivergenceException("residual is not finite after " + std::to_string(iter) + " iterations");
    }

    calib.camera_matrix = cv::Mat(intrinsicsOf(x)).clone();
    calib.distortion_coeffs = x.rowRange(K1, K3 + 1).clone();
    calib.rectification = cv::Mat::eye(3, 3, CV_64F);
    calib.image_size = imageSize;
    calib.target = target;
    calib.iterations = iter;
    calib.converged = converged;
    calib.calibration_method = "Levenberg-Marquardt (plumb_bob)";
    calib.calibration_date = std::chrono::system_clock::now();

    size_t totalPoints = 0;
    for (size_t v = 0; v < views; ++v) {
        const int off = poseOffset(v);
        calib.rvecs.push_back(x.rowRange(off, off + 3).clone());
        calib.tvecs.push_back(x.rowRange(off + 3, off + 6).clone());

        double sum = 0.0;
        for (const auto& e : calib.residuals[v]) sum += static_cast<double>(e.dot(e));
        calib.per_sample_error.push_back(std::sqrt(sum / calib.residuals[v].size()));
        totalPoints += calib.residuals[v].size();
    }
    calib.reprojection_error = std::sqrt(total / static_cast<double>(totalPoints));

    calib.is_valid = calib.validateCameraMatrix() && calib.validateDistortionCoeffs();
    if (calib.is_valid) {
        try {
            cv::Mat newK = cv::getOptimalNewCameraMatrix(calib.camera_matrix, calib.distortion_coeffs,
                                                         imageSize, cfg.alpha);
            calib.projection = cv::Mat::zeros(3, 4, CV_64F);
            newK.copyTo(calib.projection(cv::Rect(0, 0, 3, 3)));
        } catch (const cv::Exception& e) {
            rethrowCv(e, "getOptimalNewCameraMatrix");
        }
    } else {
        std::cerr << "Calibration produced invalid parameters.\n";
        calib.projection = cv::Mat::zeros(3, 4, CV_64F);
        calib.camera_matrix.copyTo(calib.projection(cv::Rect(0, 0, 3, 3)));
    }

    if (!converged) {
        std::cerr << "Calibration: iteration cap (" << cfg.maxIterations
                  << ") reached without convergence, returning best result\n";
    }
    std::cout << "Calibration: RMS reprojection error " << calib.reprojection_error
              << " px after " << iter << " iterations\n";
    return calib;
}

CalibrationResult calibrateSamples(const std::vector<Sample>& samples,
                                   const TargetGeometry& target,
                                   const Config::Solver& cfg,
                                   size_t minSamples,
                                   const std::string& cameraName) {
    if (samples.empty() || samples.size() < minSamples) {
        throw InsufficientSamplesException(samples.size(), std::max<size_t>(minSamples, 1));
    }

    const cv::Size imageSize = samples.front().detection.frameSize;
    std::vector<std::vector<cv::Point2f>> imagePoints;
    imagePoints.reserve(samples.size());
    for (const auto& s : samples) {
        require(s.detection.frameSize == imageSize, "all samples must share one frame size");
        imagePoints.push_back(s.detection.points);
    }

    CalibrationResult calib = calibrateFromCorrespondences(imagePoints, target, imageSize, cfg, minSamples);
    calib.camera_name = cameraName;
    return calib;
}
