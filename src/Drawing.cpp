#include "Drawing.hpp"
#include "Descriptor.hpp"
#include <opencv2/calib3d.hpp>
#include <opencv2/imgproc.hpp>
#include <iomanip>
#include <sstream>

void drawTargetOutline(cv::Mat& frame, const std::vector<cv::Point2f>& pts, const TargetGeometry& target){
    if (static_cast<int>(pts.size()) != target.pointCount()) return;
    auto q = outsideCorners(pts, target);
    cv::Scalar col = {0,255,255};
    for (int i=0;i<4;++i) cv::line(frame, q[i], q[(i+1)%4], col, 2, cv::LINE_AA);
    cv::circle(frame, q[0], 6, {0,0,255}, -1, cv::LINE_AA);   // canonical origin
    cv::putText(frame, "0", q[0]+cv::Point2f(8,-8), cv::FONT_HERSHEY_SIMPLEX, 0.6, {255,255,255}, 2);
}

void drawCorners(cv::Mat& frame, const std::vector<cv::Point2f>& pts, const TargetGeometry& target){
    if (pts.empty()) return;
    cv::drawChessboardCorners(frame, cv::Size(target.cols, target.rows), pts,
                              static_cast<int>(pts.size()) == target.pointCount());
}

void drawCoverageBars(cv::Mat& frame, const CoverageReport& coverage, bool goodEnough, cv::Point origin){
    const int barW = 200, barH = 15, gap = 22;
    for (int i=0;i<kDimensionCount;++i){
        int y = origin.y + i*gap;
        double f = coverage.fraction[i];
        cv::Scalar fill = goodEnough ? cv::Scalar(0,255,0)
                        : (f >= 1.0 ? cv::Scalar(0,200,255) : cv::Scalar(0,128,255));
        cv::rectangle(frame, cv::Rect(origin.x+50, y, barW, barH), cv::Scalar(50,50,50), -1);
        cv::rectangle(frame, cv::Rect(origin.x+50, y, static_cast<int>(barW*f), barH), fill, -1);
        cv::putText(frame, toString(static_cast<Dimension>(i)), {origin.x, y+barH-2},
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, {255,255,255}, 1);
    }
}

void drawSessionStatus(cv::Mat& frame, const SessionSnapshot& snap){
    std::ostringstream ss;
    ss << toString(snap.state) << "   Samples: " << snap.sampleCount << "/" << snap.capacity;
    if (snap.solverBusy) ss << "   [solving...]";
    cv::Scalar col = snap.goodEnough ? cv::Scalar(0,255,0) : cv::Scalar(255,255,255);
    cv::putText(frame, ss.str(), {20, 30}, cv::FONT_HERSHEY_SIMPLEX, 0.7, col, 2);

    std::ostringstream line2;
    line2 << std::fixed << std::setprecision(3);
    if (snap.result){
        line2 << "RMS: " << snap.result->reprojection_error << " px";
        if (!snap.result->converged) line2 << " (not converged)";
        if (snap.stale) line2 << " (stale)";
        if (snap.lastLinearError >= 0.0) line2 << "   Lin. error: " << snap.lastLinearError << " px";
    } else if (snap.lastGrid != GridStatus::Valid){
        line2 << "Looking for pattern... (" << toString(snap.lastGrid) << ")";
    } else if (snap.hasAdmission){
        line2 << "Last frame: " << toString(snap.lastAdmission);
    }
    cv::putText(frame, line2.str(), {20, 60}, cv::FONT_HERSHEY_SIMPLEX, 0.6, {255,255,255}, 2);

    drawCoverageBars(frame, snap.coverage, snap.goodEnough);

    const char* keys = "[c] Calibrate  [s] Save  [n] Resume  [r] Restart  [q] Quit";
    cv::putText(frame, keys, {20, frame.rows - 15}, cv::FONT_HERSHEY_SIMPLEX, 0.5, {255,255,255}, 1);

    if (!snap.lastError.empty()){
        cv::putText(frame, snap.lastError.substr(0, 80), {20, frame.rows - 40},
                    cv::FONT_HERSHEY_SIMPLEX, 0.5, {0,0,255}, 1);
    }
}
