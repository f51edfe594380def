/**
 * @file GridValidator.cpp
 * @brief Implementation of corner grid validation and canonical ordering
 */

#include "GridValidator.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

const char* toString(GridStatus status) {
    switch (status) {
        case GridStatus::Valid:            return "valid";
        case GridStatus::NotFound:         return "not found";
        case GridStatus::WrongCount:       return "wrong point count";
        case GridStatus::TouchesBorder:    return "touches frame border";
        case GridStatus::SelfIntersecting: return "self-intersecting grid";
        case GridStatus::PoorFit:          return "poor grid fit";
    }
    return "unknown";
}

namespace {

// Row r, column c of a row-major grid.
inline const cv::Point2f& at(const std::vector<cv::Point2f>& pts, int width, int r, int c) {
    return pts[r * width + c];
}

std::vector<cv::Point2f> rowOf(const std::vector<cv::Point2f>& pts, int width, int r) {
    return std::vector<cv::Point2f>(pts.begin() + r * width, pts.begin() + (r + 1) * width);
}

std::vector<cv::Point2f> colOf(const std::vector<cv::Point2f>& pts, int rows, int width, int c) {
    std::vector<cv::Point2f> line;
    line.reserve(rows);
    for (int r = 0; r < rows; ++r) line.push_back(at(pts, width, r, c));
    return line;
}

// Sum of squared perpendicular distances to the total-least-squares line.
double lineResidual(const std::vector<cv::Point2f>& line, int& count) {
    cv::Vec4f l;
    cv::fitLine(line, l, cv::DIST_L2, 0, 0.01, 0.01);
    double sum = 0.0;
    for (const auto& p : line) {
        double dx = p.x - l[2];
        double dy = p.y - l[3];
        double d = dx * l[1] - dy * l[0];
        sum += d * d;
    }
    count += static_cast<int>(line.size());
    return sum;
}

bool advances(const std::vector<cv::Point2f>& line) {
    cv::Point2f dir = line.back() - line.front();
    if (dir.dot(dir) <= 0.f) return false;
    for (size_t i = 0; i + 1 < line.size(); ++i) {
        if ((line[i + 1] - line[i]).dot(dir) <= 0.f) return false;
    }
    return true;
}

double medianSpacing(const std::vector<cv::Point2f>& pts, int rows, int width) {
    std::vector<double> d;
    d.reserve(2 * pts.size());
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < width; ++c) {
            if (c + 1 < width) d.push_back(cv::norm(at(pts, width, r, c + 1) - at(pts, width, r, c)));
            if (r + 1 < rows)  d.push_back(cv::norm(at(pts, width, r + 1, c) - at(pts, width, r, c)));
        }
    }
    if (d.empty()) return 0.0;
    auto mid = d.begin() + d.size() / 2;
    std::nth_element(d.begin(), mid, d.end());
    return *mid;
}

} // namespace

std::vector<cv::Point2f> rotateGrid(const std::vector<cv::Point2f>& pts,
                                    int rows, int width, int quarterTurns) {
    int k = ((quarterTurns % 4) + 4) % 4;
    std::vector<cv::Point2f> out(pts.size());
    switch (k) {
        case 0:
            return pts;
        case 2:
            std::reverse_copy(pts.begin(), pts.end(), out.begin());
            return out;
        case 1:
            // result is width x rows
            for (int i = 0; i < width; ++i)
                for (int j = 0; j < rows; ++j)
                    out[i * rows + j] = at(pts, width, rows - 1 - j, i);
            return out;
        default:
            for (int i = 0; i < width; ++i)
                for (int j = 0; j < rows; ++j)
                    out[i * rows + j] = at(pts, width, j, width - 1 - i);
            return out;
    }
}

double gridFitScore(const std::vector<cv::Point2f>& pts, int rows, int width) {
    if (rows < 2 || width < 2 || static_cast<int>(pts.size()) != rows * width)
        return std::numeric_limits<double>::infinity();

    double spacing = medianSpacing(pts, rows, width);
    if (!(spacing > 1e-6)) return std::numeric_limits<double>::infinity();

    double sum = 0.0;
    int count = 0;
    if (width > 2)
        for (int r = 0; r < rows; ++r) sum += lineResidual(rowOf(pts, width, r), count);
    if (rows > 2)
        for (int c = 0; c < width; ++c) sum += lineResidual(colOf(pts, rows, width, c), count);
    if (count == 0) return 0.0;

    return std::sqrt(sum / count) / spacing;
}

bool isMonotonicGrid(const std::vector<cv::Point2f>& pts, int rows, int width) {
    for (int r = 0; r < rows; ++r)
        if (!advances(rowOf(pts, width, r))) return false;
    for (int c = 0; c < width; ++c)
        if (!advances(colOf(pts, rows, width, c))) return false;
    return true;
}

double minNeighbourSpacing(const std::vector<cv::Point2f>& pts, int rows, int width) {
    double best = std::numeric_limits<double>::infinity();
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < width; ++c) {
            if (c + 1 < width) best = std::min(best, cv::norm(at(pts, width, r, c + 1) - at(pts, width, r, c)));
            if (r + 1 < rows)  best = std::min(best, cv::norm(at(pts, width, r + 1, c) - at(pts, width, r, c)));
        }
    }
    return best;
}

GridValidation validateGrid(const std::vector<cv::Point2f>& raw, bool found,
                            const TargetGeometry& target, const cv::Size& frameSize,
                            const Config::Sampling& cfg) {
    GridValidation out;
    if (!found || raw.empty()) {
        out.status = GridStatus::NotFound;
        return out;
    }
    if (static_cast<int>(raw.size()) != target.pointCount()) {
        out.status = GridStatus::WrongCount;
        return out;
    }

    const float border = static_cast<float>(cfg.borderPx);
    for (const auto& p : raw) {
        if (!(p.x > border && p.x < frameSize.width - border &&
              p.y > border && p.y < frameSize.height - border)) {
            out.status = GridStatus::TouchesBorder;
            return out;
        }
    }

    // Layout as given (rows x cols) versus transposed (cols x rows).
    const int rows = target.rows;
    const int cols = target.cols;
    double givenScore = gridFitScore(raw, rows, cols);
    std::vector<int> turns = target.isSquare() ? std::vector<int>{0, 1, 2, 3} : std::vector<int>{0, 2};
    int layoutRows = rows, layoutWidth = cols;
    double score = givenScore;
    if (!target.isSquare()) {
        double transposedScore = gridFitScore(raw, cols, rows);
        if (transposedScore < givenScore) {
            score = transposedScore;
            layoutRows = cols;
            layoutWidth = rows;
            turns = {1, 3};
        }
    }

    // Among the allowed rotations keep the one whose diagonal points most to the bottom-right.
    std::vector<cv::Point2f> best;
    float bestDiag = -std::numeric_limits<float>::infinity();
    for (int k : turns) {
        std::vector<cv::Point2f> cand = rotateGrid(raw, layoutRows, layoutWidth, k);
        cv::Point2f d = cand.back() - cand.front();
        if (d.x + d.y > bestDiag) {
            bestDiag = d.x + d.y;
            best = std::move(cand);
        }
    }

    out.fitScore = score;
    if (!isMonotonicGrid(best, rows, cols)) {
        out.status = GridStatus::SelfIntersecting;
        return out;
    }
    if (!(score <= cfg.gridFitTolerance)) {
        out.status = GridStatus::PoorFit;
        return out;
    }

    out.status = GridStatus::Valid;
    out.detection.points = std::move(best);
    out.detection.frameSize = frameSize;
    return out;
}
