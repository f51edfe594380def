/**
 * @file CalibrationIO.cpp
 * @brief YAML and oST persistence of calibration results
 */

#include "CalibrationIO.hpp"
#include "Exceptions.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

void ensureParentDirectory(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        std::cerr << "Calibration: cannot create directory " << parent << ": " << ec.message() << "\n";
    }
}

void writeRows(std::ostream& os, const cv::Mat& m) {
    for (int r = 0; r < m.rows; ++r) {
        for (int c = 0; c < m.cols; ++c) {
            if (c) os << " ";
            os << std::setw(8) << m.at<double>(r, c);
        }
        os << "\n";
    }
}

} // namespace

std::string distortionModelName(const cv::Mat& distortion) {
    switch (distortion.total()) {
        case 4:
        case 5: return "plumb_bob";
        case 8: return "rational_polynomial";
        default: return "unknown";
    }
}

// ============= YamlCalibrationWriter =============
YamlCalibrationWriter::YamlCalibrationWriter(const std::string& path) : path(path) {}

bool YamlCalibrationWriter::write(const CalibrationResult& calib) {
    if (!calib.is_valid) {
        std::cerr << "Calibration: refusing to save an invalid calibration\n";
        return false;
    }
    ensureParentDirectory(path);

    try {
        cv::FileStorage fs(path, cv::FileStorage::WRITE);
        if (!fs.isOpened()) {
            std::cerr << "Calibration: Cannot write YAML: " << path << "\n";
            return false;
        }

        fs << "image_width" << calib.image_size.width;
        fs << "image_height" << calib.image_size.height;
        fs << "camera_name" << calib.camera_name;
        fs << "camera_matrix" << calib.camera_matrix;
        fs << "distortion_model" << distortionModelName(calib.distortion_coeffs);
        fs << "distortion_coefficients" << calib.distortion_coeffs;
        fs << "rectification_matrix" << calib.rectification;
        fs << "projection_matrix" << calib.projection;
        fs << "target_cols" << calib.target.cols;
        fs << "target_rows" << calib.target.rows;
        fs << "target_square_size" << calib.target.squareSize;
        fs << "calibration_method" << calib.calibration_method;
        fs << "reprojection_error" << calib.reprojection_error;
        fs << "per_sample_error" << calib.per_sample_error;
        fs << "sample_count" << static_cast<int>(calib.sampleCount());
        fs << "iterations" << calib.iterations;
        fs << "converged" << static_cast<int>(calib.converged);
        fs << "calibration_time" << formatTimestamp(calib.calibration_date);
        fs << "calibration_epoch" << static_cast<double>(
            std::chrono::duration_cast<std::chrono::seconds>(calib.calibration_date.time_since_epoch()).count());
        fs.release();
    } catch (const cv::Exception& e) {
        std::cerr << "Calibration: writing " << path << " failed: " << e.what() << "\n";
        return false;
    }

    std::cout << "Calibration saved to: " << path << "\n";
    return true;
}

// ============= OstCalibrationWriter =============
OstCalibrationWriter::OstCalibrationWriter(const std::string& path) : path(path) {}

std::string formatOst(const CalibrationResult& calib) {
    require(calib.camera_matrix.rows == 3 && calib.camera_matrix.cols == 3, "camera matrix must be 3x3");
    require(calib.rectification.rows == 3 && calib.rectification.cols == 3, "rectification must be 3x3");
    require(calib.projection.rows == 3 && calib.projection.cols == 4, "projection must be 3x4");

    std::ostringstream os;
    os << std::fixed << std::setprecision(6);
    os << "# oST version 5.0 parameters\n\n\n";
    os << "[image]\n\n";
    os << "width\n" << calib.image_size.width << "\n\n";
    os << "height\n" << calib.image_size.height << "\n\n";
    os << "[" << calib.camera_name << "]\n\n";
    os << "camera matrix\n";
    writeRows(os, calib.camera_matrix);
    os << "\ndistortion\n";
    writeRows(os, calib.distortion_coeffs.reshape(1, 1));
    os << "\nrectification\n";
    writeRows(os, calib.rectification);
    os << "\nprojection\n";
    writeRows(os, calib.projection);
    os << "\n";
    return os.str();
}

bool OstCalibrationWriter::write(const CalibrationResult& calib) {
    if (!calib.is_valid) {
        std::cerr << "Calibration: refusing to save an invalid calibration\n";
        return false;
    }

    std::string text;
    try {
        text = formatOst(calib);
    } catch (const ValidationException& ve) {
        std::cerr << "Calibration: " << ve.what() << "\n";
        return false;
    }

    ensureParentDirectory(path);
    std::ofstream out(path);
    if (!out) {
        std::cerr << "Calibration: Cannot write " << path << "\n";
        return false;
    }
    out << text;
    out.close();
    if (!out) {
        std::cerr << "Calibration: write to " << path << " failed\n";
        return false;
    }
    std::cout << "Calibration saved to: " << path << "\n";
    return true;
}

// ============= CompositeCalibrationWriter =============
void CompositeCalibrationWriter::add(std::shared_ptr<CalibrationWriter> writer) {
    if (writer) writers.push_back(std::move(writer));
}

bool CompositeCalibrationWriter::write(const CalibrationResult& calib) {
    bool ok = !writers.empty();
    for (auto& w : writers) {
        if (!w->write(calib)) {
            std::cerr << "Calibration: saving to " << w->describe() << " failed\n";
            ok = false;
        }
    }
    return ok;
}

std::string CompositeCalibrationWriter::describe() const {
    std::string s;
    for (const auto& w : writers) {
        if (!s.empty()) s += ", ";
        s += w->describe();
    }
    return s;
}

// ============= Loading =============
CalibrationResult loadCalibration(const std::string& path) {
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        rethrowCv(e, "opening " + path);
    }
    if (!fs.isOpened()) {
        throw ResourceException("cannot open calibration file '" + path + "'");
    }

    CalibrationResult calib;
    fs["camera_matrix"] >> calib.camera_matrix;
    fs["distortion_coefficients"] >> calib.distortion_coeffs;
    require(!calib.camera_matrix.empty(), "camera_matrix missing in " + path);

    int w = 0, h = 0;
    if (!fs["image_width"].empty()) fs["image_width"] >> w;
    if (!fs["image_height"].empty()) fs["image_height"] >> h;
    require(w > 0 && h > 0, "image size missing in " + path);
    calib.image_size = cv::Size(w, h);

    calib.camera_matrix.convertTo(calib.camera_matrix, CV_64F);
    if (!calib.distortion_coeffs.empty()) {
        calib.distortion_coeffs.convertTo(calib.distortion_coeffs, CV_64F);
    } else {
        calib.distortion_coeffs = cv::Mat::zeros(5, 1, CV_64F);
    }

    fs["rectification_matrix"] >> calib.rectification;
    if (calib.rectification.empty()) calib.rectification = cv::Mat::eye(3, 3, CV_64F);
    calib.rectification.convertTo(calib.rectification, CV_64F);

    fs["projection_matrix"] >> calib.projection;
    if (calib.projection.empty()) {
        calib.projection = cv::Mat::zeros(3, 4, CV_64F);
        calib.camera_matrix.copyTo(calib.projection(cv::Rect(0, 0, 3, 3)));
    }
    calib.projection.convertTo(calib.projection, CV_64F);

    if (!fs["camera_name"].empty()) fs["camera_name"] >> calib.camera_name;
    if (!fs["calibration_method"].empty()) {
        fs["calibration_method"] >> calib.calibration_method;
    } else {
        calib.calibration_method = "Loaded from file";
    }
    if (!fs["reprojection_error"].empty()) fs["reprojection_error"] >> calib.reprojection_error;
    if (!fs["per_sample_error"].empty()) fs["per_sample_error"] >> calib.per_sample_error;
    if (!fs["iterations"].empty()) fs["iterations"] >> calib.iterations;
    if (!fs["converged"].empty()) calib.converged = static_cast<int>(fs["converged"]) != 0;

    if (!fs["target_cols"].empty()) fs["target_cols"] >> calib.target.cols;
    if (!fs["target_rows"].empty()) fs["target_rows"] >> calib.target.rows;
    if (!fs["target_square_size"].empty()) fs["target_square_size"] >> calib.target.squareSize;

    if (!fs["calibration_epoch"].empty()) {
        double epoch = 0.0;
        fs["calibration_epoch"] >> epoch;
        calib.calibration_date = std::chrono::system_clock::time_point(
            std::chrono::seconds(static_cast<long long>(epoch)));
    }

    calib.is_valid = calib.validateCameraMatrix() && calib.validateDistortionCoeffs();
    require(calib.is_valid, "invalid camera matrix or distortion in " + path);
    require(calib.rectification.rows == 3 && calib.rectification.cols == 3,
            "rectification_matrix must be 3x3");
    require(calib.projection.rows == 3 && calib.projection.cols == 4,
            "projection_matrix must be 3x4");

    std::cout << "Loaded calibration from: " << path << "\n";
    return calib;
}
