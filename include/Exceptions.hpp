/**
 * @file Exceptions.hpp
 * @brief Error types raised by the calibration pipeline
 * @date 2025
 *
 * The session reports these through CommandStatus and lastError instead of
 * letting them escape its threads.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <opencv2/core.hpp>

/**
 * @brief Root of every error thrown by GridCalib code
 */
class CalibException : public std::runtime_error {
public:
    explicit CalibException(const std::string& m) : std::runtime_error(m) {}
};

/**
 * @brief Bad target geometry, config value or calibration file contents
 */
class ValidationException : public CalibException {
public:
    explicit ValidationException(const std::string& m)
        : CalibException("Validation error: " + m) {}
};

/**
 * @brief Camera, video file or calibration file could not be opened
 */
class ResourceException : public CalibException {
public:
    explicit ResourceException(const std::string& m)
        : CalibException("Resource error: " + m) {}
};

/**
 * @brief Detection, pose seeding or the solver could not complete
 */
class ProcessingException : public CalibException {
public:
    explicit ProcessingException(const std::string& m)
        : CalibException("Processing error: " + m) {}
};

/**
 * @brief Raised when a solve is requested with fewer samples than required
 */
class InsufficientSamplesException : public CalibException {
public:
    InsufficientSamplesException(size_t have, size_t need)
        : CalibException("Insufficient samples: have " + std::to_string(have) +
                         ", need " + std::to_string(need)),
          available(have), required(need) {}

    size_t available;
    size_t required;
};

/**
 * @brief Raised when the reprojection residual becomes non-finite
 */
class NumericalDivergenceException : public CalibException {
public:
    explicit NumericalDivergenceException(const std::string& m)
        : CalibException("Numerical divergence: " + m) {}
};

/**
 * @brief Precondition check used by constructors and loaders
 * @param cond Must hold
 * @param msg Describes the violated precondition
 */
inline void require(bool cond, const std::string& msg) {
    if (!cond) throw ValidationException(msg);
}

/**
 * @brief Rewraps an OpenCV failure with the pipeline step it happened in
 * @param e OpenCV exception
 * @param ctx Step name, e.g. "pose initialization of view 3"
 */
[[noreturn]] inline void rethrowCv(const cv::Exception& e, const std::string& ctx) {
    std::ostringstream oss;
    oss << ctx << " | cv::Exception: (" << e.code << ") " << e.what();
    throw ProcessingException(oss.str());
}
