/**
 * @file CalibrationIO.hpp
 * @brief Persistence of a finalized calibration
 * @date 2025
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "Calibration.hpp"

/**
 * @brief Destination of a committed calibration
 * @details The session only sees this interface; tests plug in failing or recording writers.
 */
class CalibrationWriter {
public:
    virtual ~CalibrationWriter() = default;

    /**
     * @brief Persist a calibration
     * @return true on success
     */
    virtual bool write(const CalibrationResult& calib) = 0;

    /**
     * @brief Human readable destination, used in log messages
     */
    virtual std::string describe() const = 0;
};

/**
 * @brief cv::FileStorage YAML file readable by loadCalibration()
 */
class YamlCalibrationWriter : public CalibrationWriter {
private:
    std::string path;

public:
    explicit YamlCalibrationWriter(const std::string& path);

    bool write(const CalibrationResult& calib) override;
    std::string describe() const override { return path; }
};

/**
 * @brief Plain-text "oST version 5.0" parameter block
 */
class OstCalibrationWriter : public CalibrationWriter {
private:
    std::string path;

public:
    explicit OstCalibrationWriter(const std::string& path);

    bool write(const CalibrationResult& calib) override;
    std::string describe() const override { return path; }
};

/**
 * @brief Writes to every writer in turn; succeeds only if all of them do
 */
class CompositeCalibrationWriter : public CalibrationWriter {
private:
    std::vector<std::shared_ptr<CalibrationWriter>> writers;

public:
    void add(std::shared_ptr<CalibrationWriter> writer);

    bool write(const CalibrationResult& calib) override;
    std::string describe() const override;
};

/**
 * @brief Text of the oST block for a calibration
 */
std::string formatOst(const CalibrationResult& calib);

/**
 * @brief Name of the lens model of a distortion vector ("plumb_bob" for 5 coefficients)
 */
std::string distortionModelName(const cv::Mat& distortion);

/**
 * @brief Reads a calibration written by YamlCalibrationWriter
 * @throws ResourceException if the file cannot be opened
 * @throws ValidationException if required fields are missing or invalid
 */
CalibrationResult loadCalibration(const std::string& path);
