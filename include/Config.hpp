/**
 * @file Config.hpp
 * @brief Centralized configuration management for the calibration tool
 * @date 2025
 */

#pragma once

#include <string>

namespace Config {
    /**
     * @brief Closed interval used to bin one descriptor dimension
     */
    struct Range {
        double lo = 0.0;
        double hi = 1.0;
    };

    /**
     * @brief Calibration target geometry
     */
    struct Target {
        int cols = 9;               // interior corners per row
        int rows = 7;               // rows of interior corners
        double squareSize = 0.02;   // metres between adjacent corners
    };

    /**
     * @brief Sample curation parameters (validator, coverage, admission)
     */
    struct Sampling {
        int capacity = 60;
        int bins = 10;
        Range xRange{0.15, 0.85};
        Range yRange{0.15, 0.85};
        Range sizeRange{0.02, 0.42};
        Range skewRange{0.0, 0.6};
        double noveltyThreshold = 0.1;
        int minSamples = 4;
        int sufficientSamples = 40;
        double readinessThreshold = 1.0;
        double borderPx = 8.0;
        double gridFitTolerance = 0.15;
        double maxBoardSpeed = -1.0;   // pixels per frame, <= 0 disables
    };

    /**
     * @brief Nonlinear least-squares solver parameters
     */
    struct Solver {
        int maxIterations = 200;
        double tolerance = 1e-9;
        double initialFovDeg = 60.0;    // diagonal field of view for the seed
        bool refineInitialFocal = true;
        bool fixAspectRatio = false;
        bool fixPrincipalPoint = false;
        bool zeroTangentDist = false;
        bool fixK3 = false;
        double alpha = 0.0;
    };

    /**
     * @brief Runtime behavior configuration
     */
    struct Runtime {
        bool verbose = true;
        std::string cameraName = "camera";
        std::string outputYaml = "calibration.yaml";
        std::string outputOst = "ost.txt";
        std::string sourceConfigPath;
    };

    // Global configuration instances
    extern Target target;
    extern Sampling sampling;
    extern Solver solver;
    extern Runtime runtime;

    /**
     * @brief Load configuration from YAML file
     * @param filename Path to configuration file
     * @return true if loaded successfully
     */
    bool load(const std::string& filename);

    /**
     * @brief Print configuration summary to console
     */
    void printSummary();

} // namespace Config
