/**
 * @file Config.cpp
 * @brief Implementation of centralized configuration management
 */

#include "Config.hpp"
#include <opencv2/core.hpp>
#include <iostream>

namespace Config {
    // Define global configuration instances
    Target target;
    Sampling sampling;
    Solver solver;
    Runtime runtime;

    bool load(const std::string& filename) {
        cv::FileStorage fs;
        runtime.sourceConfigPath = filename;

        try {
            fs.open(filename, cv::FileStorage::READ);
        } catch (const cv::Exception& e) {
            std::cerr << "Config file unreadable (" << filename << "): " << e.what() << "\n";
            return false;
        }
        if (!fs.isOpened()) {
            std::cerr << "Config file not found (" << filename << "), using defaults.\n";
            return false;
        }

        auto get = [&](const char* key, auto& target) {
            if (!fs[key].empty()) fs[key] >> target;
        };
        auto getFlag = [&](const char* key, bool& target) {
            if (!fs[key].empty()) target = static_cast<int>(fs[key]) != 0;
        };
        auto getRange = [&](const char* lo, const char* hi, Range& r) {
            get(lo, r.lo);
            get(hi, r.hi);
        };

        // Target parameters
        get("target_cols", target.cols);
        get("target_rows", target.rows);
        get("target_square_size_m", target.squareSize);

        // Sampling parameters
        get("sampling_capacity", sampling.capacity);
        get("sampling_bins", sampling.bins);
        getRange("sampling_x_min", "sampling_x_max", sampling.xRange);
        getRange("sampling_y_min", "sampling_y_max", sampling.yRange);
        getRange("sampling_size_min", "sampling_size_max", sampling.sizeRange);
        getRange("sampling_skew_min", "sampling_skew_max", sampling.skewRange);
        get("sampling_novelty_threshold", sampling.noveltyThreshold);
        get("sampling_min_samples", sampling.minSamples);
        get("sampling_sufficient_samples", sampling.sufficientSamples);
        get("sampling_readiness_threshold", sampling.readinessThreshold);
        get("sampling_border_px", sampling.borderPx);
        get("sampling_grid_fit_tolerance", sampling.gridFitTolerance);
        get("sampling_max_board_speed", sampling.maxBoardSpeed);

        // Solver parameters
        get("solver_max_iterations", solver.maxIterations);
        get("solver_tolerance", solver.tolerance);
        get("solver_initial_fov_deg", solver.initialFovDeg);
        getFlag("solver_refine_initial_focal", solver.refineInitialFocal);
        getFlag("solver_fix_aspect_ratio", solver.fixAspectRatio);
        getFlag("solver_fix_principal_point", solver.fixPrincipalPoint);
        getFlag("solver_zero_tangent_dist", solver.zeroTangentDist);
        getFlag("solver_fix_k3", solver.fixK3);
        get("solver_alpha", solver.alpha);

        // Runtime parameters
        getFlag("runtime_verbose", runtime.verbose);
        get("runtime_camera_name", runtime.cameraName);
        get("runtime_output_yaml", runtime.outputYaml);
        get("runtime_output_ost", runtime.outputOst);

        std::cout << "Loaded configuration from: " << filename << "\n";
        return true;
    }

    void printSummary() {
        auto range = [](const Range& r) {
            return "[" + std::to_string(r.lo) + ", " + std::to_string(r.hi) + "]";
        };

        std::cout << "\n=== CONFIG SUMMARY ===\n";
        std::cout << "Config path: " << runtime.sourceConfigPath << "\n";
        std::cout << "Target: " << target.cols << "x" << target.rows
                  << " squareSize(m)=" << target.squareSize << "\n";
        std::cout << "Sampling: capacity=" << sampling.capacity
                  << " bins=" << sampling.bins
                  << " x=" << range(sampling.xRange)
                  << " y=" << range(sampling.yRange)
                  << " size=" << range(sampling.sizeRange)
                  << " skew=" << range(sampling.skewRange) << "\n"
                  << "          novelty=" << sampling.noveltyThreshold
                  << " minSamples=" << sampling.minSamples
                  << " sufficient=" << sampling.sufficientSamples
                  << " readiness=" << sampling.readinessThreshold
                  << " border=" << sampling.borderPx
                  << " gridFitTol=" << sampling.gridFitTolerance
                  << " maxSpeed=" << sampling.maxBoardSpeed << "\n";
        std::cout << "Solver: maxIter=" << solver.maxIterations
                  << " tol=" << solver.tolerance
                  << " fov=" << solver.initialFovDeg
                  << " refineFocal=" << (solver.refineInitialFocal ? "true" : "false")
                  << " fixAspect=" << (solver.fixAspectRatio ? "true" : "false")
                  << " fixPP=" << (solver.fixPrincipalPoint ? "true" : "false")
                  << " zeroTangent=" << (solver.zeroTangentDist ? "true" : "false")
                  << " fixK3=" << (solver.fixK3 ? "true" : "false")
                  << " alpha=" << solver.alpha << "\n";
        std::cout << "Runtime: verbose=" << (runtime.verbose ? "true" : "false")
                  << " camera=" << runtime.cameraName
                  << " yaml=" << runtime.outputYaml
                  << " ost=" << runtime.outputOst << "\n";
        std::cout << "=======================\n\n";
    }

} // namespace Config
