/**
 * @file main.cpp
 * @brief Live camera calibration with coverage-guided sample collection
 * @date 2025
 *
 * @details Wires the modules together:
 * - Config: YAML configuration
 * - VideoSource: frame acquisition
 * - FeatureDetector: checkerboard corners
 * - Session: validation, curation, solving and persistence
 * - Drawing: coverage bars and status overlay
 *
 * @section usage Usage Examples
 * @code
 * ./GridCalib 0                                  // webcam, default config
 * ./GridCalib 1 data/calib_config.yaml           // second camera
 * ./GridCalib board.mp4 data/calib_config.yaml   // recorded video
 * @endcode
 */

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <opencv2/highgui.hpp>

#include "CalibrationIO.hpp"
#include "Config.hpp"
#include "Drawing.hpp"
#include "Exceptions.hpp"
#include "FeatureDetector.hpp"
#include "Session.hpp"
#include "VideoSource.hpp"

namespace {

void reportSolve(const SolveReport& report) {
    if (report.discarded) return;
    if (report.status == CommandStatus::Ok) {
        std::cout << "Calibration done, RMS = " << report.result->reprojection_error
                  << " px. Press 's' to save or 'n' to keep collecting.\n";
    } else {
        std::cerr << "Calibration failed: " << toString(report.status) << " " << report.message << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        // ============= Argument Parsing =============
        if (argc < 2) {
            std::cout << "Usage: ./GridCalib [camera-index | video] [config_yaml]\n";
            return -1;
        }

        std::string source = argv[1];
        std::string configYaml = (argc >= 3) ? argv[2] : std::string("data/calib_config.yaml");

        if (!Config::load(configYaml)) {
            std::cout << "Using default configuration.\n";
        }
        if (Config::runtime.verbose) Config::printSummary();

        TargetGeometry target = TargetGeometry::fromConfig(Config::target);

        VideoSource video(source);
        if (!video.isOpened()) {
            throw ResourceException("cannot open video source '" + source + "'");
        }

        auto detector = std::make_shared<ChessboardDetector>(target);
        auto writer = std::make_shared<CompositeCalibrationWriter>();
        writer->add(std::make_shared<YamlCalibrationWriter>(Config::runtime.outputYaml));
        writer->add(std::make_shared<OstCalibrationWriter>(Config::runtime.outputOst));

        CalibrationSession session(detector, writer, target,
                                   Config::sampling, Config::solver, Config::runtime);

        std::cout << "[Calibration]\n"
                  << " - Show the checkerboard pattern (" << target.cols << "x" << target.rows << ")\n"
                  << " - Move it across the image, tilt it, bring it closer and farther\n"
                  << " - Press 'c' to CALIBRATE once the bars are green\n"
                  << " - Press 's' to SAVE, 'n' to resume collecting, 'r' to restart\n"
                  << " - Press 'q' to QUIT\n";

        const std::string window = "GridCalib";
        cv::namedWindow(window, cv::WINDOW_AUTOSIZE);

        // ============= Main Loop =============
        SolveTicket pending;
        bool waiting = false;
        Frame frame;
        while (video.read(frame)) {
            cv::Mat display = frame.image.clone();
            session.submitFrame(frame);
            session.flush();

            if (waiting && pending.report.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                reportSolve(pending.report.get());
                waiting = false;
            }

            SessionSnapshot snap = session.snapshot();
            drawCorners(display, snap.lastPoints, target);
            drawTargetOutline(display, snap.lastPoints, target);
            drawSessionStatus(display, snap);
            cv::imshow(window, display);

            int key = cv::waitKey(1);
            if (key == 'q' || key == 27) break;

            switch (key) {
                case 'c': {
                    SolveTicket ticket = session.calibrate();
                    if (ticket.status == CommandStatus::Started) {
                        pending = ticket;
                        waiting = true;
                    } else {
                        std::cout << "Calibrate: " << toString(ticket.status) << " "
                                  << ticket.report.get().message << "\n";
                    }
                    break;
                }
                case 's': {
                    CommandStatus st = session.save();
                    std::cout << "Save: " << toString(st) << "\n";
                    break;
                }
                case 'r':
                    std::cout << "Restart: " << toString(session.restart()) << "\n";
                    break;
                case 'n':
                    std::cout << "Resume: " << toString(session.resume()) << "\n";
                    break;
                default:
                    break;
            }
        }
        cv::destroyWindow(window);

        if (waiting) {
            std::cout << "Waiting for the running calibration to finish...\n";
            reportSolve(pending.report.get());
        }

        SessionSnapshot last = session.snapshot();
        std::cout << "\n=== SESSION SUMMARY ===\n"
                  << "Frames: " << last.framesProcessed
                  << ", with target: " << last.framesDetected
                  << ", accepted: " << last.framesAccepted << "\n"
                  << "Samples: " << last.sampleCount << "\n"
                  << "State: " << toString(last.state) << "\n";
        if (last.state != SessionState::Committed && last.result) {
            std::cout << "Calibration was not saved.\n";
        }
        return 0;

    } catch (const ValidationException& ve) {
        std::cerr << ve.what() << "\nTerminating due to validation failure.\n";
        return -2;
    } catch (const ResourceException& re) {
        std::cerr << re.what() << "\nTerminating due to resource allocation failure.\n";
        return -3;
    } catch (const ProcessingException& pe) {
        std::cerr << pe.what() << "\nTerminating due to processing failure.\n";
        return -4;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return -1;
    }
}
