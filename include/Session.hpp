/**
 * @file Session.hpp
 * @brief Calibration session: frame processing path, operator commands and solve lifecycle
 * @date 2025
 */

#pragma once

#include <opencv2/core.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "Calibration.hpp"
#include "CalibrationIO.hpp"
#include "Config.hpp"
#include "Coverage.hpp"
#include "FeatureDetector.hpp"
#include "GridValidator.hpp"
#include "SampleSet.hpp"
#include "Target.hpp"

enum class SessionState {
    Collecting,
    Calibrating,
    Calibrated,
    Committed
};

enum class CommandStatus {
    Ok,
    Started,
    Busy,
    InsufficientSamples,
    NumericalDivergence,
    InvalidState,
    PersistenceFailed,
    SolveFailed
};

const char* toString(SessionState s);
const char* toString(CommandStatus s);

/**
 * @brief One camera image; size falls back to image.size() when left empty
 */
struct Frame {
    cv::Mat image;
    uint64_t sequence = 0;
    cv::Size size;
};

/**
 * @brief Outcome of one solve, delivered through SolveTicket::report
 */
struct SolveReport {
    CommandStatus status = CommandStatus::Ok;
    std::string message;
    std::shared_ptr<const CalibrationResult> result;
    bool discarded = false;     // a restart happened while solving
};

struct SolveTicket {
    CommandStatus status = CommandStatus::Ok;   // Started when a solve was launched
    std::shared_future<SolveReport> report;     // always ready unless Started
};

/**
 * @brief Consistent copy of everything the presentation layer shows
 */
struct SessionSnapshot {
    SessionState state = SessionState::Collecting;
    CoverageReport coverage;
    size_t sampleCount = 0;
    size_t capacity = 0;
    bool goodEnough = false;
    std::shared_ptr<const CalibrationResult> result;
    bool stale = false;
    bool solverBusy = false;
    double lastLinearError = -1.0;
    GridStatus lastGrid = GridStatus::NotFound;
    bool hasAdmission = false;
    Admission lastAdmission = Admission::RejectedRedundant;
    std::vector<cv::Point2f> lastPoints;    // canonical corners of the last valid frame
    std::string lastError;
    uint64_t framesProcessed = 0;
    uint64_t framesDetected = 0;
    uint64_t framesAccepted = 0;
    uint64_t framesDiscarded = 0;
};

/**
 * @brief Drives validator, descriptor, admission and solver from frames and commands
 *
 * Frames are processed in arrival order by a single worker thread, the only
 * writer of the sample set. Solves run on their own thread from a copy of the
 * samples. Commands and snapshot() may be called from any thread.
 */
class CalibrationSession {
public:
    using SolverFn = std::function<CalibrationResult(const std::vector<Sample>&)>;

    /**
     * @param solver Replaces the built-in solver when set
     */
    CalibrationSession(std::shared_ptr<FeatureDetector> detector,
                       std::shared_ptr<CalibrationWriter> writer,
                       const TargetGeometry& target,
                       const Config::Sampling& sampling,
                       const Config::Solver& solverCfg,
                       const Config::Runtime& runtime,
                       SolverFn solver = SolverFn());
    ~CalibrationSession();

    CalibrationSession(const CalibrationSession&) = delete;
    CalibrationSession& operator=(const CalibrationSession&) = delete;

    /**
     * @brief Queues a frame for the processing path; never blocks on processing
     */
    void submitFrame(Frame frame);

    /**
     * @brief Blocks until every queued frame has been processed
     */
    void flush();

    /**
     * @brief Starts a solve on the current samples
     *
     * Returns Busy while a solve is in flight, InvalidState outside
     * Collecting and InsufficientSamples below the minimum; Started otherwise.
     * A restart does not cancel a running solve: its result is discarded when
     * it finishes, and until then calibrate() keeps returning Busy.
     */
    SolveTicket calibrate();

    /**
     * @brief Hands the current result to the writer; Calibrated -> Committed on success
     */
    CommandStatus save();

    /**
     * @brief Clears samples, histograms and result; any state -> Collecting
     *
     * Runs on the processing path, so frames queued before it are processed first.
     */
    CommandStatus restart();

    /**
     * @brief Calibrated -> Collecting, keeping samples and result
     */
    CommandStatus resume();

    SessionSnapshot snapshot() const;
    SessionState state() const;
    std::vector<Sample> samples() const;

private:
    void workerLoop();
    bool enqueue(std::function<void()> task);
    void processFrame(const Frame& frame);
    void collect(const GridValidation& v, uint64_t sequence);
    void finishSolve(uint64_t generation, SolveReport& report);
    void resetCollection();

    std::shared_ptr<FeatureDetector> detector_;
    std::shared_ptr<CalibrationWriter> writer_;
    TargetGeometry target_;
    Config::Sampling sampling_;
    Config::Solver solverCfg_;
    bool verbose_;
    SolverFn solver_;

    // Guarded by stateMutex_
    mutable std::mutex stateMutex_;
    SessionState state_ = SessionState::Collecting;
    SampleSet set_;
    std::shared_ptr<const CalibrationResult> result_;
    bool stale_ = false;
    bool solving_ = false;
    uint64_t generation_ = 0;
    double lastLinearError_ = -1.0;
    GridStatus lastGrid_ = GridStatus::NotFound;
    bool hasAdmission_ = false;
    Admission lastAdmission_ = Admission::RejectedRedundant;
    std::vector<cv::Point2f> lastPoints_;
    std::string lastError_;
    uint64_t framesProcessed_ = 0;
    uint64_t framesDetected_ = 0;
    uint64_t framesAccepted_ = 0;
    uint64_t framesDiscarded_ = 0;

    // Worker-thread only
    std::vector<cv::Point2f> previousPoints_;

    // Processing path
    std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::condition_variable idleCv_;
    std::deque<std::function<void()>> tasks_;
    bool stopping_ = false;
    bool busy_ = false;
    std::thread worker_;

    std::mutex solverMutex_;
    std::thread solverThread_;
};
