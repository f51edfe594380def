/**
 * @file Session.cpp
 * @brief Implementation of the calibration session state machine
 */

#include "Session.hpp"
#include "Descriptor.hpp"
#include "Exceptions.hpp"
#include "Rectification.hpp"
#include <exception>
#include <iomanip>
#include <iostream>

const char* toString(SessionState s) {
    switch (s) {
        case SessionState::Collecting:  return "Collecting";
        case SessionState::Calibrating: return "Calibrating";
        case SessionState::Calibrated:  return "Calibrated";
        case SessionState::Committed:   return "Committed";
    }
    return "?";
}

const char* toString(CommandStatus s) {
    switch (s) {
        case CommandStatus::Ok:                  return "Ok";
        case CommandStatus::Started:             return "Started";
        case CommandStatus::Busy:                return "Busy";
        case CommandStatus::InsufficientSamples: return "InsufficientSamples";
        case CommandStatus::NumericalDivergence: return "NumericalDivergence";
        case CommandStatus::InvalidState:        return "InvalidState";
        case CommandStatus::PersistenceFailed:   return "PersistenceFailed";
        case CommandStatus::SolveFailed:         return "SolveFailed";
    }
    return "?";
}

namespace {

SolveTicket readyTicket(CommandStatus status, const std::string& message) {
    std::promise<SolveReport> p;
    SolveReport report;
    report.status = status;
    report.message = message;
    p.set_value(report);
    SolveTicket ticket;
    ticket.status = status;
    ticket.report = p.get_future().share();
    return ticket;
}

} // namespace

CalibrationSession::CalibrationSession(std::shared_ptr<FeatureDetector> detector,
                                       std::shared_ptr<CalibrationWriter> writer,
                                       const TargetGeometry& target,
                                       const Config::Sampling& sampling,
                                       const Config::Solver& solverCfg,
                                       const Config::Runtime& runtime,
                                       SolverFn solver)
    : detector_(std::move(detector)),
      writer_(std::move(writer)),
      target_(target),
      sampling_(sampling),
      solverCfg_(solverCfg),
      verbose_(runtime.verbose),
      solver_(std::move(solver)),
      set_(sampling) {
    require(detector_ != nullptr, "session needs a feature detector");
    target_.validate();
    require(sampling_.minSamples > 0, "minimum sample count must be > 0");

    if (!solver_) {
        const TargetGeometry geometry = target_;
        const Config::Solver cfg = solverCfg_;
        const size_t minSamples = static_cast<size_t>(sampling_.minSamples);
        const std::string cameraName = runtime.cameraName;
        solver_ = [geometry, cfg, minSamples, cameraName](const std::vector<Sample>& samples) {
            return calibrateSamples(samples, geometry, cfg, minSamples, cameraName);
        };
    }

    worker_ = std::thread(&CalibrationSession::workerLoop, this);
}

CalibrationSession::~CalibrationSession() {
    {
        std::lock_guard<std::mutex> lk(queueMutex_);
        stopping_ = true;
    }
    queueCv_.notify_all();
    if (worker_.joinable()) worker_.join();

    std::lock_guard<std::mutex> lk(solverMutex_);
    if (solverThread_.joinable()) solverThread_.join();
}

// ============= Processing path =============
void CalibrationSession::workerLoop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(queueMutex_);
            queueCv_.wait(lk, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
            busy_ = true;
        }

        try {
            task();
        } catch (const CalibException& e) {
            std::cerr << "Session: " << e.what() << "\n";
            std::lock_guard<std::mutex> lk(stateMutex_);
            lastError_ = e.what();
        } catch (const cv::Exception& e) {
            std::cerr << "Session: OpenCV error: " << e.what() << "\n";
            std::lock_guard<std::mutex> lk(stateMutex_);
            lastError_ = e.what();
        } catch (const std::exception& e) {
            std::cerr << "Session: task failed: " << e.what() << "\n";
            std::lock_guard<std::mutex> lk(stateMutex_);
            lastError_ = e.what();
        }

        {
            std::lock_guard<std::mutex> lk(queueMutex_);
            busy_ = false;
        }
        idleCv_.notify_all();
    }
}

bool CalibrationSession::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lk(queueMutex_);
        if (stopping_) return false;
        tasks_.push_back(std::move(task));
    }
    queueCv_.notify_one();
    return true;
}

void CalibrationSession::submitFrame(Frame frame) {
    auto shared = std::make_shared<Frame>(std::move(frame));
    if (!enqueue([this, shared] { processFrame(*shared); })) {
        std::cerr << "Session: frame " << shared->sequence << " dropped, session is shutting down\n";
    }
}

void CalibrationSession::flush() {
    std::unique_lock<std::mutex> lk(queueMutex_);
    idleCv_.wait(lk, [this] { return tasks_.empty() && !busy_; });
}

void CalibrationSession::processFrame(const Frame& frame) {
    const cv::Size frameSize = frame.size.area() > 0 ? frame.size : frame.image.size();
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        ++framesProcessed_;
        if (state_ == SessionState::Calibrating || state_ == SessionState::Committed) {
            ++framesDiscarded_;
            return;
        }
    }

    // Detection is the expensive part and touches no shared state.
    std::vector<cv::Point2f> raw;
    bool found = detector_->detect(frame.image, raw);
    GridValidation v = validateGrid(raw, found, target_, frameSize, sampling_);

    if (!v.ok()) {
        previousPoints_.clear();
        std::lock_guard<std::mutex> lk(stateMutex_);
        lastGrid_ = v.status;
        lastPoints_.clear();
        if (verbose_ && v.status != GridStatus::NotFound) {
            std::cout << "Frame " << frame.sequence << " discarded: " << toString(v.status) << "\n";
        }
        return;
    }
    v.detection.frameSequence = frame.sequence;
    collect(v, frame.sequence);
}

void CalibrationSession::collect(const GridValidation& v, uint64_t sequence) {
    const Detection& det = v.detection;
    double motion = meanMotion(det.points, previousPoints_);
    previousPoints_ = det.points;

    std::lock_guard<std::mutex> lk(stateMutex_);
    ++framesDetected_;
    lastGrid_ = v.status;
    lastPoints_ = det.points;

    if (state_ == SessionState::Calibrated) {
        // Only the straightness check runs once a result exists.
        if (result_ && result_->is_valid && det.frameSize == result_->image_size) {
            lastLinearError_ = linearError(undistortDetection(det.points, *result_), target_);
        } else {
            lastLinearError_ = -1.0;
        }
        return;
    }
    if (state_ != SessionState::Collecting) {
        ++framesDiscarded_;
        return;
    }

    if (sampling_.maxBoardSpeed > 0.0 && (motion < 0.0 || motion > sampling_.maxBoardSpeed)) {
        if (verbose_) std::cout << "Frame " << sequence << " skipped: board moving\n";
        return;
    }

    SampleDescriptor d = buildDescriptor(det, target_);
    AdmissionDecision decision = set_.offer(det, d);
    hasAdmission_ = true;
    lastAdmission_ = decision.verdict;
    if (!isAccepted(decision.verdict)) return;

    ++framesAccepted_;
    if (result_) stale_ = true;
    if (verbose_) {
        std::cout << std::fixed << std::setprecision(3)
                  << "*** Added sample " << set_.size()
                  << ", x = " << d.x << ", y = " << d.y
                  << ", size = " << d.size << ", skew = " << d.skew
                  << (decision.verdict == Admission::AcceptedReplacing ? " (replaced one)" : "")
                  << "\n";
        std::cout.unsetf(std::ios::floatfield);
    }
}

// ============= Commands =============
SolveTicket CalibrationSession::calibrate() {
    std::lock_guard<std::mutex> solverLock(solverMutex_);

    std::vector<Sample> samples;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        if (solving_) return readyTicket(CommandStatus::Busy, "a solve is already running");
        if (state_ != SessionState::Collecting) {
            return readyTicket(CommandStatus::InvalidState,
                               std::string("cannot calibrate while ") + toString(state_));
        }
        const size_t need = static_cast<size_t>(sampling_.minSamples);
        if (set_.size() < need) {
            InsufficientSamplesException e(set_.size(), need);
            lastError_ = e.what();
            std::cerr << "Session: " << e.what() << "\n";
            return readyTicket(CommandStatus::InsufficientSamples, e.what());
        }
        samples = set_.samples();
        generation = generation_;
        solving_ = true;
        state_ = SessionState::Calibrating;
        lastError_.clear();
    }

    // The previous solve thread has already published its result.
    if (solverThread_.joinable()) solverThread_.join();

    std::cout << "Session: calibrating with " << samples.size() << " samples...\n";

    std::promise<SolveReport> promise;
    SolveTicket ticket;
    ticket.status = CommandStatus::Started;
    ticket.report = promise.get_future().share();

    solverThread_ = std::thread(
        [this, generation, samples = std::move(samples), promise = std::move(promise)]() mutable {
            SolveReport report;
            try {
                auto result = std::make_shared<CalibrationResult>(solver_(samples));
                if (result->is_valid) {
                    report.status = CommandStatus::Ok;
                    report.result = std::move(result);
                } else {
                    report.status = CommandStatus::SolveFailed;
                    report.message = "solver produced invalid intrinsics";
                }
            } catch (const InsufficientSamplesException& e) {
                report.status = CommandStatus::InsufficientSamples;
                report.message = e.what();
            } catch (const NumericalDivergenceException& e) {
                report.status = CommandStatus::NumericalDivergence;
                report.message = e.what();
            } catch (const CalibException& e) {
                report.status = CommandStatus::SolveFailed;
                report.message = e.what();
            } catch (const cv::Exception& e) {
                report.status = CommandStatus::SolveFailed;
                report.message = e.what();
            } catch (const std::exception& e) {
                report.status = CommandStatus::SolveFailed;
                report.message = e.what();
            }
            finishSolve(generation, report);
            promise.set_value(report);
        });
    return ticket;
}

void CalibrationSession::finishSolve(uint64_t generation, SolveReport& report) {
    std::lock_guard<std::mutex> lk(stateMutex_);
    solving_ = false;

    if (generation != generation_) {
        report.discarded = true;
        std::cout << "Session: solve finished after restart, result discarded\n";
        return;
    }

    if (report.status == CommandStatus::Ok) {
        result_ = report.result;
        stale_ = false;
        lastLinearError_ = -1.0;
        state_ = SessionState::Calibrated;
        if (verbose_) result_->printSummary();
        if (!result_->converged) {
            std::cerr << "Session: WARNING solver did not converge, check the reprojection error\n";
        }
    } else {
        state_ = SessionState::Collecting;
        lastError_ = report.message;
        std::cerr << "Session: calibration failed (" << toString(report.status) << "): "
                  << report.message << "\n";
    }
}

CommandStatus CalibrationSession::save() {
    std::shared_ptr<const CalibrationResult> result;
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        if (state_ != SessionState::Calibrated || !result_) return CommandStatus::InvalidState;
        result = result_;
    }

    bool ok = false;
    std::string error;
    if (!writer_) {
        error = "no persistence target configured";
    } else {
        try {
            ok = writer_->write(*result);
            if (!ok) error = "writing " + writer_->describe() + " failed";
        } catch (const CalibException& e) {
            error = e.what();
        } catch (const cv::Exception& e) {
            error = e.what();
        } catch (const std::exception& e) {
            error = e.what();
        }
    }

    std::lock_guard<std::mutex> lk(stateMutex_);
    if (!ok) {
        lastError_ = error;
        std::cerr << "Session: save failed: " << error << "\n";
        return CommandStatus::PersistenceFailed;
    }
    if (state_ != SessionState::Calibrated || result_ != result) {
        // restarted while writing
        return CommandStatus::InvalidState;
    }
    state_ = SessionState::Committed;
    lastError_.clear();
    return CommandStatus::Ok;
}

CommandStatus CalibrationSession::restart() {
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> finished = done->get_future();
    bool queued = enqueue([this, done] {
        try {
            resetCollection();
        } catch (...) {
            // restart() waits on this promise
            done->set_exception(std::current_exception());
            throw;
        }
        done->set_value();
    });
    if (!queued) return CommandStatus::InvalidState;
    try {
        finished.get();
    } catch (const std::exception& e) {
        std::cerr << "Session: restart failed: " << e.what() << "\n";
        return CommandStatus::InvalidState;
    }
    return CommandStatus::Ok;
}

void CalibrationSession::resetCollection() {
    previousPoints_.clear();
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        ++generation_;
        set_.clear();
        result_.reset();
        stale_ = false;
        lastLinearError_ = -1.0;
        hasAdmission_ = false;
        lastPoints_.clear();
        lastError_.clear();
        state_ = SessionState::Collecting;
    }
    std::cout << "Session: restarted\n";
}

CommandStatus CalibrationSession::resume() {
    std::lock_guard<std::mutex> lk(stateMutex_);
    if (state_ != SessionState::Calibrated) return CommandStatus::InvalidState;
    state_ = SessionState::Collecting;
    return CommandStatus::Ok;
}

// ============= Readers =============
SessionSnapshot CalibrationSession::snapshot() const {
    std::lock_guard<std::mutex> lk(stateMutex_);
    SessionSnapshot s;
    s.state = state_;
    s.coverage = set_.tracker().coverage();
    s.sampleCount = set_.size();
    s.capacity = set_.capacity();
    s.goodEnough = set_.goodEnough();
    s.result = result_;
    s.stale = stale_;
    s.solverBusy = solving_;
    s.lastLinearError = lastLinearError_;
    s.lastGrid = lastGrid_;
    s.hasAdmission = hasAdmission_;
    s.lastAdmission = lastAdmission_;
    s.lastPoints = lastPoints_;
    s.lastError = lastError_;
    s.framesProcessed = framesProcessed_;
    s.framesDetected = framesDetected_;
    s.framesAccepted = framesAccepted_;
    s.framesDiscarded = framesDiscarded_;
    return s;
}

SessionState CalibrationSession::state() const {
    std::lock_guard<std::mutex> lk(stateMutex_);
    return state_;
}

std::vector<Sample> CalibrationSession::samples() const {
    std::lock_guard<std::mutex> lk(stateMutex_);
    return set_.samples();
}
