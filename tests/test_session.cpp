#include <gtest/gtest.h>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include "Exceptions.hpp"
#include "Session.hpp"
#include "SyntheticCamera.hpp"

namespace {

const TargetGeometry kTarget(9, 7, 0.02);
const cv::Size kFrame(640, 480);

/**
 * @brief Replays precomputed corner lists; the frame's single pixel selects which one
 *
 * Index -2 simulates a detector backend failing with a plain std::runtime_error.
 */
class ScriptedDetector : public FeatureDetector {
public:
    explicit ScriptedDetector(std::vector<std::vector<cv::Point2f>> views) : views(std::move(views)) {}

    bool detect(const cv::Mat& frame, std::vector<cv::Point2f>& points) override {
        int idx = frame.at<int>(0, 0);
        if (idx == -2) throw std::runtime_error("camera backend lost");
        if (idx < 0 || idx >= static_cast<int>(views.size())) return false;
        points = views[idx];
        return true;
    }

    std::string getType() const override { return "Scripted"; }

private:
    std::vector<std::vector<cv::Point2f>> views;
};

class ToggleWriter : public CalibrationWriter {
public:
    bool fail = false;
    int writes = 0;

    bool write(const CalibrationResult&) override {
        ++writes;
        return !fail;
    }
    std::string describe() const override { return "toggle"; }
};

struct Gate {
    std::mutex m;
    std::condition_variable cv;
    bool open = false;

    void wait() {
        std::unique_lock<std::mutex> lk(m);
        cv.wait(lk, [this] { return open; });
    }
    void release() {
        {
            std::lock_guard<std::mutex> lk(m);
            open = true;
        }
        cv.notify_all();
    }
};

// Declared after the session so the solver thread is unblocked before the session joins it.
struct GateReleaser {
    std::shared_ptr<Gate> gate;
    ~GateReleaser() { gate->release(); }
};

Frame frameFor(int index, uint64_t sequence) {
    Frame f;
    f.image = cv::Mat(1, 1, CV_32S, cv::Scalar(index));
    f.sequence = sequence;
    f.size = kFrame;
    return f;
}

CalibrationResult makeResult() {
    CalibrationResult r;
    r.camera_matrix = SyntheticCamera::standard().K.clone();
    r.distortion_coeffs = cv::Mat::zeros(5, 1, CV_64F);
    r.rectification = cv::Mat::eye(3, 3, CV_64F);
    r.projection = cv::Mat::zeros(3, 4, CV_64F);
    r.camera_matrix.copyTo(r.projection(cv::Rect(0, 0, 3, 3)));
    r.image_size = kFrame;
    r.per_sample_error = {0.1, 0.1, 0.1, 0.1};
    r.reprojection_error = 0.1;
    r.iterations = 3;
    r.converged = true;
    r.target = kTarget;
    r.is_valid = true;
    return r;
}

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        views = SyntheticCamera::standard().projectAll(kTarget, spreadPoses());
        detector = std::make_shared<ScriptedDetector>(views);
        writer = std::make_shared<ToggleWriter>();
        sampling.gridFitTolerance = 0.5;
        runtime.verbose = false;
    }

    std::unique_ptr<CalibrationSession> makeSession(CalibrationSession::SolverFn solver = {}) {
        return std::make_unique<CalibrationSession>(detector, writer, kTarget, sampling,
                                                    solverCfg, runtime, std::move(solver));
    }

    void feed(CalibrationSession& session, const std::vector<int>& indices) {
        for (int idx : indices) session.submitFrame(frameFor(idx, ++sequence));
        session.flush();
    }

    std::vector<std::vector<cv::Point2f>> views;
    std::shared_ptr<ScriptedDetector> detector;
    std::shared_ptr<ToggleWriter> writer;
    Config::Sampling sampling;
    Config::Solver solverCfg;
    Config::Runtime runtime;
    uint64_t sequence = 0;
};

CalibrationSession::SolverFn fixedSolver() {
    return [](const std::vector<Sample>&) { return makeResult(); };
}

} // namespace

TEST_F(SessionTest, StartsCollectingAndEmpty) {
    auto session = makeSession(fixedSolver());
    SessionSnapshot s = session->snapshot();
    EXPECT_EQ(s.state, SessionState::Collecting);
    EXPECT_EQ(s.sampleCount, 0u);
    EXPECT_EQ(s.capacity, static_cast<size_t>(sampling.capacity));
    EXPECT_FALSE(s.result);
    EXPECT_FALSE(s.hasAdmission);
}

TEST_F(SessionTest, UndetectedFramesAreCountedButNotSampled) {
    auto session = makeSession(fixedSolver());
    feed(*session, {-1, -1});
    SessionSnapshot s = session->snapshot();
    EXPECT_EQ(s.framesProcessed, 2u);
    EXPECT_EQ(s.framesDetected, 0u);
    EXPECT_EQ(s.lastGrid, GridStatus::NotFound);
    EXPECT_EQ(s.sampleCount, 0u);
}

TEST_F(SessionTest, RepeatedFrameIsRejectedAsRedundant) {
    auto session = makeSession(fixedSolver());
    feed(*session, {0});
    ASSERT_EQ(session->snapshot().sampleCount, 1u);
    EXPECT_EQ(session->snapshot().lastAdmission, Admission::AcceptedNovel);

    feed(*session, {0});
    SessionSnapshot s = session->snapshot();
    EXPECT_EQ(s.sampleCount, 1u);
    EXPECT_TRUE(s.hasAdmission);
    EXPECT_EQ(s.lastAdmission, Admission::RejectedRedundant);
    EXPECT_EQ(s.framesDetected, 2u);
    EXPECT_EQ(s.framesAccepted, 1u);
    EXPECT_EQ(s.lastPoints.size(), static_cast<size_t>(kTarget.pointCount()));
}

TEST_F(SessionTest, CalibrateWithTooFewSamplesLeavesSessionUntouched) {
    auto session = makeSession(fixedSolver());
    feed(*session, {0, 1, 2});
    auto before = session->samples();
    ASSERT_EQ(before.size(), 3u);

    SolveTicket t = session->calibrate();
    EXPECT_EQ(t.status, CommandStatus::InsufficientSamples);
    EXPECT_EQ(t.report.get().status, CommandStatus::InsufficientSamples);

    SessionSnapshot s = session->snapshot();
    EXPECT_EQ(s.state, SessionState::Collecting);
    EXPECT_FALSE(s.lastError.empty());
    auto after = session->samples();
    ASSERT_EQ(after.size(), before.size());
    for (size_t i = 0; i < after.size(); ++i) {
        EXPECT_EQ(after[i].detection.frameSequence, before[i].detection.frameSequence);
    }
}

TEST_F(SessionTest, SecondCalibrateWhileSolvingIsBusy) {
    auto gate = std::make_shared<Gate>();
    auto session = makeSession([gate](const std::vector<Sample>&) {
        gate->wait();
        return makeResult();
    });
    GateReleaser releaser{gate};

    feed(*session, {0, 1, 2, 3, 4});
    SolveTicket first = session->calibrate();
    ASSERT_EQ(first.status, CommandStatus::Started);
    EXPECT_EQ(session->state(), SessionState::Calibrating);
    EXPECT_TRUE(session->snapshot().solverBusy);

    SolveTicket second = session->calibrate();
    EXPECT_EQ(second.status, CommandStatus::Busy);

    // Frames arriving during the solve are dropped, not sampled.
    size_t samplesBefore = session->snapshot().sampleCount;
    feed(*session, {5, 6});
    SessionSnapshot during = session->snapshot();
    EXPECT_EQ(during.sampleCount, samplesBefore);
    EXPECT_EQ(during.framesDiscarded, 2u);

    gate->release();
    SolveReport report = first.report.get();
    EXPECT_EQ(report.status, CommandStatus::Ok);
    EXPECT_FALSE(report.discarded);
    ASSERT_TRUE(report.result);

    SessionSnapshot s = session->snapshot();
    EXPECT_EQ(s.state, SessionState::Calibrated);
    EXPECT_FALSE(s.solverBusy);
    EXPECT_EQ(s.result, report.result);
}

TEST_F(SessionTest, RestartDuringSolveDiscardsTheResult) {
    auto gate = std::make_shared<Gate>();
    auto session = makeSession([gate](const std::vector<Sample>&) {
        gate->wait();
        return makeResult();
    });
    GateReleaser releaser{gate};

    feed(*session, {0, 1, 2, 3, 4});
    SolveTicket ticket = session->calibrate();
    ASSERT_EQ(ticket.status, CommandStatus::Started);

    EXPECT_EQ(session->restart(), CommandStatus::Ok);
    EXPECT_EQ(session->state(), SessionState::Collecting);
    EXPECT_EQ(session->snapshot().sampleCount, 0u);

    // The old solve still owns the solver slot.
    EXPECT_EQ(session->calibrate().status, CommandStatus::Busy);

    gate->release();
    SolveReport report = ticket.report.get();
    EXPECT_TRUE(report.discarded);

    SessionSnapshot s = session->snapshot();
    EXPECT_EQ(s.state, SessionState::Collecting);
    EXPECT_FALSE(s.result);
    EXPECT_FALSE(s.solverBusy);
}

TEST_F(SessionTest, DivergentSolveReturnsToCollecting) {
    auto session = makeSession([](const std::vector<Sample>&) -> CalibrationResult {
        throw NumericalDivergenceException("residual is not finite");
    });
    feed(*session, {0, 1, 2, 3, 4});

    SolveTicket ticket = session->calibrate();
    ASSERT_EQ(ticket.status, CommandStatus::Started);
    SolveReport report = ticket.report.get();
    EXPECT_EQ(report.status, CommandStatus::NumericalDivergence);
    EXPECT_FALSE(report.result);

    SessionSnapshot s = session->snapshot();
    EXPECT_EQ(s.state, SessionState::Collecting);
    EXPECT_FALSE(s.result);
    EXPECT_NE(s.lastError.find("Numerical divergence"), std::string::npos);
    EXPECT_EQ(s.sampleCount, 5u);
}

TEST_F(SessionTest, InvalidSolverOutputIsSolveFailed) {
    auto session = makeSession([](const std::vector<Sample>&) { return CalibrationResult(); });
    feed(*session, {0, 1, 2, 3, 4});
    SolveReport report = session->calibrate().report.get();
    EXPECT_EQ(report.status, CommandStatus::SolveFailed);
    EXPECT_EQ(session->state(), SessionState::Collecting);
}

TEST_F(SessionTest, SolverProcessingErrorIsSolveFailed) {
    auto session = makeSession([](const std::vector<Sample>&) -> CalibrationResult {
        throw ProcessingException("jacobian at iteration 7 | cv::Exception: (-5) bad argument");
    });
    feed(*session, {0, 1, 2, 3, 4});
    SolveReport report = session->calibrate().report.get();
    EXPECT_EQ(report.status, CommandStatus::SolveFailed);
    EXPECT_NE(report.message.find("jacobian at iteration 7"), std::string::npos);
    EXPECT_EQ(session->snapshot().lastError, report.message);
    EXPECT_EQ(session->state(), SessionState::Collecting);
}

TEST_F(SessionTest, SaveRequiresCalibratedState) {
    auto session = makeSession(fixedSolver());
    EXPECT_EQ(session->save(), CommandStatus::InvalidState);
    EXPECT_EQ(writer->writes, 0);
    EXPECT_EQ(session->resume(), CommandStatus::InvalidState);
}

TEST_F(SessionTest, FailedSaveKeepsResultAndCanBeRetried) {
    auto session = makeSession(fixedSolver());
    feed(*session, {0, 1, 2, 3, 4});
    ASSERT_EQ(session->calibrate().report.get().status, CommandStatus::Ok);
    ASSERT_EQ(session->state(), SessionState::Calibrated);

    writer->fail = true;
    EXPECT_EQ(session->save(), CommandStatus::PersistenceFailed);
    SessionSnapshot failed = session->snapshot();
    EXPECT_EQ(failed.state, SessionState::Calibrated);
    EXPECT_TRUE(failed.result);
    EXPECT_FALSE(failed.lastError.empty());

    writer->fail = false;
    EXPECT_EQ(session->save(), CommandStatus::Ok);
    EXPECT_EQ(session->state(), SessionState::Committed);
    EXPECT_EQ(writer->writes, 2);

    EXPECT_EQ(session->save(), CommandStatus::InvalidState);
    EXPECT_EQ(session->calibrate().status, CommandStatus::InvalidState);

    // Committed sessions ignore frames until restarted.
    feed(*session, {5});
    SessionSnapshot committed = session->snapshot();
    EXPECT_EQ(committed.sampleCount, 5u);
    EXPECT_EQ(committed.framesDiscarded, 1u);

    EXPECT_EQ(session->restart(), CommandStatus::Ok);
    EXPECT_EQ(session->state(), SessionState::Collecting);
    EXPECT_FALSE(session->snapshot().result);
}

TEST_F(SessionTest, ResumeKeepsResultAndMarksItStale) {
    auto session = makeSession(fixedSolver());
    feed(*session, {0, 1, 2, 3, 4});
    ASSERT_EQ(session->calibrate().report.get().status, CommandStatus::Ok);

    // Calibrated sessions only measure straightness; no new samples.
    feed(*session, {5});
    EXPECT_EQ(session->snapshot().sampleCount, 5u);

    EXPECT_EQ(session->resume(), CommandStatus::Ok);
    SessionSnapshot resumed = session->snapshot();
    EXPECT_EQ(resumed.state, SessionState::Collecting);
    EXPECT_TRUE(resumed.result);
    EXPECT_FALSE(resumed.stale);

    feed(*session, {6});
    SessionSnapshot grown = session->snapshot();
    EXPECT_EQ(grown.sampleCount, 6u);
    EXPECT_TRUE(grown.stale);

    ASSERT_EQ(session->calibrate().report.get().status, CommandStatus::Ok);
    EXPECT_FALSE(session->snapshot().stale);
}

TEST_F(SessionTest, MotionGateSkipsMovingBoard) {
    sampling.maxBoardSpeed = 2.0;
    auto session = makeSession(fixedSolver());

    feed(*session, {0});        // no previous frame to compare against
    EXPECT_EQ(session->snapshot().sampleCount, 0u);
    feed(*session, {0});        // still
    EXPECT_EQ(session->snapshot().sampleCount, 1u);
    feed(*session, {1});        // jumped
    EXPECT_EQ(session->snapshot().sampleCount, 1u);
    feed(*session, {1});
    EXPECT_EQ(session->snapshot().sampleCount, 2u);

    // Losing the board resets the motion reference.
    feed(*session, {-1, 2});
    EXPECT_EQ(session->snapshot().sampleCount, 2u);
}

TEST_F(SessionTest, DetectorFailureDoesNotStopTheSession) {
    auto session = makeSession(fixedSolver());
    feed(*session, {-2});
    SessionSnapshot failed = session->snapshot();
    EXPECT_EQ(failed.framesProcessed, 1u);
    EXPECT_NE(failed.lastError.find("camera backend lost"), std::string::npos);
    EXPECT_EQ(failed.state, SessionState::Collecting);

    feed(*session, {0, -2, 1});
    SessionSnapshot s = session->snapshot();
    EXPECT_EQ(s.framesProcessed, 4u);
    EXPECT_EQ(s.sampleCount, 2u);

    EXPECT_EQ(session->restart(), CommandStatus::Ok);
    EXPECT_TRUE(session->snapshot().lastError.empty());
}

TEST_F(SessionTest, FullPipelineWithBuiltInSolver) {
    views = SyntheticCamera::standard().projectAll(kTarget, coveragePoses());
    detector = std::make_shared<ScriptedDetector>(views);
    auto session = makeSession();
    std::vector<int> all;
    for (int i = 0; i < static_cast<int>(views.size()); ++i) all.push_back(i);
    feed(*session, all);

    SessionSnapshot collected = session->snapshot();
    EXPECT_EQ(collected.framesDetected, views.size());
    EXPECT_EQ(collected.sampleCount, views.size());
    for (int i = 0; i < kDimensionCount; ++i) {
        EXPECT_DOUBLE_EQ(collected.coverage.fraction[i], 1.0) << toString(static_cast<Dimension>(i));
    }
    EXPECT_GE(collected.coverage.readiness, sampling.readinessThreshold);
    EXPECT_TRUE(collected.goodEnough);

    SolveTicket ticket = session->calibrate();
    ASSERT_EQ(ticket.status, CommandStatus::Started);
    SolveReport report = ticket.report.get();
    ASSERT_EQ(report.status, CommandStatus::Ok) << report.message;
    ASSERT_TRUE(report.result);
    EXPECT_LT(report.result->reprojection_error, 0.5);
    EXPECT_NEAR(report.result->camera_matrix.at<double>(0, 0), 820.0, 8.2);
    EXPECT_NEAR(report.result->camera_matrix.at<double>(1, 1), 800.0, 8.0);
    EXPECT_NEAR(report.result->camera_matrix.at<double>(0, 2), 320.0, 3.2);
    EXPECT_NEAR(report.result->camera_matrix.at<double>(1, 2), 240.0, 2.4);
    EXPECT_EQ(report.result->camera_name, runtime.cameraName);
    EXPECT_EQ(session->state(), SessionState::Calibrated);

    feed(*session, {6});
    SessionSnapshot checked = session->snapshot();
    EXPECT_GE(checked.lastLinearError, 0.0);
    EXPECT_LT(checked.lastLinearError, 0.1);

    EXPECT_EQ(session->save(), CommandStatus::Ok);
    EXPECT_EQ(session->state(), SessionState::Committed);
    EXPECT_EQ(writer->writes, 1);
}

TEST(SessionStatus, NamesAreStable) {
    EXPECT_STREQ(toString(SessionState::Calibrating), "Calibrating");
    EXPECT_STREQ(toString(CommandStatus::PersistenceFailed), "PersistenceFailed");
    EXPECT_STREQ(toString(CommandStatus::Busy), "Busy");
}
