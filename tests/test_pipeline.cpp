#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <opencv2/imgcodecs.hpp>
#include "boatcount/pipeline.hpp"
#include "test_support.hpp"

using namespace boatcount;
using boatcount::testing::ManualClock;
using boatcount::testing::box;

namespace {

/**
 * @brief In-memory frames; finite sources end, live ones fail reads after the frames run out
 */
class FakeFrameSource : public FrameSource {
public:
    FakeFrameSource(int frames, bool finite)
        : frames_left_(frames)
        , finite_(finite) {
    }

    bool open() override {
        ++open_calls;
        open_ = true;
        return true;
    }
    void release() override { open_ = false; }
    bool isOpen() const override { return open_; }
    std::string describe() const override { return "fake source"; }
    bool isFinite() const override { return finite_; }

    bool read(cv::Mat& frame) override {
        ++read_calls;
        if (cancel && read_calls >= cancel_after_reads) {
            cancel->requestStop();
        }
        if (!open_ || frames_left_ <= 0) {
            return false;
        }
        --frames_left_;
        frame = cv::Mat(360, 640, CV_8UC3, cv::Scalar(80, 120, 160));
        return true;
    }

    int open_calls = 0;
    int read_calls = 0;
    CancellationToken* cancel = nullptr;
    int cancel_after_reads = 0;

private:
    int frames_left_;
    bool finite_;
    bool open_ = false;
};

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("boatcount_pipeline_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        config_.counter.line.relative = false;
        config_.counter.line.position = 150.0f;
        config_.capture.max_read_failures = 3;
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    // One boat from x=40 to x=260 over frames 0..9, plus a person that must be ignored
    std::string writeDetections() {
        const auto path = dir_ / "detections.csv";
        std::ofstream out(path);
        out << "frame,class_id,confidence,x1,y1,x2,y2\n";
        for (int i = 0; i < 10; ++i) {
            const Eigen::Vector4f b = box(40.0f + i * 220.0f / 9.0f, 180, 100, 60);
            out << i << ",8,0.9," << b(0) << "," << b(1) << "," << b(2) << "," << b(3) << "\n";
            out << i << ",0,0.95,500,20,540,120\n";
        }
        return path.string();
    }

    AcquisitionScheduler makeScheduler(CaptureDevice& device) {
        return AcquisitionScheduler(config_.scheduler, device, [](WallTime) { return true; }, clock_, cancel_);
    }

    std::filesystem::path dir_;
    AppConfig config_;
    ManualClock clock_;
    CancellationToken cancel_;
};

} // namespace

TEST_F(PipelineTest, ReplayedBoatIsCountedAndPublished) {
    FakeFrameSource source(12, true);
    ReplayDetector detector(writeDetections());
    EXPECT_EQ(detector.frameCount(), 10u);

    EventDispatcher dispatcher;
    const auto csv_path = dir_ / "counts.csv";
    dispatcher.addSink(std::make_shared<CsvLedgerSink>(csv_path.string()));
    auto snapshots = std::make_shared<SnapshotWriter>((dir_ / "snapshots").string(), true);
    dispatcher.addSink(snapshots);

    auto scheduler = makeScheduler(source);
    Pipeline pipeline(config_, source, detector, dispatcher, scheduler, clock_, cancel_);
    pipeline.setSnapshotWriter(snapshots);

    RunSummary summary = pipeline.run();
    EXPECT_TRUE(summary.end_of_stream);
    EXPECT_FALSE(summary.cancelled);
    EXPECT_EQ(summary.frames, 12u);
    EXPECT_EQ(summary.counted, 1u);
    EXPECT_EQ(summary.frame_errors, 0u);
    EXPECT_EQ(summary.sink_failures, 0u);
    EXPECT_FALSE(source.isOpen());

    ASSERT_NE(pipeline.getProcessor(), nullptr);
    EXPECT_EQ(pipeline.getProcessor()->getCounter().getCount(Direction::LeftToRight), 1u);

    EXPECT_TRUE(std::filesystem::exists(csv_path));
    ASSERT_FALSE(snapshots->getLastPath().empty());
    cv::Mat saved = cv::imread(snapshots->getLastPath());
    ASSERT_FALSE(saved.empty());
    EXPECT_LT(saved.cols, 640);
    EXPECT_EQ(std::filesystem::path(snapshots->getLastPath()).filename().string().rfind("boat_1_", 0), 0u);
}

TEST_F(PipelineTest, CancelledBeforeStart) {
    FakeFrameSource source(5, true);
    ReplayDetector detector(writeDetections());
    EventDispatcher dispatcher;
    auto scheduler = makeScheduler(source);
    Pipeline pipeline(config_, source, detector, dispatcher, scheduler, clock_, cancel_);

    cancel_.requestStop();
    RunSummary summary = pipeline.run();
    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.frames, 0u);
    EXPECT_EQ(source.open_calls, 0);
}

TEST_F(PipelineTest, LiveSourceIsReleasedAfterConsecutiveReadFailures) {
    FakeFrameSource source(0, false);
    source.cancel = &cancel_;
    source.cancel_after_reads = 4;
    ReplayDetector detector(writeDetections());
    EventDispatcher dispatcher;
    auto scheduler = makeScheduler(source);
    Pipeline pipeline(config_, source, detector, dispatcher, scheduler, clock_, cancel_);

    RunSummary summary = pipeline.run();
    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.read_failures, 4u);
    EXPECT_EQ(source.open_calls, 2);
    EXPECT_FALSE(source.isOpen());
}

TEST_F(PipelineTest, ReleasedCaptureDropsTracks) {
    FakeFrameSource source(4, false);
    source.cancel = &cancel_;
    source.cancel_after_reads = 8;
    ReplayDetector detector(writeDetections());
    EventDispatcher dispatcher;
    auto scheduler = makeScheduler(source);
    Pipeline pipeline(config_, source, detector, dispatcher, scheduler, clock_, cancel_);

    RunSummary summary = pipeline.run();
    EXPECT_TRUE(summary.cancelled);
    EXPECT_EQ(summary.frames, 4u);
    EXPECT_EQ(source.open_calls, 2);

    const FrameProcessor* processor = pipeline.getProcessor();
    ASSERT_NE(processor, nullptr);
    EXPECT_TRUE(processor->getTracker().getTracks().empty());
    EXPECT_EQ(processor->getCounter().trackedHistories(), 0u);
    EXPECT_EQ(processor->getTracker().getNextId(), 2);
}

TEST(VideoSourceTest, OversizedCameraIndexIsAConfigError) {
    CaptureConfig config;
    config.source = "99999999999";
    EXPECT_THROW(VideoSource source(config), ConfigError);

    config.source = "0";
    VideoSource camera(config);
    EXPECT_FALSE(camera.isFinite());
    EXPECT_FALSE(camera.isOpen());
}

TEST(ReplayDetectorTest, ReplaysRowsPerFrame) {
    const auto path = std::filesystem::temp_directory_path() / "boatcount_replay_test.csv";
    {
        std::ofstream out(path);
        out << "frame,class_id,confidence,x1,y1,x2,y2\n\n"
            << "0,8,0.9,10,20,50,60\n"
            << "0,0,0.5,100,100,120,140\n"
            << "2,8,0.7,12,20,52,60\n";
    }
    ReplayDetector detector(path.string());
    cv::Mat frame;

    auto first = detector.detect(frame);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].class_id, 8);
    EXPECT_FLOAT_EQ(first[0].confidence, 0.9f);
    EXPECT_FLOAT_EQ(first[0].tlbr(2), 50.0f);
    EXPECT_TRUE(detector.detect(frame).empty());
    EXPECT_EQ(detector.detect(frame).size(), 1u);
    EXPECT_TRUE(detector.detect(frame).empty());
    std::filesystem::remove(path);
}

TEST(ReplayDetectorTest, MalformedRowThrows) {
    const auto path = std::filesystem::temp_directory_path() / "boatcount_replay_bad.csv";
    {
        std::ofstream out(path);
        out << "0,8,0.9,10,20\n";
    }
    EXPECT_THROW(ReplayDetector(path.string()), std::runtime_error);
    std::filesystem::remove(path);
    EXPECT_THROW(ReplayDetector(path.string()), std::runtime_error);
}

TEST(RoiMaskTest, MasksPixelsOutsideTheRegion) {
    const auto path = std::filesystem::temp_directory_path() / "boatcount_mask_test.png";
    cv::Mat mask_image(36, 64, CV_8UC1, cv::Scalar(0));
    mask_image(cv::Rect(0, 0, 32, 36)).setTo(cv::Scalar(255));
    ASSERT_TRUE(cv::imwrite(path.string(), mask_image));

    RoiMask mask = RoiMask::load(path.string());
    ASSERT_FALSE(mask.empty());

    cv::Mat frame(360, 640, CV_8UC3, cv::Scalar(200, 200, 200));
    cv::Mat masked = mask.apply(frame);
    EXPECT_EQ(masked.at<cv::Vec3b>(100, 50)[0], 200);
    EXPECT_EQ(masked.at<cv::Vec3b>(100, 600)[0], 0);
    std::filesystem::remove(path);
}

TEST(RoiMaskTest, MissingFileUsesFullFrame) {
    RoiMask mask = RoiMask::load("/nonexistent/mask.png");
    EXPECT_TRUE(mask.empty());

    cv::Mat frame(10, 10, CV_8UC3, cv::Scalar(1, 2, 3));
    EXPECT_EQ(mask.apply(frame).at<cv::Vec3b>(5, 5)[2], 3);
}

TEST(SnapshotWriterTest, PublishWithoutFrameThrows) {
    const auto dir = std::filesystem::temp_directory_path() / "boatcount_snapshots_test";
    SnapshotWriter writer(dir.string(), false);
    CrossingEvent event{1, 3, std::chrono::system_clock::now(), Direction::LeftToRight, 4, box(50, 50, 20, 20)};
    EXPECT_THROW(writer.publish(event), std::runtime_error);

    writer.setFrame(cv::Mat(100, 100, CV_8UC3, cv::Scalar(0, 0, 0)), 4);
    EXPECT_NO_THROW(writer.publish(event));
    cv::Mat saved = cv::imread(writer.getLastPath());
    EXPECT_EQ(saved.cols, 100);
    std::filesystem::remove_all(dir);
}
