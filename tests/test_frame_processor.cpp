#include <gtest/gtest.h>
#include <stdexcept>
#include "boatcount/frame_processor.hpp"
#include "test_support.hpp"

using namespace boatcount;
using boatcount::testing::ManualClock;
using boatcount::testing::rawBoat;

namespace {

class RecordingSink : public EventSink {
public:
    std::string name() const override { return "recording"; }
    void publish(const CrossingEvent& event) override { events.push_back(event); }

    std::vector<CrossingEvent> events;
};

class FrameProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.counter.line.relative = false;
        config_.counter.line.position = 150.0f;
        config_.tracker.n_init = 3;
        config_.counter.cooldown = std::chrono::seconds(5);
        sink_ = std::make_shared<RecordingSink>();
        dispatcher_.addSink(sink_);
    }

    FrameStamp nextStamp() {
        FrameStamp stamp{frame_++, clock_.wallNow(), clock_.monoNow()};
        clock_.advance(std::chrono::milliseconds(100));
        return stamp;
    }

    AppConfig config_;
    EventDispatcher dispatcher_;
    std::shared_ptr<RecordingSink> sink_;
    ManualClock clock_;
    std::uint64_t frame_ = 0;
};

} // namespace

TEST_F(FrameProcessorTest, BoatCrossingTheLineIsCountedOnce) {
    FrameProcessor processor(config_, 640, 360, dispatcher_);

    std::vector<CrossingEvent> events;
    for (int i = 0; i < 10; ++i) {
        const float x = 40.0f + i * 220.0f / 9.0f;
        FrameResult result = processor.process({rawBoat(x, 180, 100, 60, 0.9f)}, nextStamp());
        events.insert(events.end(), result.events.begin(), result.events.end());
    }

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].sequence, 1u);
    EXPECT_EQ(events[0].track_id, 1);
    EXPECT_EQ(events[0].direction, Direction::LeftToRight);
    ASSERT_EQ(sink_->events.size(), 1u);
    EXPECT_EQ(sink_->events[0].sequence, 1u);
    EXPECT_EQ(processor.getCounter().getTotal(), 1u);
}

TEST_F(FrameProcessorTest, OtherClassesAndWeakDetectionsNeverCount) {
    FrameProcessor processor(config_, 640, 360, dispatcher_);

    for (int i = 0; i < 10; ++i) {
        const float x = 40.0f + i * 220.0f / 9.0f;
        processor.process({rawBoat(x, 100, 100, 60, 0.9f, 0), rawBoat(x, 260, 100, 60, 0.2f)}, nextStamp());
    }
    EXPECT_TRUE(sink_->events.empty());
    EXPECT_TRUE(processor.getTracker().getTracks().empty());
}

TEST_F(FrameProcessorTest, MalformedDetectionsAreReportedPerFrame) {
    FrameProcessor processor(config_, 640, 360, dispatcher_);

    RawDetection broken{Eigen::Vector4f(300, 10, 200, 50), 0.9f, 8};
    FrameResult result = processor.process({broken, rawBoat(100, 100, 60, 40)}, nextStamp());
    EXPECT_EQ(result.rejected, 1u);
    EXPECT_EQ(processor.getTracker().getTracks().size(), 1u);
}

TEST_F(FrameProcessorTest, RelativeLineUsesFrameWidth) {
    config_.counter.line.relative = true;
    config_.counter.line.position = 0.25f;
    FrameProcessor processor(config_, 640, 360, dispatcher_);
    EXPECT_FLOAT_EQ(processor.getCounter().getLineCoordinate(), 160.0f);
}

TEST_F(FrameProcessorTest, DeletedTracksLoseTheirHistory) {
    config_.tracker.max_age = 2;
    FrameProcessor processor(config_, 640, 360, dispatcher_);

    for (int i = 0; i < 4; ++i) {
        processor.process({rawBoat(50.0f + 4 * i, 100, 60, 40)}, nextStamp());
    }
    EXPECT_EQ(processor.getCounter().trackedHistories(), 1u);

    for (int i = 0; i < 3; ++i) {
        processor.process({}, nextStamp());
    }
    EXPECT_TRUE(processor.getTracker().getTracks().empty());
    EXPECT_EQ(processor.getCounter().trackedHistories(), 0u);
}

TEST_F(FrameProcessorTest, ResetTrackingSeparatesCaptureGaps) {
    FrameProcessor processor(config_, 640, 360, dispatcher_);
    for (int i = 0; i < 4; ++i) {
        processor.process({rawBoat(120, 180, 100, 60)}, nextStamp());
    }
    ASSERT_EQ(processor.getCounter().trackedHistories(), 1u);

    EXPECT_EQ(processor.resetTracking(), 1u);
    EXPECT_TRUE(processor.getTracker().getTracks().empty());
    EXPECT_EQ(processor.getCounter().trackedHistories(), 0u);

    // Past the line after the gap: a new identity with no history before the gap
    std::vector<CrossingEvent> events;
    for (int i = 0; i < 4; ++i) {
        FrameResult result = processor.process({rawBoat(170, 180, 100, 60)}, nextStamp());
        events.insert(events.end(), result.events.begin(), result.events.end());
    }
    EXPECT_TRUE(events.empty());
    ASSERT_EQ(processor.getTracker().getTracks().size(), 1u);
    EXPECT_EQ(processor.getTracker().getTracks()[0].getTrackId(), 2);
    EXPECT_EQ(processor.getCounter().getTotal(), 0u);
}

TEST_F(FrameProcessorTest, RejectsEmptyFrameSize) {
    EXPECT_THROW(FrameProcessor(config_, 0, 360, dispatcher_), std::invalid_argument);
}
