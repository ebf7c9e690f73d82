#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "boatcount/crossing_event.hpp"

namespace boatcount {

/**
 * @brief Consumer of counted crossings (log, ledger, snapshot, ...)
 *
 * publish() may throw; the dispatcher isolates failures so a sink can never
 * un-count an event or stop the pipeline.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual std::string name() const = 0;
    virtual void publish(const CrossingEvent& event) = 0;
};

class EventDispatcher {
public:
    void addSink(std::shared_ptr<EventSink> sink);

    /**
     * @brief Publish an event to every sink
     *
     * @return size_t Number of sinks that failed
     */
    std::size_t dispatch(const CrossingEvent& event);

    std::size_t sinkCount() const { return sinks_.size(); }
    std::uint64_t getFailures() const { return failures_; }

private:
    std::vector<std::shared_ptr<EventSink>> sinks_;
    std::uint64_t failures_ = 0;
};

/**
 * @brief Writes one info line per counted crossing
 */
class LogSink : public EventSink {
public:
    std::string name() const override { return "log"; }
    void publish(const CrossingEvent& event) override;
};

/**
 * @brief Appends counted crossings to a CSV ledger
 *
 * Columns: date,time,total,track_id,direction,frame. A header is written when the
 * file is created. Local time is used for the date and time columns.
 */
class CsvLedgerSink : public EventSink {
public:
    explicit CsvLedgerSink(std::string path);

    std::string name() const override { return "csv"; }
    void publish(const CrossingEvent& event) override;

    const std::string& getPath() const { return path_; }

private:
    std::string path_;
};

} // namespace boatcount
