#include "boatcount/event_sink.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/chrono.h>

namespace boatcount {

void EventDispatcher::addSink(std::shared_ptr<EventSink> sink) {
    if (!sink) {
        throw std::invalid_argument("event sink must not be null");
    }
    sinks_.push_back(std::move(sink));
}

std::size_t EventDispatcher::dispatch(const CrossingEvent& event) {
    std::size_t failed = 0;
    for (const auto& sink : sinks_) {
        try {
            sink->publish(event);
        } catch (const std::exception& e) {
            ++failed;
            spdlog::error("Sink '{}' failed for boat #{} (track ID {}) at {:%Y-%m-%d %H:%M:%S}: {}",
                sink->name(), event.sequence, event.track_id,
                fmt::localtime(std::chrono::system_clock::to_time_t(event.timestamp)), e.what());
        } catch (...) {
            ++failed;
            spdlog::error("Sink '{}' failed for boat #{} (track ID {}) with a non-standard exception",
                sink->name(), event.sequence, event.track_id);
        }
    }
    failures_ += failed;
    return failed;
}

void LogSink::publish(const CrossingEvent& event) {
    spdlog::info("Boat #{}  (track ID {}) going {}", event.sequence, event.track_id, toString(event.direction));
}

CsvLedgerSink::CsvLedgerSink(std::string path)
    : path_(std::move(path)) {
    if (path_.empty()) {
        throw std::invalid_argument("CSV ledger path must not be empty");
    }
}

void CsvLedgerSink::publish(const CrossingEvent& event) {
    std::error_code ec;
    const bool is_new = !std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0;

    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("cannot open " + path_);
    }
    if (is_new) {
        out << "date,time,total,track_id,direction,frame\n";
    }

    const std::tm local = fmt::localtime(std::chrono::system_clock::to_time_t(event.timestamp));
    out << fmt::format("{:%Y-%m-%d},{:%H:%M:%S},{},{},{},{}\n",
        local, local, event.sequence, event.track_id, toString(event.direction), event.frame_index);
    out.flush();
    if (!out) {
        throw std::runtime_error("write failed on " + path_);
    }
}

} // namespace boatcount
