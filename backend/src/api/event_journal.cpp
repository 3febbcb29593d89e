#include "api/event_journal.h"

using json = nlohmann::json;

namespace nodeward {

EventJournal::EventJournal(EventBus& bus, std::size_t capacity) : capacity_(capacity) {
    status_sub_ = bus.status_changed.subscribe([this](const StatusChanged& e) {
        record("status_changed", {{"state", to_string(e.state)}});
    });
    progress_sub_ = bus.download_progress.subscribe([this](const DownloadProgress& e) {
        record("download_progress", {{"current", e.bytes_received}, {"total", e.bytes_total}});
    });
    complete_sub_ = bus.download_complete.subscribe([this](const DownloadComplete& e) {
        record("download_complete", {{"version", e.version}, {"sha256", e.sha256}});
    });
    failed_sub_ = bus.download_failed.subscribe([this](const DownloadFailed& e) {
        record("download_failed", {{"reason", e.reason}, {"kind", to_string(kind_of(e.code))}});
    });
}

std::vector<EventJournal::Entry> EventJournal::since(uint64_t after) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Entry> out;
    for (const auto& e : entries_) {
        if (e.seq > after) out.push_back(e);
    }
    return out;
}

uint64_t EventJournal::last_seq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_seq_ - 1;
}

void EventJournal::record(std::string event, json payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(Entry{next_seq_++, std::move(event), std::move(payload)});
    while (entries_.size() > capacity_) entries_.pop_front();
}

}  // namespace nodeward
