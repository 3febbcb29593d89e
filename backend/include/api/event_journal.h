#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "events/event_bus.h"

namespace nodeward {

/**
 * Records supervisor events with increasing sequence numbers so a client
 * polling over HTTP can fetch what it has not seen yet.
 */
class EventJournal {
public:
    struct Entry {
        uint64_t       seq;
        std::string    event;
        nlohmann::json payload;
    };

    static constexpr std::size_t kDefaultCapacity = 256;

    explicit EventJournal(EventBus& bus, std::size_t capacity = kDefaultCapacity);

    /// Entries with seq > `after`, oldest first.
    [[nodiscard]] std::vector<Entry> since(uint64_t after) const;

    [[nodiscard]] uint64_t last_seq() const;

private:
    void record(std::string event, nlohmann::json payload);

    const std::size_t  capacity_;
    mutable std::mutex mutex_;
    std::deque<Entry>  entries_;
    uint64_t           next_seq_ = 1;

    Subscription status_sub_;
    Subscription progress_sub_;
    Subscription complete_sub_;
    Subscription failed_sub_;
};

}  // namespace nodeward
