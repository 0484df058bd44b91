/// @file src/core/events.cpp
/// @brief In-memory event sink.

#include "finrep/events.hpp"

namespace finrep {

void EventLog::publish(const EventRecord& event) {
    events_.push_back(event);
}

} // namespace finrep
