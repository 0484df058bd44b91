#pragma once

/// @file include/finrep/events.hpp
/// @brief Observational events published when an operation commits.

#include "finrep/types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace finrep {

enum class ReportEvent {
    ReportGenerated,
    ReportStored,
    AddressesConfigured,
};

[[nodiscard]] std::string_view to_string(ReportEvent event) noexcept;

/// One published event.
///
/// Payload by kind:
///   ReportGenerated      → `value` = generated_at
///   ReportStored         → `subject` = owner, `value` = period key
///   AddressesConfigured  → `subject` = caller
struct EventRecord {
    std::string                  topic;
    ReportEvent                  kind = ReportEvent::ReportGenerated;
    std::optional<Identity>      subject;
    std::optional<std::uint64_t> value;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const EventRecord&, const EventRecord&) = default;
};

/// Event transport. Delivery semantics beyond `publish` are not specified.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void publish(const EventRecord& event) = 0;
};

/// Sink that keeps every event in publication order.
class EventLog final : public EventSink {
public:
    void publish(const EventRecord& event) override;

    [[nodiscard]] std::span<const EventRecord> events() const noexcept {
        return events_;
    }

    void clear() noexcept { events_.clear(); }

private:
    std::vector<EventRecord> events_;
};

} // namespace finrep
