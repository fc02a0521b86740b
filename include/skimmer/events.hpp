#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <skimmer/world_state.hpp>

namespace skimmer {

enum class EventKind : int {
  Detection = 0,
  BinFull = 1,
  Obstacle = 2,
  Error = 3,
  Lifecycle = 4,
};

// Append-only audit record. Never mutated after construction.
struct CollectionEvent {
  std::chrono::system_clock::time_point timestamp{};
  EventKind kind = EventKind::Lifecycle;
  std::optional<WorldState> snapshot;   // null for lifecycle events
  std::uint64_t collection_count = 0;
  std::string message;
};

const char* event_kind_name(EventKind k);

// Case-insensitive inverse of event_kind_name.
std::optional<EventKind> event_kind_from_name(const std::string& s);

} // namespace skimmer
