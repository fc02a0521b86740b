#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include <skimmer/clock.hpp>
#include <skimmer/events.hpp>
#include <skimmer/presentation.hpp>
#include <skimmer/world_state.hpp>

namespace skimmer {

// Narrow interfaces to the subsystems the loop drives but does not own.
// Each call is synchronous and bounded by the collaborator's own timeouts.

struct Frame {
  int width = 0;
  int height = 0;
  std::vector<std::uint8_t> rgb;   // width*height*3, row-major
  bool empty() const { return rgb.empty(); }
};

enum class CollectorDirection : int { Forward = 0, Reverse = 1 };

class ActuationPort {
public:
  virtual ~ActuationPort() = default;
  // Speeds in [-100,100]; positive is forward.
  virtual void drive(int left_speed, int right_speed) = 0;
  virtual void stop_drive() = 0;
  // Starts the collector; it stops on its own after max_run if nobody calls
  // stop_collector() first.
  virtual void run_collector(CollectorDirection dir, Clock::duration max_run) = 0;
  virtual void stop_collector() = 0;
  // Immediate and idempotent. Safe to call at any time.
  virtual void stop_all() = 0;
};

class SensorFusionPort {
public:
  virtual ~SensorFusionPort() = default;
  virtual WorldState sample() = 0;
};

class FrameSource {
public:
  virtual ~FrameSource() = default;
  // nullopt when no frame could be grabbed this cycle.
  virtual std::optional<Frame> capture() = 0;
};

class PerceptionPort {
public:
  virtual ~PerceptionPort() = default;
  // Must answer (false, 0.0) rather than throw when no model is loaded.
  virtual Detection classify(const Frame& frame) = 0;
};

class PresentationPort {
public:
  virtual ~PresentationPort() = default;
  virtual void show(View view, const ViewData& data) = 0;
};

struct AuditSummary {
  std::uint64_t count = 0;
  std::uint64_t detections = 0;
  double avg_confidence = 0.0;
};

class AuditLogPort {
public:
  virtual ~AuditLogPort() = default;
  // Append-only; insertion order is preserved.
  virtual void append(const CollectionEvent& ev) = 0;
  virtual AuditSummary summary() const = 0;
};

} // namespace skimmer
