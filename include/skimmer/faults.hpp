#pragma once
#include <stdexcept>
#include <string>

namespace skimmer {

// Base of every fault a collaborator may raise into the loop.
class Fault : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// One sensed field unavailable; the loop degrades that field and carries on.
class SensorFault : public Fault {
public:
  using Fault::Fault;
};

// A drive or collector command was rejected or timed out.
class ActuationFault : public Fault {
public:
  using Fault::Fault;
};

// Camera or classifier unavailable; treated as "nothing detected".
class PerceptionFault : public Fault {
public:
  using Fault::Fault;
};

// Unrecoverable. Escapes run() after a best-effort stop_all().
class FatalFault : public Fault {
public:
  using Fault::Fault;
};

} // namespace skimmer
