#pragma once
#include <fstream>
#include <istream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>
#include <skimmer/ports.hpp>

namespace skimmer {

// Running totals shared by both audit log flavours.
class SummaryAccumulator {
public:
  void add(EventKind kind, bool has_confidence, double confidence);
  AuditSummary get() const;

private:
  std::uint64_t count_{0};
  std::uint64_t detections_{0};
  std::uint64_t conf_n_{0};
  double conf_sum_{0.0};
};

// In-process audit trail.
class MemoryAuditLog final : public AuditLogPort {
public:
  void append(const CollectionEvent& ev) override;
  AuditSummary summary() const override;

  std::vector<CollectionEvent> events() const;
  std::size_t size() const;

private:
  mutable std::mutex mu_;
  std::vector<CollectionEvent> events_;
  SummaryAccumulator acc_;
};

// CSV column order.
inline constexpr const char* kAuditCsvHeader =
  "Timestamp,Kind,Detected,Confidence,Lat,Lon,Payload_kg,Collection_Count,Clearance_cm,Orientation,Message";

// One CSV row (no trailing newline). Absent values are written as N/A.
std::string format_csv_row(const CollectionEvent& ev);

// Summary of an existing CSV log. Header, blank and malformed rows are skipped.
AuditSummary audit_summary_from_csv_stream(std::istream& in);

// Plain-text report for operators.
void write_summary_report(std::ostream& out, const AuditSummary& s, const std::string& source);

// Append-only CSV file. Reuses an existing file, writing the header only when
// the file is new or empty. Every row is flushed before append() returns.
class CsvAuditLog final : public AuditLogPort {
public:
  // Creates missing parent directories. nullptr when the file cannot be
  // opened for appending.
  static std::unique_ptr<CsvAuditLog> open(const std::string& path);

  // Throws std::runtime_error when the row cannot be written.
  void append(const CollectionEvent& ev) override;
  AuditSummary summary() const override;

  const std::string& path() const { return path_; }

private:
  CsvAuditLog(std::string path, std::ofstream out, AuditSummary prior);

  std::string path_;
  mutable std::mutex mu_;
  std::ofstream out_;
  AuditSummary prior_;
  SummaryAccumulator acc_;
};

} // namespace skimmer
