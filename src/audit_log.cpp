#include <skimmer/audit_log.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <system_error>
#include <stdexcept>

namespace skimmer {

// ---- SummaryAccumulator ----

void SummaryAccumulator::add(EventKind kind, bool has_confidence, double confidence) {
  ++count_;
  if (kind != EventKind::Detection) return;
  ++detections_;
  if (has_confidence) {
    conf_sum_ += confidence;
    ++conf_n_;
  }
}

AuditSummary SummaryAccumulator::get() const {
  AuditSummary s;
  s.count = count_;
  s.detections = detections_;
  s.avg_confidence = conf_n_ > 0 ? conf_sum_ / double(conf_n_) : 0.0;
  return s;
}

static AuditSummary merge(const AuditSummary& a, const AuditSummary& b) {
  AuditSummary out;
  out.count = a.count + b.count;
  out.detections = a.detections + b.detections;
  if (out.detections > 0) {
    out.avg_confidence = (a.avg_confidence * double(a.detections) +
                          b.avg_confidence * double(b.detections)) / double(out.detections);
  }
  return out;
}

// ---- MemoryAuditLog ----

void MemoryAuditLog::append(const CollectionEvent& ev) {
  std::lock_guard<std::mutex> lk(mu_);
  events_.push_back(ev);
  acc_.add(ev.kind, ev.snapshot.has_value(),
           ev.snapshot ? ev.snapshot->detection.confidence : 0.0);
}

AuditSummary MemoryAuditLog::summary() const {
  std::lock_guard<std::mutex> lk(mu_);
  return acc_.get();
}

std::vector<CollectionEvent> MemoryAuditLog::events() const {
  std::lock_guard<std::mutex> lk(mu_);
  return events_;
}

std::size_t MemoryAuditLog::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return events_.size();
}

// ---- CSV helpers ----

static std::string format_time(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return std::string(buf);
}

static std::string fixed(double v, int places) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", places, v);
  return std::string(buf);
}

static std::string quote_if_needed(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else if (c == '\n') out += ' ';
    else out += c;
  }
  out += '"';
  return out;
}

std::string format_csv_row(const CollectionEvent& ev) {
  const std::string na = "N/A";
  std::vector<std::string> cols;
  cols.reserve(11);
  cols.push_back(format_time(ev.timestamp));
  cols.push_back(event_kind_name(ev.kind));

  if (ev.snapshot) {
    const WorldState& ws = *ev.snapshot;
    cols.push_back(ws.detection.is_target ? "Yes" : "No");
    cols.push_back(fixed(ws.detection.confidence, 4));
    cols.push_back(ws.position ? fixed(ws.position->lat_deg, 6) : na);
    cols.push_back(ws.position ? fixed(ws.position->lon_deg, 6) : na);
    cols.push_back(ws.payload_measured ? fixed(ws.payload_mass_kg, 2) : na);
  } else {
    for (int i = 0; i < 5; ++i) cols.push_back(na);
  }

  cols.push_back(std::to_string(ev.collection_count));

  if (ev.snapshot) {
    const WorldState& ws = *ev.snapshot;
    cols.push_back(ws.clearance_cm ? fixed(*ws.clearance_cm, 2) : na);
    if (ws.orientation) {
      char buf[48];
      std::snprintf(buf, sizeof(buf), "P:%.1f R:%.1f",
                    ws.orientation->pitch_deg, ws.orientation->roll_deg);
      cols.push_back(buf);
    } else {
      cols.push_back(na);
    }
  } else {
    cols.push_back(na);
    cols.push_back(na);
  }

  cols.push_back(quote_if_needed(ev.message));

  std::string row;
  for (std::size_t i = 0; i < cols.size(); ++i) {
    if (i) row += ',';
    row += cols[i];
  }
  return row;
}

// Splits one row, honouring double-quoted fields.
static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  bool in_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_quotes) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') { cur.push_back('"'); ++i; }
      else if (c == '"') in_quotes = false;
      else cur.push_back(c);
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == ',') {
      cols.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  cols.push_back(cur);
  return cols;
}

static bool to_double_safe(const std::string& s, double& out) {
  try {
    size_t idx = 0;
    const double v = std::stod(s, &idx);
    if (idx != s.size() || !std::isfinite(v)) return false;
    out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

AuditSummary audit_summary_from_csv_stream(std::istream& in) {
  SummaryAccumulator acc;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    const auto cols = split_csv_line(line);
    if (cols.size() < 11) continue;
    if (cols[0] == "Timestamp") continue;
    const auto kind = event_kind_from_name(cols[1]);
    if (!kind) continue;
    double conf = 0.0;
    const bool has_conf = to_double_safe(cols[3], conf);
    acc.add(*kind, has_conf, conf);
  }
  return acc.get();
}

void write_summary_report(std::ostream& out, const AuditSummary& s, const std::string& source) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f%%", s.avg_confidence * 100.0);
  const double rate = s.count > 0 ? double(s.detections) / double(s.count) : 0.0;
  char rate_buf[64];
  std::snprintf(rate_buf, sizeof(rate_buf), "%.2f%%", rate * 100.0);

  out << "=== Collection Log Summary ===\n"
      << "Source: " << source << "\n"
      << "Total log entries: " << s.count << "\n"
      << "Total detections: " << s.detections << "\n"
      << "Average confidence: " << buf << "\n"
      << "Detection rate: " << rate_buf << "\n"
      << "==============================\n";
}

// ---- CsvAuditLog ----

std::unique_ptr<CsvAuditLog> CsvAuditLog::open(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) return nullptr;
  }

  AuditSummary prior{};
  bool needs_header = true;
  {
    std::ifstream existing(path);
    if (existing) {
      prior = audit_summary_from_csv_stream(existing);
      existing.clear();
      existing.seekg(0, std::ios::end);
      needs_header = existing.tellg() <= 0;
    }
  }

  std::ofstream out(path, std::ios::app);
  if (!out) return nullptr;
  if (needs_header) {
    out << kAuditCsvHeader << "\n";
    out.flush();
    if (!out) return nullptr;
  }
  return std::unique_ptr<CsvAuditLog>(new CsvAuditLog(path, std::move(out), prior));
}

CsvAuditLog::CsvAuditLog(std::string path, std::ofstream out, AuditSummary prior)
  : path_(std::move(path)), out_(std::move(out)), prior_(prior) {}

void CsvAuditLog::append(const CollectionEvent& ev) {
  const std::string row = format_csv_row(ev);
  std::lock_guard<std::mutex> lk(mu_);
  out_ << row << "\n";
  out_.flush();
  if (!out_) throw std::runtime_error("audit log write failed: " + path_);
  acc_.add(ev.kind, ev.snapshot.has_value(),
           ev.snapshot ? ev.snapshot->detection.confidence : 0.0);
}

AuditSummary CsvAuditLog::summary() const {
  std::lock_guard<std::mutex> lk(mu_);
  return merge(prior_, acc_.get());
}

} // namespace skimmer
