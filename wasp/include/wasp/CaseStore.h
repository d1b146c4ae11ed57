#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "Common.h"

namespace wasp {

struct CaseUpsert {
  std::string key;
  std::string zone;
  std::string ip;
  Asn asn{0};
  std::string country;
  TimeMs ts{0};
};

// Everything written when a recompute materializes. Status is always OPEN.
struct CaseSnapshot {
  TimeMs last_seen{0};
  CaseMetrics metrics{};
  ReportArtifacts artifacts{};
};

// Durable home of Case and Event rows. Events are append-only; cases are
// never deleted. All calls are safe to make from several threads.
class ICaseStore {
 public:
  virtual ~ICaseStore() = default;

  // Existing key: bumps last_seen (never backwards) and returns its id.
  // New key: inserts with status OPEN and first_seen = last_seen = ts.
  virtual StoreStatus upsert_case(const CaseUpsert& in, std::string& case_id) = 0;
  virtual StoreStatus append_event(const std::string& case_id, const Event& ev) = 0;
  // Events with ts >= from_ts ordered by (ts, insertion order).
  virtual StoreStatus select_events_in_window(const std::string& case_id, TimeMs from_ts,
                                              std::vector<Event>& out) = 0;
  virtual StoreStatus update_case_snapshot(const std::string& case_id, const CaseSnapshot& snap) = 0;

  virtual StoreStatus get_case(const std::string& case_id, Case& out) = 0;
  virtual StoreStatus find_case_by_key(const std::string& key, Case& out) = 0;
  virtual StoreStatus count_events(const std::string& case_id, size_t& out) = 0;
};

void apply_snapshot(Case& c, const CaseSnapshot& snap);

class MemoryCaseStore final : public ICaseStore {
 public:
  StoreStatus upsert_case(const CaseUpsert& in, std::string& case_id) override;
  StoreStatus append_event(const std::string& case_id, const Event& ev) override;
  StoreStatus select_events_in_window(const std::string& case_id, TimeMs from_ts,
                                      std::vector<Event>& out) override;
  StoreStatus update_case_snapshot(const std::string& case_id, const CaseSnapshot& snap) override;
  StoreStatus get_case(const std::string& case_id, Case& out) override;
  StoreStatus find_case_by_key(const std::string& key, Case& out) override;
  StoreStatus count_events(const std::string& case_id, size_t& out) override;

  size_t case_count() const;

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, Case> cases_;
  std::unordered_map<std::string, std::string> id_by_key_;
  // (ts, id) keeps window scans ordered like the (case_id, ts) index.
  std::unordered_map<std::string, std::map<std::pair<TimeMs, int64_t>, Event>> events_;
  int64_t next_event_id_{1};
};

} // namespace wasp
