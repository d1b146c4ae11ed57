#include "wasp/CaseStore.h"
#include "wasp/Util.h"
#include <algorithm>

namespace wasp {

void apply_snapshot(Case& c, const CaseSnapshot& snap) {
  const CaseMetrics& m = snap.metrics;
  c.last_seen = std::max(c.last_seen, snap.last_seen);
  c.status = std::string(kStatusOpen);
  c.attack_rps = m.attack_rps;
  c.est_bandwidth_mbps = m.est_bandwidth_mbps;
  c.system_capacity_rps = m.system_capacity_rps;
  c.af = m.af;
  c.df = m.df;
  c.bof = m.bof;
  c.evidence_count = m.evidence_count;
  c.mercy = m.mercy;
  c.justice = m.justice;
  c.abuse_report = snap.artifacts.abuse_report;
  c.section504_draft = snap.artifacts.section504_draft;
}

StoreStatus MemoryCaseStore::upsert_case(const CaseUpsert& in, std::string& case_id) {
  if (in.key.empty()) return StoreStatus::Invalid;
  std::lock_guard<std::mutex> lock(mu_);
  auto found = id_by_key_.find(in.key);
  if (found != id_by_key_.end()) {
    Case& c = cases_[found->second];
    c.last_seen = std::max(c.last_seen, in.ts);
    case_id = c.id;
    return StoreStatus::Ok;
  }
  Case c{};
  c.id = make_opaque_id();
  c.key = in.key;
  c.zone = in.zone;
  c.ip = in.ip;
  c.asn = in.asn;
  c.country = in.country;
  c.first_seen = in.ts;
  c.last_seen = in.ts;
  id_by_key_[c.key] = c.id;
  case_id = c.id;
  cases_.emplace(c.id, std::move(c));
  return StoreStatus::Ok;
}

StoreStatus MemoryCaseStore::append_event(const std::string& case_id, const Event& ev) {
  std::lock_guard<std::mutex> lock(mu_);
  if (cases_.find(case_id) == cases_.end()) return StoreStatus::NotFound;
  Event row = ev;
  row.id = next_event_id_++;
  row.case_id = case_id;
  events_[case_id].emplace(std::make_pair(row.ts, row.id), std::move(row));
  return StoreStatus::Ok;
}

StoreStatus MemoryCaseStore::select_events_in_window(const std::string& case_id, TimeMs from_ts,
                                                     std::vector<Event>& out) {
  out.clear();
  std::lock_guard<std::mutex> lock(mu_);
  if (cases_.find(case_id) == cases_.end()) return StoreStatus::NotFound;
  auto it = events_.find(case_id);
  if (it == events_.end()) return StoreStatus::Ok;
  for (auto e = it->second.lower_bound({from_ts, 0}); e != it->second.end(); ++e) {
    out.push_back(e->second);
  }
  return StoreStatus::Ok;
}

StoreStatus MemoryCaseStore::update_case_snapshot(const std::string& case_id, const CaseSnapshot& snap) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = cases_.find(case_id);
  if (it == cases_.end()) return StoreStatus::NotFound;
  apply_snapshot(it->second, snap);
  return StoreStatus::Ok;
}

StoreStatus MemoryCaseStore::get_case(const std::string& case_id, Case& out) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = cases_.find(case_id);
  if (it == cases_.end()) return StoreStatus::NotFound;
  out = it->second;
  return StoreStatus::Ok;
}

StoreStatus MemoryCaseStore::find_case_by_key(const std::string& key, Case& out) {
  std::lock_guard<std::mutex> lock(mu_);
  auto found = id_by_key_.find(key);
  if (found == id_by_key_.end()) return StoreStatus::NotFound;
  out = cases_.at(found->second);
  return StoreStatus::Ok;
}

StoreStatus MemoryCaseStore::count_events(const std::string& case_id, size_t& out) {
  std::lock_guard<std::mutex> lock(mu_);
  if (cases_.find(case_id) == cases_.end()) return StoreStatus::NotFound;
  auto it = events_.find(case_id);
  out = it == events_.end() ? 0 : it->second.size();
  return StoreStatus::Ok;
}

size_t MemoryCaseStore::case_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cases_.size();
}

} // namespace wasp
