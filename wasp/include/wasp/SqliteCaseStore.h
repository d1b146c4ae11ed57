#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "CaseStore.h"
#include "Log.h"

struct sqlite3;

namespace wasp {

struct SqliteConfig {
  std::string path{"wasp.db"}; // ":memory:" for a private in-memory database
  int busy_timeout_ms{5000};
  bool wal{true};
};

// ICaseStore over one SQLite connection. Creates the cases/events tables and
// their indexes on open. Busy/locked/IO errors surface as Unavailable.
class SqliteCaseStore final : public ICaseStore {
 public:
  explicit SqliteCaseStore(const SqliteConfig& cfg, ILogSink* log = nullptr);
  ~SqliteCaseStore() override;
  SqliteCaseStore(const SqliteCaseStore&) = delete;
  SqliteCaseStore& operator=(const SqliteCaseStore&) = delete;

  StoreStatus upsert_case(const CaseUpsert& in, std::string& case_id) override;
  StoreStatus append_event(const std::string& case_id, const Event& ev) override;
  StoreStatus select_events_in_window(const std::string& case_id, TimeMs from_ts,
                                      std::vector<Event>& out) override;
  StoreStatus update_case_snapshot(const std::string& case_id, const CaseSnapshot& snap) override;
  StoreStatus get_case(const std::string& case_id, Case& out) override;
  StoreStatus find_case_by_key(const std::string& key, Case& out) override;
  StoreStatus count_events(const std::string& case_id, size_t& out) override;

  std::string last_error() const;

 private:
  StoreStatus exec(const char* sql);
  void rollback();
  StoreStatus fail(int rc, const char* what);
  StoreStatus load_case(const char* sql, const std::string& arg, Case& out);

  SqliteConfig cfg_{};
  NoopLogSink noop_log_{};
  Logger log_;
  mutable std::mutex mu_;
  sqlite3* db_{nullptr};
  std::string last_error_;
};

} // namespace wasp
