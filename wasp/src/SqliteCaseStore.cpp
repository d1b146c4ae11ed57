#include "wasp/SqliteCaseStore.h"
#include "wasp/Util.h"
#include <sqlite3.h>
#include <stdexcept>

namespace wasp {

namespace {

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS cases (
  id TEXT PRIMARY KEY,
  key TEXT UNIQUE,
  zone TEXT,
  ip TEXT,
  asn INTEGER,
  country TEXT,
  first_seen INTEGER,
  last_seen INTEGER,
  status TEXT,
  attack_rps REAL DEFAULT 0,
  est_bandwidth_mbps REAL DEFAULT 0,
  system_capacity_rps REAL DEFAULT 0,
  AF REAL DEFAULT 0,
  DF REAL DEFAULT 0,
  BoF REAL DEFAULT 1,
  evidence_count INTEGER DEFAULT 0,
  mercy REAL DEFAULT 0.5,
  justice REAL DEFAULT 0.5,
  abuse_report TEXT,
  section504_draft TEXT
);
CREATE INDEX IF NOT EXISTS idx_cases_key ON cases(key);
CREATE INDEX IF NOT EXISTS idx_cases_last ON cases(last_seen);
CREATE TABLE IF NOT EXISTS events (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  case_id TEXT,
  ts INTEGER,
  path TEXT,
  method TEXT,
  ua TEXT,
  action TEXT,
  score REAL,
  hits INTEGER,
  colo TEXT,
  FOREIGN KEY(case_id) REFERENCES cases(id)
);
CREATE INDEX IF NOT EXISTS idx_events_case_ts ON events(case_id, ts);
)SQL";

const char* kCaseColumns =
    "SELECT id, key, zone, ip, asn, country, first_seen, last_seen, status, attack_rps, "
    "est_bandwidth_mbps, system_capacity_rps, AF, DF, BoF, evidence_count, mercy, justice, "
    "abuse_report, section504_draft FROM cases ";

// Owns one prepared statement.
class Stmt {
 public:
  Stmt(sqlite3* db, const char* sql) { rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr); }
  ~Stmt() { sqlite3_finalize(stmt_); }
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  int prepare_rc() const { return rc_; }
  sqlite3_stmt* get() const { return stmt_; }

  void bind(int idx, const std::string& v) {
    sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
  }
  void bind(int idx, const std::optional<std::string>& v) {
    if (v) bind(idx, *v);
    else sqlite3_bind_null(stmt_, idx);
  }
  void bind(int idx, int64_t v) { sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v)); }
  void bind(int idx, double v) { sqlite3_bind_double(stmt_, idx, v); }

  int step() { return sqlite3_step(stmt_); }

  std::string text(int col) const {
    const unsigned char* p = sqlite3_column_text(stmt_, col);
    return p ? std::string(reinterpret_cast<const char*>(p),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, col)))
             : std::string();
  }
  std::optional<std::string> opt_text(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    return text(col);
  }
  int64_t i64(int col) const { return static_cast<int64_t>(sqlite3_column_int64(stmt_, col)); }
  double f64(int col) const { return sqlite3_column_double(stmt_, col); }

 private:
  sqlite3_stmt* stmt_{nullptr};
  int rc_{SQLITE_OK};
};

bool is_transient(int rc) {
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
    case SQLITE_PROTOCOL:
      return true;
    default:
      return false;
  }
}

int64_t as_i64(TimeMs v) { return static_cast<int64_t>(v); }

} // namespace

SqliteCaseStore::SqliteCaseStore(const SqliteConfig& cfg, ILogSink* log)
    : cfg_(cfg), log_(log ? log : &noop_log_, "sqlite") {
  int rc = sqlite3_open_v2(cfg_.path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + cfg_.path + ": " + msg);
  }
  sqlite3_busy_timeout(db_, cfg_.busy_timeout_ms);
  if (exec("PRAGMA foreign_keys = ON;") != StoreStatus::Ok ||
      (cfg_.wal && cfg_.path != ":memory:" && exec("PRAGMA journal_mode = WAL;") != StoreStatus::Ok) ||
      exec(kSchema) != StoreStatus::Ok) {
    std::string msg = last_error_;
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite schema " + cfg_.path + ": " + msg);
  }
  log_.info("opened case store " + cfg_.path);
}

SqliteCaseStore::~SqliteCaseStore() {
  if (db_) sqlite3_close(db_);
}

std::string SqliteCaseStore::last_error() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_error_;
}

StoreStatus SqliteCaseStore::exec(const char* sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    last_error_ = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    log_.warn("exec: " + last_error_);
    return is_transient(rc) ? StoreStatus::Unavailable : StoreStatus::Invalid;
  }
  return StoreStatus::Ok;
}

void SqliteCaseStore::rollback() {
  if (sqlite3_get_autocommit(db_)) return;
  if (exec("ROLLBACK;") != StoreStatus::Ok) log_.error("rollback failed: " + last_error_);
}

StoreStatus SqliteCaseStore::fail(int rc, const char* what) {
  last_error_ = std::string(what) + ": " + sqlite3_errmsg(db_);
  log_.warn(last_error_);
  if (is_transient(rc)) return StoreStatus::Unavailable;
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return StoreStatus::NotFound;
  return StoreStatus::Invalid;
}

StoreStatus SqliteCaseStore::upsert_case(const CaseUpsert& in, std::string& case_id) {
  if (in.key.empty()) return StoreStatus::Invalid;
  std::lock_guard<std::mutex> lock(mu_);
  // A transaction left open by an earlier failure would make BEGIN fail forever.
  if (!sqlite3_get_autocommit(db_)) rollback();
  StoreStatus st = exec("BEGIN IMMEDIATE;");
  if (st != StoreStatus::Ok) return st;

  {
    Stmt ins(db_,
             "INSERT INTO cases (id, key, zone, ip, asn, country, first_seen, last_seen, status) "
             "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?7, 'OPEN') "
             "ON CONFLICT(key) DO UPDATE SET last_seen = MAX(cases.last_seen, excluded.last_seen);");
    if (ins.prepare_rc() != SQLITE_OK) {
      st = fail(ins.prepare_rc(), "prepare upsert");
    } else {
      ins.bind(1, make_opaque_id());
      ins.bind(2, in.key);
      ins.bind(3, in.zone);
      ins.bind(4, in.ip);
      ins.bind(5, static_cast<int64_t>(in.asn));
      ins.bind(6, in.country);
      ins.bind(7, as_i64(in.ts));
      int rc = ins.step();
      if (rc != SQLITE_DONE) st = fail(rc, "upsert case");
    }
  }

  if (st == StoreStatus::Ok) {
    Stmt sel(db_, "SELECT id FROM cases WHERE key = ?1;");
    if (sel.prepare_rc() != SQLITE_OK) {
      st = fail(sel.prepare_rc(), "prepare case id");
    } else {
      sel.bind(1, in.key);
      int rc = sel.step();
      if (rc == SQLITE_ROW) case_id = sel.text(0);
      else st = fail(rc, "select case id");
    }
  }

  if (st == StoreStatus::Ok) st = exec("COMMIT;");
  // A failed COMMIT (SQLITE_BUSY) leaves the transaction open.
  if (st != StoreStatus::Ok) rollback();
  return st;
}

StoreStatus SqliteCaseStore::append_event(const std::string& case_id, const Event& ev) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt ins(db_,
           "INSERT INTO events (case_id, ts, path, method, ua, action, score, hits, colo) "
           "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9);");
  if (ins.prepare_rc() != SQLITE_OK) return fail(ins.prepare_rc(), "prepare append");
  ins.bind(1, case_id);
  ins.bind(2, as_i64(ev.ts));
  ins.bind(3, ev.path);
  ins.bind(4, ev.method);
  ins.bind(5, ev.user_agent);
  ins.bind(6, std::string(to_string(ev.action)));
  ins.bind(7, ev.score);
  ins.bind(8, static_cast<int64_t>(ev.hits));
  ins.bind(9, ev.colo);
  int rc = ins.step();
  if (rc != SQLITE_DONE) return fail(rc, "append event");
  return StoreStatus::Ok;
}

StoreStatus SqliteCaseStore::select_events_in_window(const std::string& case_id, TimeMs from_ts,
                                                     std::vector<Event>& out) {
  out.clear();
  std::lock_guard<std::mutex> lock(mu_);
  Stmt sel(db_,
           "SELECT id, ts, path, method, ua, action, score, hits, colo FROM events "
           "WHERE case_id = ?1 AND ts >= ?2 ORDER BY ts, id;");
  if (sel.prepare_rc() != SQLITE_OK) return fail(sel.prepare_rc(), "prepare window");
  sel.bind(1, case_id);
  sel.bind(2, as_i64(from_ts));
  int rc = SQLITE_OK;
  while ((rc = sel.step()) == SQLITE_ROW) {
    auto action = parse_action(sel.text(5));
    if (!action) {
      last_error_ = "event " + std::to_string(sel.i64(0)) + " has unknown action";
      log_.error(last_error_);
      out.clear();
      return StoreStatus::Invalid;
    }
    Event e{};
    e.id = sel.i64(0);
    e.case_id = case_id;
    e.ts = static_cast<TimeMs>(sel.i64(1));
    e.path = sel.text(2);
    e.method = sel.text(3);
    e.user_agent = sel.text(4);
    e.action = *action;
    e.score = sel.f64(6);
    e.hits = static_cast<uint32_t>(sel.i64(7));
    e.colo = sel.text(8);
    out.push_back(std::move(e));
  }
  if (rc != SQLITE_DONE) {
    out.clear();
    return fail(rc, "scan window");
  }
  return StoreStatus::Ok;
}

StoreStatus SqliteCaseStore::update_case_snapshot(const std::string& case_id, const CaseSnapshot& snap) {
  const CaseMetrics& m = snap.metrics;
  std::lock_guard<std::mutex> lock(mu_);
  Stmt up(db_,
          "UPDATE cases SET last_seen = MAX(last_seen, ?2), status = ?3, attack_rps = ?4, "
          "est_bandwidth_mbps = ?5, system_capacity_rps = ?6, AF = ?7, DF = ?8, BoF = ?9, "
          "evidence_count = ?10, mercy = ?11, justice = ?12, abuse_report = ?13, "
          "section504_draft = ?14 WHERE id = ?1;");
  if (up.prepare_rc() != SQLITE_OK) return fail(up.prepare_rc(), "prepare snapshot");
  up.bind(1, case_id);
  up.bind(2, as_i64(snap.last_seen));
  up.bind(3, std::string(kStatusOpen));
  up.bind(4, m.attack_rps);
  up.bind(5, m.est_bandwidth_mbps);
  up.bind(6, m.system_capacity_rps);
  up.bind(7, m.af);
  up.bind(8, m.df);
  up.bind(9, m.bof);
  up.bind(10, m.evidence_count);
  up.bind(11, m.mercy);
  up.bind(12, m.justice);
  up.bind(13, snap.artifacts.abuse_report);
  up.bind(14, snap.artifacts.section504_draft);
  int rc = up.step();
  if (rc != SQLITE_DONE) return fail(rc, "update snapshot");
  if (sqlite3_changes(db_) == 0) return StoreStatus::NotFound;
  return StoreStatus::Ok;
}

StoreStatus SqliteCaseStore::load_case(const char* where, const std::string& arg, Case& out) {
  std::string sql = std::string(kCaseColumns) + where;
  Stmt sel(db_, sql.c_str());
  if (sel.prepare_rc() != SQLITE_OK) return fail(sel.prepare_rc(), "prepare case");
  sel.bind(1, arg);
  int rc = sel.step();
  if (rc == SQLITE_DONE) return StoreStatus::NotFound;
  if (rc != SQLITE_ROW) return fail(rc, "load case");
  Case c{};
  c.id = sel.text(0);
  c.key = sel.text(1);
  c.zone = sel.text(2);
  c.ip = sel.text(3);
  c.asn = static_cast<Asn>(sel.i64(4));
  c.country = sel.text(5);
  c.first_seen = static_cast<TimeMs>(sel.i64(6));
  c.last_seen = static_cast<TimeMs>(sel.i64(7));
  c.status = sel.text(8);
  c.attack_rps = sel.f64(9);
  c.est_bandwidth_mbps = sel.f64(10);
  c.system_capacity_rps = sel.f64(11);
  c.af = sel.f64(12);
  c.df = sel.f64(13);
  c.bof = sel.f64(14);
  c.evidence_count = sel.i64(15);
  c.mercy = sel.f64(16);
  c.justice = sel.f64(17);
  c.abuse_report = sel.opt_text(18);
  c.section504_draft = sel.opt_text(19);
  out = std::move(c);
  return StoreStatus::Ok;
}

StoreStatus SqliteCaseStore::get_case(const std::string& case_id, Case& out) {
  std::lock_guard<std::mutex> lock(mu_);
  return load_case("WHERE id = ?1;", case_id, out);
}

StoreStatus SqliteCaseStore::find_case_by_key(const std::string& key, Case& out) {
  std::lock_guard<std::mutex> lock(mu_);
  return load_case("WHERE key = ?1;", key, out);
}

StoreStatus SqliteCaseStore::count_events(const std::string& case_id, size_t& out) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt sel(db_, "SELECT COUNT(*) FROM events WHERE case_id = ?1;");
  if (sel.prepare_rc() != SQLITE_OK) return fail(sel.prepare_rc(), "prepare count");
  sel.bind(1, case_id);
  int rc = sel.step();
  if (rc != SQLITE_ROW) return fail(rc, "count events");
  out = static_cast<size_t>(sel.i64(0));
  return StoreStatus::Ok;
}

} // namespace wasp
