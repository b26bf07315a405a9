#include "SqliteStore.hpp"
#include "InitDb.hpp"
#include <cstring>
#include <stdexcept>
#include <sqlite3.h>

namespace docguard {

namespace {

// Finalizes on scope exit; step errors carry the connection's message.
struct Stmt {
  sqlite3*      db;
  sqlite3_stmt* st = nullptr;

  Stmt(sqlite3* d, const char* sql) : db(d) {
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
      throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
  }
  ~Stmt() { sqlite3_finalize(st); }
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  template <size_t N>
  void blob(int i, const std::array<uint8_t, N>& v) {
    sqlite3_bind_blob(st, i, v.data(), static_cast<int>(N), SQLITE_TRANSIENT);
  }
  void blob(int i, const Bytes& v) {
    // zero-length blob must still bind as a blob, not NULL
    sqlite3_bind_blob(st, i, v.empty() ? "" : static_cast<const void*>(v.data()),
                      static_cast<int>(v.size()), SQLITE_TRANSIENT);
  }
  void text(int i, const std::string& s) {
    sqlite3_bind_text(st, i, s.c_str(), -1, SQLITE_TRANSIENT);
  }
  void i64(int i, int64_t v) { sqlite3_bind_int64(st, i, v); }

  bool row(const char* what) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string(what) + " failed: " + sqlite3_errmsg(db));
  }
  void done(const char* what) {
    if (sqlite3_step(st) != SQLITE_DONE)
      throw std::runtime_error(std::string(what) + " failed: " + sqlite3_errmsg(db));
  }

  template <size_t N>
  std::array<uint8_t, N> colArray(int c) const {
    std::array<uint8_t, N> out{};
    const void* p = sqlite3_column_blob(st, c);
    int n = sqlite3_column_bytes(st, c);
    if (p && n == static_cast<int>(N)) std::memcpy(out.data(), p, N);
    return out;
  }
  Bytes colBytes(int c) const {
    const auto* p = static_cast<const uint8_t*>(sqlite3_column_blob(st, c));
    int n = sqlite3_column_bytes(st, c);
    return p ? Bytes(p, p + n) : Bytes{};
  }
  std::string colText(int c) const {
    const auto* p = sqlite3_column_text(st, c);
    return p ? std::string(reinterpret_cast<const char*>(p)) : std::string{};
  }
  int64_t colI64(int c) const { return sqlite3_column_int64(st, c); }
};

void bindLock(Stmt& s, int first, const LocationLock& l) {
  s.i64(first,     l.enabled ? 1 : 0);
  s.i64(first + 1, l.latitude);
  s.i64(first + 2, l.longitude);
  s.i64(first + 3, l.radiusMeters);
}

LocationLock readLock(const Stmt& s, int first) {
  LocationLock l;
  l.enabled      = s.colI64(first) != 0;
  l.latitude     = static_cast<int32_t>(s.colI64(first + 1));
  l.longitude    = static_cast<int32_t>(s.colI64(first + 2));
  l.radiusMeters = static_cast<uint32_t>(s.colI64(first + 3));
  return l;
}

} // namespace

SqliteStore::SqliteStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db=nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr)!=SQLITE_OK) {
    sqlite3_close(db);
    throw std::runtime_error("failed to open db: " + dbPath);
  }
  try {
    applyConnectionPragmas(db);
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
  db_ = db;
}

SqliteStore::~SqliteStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void SqliteStore::exec(const char* sql) {
  auto* db = static_cast<sqlite3*>(db_);
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("SQLite exec failed: " + msg);
  }
}

std::optional<FileRecord> SqliteStore::findRecord(const FileHash& h) const {
  Stmt s(static_cast<sqlite3*>(db_), R"SQL(
    SELECT file_hash, uploader, storage_pointer, signature, timestamp,
           has_location_lock, lock_latitude, lock_longitude, lock_radius_m
    FROM file_records WHERE file_hash = ?
  )SQL");
  s.blob(1, h);
  if (!s.row("findRecord")) return std::nullopt;
  FileRecord r;
  r.fileHash       = s.colArray<32>(0);
  r.uploader       = s.colArray<20>(1);
  r.storagePointer = s.colText(2);
  r.signature      = s.colBytes(3);
  r.timestamp      = s.colI64(4);
  r.lock           = readLock(s, 5);
  return r;
}

void SqliteStore::insertRecord(const FileRecord& r) {
  Stmt s(static_cast<sqlite3*>(db_), R"SQL(
    INSERT INTO file_records
      (file_hash, uploader, storage_pointer, signature, timestamp,
       has_location_lock, lock_latitude, lock_longitude, lock_radius_m)
    VALUES (?,?,?,?,?,?,?,?,?)
  )SQL");
  int i=1;
  s.blob(i++, r.fileHash);
  s.blob(i++, r.uploader);
  s.text(i++, r.storagePointer);
  s.blob(i++, r.signature);
  s.i64(i++, r.timestamp);
  bindLock(s, i, r.lock);
  s.done("insertRecord");
}

std::optional<bool> SqliteStore::findAccess(const FileHash& h, const Principal& p) const {
  Stmt s(static_cast<sqlite3*>(db_),
         "SELECT allowed FROM file_access WHERE file_hash = ? AND principal = ?");
  s.blob(1, h);
  s.blob(2, p);
  if (!s.row("findAccess")) return std::nullopt;
  return s.colI64(0) != 0;
}

void SqliteStore::setAccess(const FileHash& h, const Principal& p, bool allowed) {
  Stmt s(static_cast<sqlite3*>(db_), R"SQL(
    INSERT INTO file_access (file_hash, principal, allowed) VALUES (?,?,?)
    ON CONFLICT(file_hash, principal) DO UPDATE SET allowed = excluded.allowed
  )SQL");
  s.blob(1, h);
  s.blob(2, p);
  s.i64(3, allowed ? 1 : 0);
  s.done("setAccess");
}

uint64_t SqliteStore::appendEvent(const Event& e) {
  auto* db = static_cast<sqlite3*>(db_);
  Stmt s(db, R"SQL(
    INSERT INTO events
      (kind, file_hash, principal, timestamp, storage_pointer, signature,
       has_location_lock, lock_latitude, lock_longitude, lock_radius_m)
    VALUES (?,?,?,?,?,?,?,?,?,?)
  )SQL");
  int i=1;
  s.i64(i++, static_cast<int64_t>(e.kind));
  s.blob(i++, e.fileHash);
  s.blob(i++, e.principal);
  s.i64(i++, e.timestamp);
  s.text(i++, e.storagePointer);
  s.blob(i++, e.signature);
  bindLock(s, i, e.lock);
  s.done("appendEvent");
  return static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
}

std::vector<Event> SqliteStore::scanEvents(std::optional<int64_t> fromTime,
                                           std::optional<int64_t> toTime) const {
  Stmt s(static_cast<sqlite3*>(db_), R"SQL(
    SELECT seq, kind, file_hash, principal, timestamp, storage_pointer, signature,
           has_location_lock, lock_latitude, lock_longitude, lock_radius_m
    FROM events
    WHERE (?1 IS NULL OR timestamp >= ?1) AND (?2 IS NULL OR timestamp <= ?2)
    ORDER BY seq ASC
  )SQL");
  if (fromTime) s.i64(1, *fromTime);
  if (toTime)   s.i64(2, *toTime);

  std::vector<Event> out;
  while (s.row("scanEvents")) {
    Event e;
    e.sequence       = static_cast<uint64_t>(s.colI64(0));
    e.kind           = static_cast<EventKind>(s.colI64(1));
    e.fileHash       = s.colArray<32>(2);
    e.principal      = s.colArray<20>(3);
    e.timestamp      = s.colI64(4);
    e.storagePointer = s.colText(5);
    e.signature      = s.colBytes(6);
    e.lock           = readLock(s, 7);
    out.push_back(std::move(e));
  }
  return out;
}

void SqliteStore::begin()    { exec("BEGIN IMMEDIATE;"); }
void SqliteStore::commit()   { exec("COMMIT;"); }
void SqliteStore::rollback() { exec("ROLLBACK;"); }

} // namespace docguard
