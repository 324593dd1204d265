#include "MetadataStore.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include "core/Error.hpp"

namespace ifs {

namespace {

// Finalizes the statement on scope exit.
struct Statement {
  sqlite3_stmt* st = nullptr;
  ~Statement() { sqlite3_finalize(st); }
};

void prepare(sqlite3* db, const char* sql, Statement& s) {
  if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK) {
    throw Error::persistence(std::string("prepare failed: ") + sqlite3_errmsg(db));
  }
}

void bind_text(sqlite3_stmt* st, int i, const std::string& v) {
  sqlite3_bind_text(st, i, v.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_opt_text(sqlite3_stmt* st, int i, const std::optional<std::string>& v) {
  if (v) bind_text(st, i, *v);
  else   sqlite3_bind_null(st, i);
}

std::string column_text(sqlite3_stmt* st, int i) {
  auto* p = sqlite3_column_text(st, i);
  return p ? reinterpret_cast<const char*>(p) : std::string();
}

std::optional<std::string> column_opt_text(sqlite3_stmt* st, int i) {
  if (sqlite3_column_type(st, i) == SQLITE_NULL) return std::nullopt;
  return column_text(st, i);
}

constexpr const char* kColumns =
  "id, original_name, stored_name, file_path, file_size, mime_type, upload_time, "
  "is_video, thumbnail_path, video_duration, video_resolution";

FileRecord read_row(sqlite3_stmt* st) {
  FileRecord r;
  r.id               = column_text(st, 0);
  r.original_name    = column_text(st, 1);
  r.stored_name      = column_text(st, 2);
  r.file_path        = column_text(st, 3);
  r.file_size        = sqlite3_column_int64(st, 4);
  r.mime_type        = column_text(st, 5);
  r.upload_time      = sqlite3_column_int64(st, 6);
  r.is_video         = sqlite3_column_int(st, 7) != 0;
  r.thumbnail_path   = column_opt_text(st, 8);
  if (sqlite3_column_type(st, 9) != SQLITE_NULL) r.video_duration = sqlite3_column_double(st, 9);
  r.video_resolution = column_opt_text(st, 10);
  return r;
}

Error step_error(sqlite3* db, const std::string& what) {
  const int ext = sqlite3_extended_errcode(db);
  const std::string msg = what + ": " + sqlite3_errmsg(db);
  if (ext == SQLITE_CONSTRAINT_UNIQUE || ext == SQLITE_CONSTRAINT_PRIMARYKEY) {
    return Error::conflict(msg);
  }
  return Error::persistence(msg);
}

} // namespace

MetadataStore::MetadataStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw Error::persistence("failed to open db " + dbPath + ": " + msg);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

MetadataStore::~MetadataStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void MetadataStore::exec(const char* sql) {
  auto* db = static_cast<sqlite3*>(db_);
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw Error::persistence(std::string(sql) + " failed: " + msg);
  }
}

MetadataStore::Transaction::Transaction(MetadataStore& store)
  : store_(store), lock_(store.mu_) {
  store_.exec("BEGIN IMMEDIATE");
}

MetadataStore::Transaction::~Transaction() {
  if (done_) return;
  char* err = nullptr;
  if (sqlite3_exec(static_cast<sqlite3*>(store_.db_), "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::warn("rollback failed: {}", err ? err : "unknown error");
    sqlite3_free(err);
  }
}

void MetadataStore::Transaction::commit() {
  store_.exec("COMMIT");
  done_ = true;
}

void MetadataStore::insertFile(const FileRecord& r) {
  std::lock_guard<std::recursive_mutex> lk(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO files
      (id, original_name, stored_name, file_path, file_size, mime_type, upload_time,
       is_video, thumbnail_path, video_duration, video_resolution)
    VALUES (?,?,?,?,?,?,?,?,?,?,?)
  )SQL";
  Statement s;
  prepare(db, sql, s);
  int i = 1;
  bind_text(s.st, i++, r.id);
  bind_text(s.st, i++, r.original_name);
  bind_text(s.st, i++, r.stored_name);
  bind_text(s.st, i++, r.file_path);
  sqlite3_bind_int64(s.st, i++, r.file_size);
  bind_text(s.st, i++, r.mime_type);
  sqlite3_bind_int64(s.st, i++, r.upload_time);
  sqlite3_bind_int(s.st, i++, r.is_video ? 1 : 0);
  bind_opt_text(s.st, i++, r.thumbnail_path);
  if (r.video_duration) sqlite3_bind_double(s.st, i++, *r.video_duration);
  else                  sqlite3_bind_null(s.st, i++);
  bind_opt_text(s.st, i++, r.video_resolution);

  if (sqlite3_step(s.st) != SQLITE_DONE) {
    throw step_error(db, "insertFile failed");
  }
}

std::optional<FileRecord> MetadataStore::getFileById(const std::string& id) {
  std::lock_guard<std::recursive_mutex> lk(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const std::string sql = std::string("SELECT ") + kColumns + " FROM files WHERE id = ?";
  Statement s;
  prepare(db, sql.c_str(), s);
  bind_text(s.st, 1, id);
  int rc = sqlite3_step(s.st);
  if (rc == SQLITE_ROW) return read_row(s.st);
  if (rc == SQLITE_DONE) return std::nullopt;
  throw step_error(db, "getFileById failed");
}

std::vector<FileRecord> MetadataStore::listFiles(int limit, int offset, bool videosOnly) {
  if (limit <= 0)  throw Error::validation("limit must be positive");
  if (offset < 0)  throw Error::validation("offset must not be negative");

  std::lock_guard<std::recursive_mutex> lk(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  std::string sql = std::string("SELECT ") + kColumns + " FROM files";
  if (videosOnly) sql += " WHERE is_video = 1";
  sql += " ORDER BY upload_time DESC, seq DESC LIMIT ? OFFSET ?";
  Statement s;
  prepare(db, sql.c_str(), s);
  sqlite3_bind_int(s.st, 1, limit);
  sqlite3_bind_int(s.st, 2, offset);

  std::vector<FileRecord> out;
  int rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
    out.push_back(read_row(s.st));
  }
  if (rc != SQLITE_DONE) throw step_error(db, "listFiles failed");
  return out;
}

bool MetadataStore::deleteFile(const std::string& id) {
  std::lock_guard<std::recursive_mutex> lk(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Statement s;
  prepare(db, "DELETE FROM files WHERE id = ?", s);
  bind_text(s.st, 1, id);
  if (sqlite3_step(s.st) != SQLITE_DONE) throw step_error(db, "deleteFile failed");
  return sqlite3_changes(db) > 0;
}

StoreStats MetadataStore::stats() {
  std::lock_guard<std::recursive_mutex> lk(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    SELECT COUNT(*), COALESCE(SUM(file_size), 0), COALESCE(SUM(is_video), 0)
    FROM files
  )SQL";
  Statement s;
  prepare(db, sql, s);
  if (sqlite3_step(s.st) != SQLITE_ROW) throw step_error(db, "stats failed");
  StoreStats out;
  out.total_files = sqlite3_column_int64(s.st, 0);
  out.total_size  = sqlite3_column_int64(s.st, 1);
  out.video_count = sqlite3_column_int64(s.st, 2);
  return out;
}

bool MetadataStore::updateVideoMetadata(const std::string& id, const VideoMetadata& fields) {
  std::lock_guard<std::recursive_mutex> lk(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    UPDATE files
       SET video_duration = ?, video_resolution = ?, thumbnail_path = ?
     WHERE id = ?
  )SQL";
  Statement s;
  prepare(db, sql, s);
  sqlite3_bind_double(s.st, 1, fields.duration);
  bind_text(s.st, 2, fields.resolution);
  bind_opt_text(s.st, 3, fields.thumbnail_path);
  bind_text(s.st, 4, id);
  if (sqlite3_step(s.st) != SQLITE_DONE) throw step_error(db, "updateVideoMetadata failed");
  return sqlite3_changes(db) > 0;
}

} // namespace ifs
