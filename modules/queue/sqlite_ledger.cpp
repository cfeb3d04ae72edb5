#include <proofagg/common/log.h>
#include <proofagg/queue/sqlite_ledger.hpp>

#include <sqlite3.h>

namespace pagg::queue {
namespace {
const char* schema = R"(
CREATE TABLE IF NOT EXISTS witness_jobs (
  aggregation_round INTEGER NOT NULL,
  batch_number INTEGER NOT NULL,
  status TEXT NOT NULL DEFAULT 'queued',
  attempts INTEGER NOT NULL DEFAULT 0,
  error TEXT,
  is_retryable INTEGER NOT NULL DEFAULT 1,
  time_taken_ms INTEGER,
  processing_started_at TEXT,
  picked_by TEXT,
  created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
  updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
  PRIMARY KEY (aggregation_round, batch_number)
);
CREATE TABLE IF NOT EXISTS prover_jobs (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  batch_number INTEGER NOT NULL,
  circuit_id INTEGER NOT NULL,
  sequence_number INTEGER NOT NULL,
  depth INTEGER NOT NULL,
  aggregation_round INTEGER NOT NULL,
  circuit_blob_url TEXT NOT NULL,
  is_node_final_proof INTEGER NOT NULL DEFAULT 0,
  status TEXT NOT NULL DEFAULT 'queued',
  created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
  updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
  UNIQUE (batch_number, aggregation_round, circuit_id, depth, sequence_number)
);
CREATE TABLE IF NOT EXISTS dependency_tracker (
  aggregation_round INTEGER NOT NULL,
  batch_number INTEGER NOT NULL,
  slot INTEGER NOT NULL,
  prover_job_id INTEGER REFERENCES prover_jobs (id),
  PRIMARY KEY (aggregation_round, batch_number, slot)
);
)";

// Lowest queued job of a round with every dependency slot set to a
// successful prover job.
const char* claimSql = R"(
UPDATE witness_jobs
SET status = 'picked',
    attempts = attempts + 1,
    picked_by = ?2,
    processing_started_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now'),
    updated_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now')
WHERE aggregation_round = ?1
  AND batch_number = (
    SELECT w.batch_number FROM witness_jobs w
    WHERE w.aggregation_round = ?1
      AND w.status = 'queued'
      AND NOT EXISTS (
        SELECT 1 FROM dependency_tracker d
        LEFT JOIN prover_jobs p ON p.id = d.prover_job_id
        WHERE d.aggregation_round = w.aggregation_round
          AND d.batch_number = w.batch_number
          AND (p.id IS NULL OR p.status <> 'successful'))
    ORDER BY w.batch_number ASC
    LIMIT 1)
RETURNING batch_number
)";

// Picked or in-progress jobs of round ?1 whose processing started at least
// ?3 milliseconds ago, split by the attempt limit ?2.
const char* failStuckSql = R"(
UPDATE witness_jobs
SET status = 'failed',
    error = 'processing did not finish within ' || ?3 || 'ms after ' ||
            attempts || ' attempts',
    is_retryable = 0,
    updated_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now')
WHERE aggregation_round = ?1
  AND status IN ('picked', 'in_progress')
  AND (julianday('now') - julianday(processing_started_at)) * 86400000.0 >= ?3
  AND attempts >= ?2
)";

const char* requeueStuckSql = R"(
UPDATE witness_jobs
SET status = 'queued',
    picked_by = NULL,
    processing_started_at = NULL,
    updated_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now')
WHERE aggregation_round = ?1
  AND status IN ('picked', 'in_progress')
  AND (julianday('now') - julianday(processing_started_at)) * 86400000.0 >= ?3
  AND attempts < ?2
)";

inline int
RoundToInt(AggregationRound round) {
  return static_cast<int>(round);
}
}

class SQLiteLedger::Statement {
  public:
  Statement(sqlite3* db, const char* sql)
    : m_db(db) {
    m_rc = sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr);
    if(m_rc != SQLITE_OK) {
      pagg_log(PAGG_QUEUE,
               PAGG_LOCALERROR,
               "Could not prepare statement! Error: {}",
               sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    if(m_stmt)
      sqlite3_finalize(m_stmt);
  }

  bool ok() const { return m_rc == SQLITE_OK; }

  Statement& bind(int idx, int64_t v) {
    if(ok())
      m_rc = sqlite3_bind_int64(m_stmt, idx, v);
    return *this;
  }
  Statement& bind(int idx, std::string_view v) {
    if(ok())
      m_rc = sqlite3_bind_text(
        m_stmt, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    return *this;
  }
  Statement& bindKey(const CircuitKey& key) {
    return bind(1, key.batch)
      .bind(2, key.circuitId)
      .bind(3, key.sequenceNumber)
      .bind(4, key.depth)
      .bind(5, RoundToInt(key.round));
  }

  /** @brief Returns SQLITE_ROW, SQLITE_DONE or an error code. */
  int step() {
    if(!ok())
      return m_rc;
    int rc = sqlite3_step(m_stmt);
    if(rc != SQLITE_ROW && rc != SQLITE_DONE) {
      pagg_log(PAGG_QUEUE,
               PAGG_LOCALERROR,
               "Could not execute statement! Error: {}",
               sqlite3_errmsg(m_db));
    }
    return rc;
  }

  int64_t columnInt64(int col) { return sqlite3_column_int64(m_stmt, col); }
  bool columnIsNull(int col) {
    return sqlite3_column_type(m_stmt, col) == SQLITE_NULL;
  }
  std::string columnText(int col) {
    const unsigned char* t = sqlite3_column_text(m_stmt, col);
    return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
  }

  private:
  sqlite3* m_db;
  sqlite3_stmt* m_stmt = nullptr;
  int m_rc;
};

SQLiteLedger::SQLiteLedger(std::string path, int busyTimeoutMS)
  : m_path(std::move(path))
  , m_busyTimeoutMS(busyTimeoutMS) {}

SQLiteLedger::~SQLiteLedger() {
  close();
}

pagg_status
SQLiteLedger::open() {
  std::unique_lock lock(m_mutex);
  if(m_db)
    return PAGG_OK;

  int rc = sqlite3_open_v2(m_path.c_str(),
                           &m_db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                             SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if(rc != SQLITE_OK) {
    pagg_log(PAGG_QUEUE,
             PAGG_LOCALERROR,
             "Could not open ledger database {}! Error: {}",
             m_path,
             m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc));
    if(m_db) {
      sqlite3_close(m_db);
      m_db = nullptr;
    }
    return PAGG_DATABASE_ERROR;
  }

  sqlite3_busy_timeout(m_db, m_busyTimeoutMS);

  pagg_status s = exec("PRAGMA journal_mode = WAL");
  if(s == PAGG_OK)
    s = exec("PRAGMA foreign_keys = ON");
  if(s == PAGG_OK)
    s = exec(schema);
  if(s != PAGG_OK) {
    sqlite3_close(m_db);
    m_db = nullptr;
    return s;
  }

  pagg_log(PAGG_QUEUE, PAGG_DEBUG, "Opened ledger database {}.", m_path);
  return PAGG_OK;
}

void
SQLiteLedger::close() {
  std::unique_lock lock(m_mutex);
  if(m_db) {
    sqlite3_close(m_db);
    m_db = nullptr;
  }
}

pagg_status
SQLiteLedger::exec(const char* sql) {
  if(!m_db)
    return PAGG_DATABASE_ERROR;

  char* errmsg = nullptr;
  int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errmsg);
  if(rc != SQLITE_OK) {
    pagg_log(PAGG_QUEUE,
             PAGG_LOCALERROR,
             "Could not execute \"{}\"! Error: {}",
             sql,
             errmsg ? errmsg : sqlite3_errstr(rc));
    sqlite3_free(errmsg);
    return PAGG_DATABASE_ERROR;
  }
  return PAGG_OK;
}

pagg_status
SQLiteLedger::claimNextReadyJob(AggregationRound round,
                                std::string_view pickedBy,
                                std::optional<BatchNumber>& out) {
  std::unique_lock lock(m_mutex);
  out.reset();

  // The write lock is taken up front, so concurrent claimers wait for each
  // other instead of failing on a stale snapshot.
  if(exec("BEGIN IMMEDIATE") != PAGG_OK)
    return PAGG_TRANSACTION_ERROR;

  int rc;
  {
    Statement stmt(m_db, claimSql);
    stmt.bind(1, RoundToInt(round)).bind(2, pickedBy);
    rc = stmt.step();
    if(rc == SQLITE_ROW) {
      out = static_cast<BatchNumber>(stmt.columnInt64(0));
    }
  }

  pagg_status s = PAGG_OK;
  if(rc != SQLITE_ROW && rc != SQLITE_DONE) {
    s = PAGG_DATABASE_ERROR;
  } else if(exec("COMMIT") != PAGG_OK) {
    s = PAGG_TRANSACTION_ERROR;
  }
  if(s != PAGG_OK) {
    out.reset();
    if(!sqlite3_get_autocommit(m_db) && exec("ROLLBACK") != PAGG_OK) {
      pagg_log(PAGG_QUEUE,
               PAGG_LOCALERROR,
               "Could not roll back failed claim of {} job!",
               round);
    }
    return s;
  }

  if(out) {
    pagg_log(PAGG_QUEUE,
             PAGG_DEBUG,
             "{} claimed {} job of batch {}.",
             pickedBy,
             round,
             *out);
  }
  return PAGG_OK;
}

pagg_status
SQLiteLedger::updateWitnessJobStatus(AggregationRound round,
                                     BatchNumber batch,
                                     const char* sql,
                                     const char* what) {
  std::unique_lock lock(m_mutex);
  Statement stmt(m_db, sql);
  stmt.bind(1, RoundToInt(round)).bind(2, batch);
  if(stmt.step() != SQLITE_DONE)
    return PAGG_DATABASE_ERROR;
  if(sqlite3_changes(m_db) == 0) {
    pagg_log(PAGG_QUEUE,
             PAGG_LOCALWARNING,
             "Could not mark {} job of batch {} as {}: no matching job.",
             round,
             batch,
             what);
    return PAGG_JOB_NOT_FOUND;
  }
  return PAGG_OK;
}

pagg_status
SQLiteLedger::markInProgress(AggregationRound round, BatchNumber batch) {
  return updateWitnessJobStatus(
    round,
    batch,
    "UPDATE witness_jobs SET status = 'in_progress', "
    "updated_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now') "
    "WHERE aggregation_round = ?1 AND batch_number = ?2 "
    "AND status = 'picked'",
    "in progress");
}

pagg_status
SQLiteLedger::getDependencyJobIds(AggregationRound round,
                                  BatchNumber batch,
                                  std::vector<ProverJobId>& out) {
  std::unique_lock lock(m_mutex);
  out.clear();

  Statement stmt(m_db,
                 "SELECT slot, prover_job_id FROM dependency_tracker "
                 "WHERE aggregation_round = ?1 AND batch_number = ?2 "
                 "ORDER BY slot ASC");
  stmt.bind(1, RoundToInt(round)).bind(2, batch);

  int rc;
  while((rc = stmt.step()) == SQLITE_ROW) {
    if(stmt.columnIsNull(1)) {
      pagg_log(PAGG_QUEUE,
               PAGG_LOCALERROR,
               "Dependency slot {} of {} job of batch {} is not set!",
               stmt.columnInt64(0),
               round,
               batch);
      out.clear();
      return PAGG_DEPENDENCY_COUNT_MISMATCH;
    }
    out.push_back(static_cast<ProverJobId>(stmt.columnInt64(1)));
  }
  if(rc != SQLITE_DONE) {
    out.clear();
    return PAGG_DATABASE_ERROR;
  }
  return PAGG_OK;
}

pagg_status
SQLiteLedger::getProverJobKey(ProverJobId id, CircuitKey& out) {
  std::unique_lock lock(m_mutex);
  Statement stmt(m_db,
                 "SELECT batch_number, circuit_id, sequence_number, depth, "
                 "aggregation_round FROM prover_jobs WHERE id = ?1");
  stmt.bind(1, static_cast<int64_t>(id));

  int rc = stmt.step();
  if(rc == SQLITE_DONE)
    return PAGG_JOB_NOT_FOUND;
  if(rc != SQLITE_ROW)
    return PAGG_DATABASE_ERROR;

  AggregationRound round;
  if(!AggregationRoundFromInt(static_cast<int>(stmt.columnInt64(4)), round)) {
    pagg_log(PAGG_QUEUE,
             PAGG_LOCALERROR,
             "Prover job {} has unknown aggregation round {}!",
             id,
             stmt.columnInt64(4));
    return PAGG_DATABASE_ERROR;
  }

  out.batch = static_cast<BatchNumber>(stmt.columnInt64(0));
  out.circuitId = static_cast<uint8_t>(stmt.columnInt64(1));
  out.sequenceNumber = static_cast<uint16_t>(stmt.columnInt64(2));
  out.depth = static_cast<uint16_t>(stmt.columnInt64(3));
  out.round = round;
  return PAGG_OK;
}

pagg_status
SQLiteLedger::markFailed(AggregationRound round,
                         BatchNumber batch,
                         std::string_view error,
                         bool retryable) {
  std::unique_lock lock(m_mutex);
  Statement stmt(m_db,
                 "UPDATE witness_jobs SET status = 'failed', error = ?3, "
                 "is_retryable = ?4, "
                 "updated_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now') "
                 "WHERE aggregation_round = ?1 AND batch_number = ?2");
  stmt.bind(1, RoundToInt(round))
    .bind(2, batch)
    .bind(3, error)
    .bind(4, retryable ? 1 : 0);
  if(stmt.step() != SQLITE_DONE)
    return PAGG_DATABASE_ERROR;
  if(sqlite3_changes(m_db) == 0)
    return PAGG_JOB_NOT_FOUND;
  return PAGG_OK;
}

pagg_status
SQLiteLedger::insertProverJob(const ProverJobRecord& job, ProverJobId& id) {
  std::unique_lock lock(m_mutex);
  Statement stmt(
    m_db,
    "INSERT INTO prover_jobs (batch_number, circuit_id, sequence_number, "
    "depth, aggregation_round, circuit_blob_url, is_node_final_proof) "
    "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7) "
    "ON CONFLICT (batch_number, aggregation_round, circuit_id, depth, "
    "sequence_number) DO UPDATE SET "
    "circuit_blob_url = excluded.circuit_blob_url, "
    "updated_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now') "
    "RETURNING id");
  stmt.bindKey(job.key)
    .bind(6, job.circuitBlobUrl)
    .bind(7, job.isNodeFinalProof ? 1 : 0);

  if(stmt.step() != SQLITE_ROW)
    return PAGG_DATABASE_ERROR;
  id = static_cast<ProverJobId>(stmt.columnInt64(0));

  pagg_log(PAGG_QUEUE,
           PAGG_TRACE,
           "Inserted prover job {} for {}.",
           id,
           job.key);
  return PAGG_OK;
}

pagg_status
SQLiteLedger::markSucceeded(AggregationRound round,
                            BatchNumber batch,
                            std::chrono::milliseconds elapsed) {
  std::unique_lock lock(m_mutex);
  Statement stmt(m_db,
                 "UPDATE witness_jobs SET status = 'successful', "
                 "time_taken_ms = ?3, "
                 "updated_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now') "
                 "WHERE aggregation_round = ?1 AND batch_number = ?2");
  stmt.bind(1, RoundToInt(round))
    .bind(2, batch)
    .bind(3, static_cast<int64_t>(elapsed.count()));
  if(stmt.step() != SQLITE_DONE)
    return PAGG_DATABASE_ERROR;
  if(sqlite3_changes(m_db) == 0)
    return PAGG_JOB_NOT_FOUND;
  return PAGG_OK;
}

pagg_status
SQLiteLedger::beginTransaction() {
  std::unique_lock lock(m_mutex);
  return exec("BEGIN IMMEDIATE") == PAGG_OK ? PAGG_OK
                                            : PAGG_TRANSACTION_ERROR;
}

pagg_status
SQLiteLedger::commit() {
  std::unique_lock lock(m_mutex);
  return exec("COMMIT") == PAGG_OK ? PAGG_OK : PAGG_TRANSACTION_ERROR;
}

pagg_status
SQLiteLedger::rollback() {
  std::unique_lock lock(m_mutex);
  if(m_db && sqlite3_get_autocommit(m_db)) {
    // Nothing to roll back, SQLite may already have ended the transaction.
    return PAGG_OK;
  }
  return exec("ROLLBACK") == PAGG_OK ? PAGG_OK : PAGG_TRANSACTION_ERROR;
}

pagg_status
SQLiteLedger::insertWitnessJob(AggregationRound round,
                               BatchNumber batch,
                               uint32_t dependencySlots) {
  std::unique_lock lock(m_mutex);
  if(exec("SAVEPOINT insert_witness_job") != PAGG_OK)
    return PAGG_TRANSACTION_ERROR;

  auto undo = [this]() {
    if(exec("ROLLBACK TO insert_witness_job") != PAGG_OK ||
       exec("RELEASE insert_witness_job") != PAGG_OK) {
      return PAGG_TRANSACTION_ERROR;
    }
    return PAGG_DATABASE_ERROR;
  };

  {
    Statement stmt(m_db,
                   "INSERT INTO witness_jobs (aggregation_round, batch_number) "
                   "VALUES (?1, ?2) ON CONFLICT DO NOTHING");
    stmt.bind(1, RoundToInt(round)).bind(2, batch);
    if(stmt.step() != SQLITE_DONE)
      return undo();
  }

  for(uint32_t slot = 0; slot < dependencySlots; ++slot) {
    Statement stmt(m_db,
                   "INSERT INTO dependency_tracker (aggregation_round, "
                   "batch_number, slot) VALUES (?1, ?2, ?3) "
                   "ON CONFLICT DO NOTHING");
    stmt.bind(1, RoundToInt(round)).bind(2, batch).bind(3, slot);
    if(stmt.step() != SQLITE_DONE)
      return undo();
  }

  if(exec("RELEASE insert_witness_job") != PAGG_OK)
    return PAGG_TRANSACTION_ERROR;
  return PAGG_OK;
}

pagg_status
SQLiteLedger::setDependency(AggregationRound round,
                            BatchNumber batch,
                            uint32_t slot,
                            ProverJobId proverJob) {
  std::unique_lock lock(m_mutex);
  Statement stmt(m_db,
                 "UPDATE dependency_tracker SET prover_job_id = ?4 "
                 "WHERE aggregation_round = ?1 AND batch_number = ?2 "
                 "AND slot = ?3");
  stmt.bind(1, RoundToInt(round))
    .bind(2, batch)
    .bind(3, slot)
    .bind(4, static_cast<int64_t>(proverJob));
  if(stmt.step() != SQLITE_DONE)
    return PAGG_DATABASE_ERROR;
  if(sqlite3_changes(m_db) == 0)
    return PAGG_JOB_NOT_FOUND;
  return PAGG_OK;
}

pagg_status
SQLiteLedger::markProverJobSucceeded(ProverJobId id) {
  std::unique_lock lock(m_mutex);
  Statement stmt(m_db,
                 "UPDATE prover_jobs SET status = 'successful', "
                 "updated_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now') "
                 "WHERE id = ?1");
  stmt.bind(1, static_cast<int64_t>(id));
  if(stmt.step() != SQLITE_DONE)
    return PAGG_DATABASE_ERROR;
  if(sqlite3_changes(m_db) == 0)
    return PAGG_JOB_NOT_FOUND;
  return PAGG_OK;
}

pagg_status
SQLiteLedger::getWitnessJob(AggregationRound round,
                            BatchNumber batch,
                            WitnessJobRecord& out) {
  std::unique_lock lock(m_mutex);
  Statement stmt(m_db,
                 "SELECT status, attempts, error, is_retryable, "
                 "time_taken_ms, picked_by FROM witness_jobs "
                 "WHERE aggregation_round = ?1 AND batch_number = ?2");
  stmt.bind(1, RoundToInt(round)).bind(2, batch);

  int rc = stmt.step();
  if(rc == SQLITE_DONE)
    return PAGG_JOB_NOT_FOUND;
  if(rc != SQLITE_ROW)
    return PAGG_DATABASE_ERROR;

  std::string status = stmt.columnText(0);
  if(!WitnessJobStatusFromStr(status, out.status)) {
    pagg_log(PAGG_QUEUE,
             PAGG_LOCALERROR,
             "{} job of batch {} has unknown status \"{}\"!",
             round,
             batch,
             status);
    return PAGG_DATABASE_ERROR;
  }
  out.round = round;
  out.batch = batch;
  out.attempts = static_cast<uint32_t>(stmt.columnInt64(1));
  out.error = stmt.columnText(2);
  out.retryable = stmt.columnInt64(3) != 0;
  out.timeTakenMS = static_cast<uint64_t>(stmt.columnInt64(4));
  out.pickedBy = stmt.columnText(5);
  return PAGG_OK;
}

pagg_status
SQLiteLedger::countProverJobs(const CircuitKey& key, uint64_t& count) {
  std::unique_lock lock(m_mutex);
  Statement stmt(m_db,
                 "SELECT COUNT(*) FROM prover_jobs WHERE batch_number = ?1 "
                 "AND circuit_id = ?2 AND sequence_number = ?3 "
                 "AND depth = ?4 AND aggregation_round = ?5");
  stmt.bindKey(key);
  if(stmt.step() != SQLITE_ROW)
    return PAGG_DATABASE_ERROR;
  count = static_cast<uint64_t>(stmt.columnInt64(0));
  return PAGG_OK;
}

pagg_status
SQLiteLedger::requeueFailedJobs(AggregationRound round,
                                uint32_t maxAttempts,
                                uint64_t& requeued) {
  std::unique_lock lock(m_mutex);
  Statement stmt(m_db,
                 "UPDATE witness_jobs SET status = 'queued', "
                 "updated_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now') "
                 "WHERE aggregation_round = ?1 AND status = 'failed' "
                 "AND is_retryable = 1 AND attempts < ?2");
  stmt.bind(1, RoundToInt(round)).bind(2, maxAttempts);
  if(stmt.step() != SQLITE_DONE)
    return PAGG_DATABASE_ERROR;
  requeued = static_cast<uint64_t>(sqlite3_changes(m_db));
  if(requeued > 0) {
    pagg_log(PAGG_QUEUE,
             PAGG_INFO,
             "Requeued {} failed {} jobs.",
             requeued,
             round);
  }
  return PAGG_OK;
}

pagg_status
SQLiteLedger::requeueStuckJobs(AggregationRound round,
                               std::chrono::milliseconds processingTimeout,
                               uint32_t maxAttempts,
                               uint64_t& requeued,
                               uint64_t& failed) {
  std::unique_lock lock(m_mutex);
  requeued = 0;
  failed = 0;

  if(exec("BEGIN IMMEDIATE") != PAGG_OK)
    return PAGG_TRANSACTION_ERROR;

  pagg_status s = PAGG_OK;
  for(const char* sql : { failStuckSql, requeueStuckSql }) {
    Statement stmt(m_db, sql);
    stmt.bind(1, RoundToInt(round))
      .bind(2, maxAttempts)
      .bind(3, static_cast<int64_t>(processingTimeout.count()));
    if(stmt.step() != SQLITE_DONE) {
      s = PAGG_DATABASE_ERROR;
      break;
    }
    uint64_t& changed = sql == failStuckSql ? failed : requeued;
    changed = static_cast<uint64_t>(sqlite3_changes(m_db));
  }

  if(s == PAGG_OK && exec("COMMIT") != PAGG_OK)
    s = PAGG_TRANSACTION_ERROR;
  if(s != PAGG_OK) {
    requeued = 0;
    failed = 0;
    if(!sqlite3_get_autocommit(m_db) && exec("ROLLBACK") != PAGG_OK) {
      pagg_log(PAGG_QUEUE,
               PAGG_LOCALERROR,
               "Could not roll back recovery of stuck {} jobs!",
               round);
    }
    return s;
  }

  if(requeued > 0 || failed > 0) {
    pagg_log(PAGG_QUEUE,
             PAGG_LOCALWARNING,
             "Recovered {} jobs stuck for at least {}ms: {} requeued, {} "
             "failed after {} attempts.",
             round,
             processingTimeout.count(),
             requeued,
             failed,
             maxAttempts);
  }
  return PAGG_OK;
}
}
