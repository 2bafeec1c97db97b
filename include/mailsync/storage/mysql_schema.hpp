#pragma once

#include <boost/mysql/common_server_errc.hpp>
#include <boost/system/error_code.hpp>

#include <array>
#include <string_view>

namespace mailsync::schema {

// MySQL 8 schema. All timestamps are Unix milliseconds (BIGINT).
// Migrations run in order, each exactly once, and are recorded in
// schema_version only after every statement succeeded. Never edit a released
// migration; append a new one. Statements must be safe to re-run: MySQL
// commits DDL implicitly, so a crash can leave a migration half applied.

inline constexpr std::string_view VERSION_TABLE = R"SQL(
CREATE TABLE IF NOT EXISTS schema_version (
    version INT NOT NULL PRIMARY KEY,
    description VARCHAR(255) NOT NULL DEFAULT '',
    applied_at BIGINT NOT NULL DEFAULT 0
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci
)SQL";

inline constexpr std::string_view V1_SCHEMA = R"SQL(

CREATE TABLE IF NOT EXISTS processing_runs (
    run_id VARCHAR(64) NOT NULL PRIMARY KEY,
    principal VARCHAR(320) NOT NULL,
    status VARCHAR(32) NOT NULL DEFAULT 'pending',
    folder VARCHAR(512) NOT NULL DEFAULT 'INBOX',
    item_limit INT NOT NULL DEFAULT 0,
    apply_labels TINYINT NOT NULL DEFAULT 0,
    total_items INT NOT NULL DEFAULT 0,
    processed_items INT NOT NULL DEFAULT 0,
    generated_items INT NOT NULL DEFAULT 0,
    applied_items INT NOT NULL DEFAULT 0,
    cursor_token VARCHAR(255) NOT NULL DEFAULT '',
    error_log JSON NOT NULL DEFAULT ('[]'),
    created_at BIGINT NOT NULL,
    updated_at BIGINT NOT NULL,
    finished_at BIGINT NOT NULL DEFAULT 0
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS suggestions (
    suggestion_id VARCHAR(160) NOT NULL PRIMARY KEY,
    run_id VARCHAR(64) NOT NULL,
    remote_item_id VARCHAR(64) NOT NULL,
    folder VARCHAR(512) NOT NULL DEFAULT '',
    subject TEXT NOT NULL,
    suggested_labels JSON NOT NULL DEFAULT ('[]'),
    confidence_category VARCHAR(16) NOT NULL DEFAULT 'no_match',
    reasoning TEXT NOT NULL,
    status VARCHAR(16) NOT NULL DEFAULT 'pending',
    created_at BIGINT NOT NULL,
    updated_at BIGINT NOT NULL,
    UNIQUE KEY uq_suggestion_run_item (run_id, remote_item_id),
    CONSTRAINT fk_suggestion_run FOREIGN KEY (run_id) REFERENCES processing_runs(run_id) ON DELETE CASCADE
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS audit_log (
    audit_id BIGINT UNSIGNED AUTO_INCREMENT PRIMARY KEY,
    run_id VARCHAR(64) NOT NULL,
    suggestion_id VARCHAR(160) NOT NULL,
    operation VARCHAR(16) NOT NULL,
    item_id VARCHAR(64) NOT NULL,
    folder VARCHAR(512) NOT NULL DEFAULT '',
    label VARCHAR(512) NOT NULL,
    attempted_at BIGINT NOT NULL,
    synced TINYINT NOT NULL DEFAULT 0,
    synced_at BIGINT NOT NULL DEFAULT 0,
    remote_outcome VARCHAR(16) NOT NULL DEFAULT 'unknown',
    last_error TEXT NOT NULL,
    CONSTRAINT fk_audit_run FOREIGN KEY (run_id) REFERENCES processing_runs(run_id) ON DELETE CASCADE,
    CONSTRAINT fk_audit_suggestion FOREIGN KEY (suggestion_id) REFERENCES suggestions(suggestion_id) ON DELETE CASCADE
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS folder_cache (
    principal VARCHAR(320) NOT NULL PRIMARY KEY,
    folders JSON NOT NULL,
    cached_at BIGINT NOT NULL,
    expires_at BIGINT NOT NULL
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS sessions (
    session_id VARCHAR(64) NOT NULL PRIMARY KEY,
    principal VARCHAR(320) NOT NULL,
    state VARCHAR(16) NOT NULL,
    auth_mode VARCHAR(16) NOT NULL DEFAULT 'password',
    owner_pid BIGINT NOT NULL DEFAULT 0,
    retry_count INT NOT NULL DEFAULT 0,
    created_at BIGINT NOT NULL,
    last_activity BIGINT NOT NULL
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

)SQL";

// Hot-path lookups: suggestions by run and status, runs by principal and
// status, unsynced audit entries by run.
inline constexpr std::string_view V2_INDEXES = R"SQL(

CREATE INDEX idx_suggestions_run_status ON suggestions (run_id, status);
CREATE INDEX idx_runs_principal_status ON processing_runs (principal, status, created_at);
CREATE INDEX idx_audit_run_synced ON audit_log (run_id, synced);
CREATE INDEX idx_audit_synced ON audit_log (synced, attempted_at);
CREATE INDEX idx_sessions_principal ON sessions (principal);

)SQL";

struct Migration {
  int version;
  std::string_view description;
  std::string_view sql;
};

inline constexpr std::array<Migration, 2> MIGRATIONS{{
    {1, "initial tables", V1_SCHEMA},
    {2, "composite indexes for hot reads", V2_INDEXES},
}};

inline constexpr int CURRENT_SCHEMA_VERSION = MIGRATIONS.back().version;

// Errors from DDL that an interrupted earlier attempt already executed.
// CREATE INDEX has no IF NOT EXISTS in MySQL 8.
[[nodiscard]] inline auto
is_already_applied(const boost::system::error_code &ec) noexcept -> bool {
  return ec == boost::mysql::common_server_errc::er_dup_keyname ||
         ec == boost::mysql::common_server_errc::er_dup_fieldname ||
         ec == boost::mysql::common_server_errc::er_table_exists_error;
}

} // namespace mailsync::schema
