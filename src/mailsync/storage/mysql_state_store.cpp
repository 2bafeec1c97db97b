#include "mailsync/storage/mysql_state_store.hpp"

#include "mailsync/core/asio_awaitable.hpp"
#include "mailsync/storage/mysql_schema.hpp"
#include "mailsync/util/log.hpp"
#include "mailsync/util/time.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/connect_params.hpp>
#include <boost/mysql/diagnostics.hpp>
#include <boost/mysql/format_sql.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/sequence.hpp>
#include <boost/mysql/with_params.hpp>

#include <glaze/json.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace mailsync::persistence_dto {

struct SuggestedLabelJson {
  std::string label_id;
  std::string label_name;
  double confidence{0.0};
  int rank{1};
};

struct FolderJson {
  std::string name;
  std::string display_name;
  std::string type{"label"};
  bool selectable{true};
  std::string delimiter{"/"};
};

} // namespace mailsync::persistence_dto

namespace glz {

template <> struct meta<mailsync::persistence_dto::SuggestedLabelJson> {
  using T = mailsync::persistence_dto::SuggestedLabelJson;
  static constexpr auto value =
      object("label_id", &T::label_id, "label_name", &T::label_name,
             "confidence", &T::confidence, "rank", &T::rank);
};

template <> struct meta<mailsync::persistence_dto::FolderJson> {
  using T = mailsync::persistence_dto::FolderJson;
  static constexpr auto value =
      object("name", &T::name, "display_name", &T::display_name, "type",
             &T::type, "selectable", &T::selectable, "delimiter",
             &T::delimiter);
};

} // namespace glz

namespace mailsync::storage {
namespace {

using boost::asio::use_awaitable;

constexpr std::string_view kRunColumns =
    "run_id, principal, status, folder, item_limit, apply_labels, "
    "total_items, processed_items, generated_items, applied_items, "
    "cursor_token, error_log, created_at, updated_at, finished_at";

constexpr std::string_view kSuggestionColumns =
    "suggestion_id, run_id, remote_item_id, folder, subject, "
    "suggested_labels, confidence_category, reasoning, status, created_at, "
    "updated_at";

constexpr std::string_view kAuditColumns =
    "audit_id, run_id, suggestion_id, operation, item_id, folder, label, "
    "attempted_at, synced, synced_at, remote_outcome, last_error";

constexpr std::string_view kSessionColumns =
    "session_id, principal, state, auth_mode, owner_pid, retry_count, "
    "created_at, last_activity";

[[nodiscard]] auto to_millis(util::TimePoint tp) -> std::int64_t {
  return tp == util::TimePoint{} ? 0 : util::to_unix_millis(tp);
}

[[nodiscard]] auto from_millis(std::int64_t ts) -> util::TimePoint {
  return util::from_unix_millis(ts);
}

[[nodiscard]] auto now_millis() -> std::int64_t {
  return util::to_unix_millis(util::Clock::now());
}

[[nodiscard]] auto split_sql_statements(std::string_view input)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  std::string current;
  current.reserve(input.size());

  bool in_single = false;
  bool in_double = false;
  auto flush = [&] {
    auto first = current.find_first_not_of(" \n\r\t");
    if (first != std::string::npos) {
      auto last = current.find_last_not_of(" \n\r\t");
      out.emplace_back(current.substr(first, last - first + 1));
    }
    current.clear();
  };

  for (char c : input) {
    if (c == '\'' && !in_double) {
      in_single = !in_single;
    } else if (c == '"' && !in_single) {
      in_double = !in_double;
    }
    if (c == ';' && !in_single && !in_double) {
      flush();
      continue;
    }
    current.push_back(c);
  }
  flush();
  return out;
}

[[nodiscard]] auto make_pool_params(const DatabaseConfig &cfg)
    -> boost::mysql::pool_params {
  boost::mysql::pool_params params;
  params.server_address.emplace_host_and_port(cfg.host, cfg.port);
  params.username = cfg.username;
  params.password = cfg.password;
  params.database = cfg.database;
  params.initial_size = 1;
  params.max_size = std::max<std::size_t>(1, cfg.pool_size);
  params.thread_safe = true;
  params.connect_timeout = std::chrono::seconds(cfg.connect_timeout);
  params.ssl = boost::mysql::ssl_mode::disable;
  return params;
}

[[nodiscard]] auto as_i64(const boost::mysql::field_view &f) -> std::int64_t {
  if (f.is_int64()) {
    return f.as_int64();
  }
  if (f.is_uint64()) {
    return static_cast<std::int64_t>(f.as_uint64());
  }
  if (f.is_string()) {
    return std::stoll(std::string(f.as_string()));
  }
  return 0;
}

[[nodiscard]] auto as_bool(const boost::mysql::field_view &f) -> bool {
  return as_i64(f) != 0;
}

[[nodiscard]] auto as_sv(const boost::mysql::field_view &f)
    -> std::string_view {
  if (!f.is_string()) {
    return {};
  }
  auto s = f.as_string();
  return std::string_view(s.data(), s.size());
}

[[nodiscard]] auto as_str(const boost::mysql::field_view &f) -> std::string {
  if (f.is_string()) {
    return std::string(as_sv(f));
  }
  if (f.is_int64()) {
    return std::to_string(f.as_int64());
  }
  if (f.is_uint64()) {
    return std::to_string(f.as_uint64());
  }
  return {};
}

// === JSON columns ===

[[nodiscard]] auto labels_to_json(const std::vector<SuggestedLabel> &labels)
    -> std::string {
  std::vector<persistence_dto::SuggestedLabelJson> dto;
  dto.reserve(labels.size());
  for (const auto &l : labels) {
    dto.push_back({.label_id = l.label_id,
                   .label_name = l.label_name,
                   .confidence = l.confidence,
                   .rank = l.rank});
  }
  if (auto out = glz::write_json(dto); out) {
    return *out;
  }
  return "[]";
}

[[nodiscard]] auto labels_from_json(std::string_view json)
    -> std::vector<SuggestedLabel> {
  std::vector<persistence_dto::SuggestedLabelJson> dto;
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(dto, json); ec) {
    log::warn("Corrupt suggested_labels JSON ignored: {}", json);
    return {};
  }
  std::vector<SuggestedLabel> out;
  out.reserve(dto.size());
  for (auto &d : dto) {
    out.push_back({.label_id = std::move(d.label_id),
                   .label_name = std::move(d.label_name),
                   .confidence = d.confidence,
                   .rank = d.rank});
  }
  return out;
}

[[nodiscard]] auto strings_to_json(const std::vector<std::string> &items)
    -> std::string {
  if (auto out = glz::write_json(items); out) {
    return *out;
  }
  return "[]";
}

[[nodiscard]] auto strings_from_json(std::string_view json)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(out, json); ec) {
    log::warn("Corrupt error_log JSON ignored");
    return {};
  }
  return out;
}

[[nodiscard]] auto folders_to_json(std::span<const Folder> folders)
    -> std::string {
  std::vector<persistence_dto::FolderJson> dto;
  dto.reserve(folders.size());
  for (const auto &f : folders) {
    dto.push_back({.name = f.name,
                   .display_name = f.display_name,
                   .type = std::string(to_string_view(f.type)),
                   .selectable = f.selectable,
                   .delimiter = f.delimiter});
  }
  if (auto out = glz::write_json(dto); out) {
    return *out;
  }
  return "[]";
}

[[nodiscard]] auto folders_from_json(std::string_view json)
    -> std::optional<std::vector<Folder>> {
  std::vector<persistence_dto::FolderJson> dto;
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(dto, json); ec) {
    return std::nullopt;
  }
  std::vector<Folder> out;
  out.reserve(dto.size());
  for (auto &d : dto) {
    out.push_back({.name = std::move(d.name),
                   .display_name = std::move(d.display_name),
                   .type = parse<FolderType>(d.type),
                   .selectable = d.selectable,
                   .delimiter = std::move(d.delimiter)});
  }
  return out;
}

// === Row mapping ===

[[nodiscard]] auto to_run(const boost::mysql::row_view &row) -> ProcessingRun {
  ProcessingRun run;
  run.id = RunId{as_str(row.at(0))};
  run.principal = Principal{as_str(row.at(1))};
  run.status = parse<RunStatus>(as_sv(row.at(2)));
  run.folder = as_str(row.at(3));
  run.item_limit = static_cast<int>(as_i64(row.at(4)));
  run.apply = as_bool(row.at(5));
  run.total = static_cast<int>(as_i64(row.at(6)));
  run.processed = static_cast<int>(as_i64(row.at(7)));
  run.generated = static_cast<int>(as_i64(row.at(8)));
  run.applied = static_cast<int>(as_i64(row.at(9)));
  run.cursor = as_str(row.at(10));
  run.error_log = strings_from_json(as_sv(row.at(11)));
  run.created_at = from_millis(as_i64(row.at(12)));
  run.updated_at = from_millis(as_i64(row.at(13)));
  run.finished_at = from_millis(as_i64(row.at(14)));
  return run;
}

[[nodiscard]] auto to_suggestion(const boost::mysql::row_view &row)
    -> Suggestion {
  return Suggestion{
      .id = SuggestionId{as_str(row.at(0))},
      .run_id = RunId{as_str(row.at(1))},
      .remote_item_id = as_str(row.at(2)),
      .folder = as_str(row.at(3)),
      .subject = as_str(row.at(4)),
      .labels = labels_from_json(as_sv(row.at(5))),
      .category = parse<ConfidenceCategory>(as_sv(row.at(6))),
      .reasoning = as_str(row.at(7)),
      .status = parse<SuggestionStatus>(as_sv(row.at(8))),
      .created_at = from_millis(as_i64(row.at(9))),
      .updated_at = from_millis(as_i64(row.at(10))),
  };
}

[[nodiscard]] auto to_audit_entry(const boost::mysql::row_view &row)
    -> AuditLogEntry {
  return AuditLogEntry{
      .id = as_i64(row.at(0)),
      .run_id = RunId{as_str(row.at(1))},
      .suggestion_id = SuggestionId{as_str(row.at(2))},
      .op = parse<MutationOp>(as_sv(row.at(3))),
      .item_id = as_str(row.at(4)),
      .folder = as_str(row.at(5)),
      .label = as_str(row.at(6)),
      .attempted_at = from_millis(as_i64(row.at(7))),
      .synced = as_bool(row.at(8)),
      .synced_at = from_millis(as_i64(row.at(9))),
      .outcome = parse<RemoteOutcome>(as_sv(row.at(10))),
      .last_error = as_str(row.at(11)),
  };
}

[[nodiscard]] auto to_session_info(const boost::mysql::row_view &row)
    -> SessionInfo {
  SessionInfo info;
  info.id = SessionId{as_str(row.at(0))};
  info.principal = Principal{as_str(row.at(1))};
  info.state = parse<SessionState>(as_sv(row.at(2)));
  info.auth_mode = parse<AuthMode>(as_sv(row.at(3)));
  info.owner_pid = as_i64(row.at(4));
  info.retry_count = static_cast<int>(as_i64(row.at(5)));
  info.created_at = from_millis(as_i64(row.at(6)));
  info.last_activity = from_millis(as_i64(row.at(7)));
  return info;
}

auto format_suggestion_row(const Suggestion *s,
                           boost::mysql::format_context_base &ctx) -> void {
  boost::mysql::format_sql_to(
      ctx, "({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {})", s->id.str(),
      s->run_id.str(), s->remote_item_id, s->folder, s->subject,
      labels_to_json(s->labels), to_string_view(s->category), s->reasoning,
      to_string_view(s->status), to_millis(s->created_at),
      to_millis(s->updated_at));
}

template <typename F>
auto mysql_try(F &&f) -> task<typename std::invoke_result_t<F>::value_type> {
  try {
    co_return co_await std::forward<F>(f)();
  } catch (const std::exception &e) {
    log::error("MySQL operation failed: {}", e.what());
    co_return fail(Error::DatabaseQueryFailed);
  }
}

// Rolls back explicitly so the connection can go back to the pool as is.
auto rollback(boost::mysql::pooled_connection &conn) -> task<void> {
  boost::mysql::results res;
  co_await conn->async_execute("ROLLBACK", res, use_awaitable);
  conn.return_without_reset();
}

auto commit(boost::mysql::pooled_connection &conn) -> task<void> {
  boost::mysql::results res;
  co_await conn->async_execute("COMMIT", res, use_awaitable);
  conn.return_without_reset();
}

} // namespace

MySQLStateStore::MySQLStateStore(boost::asio::any_io_executor executor,
                                 const DatabaseConfig &config)
    : cfg_(config), pool_(executor, make_pool_params(config)) {}

MySQLStateStore::~MySQLStateStore() { pool_.cancel(); }

auto MySQLStateStore::ensure_database_exists() -> task<Result<void>> {
  std::string direct_connect_error;
  try {
    // Connecting to the configured database directly needs no CREATE
    // privilege, which is the normal case.
    boost::mysql::connect_params params;
    params.server_address.emplace_host_and_port(cfg_.host, cfg_.port);
    params.username = cfg_.username;
    params.password = cfg_.password;
    params.database = cfg_.database;
    params.ssl = boost::mysql::ssl_mode::disable;

    boost::mysql::any_connection conn(pool_.get_executor());
    co_await conn.async_connect(
        params, boost::asio::cancel_after(
                    std::chrono::seconds(cfg_.connect_timeout), use_awaitable));
    co_await conn.async_close(use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    direct_connect_error = e.what();
  }

  try {
    boost::mysql::connect_params params;
    params.server_address.emplace_host_and_port(cfg_.host, cfg_.port);
    params.username = cfg_.username;
    params.password = cfg_.password;
    params.ssl = boost::mysql::ssl_mode::disable;

    boost::mysql::any_connection conn(pool_.get_executor());
    co_await conn.async_connect(
        params, boost::asio::cancel_after(
                    std::chrono::seconds(cfg_.connect_timeout), use_awaitable));

    boost::mysql::results res;
    co_await conn.async_execute(
        boost::mysql::with_params("CREATE DATABASE IF NOT EXISTS {:i}",
                                  cfg_.database),
        res, use_awaitable);
    co_await conn.async_close(use_awaitable);
    co_return ok();
  } catch (const std::exception &e) {
    log::error(
        "MySQL ensure database failed: direct_connect='{}', create_db='{}'",
        direct_connect_error, e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLStateStore::open() -> task<Result<void>> {
  if (open_.load(std::memory_order_acquire)) {
    co_return ok();
  }

  auto db_res = co_await ensure_database_exists();
  if (!db_res) {
    co_return fail(db_res.error());
  }

  open_.store(true, std::memory_order_release);
  pool_.async_run(boost::asio::detached);

  auto conn_res = co_await get_connection();
  if (!conn_res) {
    open_.store(false, std::memory_order_release);
    co_return fail(conn_res.error());
  }

  auto schema_res = co_await apply_migrations(conn_res->get());
  if (!schema_res) {
    open_.store(false, std::memory_order_release);
    co_return fail(schema_res.error());
  }
  conn_res->return_without_reset();

  log::info("MySQL state store opened: {}:{} / {} (schema v{})", cfg_.host,
            cfg_.port, cfg_.database, schema_version());
  co_return ok();
}

auto MySQLStateStore::close() -> task<void> {
  if (open_.exchange(false, std::memory_order_acq_rel)) {
    pool_.cancel();
  }
  co_return;
}

auto MySQLStateStore::is_open() const noexcept -> bool {
  return open_.load(std::memory_order_acquire);
}

auto MySQLStateStore::get_connection()
    -> task<Result<boost::mysql::pooled_connection>> {
  if (!is_open()) {
    co_return fail(Error::SystemNotRunning);
  }

  try {
    auto conn = co_await pool_.async_get_connection(boost::asio::cancel_after(
        std::chrono::seconds(cfg_.connect_timeout), use_awaitable));
    co_return ok(std::move(conn));
  } catch (const std::exception &e) {
    log::error("MySQL get connection failed: {}", e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

auto MySQLStateStore::apply_migrations(boost::mysql::any_connection &conn)
    -> task<Result<void>> {
  try {
    boost::mysql::results res;
    co_await conn.async_execute(schema::VERSION_TABLE, res, use_awaitable);

    boost::mysql::results ver_res;
    co_await conn.async_execute(
        "SELECT COALESCE(MAX(version), 0) FROM schema_version", ver_res,
        use_awaitable);
    int current =
        ver_res.rows().empty() ? 0 : static_cast<int>(as_i64(ver_res.rows().at(0).at(0)));

    for (const auto &migration : schema::MIGRATIONS) {
      if (migration.version <= current) {
        continue;
      }
      log::info("Applying schema migration v{}: {}", migration.version,
                migration.description);

      // One statement at a time; the version row is written only once all
      // of them went through.
      for (const auto &stmt_sql : split_sql_statements(migration.sql)) {
        boost::mysql::results stmt_res;
        boost::mysql::diagnostics diag;
        auto [ec] = co_await conn.async_execute(stmt_sql, stmt_res, diag,
                                                use_nothrow);
        if (!ec) {
          continue;
        }
        if (schema::is_already_applied(ec)) {
          log::warn("Migration v{}: statement already applied ({})",
                    migration.version, diag.server_message());
          continue;
        }
        log::error("Migration v{} failed: {} {}", migration.version,
                   ec.message(), diag.server_message());
        co_return fail(Error::DatabaseOpenFailed);
      }

      boost::mysql::results ins_res;
      co_await conn.async_execute(
          boost::mysql::with_params(
              "INSERT IGNORE INTO schema_version(version, description, "
              "applied_at) VALUES ({}, {}, {})",
              migration.version, migration.description, now_millis()),
          ins_res, use_awaitable);
      current = migration.version;
    }

    schema_version_.store(current, std::memory_order_release);
    co_return ok();
  } catch (const std::exception &e) {
    log::error("MySQL schema migration failed: {}", e.what());
    co_return fail(Error::DatabaseOpenFailed);
  }
}

// === Runs ===

auto MySQLStateStore::save_run(const ProcessingRun &run)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO processing_runs(run_id, principal, status, folder, "
            "item_limit, apply_labels, total_items, processed_items, "
            "generated_items, applied_items, cursor_token, error_log, "
            "created_at, updated_at, finished_at) "
            "VALUES({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, "
            "{}) "
            "ON DUPLICATE KEY UPDATE "
            "status=VALUES(status), total_items=VALUES(total_items), "
            "processed_items=VALUES(processed_items), "
            "generated_items=VALUES(generated_items), "
            "applied_items=VALUES(applied_items), "
            "cursor_token=VALUES(cursor_token), error_log=VALUES(error_log), "
            "updated_at=VALUES(updated_at), finished_at=VALUES(finished_at)",
            run.id.str(), run.principal.str(), to_string_view(run.status),
            run.folder, run.item_limit, run.apply ? 1 : 0, run.total,
            run.processed, run.generated, run.applied, run.cursor,
            strings_to_json(run.error_log), to_millis(run.created_at),
            to_millis(run.updated_at), to_millis(run.finished_at)),
        res, use_awaitable);

    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLStateStore::update_run(const ProcessingRun &run)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    boost::mysql::results res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "UPDATE processing_runs SET status={}, total_items={}, "
            "processed_items={}, generated_items={}, applied_items={}, "
            "cursor_token={}, error_log={}, updated_at={}, finished_at={} "
            "WHERE run_id={}",
            to_string_view(run.status), run.total, run.processed,
            run.generated, run.applied, run.cursor,
            strings_to_json(run.error_log), to_millis(run.updated_at),
            to_millis(run.finished_at), run.id.str()),
        res, use_awaitable);

    if (res.affected_rows() == 0) {
      // No change and no row look the same to UPDATE.
      boost::mysql::results check;
      co_await conn.async_execute(
          boost::mysql::with_params(
              "SELECT 1 FROM processing_runs WHERE run_id={}", run.id.str()),
          check, use_awaitable);
      if (check.rows().empty()) {
        conn_res->return_without_reset();
        co_return fail(Error::NotFound);
      }
    }
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLStateStore::get_run(const RunId &id)
    -> task<Result<ProcessingRun>> {
  co_return co_await mysql_try([&]() -> task<Result<ProcessingRun>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT {:r} FROM processing_runs WHERE run_id={}", kRunColumns,
            id.str()),
        res, use_awaitable);
    conn_res->return_without_reset();

    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    co_return ok(to_run(res.rows().at(0)));
  });
}

auto MySQLStateStore::list_runs(const RunQuery &query)
    -> task<Result<std::vector<ProcessingRun>>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<std::vector<ProcessingRun>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        const std::string principal =
            query.principal ? query.principal->str() : std::string{};
        const std::string_view status =
            query.status ? to_string_view(*query.status) : std::string_view{};

        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT {:r} FROM processing_runs "
                "WHERE ({} = '' OR principal = {}) "
                "AND ({} = '' OR status = {}) "
                "ORDER BY created_at DESC LIMIT {}",
                kRunColumns, principal, principal, status, status,
                query.limit),
            res, use_awaitable);
        conn_res->return_without_reset();

        std::vector<ProcessingRun> out;
        out.reserve(res.rows().size());
        for (auto row : res.rows()) {
          out.push_back(to_run(row));
        }
        co_return ok(std::move(out));
      });
}

auto MySQLStateStore::run_stats() -> task<Result<RunStats>> {
  co_return co_await mysql_try([&]() -> task<Result<RunStats>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        "SELECT status, COUNT(*) FROM processing_runs GROUP BY status", res,
        use_awaitable);
    conn_res->return_without_reset();

    RunStats stats;
    for (auto row : res.rows()) {
      stats[parse<RunStatus>(as_sv(row.at(0)))] += as_i64(row.at(1));
    }
    co_return ok(std::move(stats));
  });
}

auto MySQLStateStore::delete_runs_before(TimePoint cutoff)
    -> task<Result<std::size_t>> {
  co_return co_await mysql_try([&]() -> task<Result<std::size_t>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "DELETE FROM processing_runs WHERE status IN ({}, {}) "
            "AND finished_at > 0 AND finished_at < {}",
            to_string_view(RunStatus::Completed),
            to_string_view(RunStatus::Failed), to_millis(cutoff)),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok(static_cast<std::size_t>(res.affected_rows()));
  });
}

// === Suggestions ===

auto MySQLStateStore::save_suggestion(const Suggestion &s)
    -> task<Result<bool>> {
  co_return co_await mysql_try([&]() -> task<Result<bool>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    const std::vector<const Suggestion *> rows{&s};
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT IGNORE INTO suggestions({:r}) VALUES {}",
            kSuggestionColumns,
            boost::mysql::sequence(std::cref(rows), format_suggestion_row)),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok(res.affected_rows() > 0);
  });
}

auto MySQLStateStore::get_suggestion(const SuggestionId &id)
    -> task<Result<Suggestion>> {
  co_return co_await mysql_try([&]() -> task<Result<Suggestion>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT {:r} FROM suggestions WHERE suggestion_id={}",
            kSuggestionColumns, id.str()),
        res, use_awaitable);
    conn_res->return_without_reset();

    if (res.rows().empty()) {
      co_return fail(Error::NotFound);
    }
    co_return ok(to_suggestion(res.rows().at(0)));
  });
}

auto MySQLStateStore::get_suggestions(const RunId &run_id,
                                      std::optional<SuggestionStatus> status)
    -> task<Result<std::vector<Suggestion>>> {
  co_return co_await mysql_try([&]() -> task<Result<std::vector<Suggestion>>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    const std::string_view status_sv =
        status ? to_string_view(*status) : std::string_view{};
    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "SELECT {:r} FROM suggestions WHERE run_id={} "
            "AND ({} = '' OR status = {}) "
            "ORDER BY CAST(remote_item_id AS UNSIGNED), remote_item_id",
            kSuggestionColumns, run_id.str(), status_sv, status_sv),
        res, use_awaitable);
    conn_res->return_without_reset();

    std::vector<Suggestion> out;
    out.reserve(res.rows().size());
    for (auto row : res.rows()) {
      out.push_back(to_suggestion(row));
    }
    co_return ok(std::move(out));
  });
}

auto MySQLStateStore::update_suggestion_status(const SuggestionId &id,
                                               SuggestionStatus to)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    boost::mysql::results tx_res;
    co_await conn.async_execute("START TRANSACTION", tx_res, use_awaitable);

    boost::mysql::results sel_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "SELECT status FROM suggestions WHERE suggestion_id={} FOR UPDATE",
            id.str()),
        sel_res, use_awaitable);
    if (sel_res.rows().empty()) {
      co_await rollback(*conn_res);
      co_return fail(Error::NotFound);
    }

    const auto from = parse<SuggestionStatus>(as_sv(sel_res.rows().at(0).at(0)));
    if (!can_transition(from, to)) {
      co_await rollback(*conn_res);
      log::debug("Suggestion {} rejected transition {} -> {}", id,
                 to_string_view(from), to_string_view(to));
      co_return fail(Error::InvalidState);
    }

    boost::mysql::results upd_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "UPDATE suggestions SET status={}, updated_at={} "
            "WHERE suggestion_id={}",
            to_string_view(to), now_millis(), id.str()),
        upd_res, use_awaitable);

    co_await commit(*conn_res);
    co_return ok();
  });
}

// === Batch ===

auto MySQLStateStore::commit_page(const RunId &run_id,
                                  std::span<const Suggestion> suggestions,
                                  std::string_view next_cursor)
    -> task<Result<int>> {
  co_return co_await mysql_try([&]() -> task<Result<int>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    boost::mysql::results tx_res;
    co_await conn.async_execute("START TRANSACTION", tx_res, use_awaitable);

    boost::mysql::results run_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "SELECT status FROM processing_runs WHERE run_id={} FOR UPDATE",
            run_id.str()),
        run_res, use_awaitable);
    if (run_res.rows().empty()) {
      co_await rollback(*conn_res);
      co_return fail(Error::NotFound);
    }

    // Drop items already persisted for this run, and repeats in the page.
    std::unordered_set<std::string> existing;
    if (!suggestions.empty()) {
      std::vector<std::string> item_ids;
      item_ids.reserve(suggestions.size());
      for (const auto &s : suggestions) {
        item_ids.push_back(s.remote_item_id);
      }
      auto format_id = [](const std::string &v,
                          boost::mysql::format_context_base &ctx) {
        boost::mysql::format_sql_to(ctx, "{}", v);
      };
      boost::mysql::results dup_res;
      co_await conn.async_execute(
          boost::mysql::with_params(
              "SELECT remote_item_id FROM suggestions WHERE run_id={} "
              "AND remote_item_id IN ({})",
              run_id.str(), boost::mysql::sequence(std::cref(item_ids), format_id)),
          dup_res, use_awaitable);
      for (auto row : dup_res.rows()) {
        existing.insert(as_str(row.at(0)));
      }
    }

    std::vector<const Suggestion *> fresh;
    fresh.reserve(suggestions.size());
    int generated = 0;
    for (const auto &s : suggestions) {
      if (existing.insert(s.remote_item_id).second) {
        fresh.push_back(&s);
        if (s.status != SuggestionStatus::NoMatch) {
          ++generated;
        }
      }
    }

    if (!fresh.empty()) {
      boost::mysql::results ins_res;
      co_await conn.async_execute(
          boost::mysql::with_params(
              "INSERT INTO suggestions({:r}) VALUES {}", kSuggestionColumns,
              boost::mysql::sequence(std::cref(fresh), format_suggestion_row)),
          ins_res, use_awaitable);
    }

    const auto inserted = static_cast<int>(fresh.size());
    boost::mysql::results upd_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "UPDATE processing_runs SET cursor_token={}, "
            "processed_items=processed_items+{}, "
            "generated_items=generated_items+{}, updated_at={} "
            "WHERE run_id={}",
            next_cursor, inserted, generated, now_millis(), run_id.str()),
        upd_res, use_awaitable);

    co_await commit(*conn_res);
    co_return ok(inserted);
  });
}

// === Audit ===

auto MySQLStateStore::append_audit_entry(const AuditLogEntry &entry)
    -> task<Result<std::int64_t>> {
  co_return co_await mysql_try([&]() -> task<Result<std::int64_t>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO audit_log(run_id, suggestion_id, operation, item_id, "
            "folder, label, attempted_at, synced, synced_at, remote_outcome, "
            "last_error) VALUES({}, {}, {}, {}, {}, {}, {}, 0, 0, {}, '')",
            entry.run_id.str(), entry.suggestion_id.str(),
            to_string_view(entry.op), entry.item_id, entry.folder, entry.label,
            to_millis(entry.attempted_at),
            to_string_view(RemoteOutcome::Unknown)),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok(static_cast<std::int64_t>(res.last_insert_id()));
  });
}

auto MySQLStateStore::list_unsynced_audit(const AuditQuery &query)
    -> task<Result<std::vector<AuditLogEntry>>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<std::vector<AuditLogEntry>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        const std::string run =
            query.run_id ? query.run_id->str() : std::string{};
        const std::string owner =
            query.principal ? query.principal->str() : std::string{};
        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT {:r} FROM audit_log WHERE synced = 0 "
                "AND ({} = '' OR run_id = {}) "
                "AND ({} = '' OR run_id IN "
                "(SELECT run_id FROM processing_runs WHERE principal = {})) "
                "ORDER BY audit_id",
                kAuditColumns, run, run, owner, owner),
            res, use_awaitable);
        conn_res->return_without_reset();

        std::vector<AuditLogEntry> out;
        out.reserve(res.rows().size());
        for (auto row : res.rows()) {
          out.push_back(to_audit_entry(row));
        }
        co_return ok(std::move(out));
      });
}

auto MySQLStateStore::record_audit_error(std::int64_t audit_id,
                                         std::string_view message)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "UPDATE audit_log SET last_error={} WHERE audit_id={}", message,
            audit_id),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLStateStore::complete_mutation(std::int64_t audit_id)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    boost::mysql::results tx_res;
    co_await conn.async_execute("START TRANSACTION", tx_res, use_awaitable);

    boost::mysql::results audit_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "SELECT suggestion_id, run_id, synced FROM audit_log "
            "WHERE audit_id={} FOR UPDATE",
            audit_id),
        audit_res, use_awaitable);
    if (audit_res.rows().empty()) {
      co_await rollback(*conn_res);
      co_return fail(Error::NotFound);
    }
    const auto audit_row = audit_res.rows().at(0);
    if (as_bool(audit_row.at(2))) {
      co_await rollback(*conn_res);
      co_return ok();
    }
    const auto suggestion_id = as_str(audit_row.at(0));
    const auto run_id = as_str(audit_row.at(1));

    boost::mysql::results sug_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "SELECT status FROM suggestions WHERE suggestion_id={} FOR UPDATE",
            suggestion_id),
        sug_res, use_awaitable);
    if (sug_res.rows().empty()) {
      co_await rollback(*conn_res);
      co_return fail(Error::NotFound);
    }
    const auto status = parse<SuggestionStatus>(as_sv(sug_res.rows().at(0).at(0)));
    if (status != SuggestionStatus::Applied &&
        !can_transition(status, SuggestionStatus::Applied)) {
      co_await rollback(*conn_res);
      co_return fail(Error::InvalidState);
    }

    const auto now = now_millis();
    if (status != SuggestionStatus::Applied) {
      boost::mysql::results upd_sug;
      co_await conn.async_execute(
          boost::mysql::with_params(
              "UPDATE suggestions SET status={}, updated_at={} "
              "WHERE suggestion_id={}",
              to_string_view(SuggestionStatus::Applied), now, suggestion_id),
          upd_sug, use_awaitable);

      boost::mysql::results upd_run;
      co_await conn.async_execute(
          boost::mysql::with_params(
              "UPDATE processing_runs SET applied_items=applied_items+1, "
              "updated_at={} WHERE run_id={}",
              now, run_id),
          upd_run, use_awaitable);
    }

    boost::mysql::results upd_audit;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "UPDATE audit_log SET synced=1, synced_at={}, remote_outcome={}, "
            "last_error='' WHERE audit_id={}",
            now, to_string_view(RemoteOutcome::Applied), audit_id),
        upd_audit, use_awaitable);

    co_await commit(*conn_res);
    co_return ok();
  });
}

auto MySQLStateStore::resolve_audit_entry(std::int64_t audit_id,
                                          bool remote_present)
    -> task<Result<RemoteOutcome>> {
  co_return co_await mysql_try([&]() -> task<Result<RemoteOutcome>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();

    boost::mysql::results tx_res;
    co_await conn.async_execute("START TRANSACTION", tx_res, use_awaitable);

    boost::mysql::results audit_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "SELECT suggestion_id, run_id, operation, synced, remote_outcome "
            "FROM audit_log WHERE audit_id={} FOR UPDATE",
            audit_id),
        audit_res, use_awaitable);
    if (audit_res.rows().empty()) {
      co_await rollback(*conn_res);
      co_return fail(Error::NotFound);
    }
    const auto audit_row = audit_res.rows().at(0);
    if (as_bool(audit_row.at(3))) {
      const auto recorded = parse<RemoteOutcome>(as_sv(audit_row.at(4)));
      co_await rollback(*conn_res);
      co_return ok(recorded);
    }
    const auto suggestion_id = as_str(audit_row.at(0));
    const auto run_id = as_str(audit_row.at(1));
    const auto op = parse<MutationOp>(as_sv(audit_row.at(2)));

    const bool took_effect =
        op == MutationOp::AddLabel ? remote_present : !remote_present;
    const auto outcome =
        took_effect ? RemoteOutcome::Applied : RemoteOutcome::Absent;
    const auto now = now_millis();

    if (took_effect) {
      boost::mysql::results sug_res;
      co_await conn.async_execute(
          boost::mysql::with_params("SELECT status FROM suggestions WHERE "
                                    "suggestion_id={} FOR UPDATE",
                                    suggestion_id),
          sug_res, use_awaitable);
      if (!sug_res.rows().empty() &&
          parse<SuggestionStatus>(as_sv(sug_res.rows().at(0).at(0))) ==
              SuggestionStatus::Approved) {
        boost::mysql::results upd_sug;
        co_await conn.async_execute(
            boost::mysql::with_params(
                "UPDATE suggestions SET status={}, updated_at={} "
                "WHERE suggestion_id={}",
                to_string_view(SuggestionStatus::Applied), now,
                suggestion_id),
            upd_sug, use_awaitable);

        boost::mysql::results upd_run;
        co_await conn.async_execute(
            boost::mysql::with_params(
                "UPDATE processing_runs SET applied_items=applied_items+1, "
                "updated_at={} WHERE run_id={}",
                now, run_id),
            upd_run, use_awaitable);
      }
    }

    boost::mysql::results upd_audit;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "UPDATE audit_log SET synced=1, synced_at={}, remote_outcome={} "
            "WHERE audit_id={}",
            now, to_string_view(outcome), audit_id),
        upd_audit, use_awaitable);

    co_await commit(*conn_res);
    co_return ok(outcome);
  });
}

// === Folder cache ===

auto MySQLStateStore::put_folder_cache(const Principal &principal,
                                       std::span<const Folder> folders,
                                       TimePoint expires_at)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO folder_cache(principal, folders, cached_at, "
            "expires_at) VALUES({}, {}, {}, {}) "
            "ON DUPLICATE KEY UPDATE folders=VALUES(folders), "
            "cached_at=VALUES(cached_at), expires_at=VALUES(expires_at)",
            principal.str(), folders_to_json(folders), now_millis(),
            to_millis(expires_at)),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLStateStore::get_folder_cache(const Principal &principal,
                                       TimePoint now)
    -> task<Result<std::optional<std::vector<Folder>>>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<std::optional<std::vector<Folder>>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT folders, expires_at FROM folder_cache "
                "WHERE principal={}",
                principal.str()),
            res, use_awaitable);
        conn_res->return_without_reset();

        if (res.rows().empty()) {
          co_return ok(std::optional<std::vector<Folder>>{});
        }
        const auto row = res.rows().at(0);
        if (as_i64(row.at(1)) <= to_millis(now)) {
          co_return ok(std::optional<std::vector<Folder>>{});
        }
        auto folders = folders_from_json(as_sv(row.at(0)));
        if (!folders) {
          log::warn("Corrupt folder cache for user, treating as stale");
        }
        co_return ok(std::move(folders));
      });
}

// === Sessions ===

auto MySQLStateStore::save_session_record(const SessionInfo &info)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params(
            "INSERT INTO sessions({:r}) VALUES({}, {}, {}, {}, {}, {}, {}, {}) "
            "ON DUPLICATE KEY UPDATE state=VALUES(state), "
            "retry_count=VALUES(retry_count), "
            "last_activity=VALUES(last_activity)",
            kSessionColumns, info.id.str(), info.principal.str(),
            to_string_view(info.state), to_string_view(info.auth_mode),
            info.owner_pid, info.retry_count, to_millis(info.created_at),
            to_millis(info.last_activity)),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLStateStore::delete_session_record(const SessionId &id)
    -> task<Result<void>> {
  co_return co_await mysql_try([&]() -> task<Result<void>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }

    boost::mysql::results res;
    co_await conn_res->get().async_execute(
        boost::mysql::with_params("DELETE FROM sessions WHERE session_id={}",
                                  id.str()),
        res, use_awaitable);
    conn_res->return_without_reset();
    co_return ok();
  });
}

auto MySQLStateStore::list_session_records()
    -> task<Result<std::vector<SessionInfo>>> {
  co_return co_await mysql_try(
      [&]() -> task<Result<std::vector<SessionInfo>>> {
        auto conn_res = co_await get_connection();
        if (!conn_res) {
          co_return fail(conn_res.error());
        }

        boost::mysql::results res;
        co_await conn_res->get().async_execute(
            boost::mysql::with_params(
                "SELECT {:r} FROM sessions ORDER BY last_activity DESC",
                kSessionColumns),
            res, use_awaitable);
        conn_res->return_without_reset();

        std::vector<SessionInfo> out;
        out.reserve(res.rows().size());
        for (auto row : res.rows()) {
          out.push_back(to_session_info(row));
        }
        co_return ok(std::move(out));
      });
}

// === Maintenance ===

auto MySQLStateStore::cleanup(TimePoint cutoff)
    -> task<Result<CleanupReport>> {
  co_return co_await mysql_try([&]() -> task<Result<CleanupReport>> {
    auto conn_res = co_await get_connection();
    if (!conn_res) {
      co_return fail(conn_res.error());
    }
    auto &conn = conn_res->get();
    const auto cutoff_ms = to_millis(cutoff);

    boost::mysql::results tx_res;
    co_await conn.async_execute("START TRANSACTION", tx_res, use_awaitable);

    CleanupReport report;

    boost::mysql::results audit_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "DELETE FROM audit_log WHERE synced=1 AND synced_at < {}",
            cutoff_ms),
        audit_res, use_awaitable);
    report.audit_entries = static_cast<std::size_t>(audit_res.affected_rows());

    boost::mysql::results run_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "DELETE FROM processing_runs WHERE status IN ({}, {}) "
            "AND finished_at > 0 AND finished_at < {}",
            to_string_view(RunStatus::Completed),
            to_string_view(RunStatus::Failed), cutoff_ms),
        run_res, use_awaitable);
    report.runs = static_cast<std::size_t>(run_res.affected_rows());

    boost::mysql::results session_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "DELETE FROM sessions WHERE last_activity < {}", cutoff_ms),
        session_res, use_awaitable);
    report.session_records =
        static_cast<std::size_t>(session_res.affected_rows());

    boost::mysql::results cache_res;
    co_await conn.async_execute(
        boost::mysql::with_params(
            "DELETE FROM folder_cache WHERE expires_at < {}", now_millis()),
        cache_res, use_awaitable);
    report.cache_entries = static_cast<std::size_t>(cache_res.affected_rows());

    co_await commit(*conn_res);
    co_return ok(report);
  });
}

} // namespace mailsync::storage
