#include "hailstone/store/record_store.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <sqlite3.h>

namespace hailstone::store {

namespace fs = std::filesystem;

namespace {

constexpr const char* kCreateTableSql = R"(
CREATE TABLE IF NOT EXISTS orbit_info (
  start INTEGER PRIMARY KEY,
  first_drop INTEGER,
  first_orbit TEXT NOT NULL,
  total_orbit TEXT NOT NULL,
  stop_mod INTEGER,
  stop_index INTEGER,
  first_op_ids TEXT NOT NULL,
  first_op_counts TEXT NOT NULL,
  total_op_ids TEXT NOT NULL,
  total_op_counts TEXT NOT NULL
))";

constexpr const char* kInsertSql = R"(
INSERT OR REPLACE INTO orbit_info (
  start, first_drop, first_orbit, total_orbit, stop_mod, stop_index,
  first_op_ids, first_op_counts, total_op_ids, total_op_counts
) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10))";

constexpr const char* kSelectSql = R"(
SELECT start, first_drop, first_orbit, total_orbit, stop_mod, stop_index,
       first_op_ids, first_op_counts, total_op_ids, total_op_counts
FROM orbit_info WHERE start = ?1)";

constexpr const char* kCountSql = "SELECT COUNT(*) FROM orbit_info";

template <typename Range>
auto JoinFields(const Range& fields) -> std::string {
  return fmt::format("{}", fmt::join(fields, ","));
}

auto FormatCounts(const orbit::OpCounts& counts) -> std::string {
  std::vector<std::string> pairs;
  pairs.reserve(counts.size());
  for (const auto& [op_id, count] : counts) {
    pairs.push_back(fmt::format("{}={}", op_id, count));
  }
  return JoinFields(pairs);
}

auto SplitFields(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> fields;
  if (text.empty()) {
    return fields;
  }
  std::size_t begin = 0;
  while (true) {
    std::size_t comma = text.find(',', begin);
    fields.push_back(text.substr(begin, comma - begin));
    if (comma == std::string_view::npos) {
      break;
    }
    begin = comma + 1;
  }
  return fields;
}

template <typename T>
auto ParseNumber(std::string_view field) -> std::optional<T> {
  T value{};
  const char* last = field.data() + field.size();
  auto [ptr, ec] = std::from_chars(field.data(), last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

auto ParseValues(std::string_view text) -> Result<std::vector<Value>> {
  std::vector<Value> values;
  for (std::string_view field : SplitFields(text)) {
    auto value = ParseNumber<Value>(field);
    if (!value) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format("malformed orbit value '{}' in store", field)));
    }
    values.push_back(*value);
  }
  return values;
}

auto ParseOpIds(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> op_ids;
  for (std::string_view field : SplitFields(text)) {
    op_ids.emplace_back(field);
  }
  return op_ids;
}

auto ParseCounts(std::string_view text) -> Result<orbit::OpCounts> {
  orbit::OpCounts counts;
  for (std::string_view field : SplitFields(text)) {
    std::size_t eq = field.find('=');
    std::optional<std::size_t> count;
    if (eq != std::string_view::npos) {
      count = ParseNumber<std::size_t>(field.substr(eq + 1));
    }
    if (!count) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format("malformed op count '{}' in store", field)));
    }
    counts[std::string(field.substr(0, eq))] = *count;
  }
  return counts;
}

auto ColumnText(sqlite3_stmt* stmt, int column) -> std::string_view {
  const auto* text =
      reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
  if (text == nullptr) {
    return {};
  }
  return {text, static_cast<std::size_t>(sqlite3_column_bytes(stmt, column))};
}

auto ColumnOptional(sqlite3_stmt* stmt, int column)
    -> std::optional<uint64_t> {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(sqlite3_column_int64(stmt, column));
}

void BindText(sqlite3_stmt* stmt, int index, const std::string& text) {
  sqlite3_bind_text(
      stmt, index, text.c_str(), static_cast<int>(text.size()),
      SQLITE_TRANSIENT);
}

template <typename T>
void BindOptional(sqlite3_stmt* stmt, int index, const std::optional<T>& v) {
  if (v) {
    sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(*v));
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

}  // namespace

void RecordStore::DatabaseCloser::operator()(sqlite3* db) const {
  sqlite3_close(db);
}

void RecordStore::StatementFinalizer::operator()(sqlite3_stmt* stmt) const {
  sqlite3_finalize(stmt);
}

auto RecordStore::Open(const fs::path& path) -> Result<RecordStore> {
  if (path != fs::path(kInMemoryPath) && path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "cannot create directory '{}': {}",
                  path.parent_path().string(), ec.message())));
    }
  }

  sqlite3* raw = nullptr;
  int rc = sqlite3_open_v2(
      path.string().c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
      nullptr);
  // sqlite3_open_v2 hands back a handle even on failure; it must be closed.
  RecordStore store(raw);
  if (rc != SQLITE_OK) {
    return std::unexpected(
        store.Error(fmt::format("cannot open database '{}'", path.string())));
  }

  if (auto created = store.Exec(kCreateTableSql); !created) {
    return std::unexpected(std::move(created.error()));
  }
  return store;
}

auto RecordStore::Put(const orbit::OrbitRecord& record) -> Result<void> {
  auto stmt = Prepare(kInsertSql);
  if (!stmt) {
    return std::unexpected(std::move(stmt.error()));
  }
  return Insert(stmt->get(), record);
}

auto RecordStore::PutAll(std::span<const orbit::OrbitRecord> records)
    -> Result<void> {
  auto stmt = Prepare(kInsertSql);
  if (!stmt) {
    return std::unexpected(std::move(stmt.error()));
  }
  if (auto begun = Exec("BEGIN"); !begun) {
    return begun;
  }

  for (const auto& record : records) {
    auto inserted = Insert(stmt->get(), record);
    if (!inserted) {
      if (auto rolled_back = Exec("ROLLBACK"); !rolled_back) {
        return std::unexpected(
            std::move(inserted.error())
                .WithNote(rolled_back.error().primary.message));
      }
      return inserted;
    }
    sqlite3_reset(stmt->get());
    sqlite3_clear_bindings(stmt->get());
  }

  return Exec("COMMIT");
}

auto RecordStore::Get(Value start)
    -> Result<std::optional<orbit::OrbitRecord>> {
  auto stmt = Prepare(kSelectSql);
  if (!stmt) {
    return std::unexpected(std::move(stmt.error()));
  }
  sqlite3_bind_int64(stmt->get(), 1, static_cast<sqlite3_int64>(start));

  int rc = sqlite3_step(stmt->get());
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    return std::unexpected(Error(fmt::format("cannot read start {}", start)));
  }

  sqlite3_stmt* row = stmt->get();
  orbit::OrbitRecord record{
      .start = static_cast<Value>(sqlite3_column_int64(row, 0))};
  if (auto first_drop = ColumnOptional(row, 1)) {
    record.first_drop_length = static_cast<std::size_t>(*first_drop);
  }
  record.stop_mod = ColumnOptional(row, 4);
  record.stop_index = ColumnOptional(row, 5);
  record.first_op_ids = ParseOpIds(ColumnText(row, 6));
  record.total_op_ids = ParseOpIds(ColumnText(row, 8));

  auto first_orbit = ParseValues(ColumnText(row, 2));
  auto total_orbit = ParseValues(ColumnText(row, 3));
  auto first_counts = ParseCounts(ColumnText(row, 7));
  auto total_counts = ParseCounts(ColumnText(row, 9));
  if (!first_orbit) {
    return std::unexpected(std::move(first_orbit.error()));
  }
  if (!total_orbit) {
    return std::unexpected(std::move(total_orbit.error()));
  }
  if (!first_counts) {
    return std::unexpected(std::move(first_counts.error()));
  }
  if (!total_counts) {
    return std::unexpected(std::move(total_counts.error()));
  }
  record.first_orbit = std::move(*first_orbit);
  record.total_orbit = std::move(*total_orbit);
  record.first_op_counts = std::move(*first_counts);
  record.total_op_counts = std::move(*total_counts);
  return record;
}

auto RecordStore::Count() -> Result<std::size_t> {
  auto stmt = Prepare(kCountSql);
  if (!stmt) {
    return std::unexpected(std::move(stmt.error()));
  }
  if (sqlite3_step(stmt->get()) != SQLITE_ROW) {
    return std::unexpected(Error("cannot count records"));
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt->get(), 0));
}

auto RecordStore::Exec(const char* sql) -> Result<void> {
  char* message = nullptr;
  int rc = sqlite3_exec(db_.get(), sql, nullptr, nullptr, &message);
  if (rc != SQLITE_OK) {
    std::string detail = message != nullptr ? message : sqlite3_errstr(rc);
    sqlite3_free(message);
    return std::unexpected(
        Diagnostic::HostError(fmt::format("sqlite: {}", detail)));
  }
  return {};
}

auto RecordStore::Prepare(const char* sql) -> Result<Statement> {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return std::unexpected(Error("cannot prepare statement"));
  }
  return Statement(raw);
}

auto RecordStore::Insert(sqlite3_stmt* stmt, const orbit::OrbitRecord& record)
    -> Result<void> {
  constexpr auto kMaxKey =
      static_cast<Value>(std::numeric_limits<sqlite3_int64>::max());
  if (record.start > kMaxKey) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("start {} does not fit a database key", record.start)));
  }

  std::string first_orbit = JoinFields(record.first_orbit);
  std::string total_orbit = JoinFields(record.total_orbit);
  std::string first_ops = JoinFields(record.first_op_ids);
  std::string total_ops = JoinFields(record.total_op_ids);
  std::string first_counts = FormatCounts(record.first_op_counts);
  std::string total_counts = FormatCounts(record.total_op_counts);

  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(record.start));
  BindOptional(stmt, 2, record.first_drop_length);
  BindText(stmt, 3, first_orbit);
  BindText(stmt, 4, total_orbit);
  BindOptional(stmt, 5, record.stop_mod);
  BindOptional(stmt, 6, record.stop_index);
  BindText(stmt, 7, first_ops);
  BindText(stmt, 8, first_counts);
  BindText(stmt, 9, total_ops);
  BindText(stmt, 10, total_counts);

  if (sqlite3_step(stmt) != SQLITE_DONE) {
    return std::unexpected(
        Error(fmt::format("cannot store start {}", record.start)));
  }
  return {};
}

auto RecordStore::Error(std::string_view action) const -> Diagnostic {
  const char* detail =
      db_ != nullptr ? sqlite3_errmsg(db_.get()) : "out of memory";
  return Diagnostic::HostError(fmt::format("{}: {}", action, detail));
}

}  // namespace hailstone::store
