#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

#include "hailstone/common/diagnostic.hpp"
#include "hailstone/common/integer.hpp"
#include "hailstone/orbit/orbit_record.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace hailstone::store {

inline constexpr std::string_view kInMemoryPath = ":memory:";

// SQLite table of orbit records keyed by start value. Writing a start that is
// already stored replaces the old row.
//
// Sequences are stored as comma-separated text ("1,4,2"), op tallies as
// "op=count" pairs ("d2=1,m3a1=1").
class RecordStore {
 public:
  // Opens (creating if needed) the database and the orbit_info table. Parent
  // directories of `path` are created. kInMemoryPath opens a private
  // in-memory database.
  static auto Open(const std::filesystem::path& path) -> Result<RecordStore>;

  auto Put(const orbit::OrbitRecord& record) -> Result<void>;

  // All-or-nothing: one transaction, rolled back on the first failure.
  auto PutAll(std::span<const orbit::OrbitRecord> records) -> Result<void>;

  auto Get(Value start) -> Result<std::optional<orbit::OrbitRecord>>;

  auto Count() -> Result<std::size_t>;

 private:
  struct DatabaseCloser {
    void operator()(sqlite3* db) const;
  };
  struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const;
  };
  using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

  explicit RecordStore(sqlite3* db) : db_(db) {
  }

  auto Exec(const char* sql) -> Result<void>;
  auto Prepare(const char* sql) -> Result<Statement>;
  auto Insert(sqlite3_stmt* stmt, const orbit::OrbitRecord& record)
      -> Result<void>;
  [[nodiscard]] auto Error(std::string_view action) const -> Diagnostic;

  std::unique_ptr<sqlite3, DatabaseCloser> db_;
};

}  // namespace hailstone::store
