#pragma once

#include "cintel/storage/sqlite/sqlite_db.h"
#include "cintel/storage/trace_log.h"

#include <memory>

namespace cintel::storage::sqlite {

class SqliteTraceLog final : public ITraceLog {
 public:
  explicit SqliteTraceLog(std::shared_ptr<SqliteDb> db);

  void append(const TraceEvent& event) override;
  [[nodiscard]] std::vector<TraceEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace cintel::storage::sqlite
