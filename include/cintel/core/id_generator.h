#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace cintel::core {

// ID source for documents, traces and trace events.
// Contract: next(prefix) returns a non-empty ID starting with prefix.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// "<prefix>-<unix micros>-<counter>". Unique within the process, sortable by creation time.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator() = default;
  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

// "<prefix>-<counter>". Same call sequence, same IDs.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;
  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace cintel::core
