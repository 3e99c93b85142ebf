#pragma once

#include <string>

namespace cintel::core {

// Timestamp source, injected so traces and document records are reproducible in tests.
class IClock {
 public:
  virtual ~IClock() = default;

  // ISO 8601 UTC, never empty.
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
};

class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}

  std::string now_iso8601() override { return fixed_time_; }

 private:
  std::string fixed_time_;
};

}  // namespace cintel::core
