#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

// Error taxonomy for the audit ledger.
// encoding_error and validation_error are caller bugs and fail fast.
// append_error is transient; the whole append may be retried.
// sequence_conflict means the single-writer guarantee was broken.
// integrity_violation is raised while the ledger is frozen after a failed
// verification.
namespace auditchain::common {

enum class error_code : uint16_t {
  encoding_error = 1,
  append_error = 2,
  sequence_conflict = 3,
  validation_error = 4,
  integrity_violation = 5,
};

std::string_view to_string(error_code code);

class error : public std::runtime_error {
 public:
  error(const error_code code, const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  error_code code() const noexcept { return code_; }

 private:
  error_code code_;
};

class encoding_error final : public error {
 public:
  explicit encoding_error(const std::string& message)
      : error{error_code::encoding_error, message} {}
};

class append_error final : public error {
 public:
  explicit append_error(const std::string& message)
      : error{error_code::append_error, message} {}
};

class sequence_conflict final : public error {
 public:
  sequence_conflict(const uint64_t expected, const uint64_t actual)
      : error{error_code::sequence_conflict,
              "sequence conflict: expected " + std::to_string(expected) +
                  ", got " + std::to_string(actual)},
        expected_{expected},
        actual_{actual} {}

  explicit sequence_conflict(const std::string& message)
      : error{error_code::sequence_conflict, message} {}

  std::optional<uint64_t> expected() const noexcept { return expected_; }
  std::optional<uint64_t> actual() const noexcept { return actual_; }

 private:
  std::optional<uint64_t> expected_;
  std::optional<uint64_t> actual_;
};

class validation_error final : public error {
 public:
  explicit validation_error(const std::string& message)
      : error{error_code::validation_error, message} {}
};

class integrity_violation final : public error {
 public:
  integrity_violation(const uint64_t first_invalid_sequence,
                      const std::string& message)
      : error{error_code::integrity_violation, message},
        first_invalid_sequence_{first_invalid_sequence} {}

  uint64_t first_invalid_sequence() const noexcept {
    return first_invalid_sequence_;
  }

 private:
  uint64_t first_invalid_sequence_{};
};

}  // namespace auditchain::common
