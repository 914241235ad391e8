#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "model/receipt.hpp"

namespace joule_gate::ledger {

class LedgerError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Append-only record of admitted runs. add() returns only once the record is
// durable and throws LedgerError otherwise. A failed write leaves no record
// and keeps its id. A failed fsync leaves the line in the file; re-adding the
// same fields only re-syncs it and returns the original id.
class ReceiptLedger {
 public:
  virtual std::uint64_t add(const model::receipt_fields& fields) = 0;
  virtual std::size_t size() const = 0;
  virtual ~ReceiptLedger() = default;
};

// One JSON object per line, appended with O_APPEND and fsync'd.
class FileReceiptLedger final : public ReceiptLedger {
 public:
  using SyncFunction = std::function<int(int fd)>;

  explicit FileReceiptLedger(std::filesystem::path path, bool sync = true, SyncFunction sync_fn = nullptr);

  std::uint64_t add(const model::receipt_fields& fields) override;
  std::size_t size() const override;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
  [[nodiscard]] std::uint64_t next_id() const;

 private:
  struct UnsyncedRecord {
    std::uint64_t id{0};
    std::string fields_line;
  };

  void recover();
  bool sync_existing_file() const;

  std::filesystem::path path_;
  bool sync_{true};
  SyncFunction sync_fn_;
  mutable std::mutex mutex_;
  std::uint64_t next_id_{1};
  std::size_t count_{0};
  bool needs_newline_{false};
  std::optional<UnsyncedRecord> unsynced_{};
};

std::vector<model::receipt> read_receipts(const std::filesystem::path& path);

// Newest `count` receipts, newest first.
std::vector<model::receipt> tail_receipts(const std::filesystem::path& path, std::size_t count);

}  // namespace joule_gate::ledger
