#include "ledger/receipt_ledger.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

#include "core/timestamp.hpp"

namespace joule_gate::ledger {

namespace {

std::string errno_message(const std::string& what) { return what + ": " + std::strerror(errno); }

bool write_all(const int fd, const std::string& data) noexcept {
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t result = ::write(fd, data.data() + written, data.size() - written);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<std::size_t>(result);
  }
  return true;
}

template <typename Visitor>
void for_each_record(const std::filesystem::path& path, Visitor&& visit) {
  std::ifstream input(path);
  if (!input.is_open()) {
    return;
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }

    try {
      visit(model::receipt_from_json(nlohmann::json::parse(line)));
    } catch (const std::exception& ex) {
      std::cerr << "[ledger] skipping unreadable record at " << path.string() << ':' << line_number << ": "
                << ex.what() << '\n';
    }
  }
}

}  // namespace

FileReceiptLedger::FileReceiptLedger(std::filesystem::path path, const bool sync, SyncFunction sync_fn)
    : path_(std::move(path)), sync_(sync), sync_fn_(std::move(sync_fn)) {
  if (!sync_fn_) {
    sync_fn_ = [](const int fd) { return ::fsync(fd); };
  }
  if (path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw LedgerError("unable to create ledger directory " + path_.parent_path().string() + ": " + ec.message());
    }
  }
  recover();
}

void FileReceiptLedger::recover() {
  std::uint64_t max_id = 0;
  std::size_t count = 0;
  for_each_record(path_, [&](const model::receipt& receipt) {
    max_id = std::max(max_id, receipt.id);
    ++count;
  });
  next_id_ = max_id + 1;
  count_ = count;

  // A crash mid-append leaves a line without its terminator.
  std::ifstream input(path_, std::ios::binary | std::ios::ate);
  if (input.is_open() && input.tellg() > 0) {
    input.seekg(-1, std::ios::end);
    char last = '\n';
    input.get(last);
    needs_newline_ = last != '\n';
    if (needs_newline_) {
      std::cerr << "[ledger] repairing torn final record in " << path_.string() << '\n';
    }
  }
}

bool FileReceiptLedger::sync_existing_file() const {
  const int fd = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }
  const bool synced = sync_fn_(fd) == 0;
  const int sync_errno = errno;
  ::close(fd);
  errno = sync_errno;
  return synced;
}

std::uint64_t FileReceiptLedger::add(const model::receipt_fields& fields) {
  std::lock_guard<std::mutex> lock(mutex_);

  model::receipt record{};
  record.fields = fields;

  std::string fields_line;
  std::string line;
  try {
    fields_line = model::to_json_line(record);
    record.id = next_id_;
    record.timestamp = core::unix_seconds_now();
    line = model::to_json_line(record);
  } catch (const nlohmann::json::exception& ex) {
    throw LedgerError("unable to serialize receipt for " + fields.task_name + ": " + ex.what());
  }

  if (unsynced_.has_value()) {
    if (unsynced_->fields_line == fields_line) {
      // Same receipt as the one whose fsync failed: its line is already in the file.
      if (!sync_ || sync_existing_file()) {
        const std::uint64_t id = unsynced_->id;
        unsynced_.reset();
        return id;
      }
      throw LedgerError(errno_message("ledger fsync retry failed for " + path_.string()));
    }
    std::cerr << "[ledger] receipt #" << unsynced_->id << " was written but never confirmed durable\n";
    unsynced_.reset();
  }

  line.push_back('\n');
  if (needs_newline_) {
    line.insert(line.begin(), '\n');
  }

  const int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw LedgerError(errno_message("unable to open ledger " + path_.string()));
  }

  const bool wrote = write_all(fd, line);
  const int write_errno = errno;
  const bool synced = wrote && (!sync_ || sync_fn_(fd) == 0);
  const int sync_errno = errno;
  ::close(fd);

  if (!wrote) {
    // A short write may have left a fragment behind.
    needs_newline_ = true;
    errno = write_errno;
    throw LedgerError(errno_message("ledger append failed for " + path_.string()));
  }
  needs_newline_ = false;
  ++count_;
  const std::uint64_t id = next_id_++;

  if (!synced) {
    unsynced_ = UnsyncedRecord{id, std::move(fields_line)};
    errno = sync_errno;
    throw LedgerError(errno_message("ledger fsync failed for " + path_.string()));
  }
  return id;
}

std::size_t FileReceiptLedger::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_;
}

std::uint64_t FileReceiptLedger::next_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_id_;
}

std::vector<model::receipt> read_receipts(const std::filesystem::path& path) {
  std::vector<model::receipt> receipts;
  for_each_record(path, [&receipts](const model::receipt& receipt) { receipts.push_back(receipt); });
  return receipts;
}

std::vector<model::receipt> tail_receipts(const std::filesystem::path& path, const std::size_t count) {
  std::vector<model::receipt> receipts = read_receipts(path);
  std::sort(receipts.begin(), receipts.end(),
            [](const model::receipt& a, const model::receipt& b) { return a.id > b.id; });
  if (receipts.size() > count) {
    receipts.resize(count);
  }
  return receipts;
}

}  // namespace joule_gate::ledger
