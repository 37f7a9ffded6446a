#include "lifecycle/lock_record.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>

#include "common/constants.hpp"
#include "common/logging.hpp"

namespace whiz::lifecycle {

namespace fs = std::filesystem;

auto unix_now() -> double {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

namespace {

// 整行必须被完整解析，否则视为格式错误
template <typename T>
auto parse_full(const std::string& line, T& out) -> bool {
  std::istringstream iss(line);
  iss >> out;
  if (iss.fail()) {
    return false;
  }
  iss >> std::ws;
  return iss.eof();
}

}  // namespace

LockRecordStore::LockRecordStore(fs::path path) : path_(std::move(path)) {}

auto LockRecordStore::defaultPathFor(const std::string& app_name,
                                     const std::optional<fs::path>& directory)
    -> fs::path {
  fs::path base;
  if (directory) {
    base = *directory;
  } else {
    std::error_code ec;
    base = fs::temp_directory_path(ec);
    if (ec) {
      LOG_WARNING << "Cannot determine temp directory (" << ec.message()
                  << "), using current directory";
      base = ".";
    }
  }
  return base / (app_name + constants::kLockFileSuffix);
}

auto LockRecordStore::read() const -> std::optional<LockRecord> {
  std::ifstream file(path_);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::string pid_line;
  std::string time_line;
  if (!std::getline(file, pid_line) || !std::getline(file, time_line)) {
    LOG_DEBUG << "Lock file " << path_ << " is truncated";
    return std::nullopt;
  }

  std::string extra;
  while (std::getline(file, extra)) {
    if (extra.find_first_not_of(" \t\r") != std::string::npos) {
      LOG_DEBUG << "Lock file " << path_ << " has trailing content";
      return std::nullopt;
    }
  }

  LockRecord record;
  long long pid = 0;
  if (!parse_full(pid_line, pid) || pid <= 0 ||
      pid > static_cast<long long>(
                std::numeric_limits<common::ProcessId>::max()) ||
      !parse_full(time_line, record.acquired_at)) {
    LOG_DEBUG << "Lock file " << path_ << " is malformed";
    return std::nullopt;
  }
  record.owner_pid = static_cast<common::ProcessId>(pid);
  return record;
}

auto LockRecordStore::write(const LockRecord& record) const
    -> LockRecordResult<void> {
  fs::path tmp_path = path_;
  tmp_path += ".tmp";

  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file.is_open()) {
      return tl::make_unexpected(
          LockRecordError{"Cannot open " + tmp_path.string() + " for writing"});
    }
    file << record.owner_pid << '\n'
         << std::fixed << std::setprecision(6) << record.acquired_at;
    file.flush();
    if (!file) {
      return tl::make_unexpected(
          LockRecordError{"Failed to write " + tmp_path.string()});
    }
  }

  std::error_code ec;
  fs::rename(tmp_path, path_, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp_path, ignored);
    return tl::make_unexpected(LockRecordError{
        "Failed to move lock record into place: " + ec.message()});
  }
  return {};
}

auto LockRecordStore::remove() const -> LockRecordResult<void> {
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    return tl::make_unexpected(LockRecordError{
        "Failed to remove " + path_.string() + ": " + ec.message()});
  }
  return {};
}

auto LockRecordStore::exists() const -> bool {
  std::error_code ec;
  return fs::exists(path_, ec);
}

auto LockRecordStore::makeCurrent() -> LockRecord {
  return LockRecord{common::current_process_id(), unix_now()};
}

auto LockRecordStore::isStale(const LockRecord& record,
                              std::chrono::seconds timeout) -> bool {
  if (!common::is_process_running(record.owner_pid)) {
    return true;
  }
  const double age = unix_now() - record.acquired_at;
  return age > static_cast<double>(timeout.count());
}

}  // namespace whiz::lifecycle
