// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/logging.h"

#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "base/mutex.h"
#include "base/result.h"

namespace base {

static pid_t my_gettid() { return syscall(SYS_gettid); }

static int my_gettimeofday(struct timeval* tv, struct timezone* tz) {
  return gettimeofday(tv, tz);
}

inline namespace implementation {

static constexpr bool kDebugDefault =
#ifdef NDEBUG
    false
#else
    true
#endif
    ;

using Key = std::pair<const char*, unsigned int>;

struct KeyLess {
  bool operator()(const Key& a, const Key& b) const noexcept {
    int cmp = ::strcmp(a.first, b.first);
    return cmp < 0 || (cmp == 0 && a.second < b.second);
  }
};

using EveryNMap = std::map<Key, std::size_t, KeyLess>;
using TargetVec = std::vector<LogTarget*>;

static std::atomic_bool g_debug(kDebugDefault);
static std::mutex g_mu;
static level_t g_stderr = LOG_LEVEL_INFO;  // protected by g_mu
static GetTidFunc g_gtid = my_gettid;      // protected by g_mu
static GetTimeOfDayFunc g_gtod = my_gettimeofday;  // protected by g_mu

class LogSTDERR : public LogTarget {
 public:
  LogSTDERR() noexcept = default;
  bool want(const char* file, unsigned int line, level_t level) const override {
    // g_mu held by caller
    return level >= g_stderr;
  }
  void log(const LogEntry& entry) override {
    auto str = entry.as_string();
    const char* ptr = str.data();
    std::size_t len = str.size();
    while (len > 0) {
      ssize_t n = ::write(2, ptr, len);
      if (n < 0) {
        if (errno == EINTR) continue;
        break;
      }
      ptr += n;
      len -= n;
    }
  }
  void flush() override { ::fdatasync(2); }
};

// Leaked on purpose: logging may happen during static destruction.
static EveryNMap& every_n_map() {
  static EveryNMap& ref = *new EveryNMap;
  return ref;
}

static TargetVec& targets() {
  static TargetVec& ref = *new TargetVec{new LogSTDERR};
  return ref;
}

static void maybe_terminate(const LogEntry& entry) {
  if (entry.level >= LOG_LEVEL_FATAL) std::terminate();
  if (entry.level >= LOG_LEVEL_DFATAL && debug()) std::terminate();
}

static char level_char(level_t level) noexcept {
  if (level >= LOG_LEVEL_DFATAL) return 'F';
  if (level >= LOG_LEVEL_ERROR) return 'E';
  if (level >= LOG_LEVEL_WARN) return 'W';
  if (level >= LOG_LEVEL_INFO) return 'I';
  return 'D';
}

}  // inline namespace implementation

bool debug() noexcept { return g_debug.load(std::memory_order_relaxed); }

void set_debug(bool value) noexcept {
  g_debug.store(value, std::memory_order_relaxed);
}

LogEntry::LogEntry(const char* file, unsigned int line, level_t level,
                   std::string message)
    : time{0, 0},
      tid(0),
      file(file),
      line(line),
      level(level),
      message(std::move(message)) {
  auto lock = acquire_lock(g_mu);
  (*g_gtod)(&time, nullptr);
  tid = (*g_gtid)();
}

void LogEntry::append_to(std::string* out) const {
  struct tm tm;
  ::memset(&tm, 0, sizeof(tm));
  ::gmtime_r(&time.tv_sec, &tm);

  std::array<char, 32> buf;
  ::snprintf(buf.data(), buf.size(), "%c%02d%02d %02d:%02d:%02d.%06ld  ",
             level_char(level), tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
             tm.tm_min, tm.tm_sec, static_cast<long>(time.tv_usec));

  std::ostringstream o;
  o << buf.data() << tid << ' ' << (file ? file : "???") << ':' << line
    << "] " << message << '\n';
  out->append(o.str());
}

std::string LogEntry::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

Logger::Logger(const char* file, unsigned int line, unsigned int every_n,
               level_t level)
    : file_(file), line_(line), level_(level) {
  if (file == nullptr || line == 0 || every_n == 0) std::terminate();
  if (want(file, line, every_n, level)) ss_.reset(new std::ostringstream);
}

bool want(const char* file, unsigned int line, unsigned int n, level_t level) {
  if (level >= LOG_LEVEL_DFATAL) return true;
  auto lock = acquire_lock(g_mu);
  if (n > 1) {
    auto& count = every_n_map()[Key(file, line)];
    bool first = (count == 0);
    count = (count + 1) % n;
    if (!first) return false;
  }
  for (const LogTarget* target : targets()) {
    if (target->want(file, line, level)) return true;
  }
  return false;
}

void log(const LogEntry& entry) {
  {
    auto lock = acquire_lock(g_mu);
    if (entry) {
      for (LogTarget* target : targets()) {
        if (target->want(entry.file, entry.line, entry.level))
          target->log(entry);
      }
    }
    if (entry.level >= LOG_LEVEL_ERROR) {
      for (LogTarget* target : targets()) target->flush();
    }
  }
  maybe_terminate(entry);
}

void log_flush() {
  auto lock = acquire_lock(g_mu);
  for (LogTarget* target : targets()) target->flush();
}

void log_stderr_set_level(level_t level) {
  auto lock = acquire_lock(g_mu);
  g_stderr = level;
}

void log_target_add(LogTarget* target) {
  auto lock = acquire_lock(g_mu);
  if (target) targets().push_back(target);
}

void log_target_remove(LogTarget* target) {
  auto lock = acquire_lock(g_mu);
  auto& v = targets();
  v.erase(std::remove(v.begin(), v.end(), target), v.end());
}

void log_set_gettid(GetTidFunc func) {
  auto lock = acquire_lock(g_mu);
  g_gtid = func ? func : my_gettid;
}

void log_set_gettimeofday(GetTimeOfDayFunc func) {
  auto lock = acquire_lock(g_mu);
  g_gtod = func ? func : my_gettimeofday;
}

namespace internal {

Logger log_check(const char* file, unsigned int line, const char* expr,
                 bool cond) {
  if (cond) return Logger();
  Logger logger(file, line, 1, LOG_LEVEL_DFATAL);
  logger << "CHECK FAILED: " << expr;
  return logger;
}

Logger log_check_ok(const char* file, unsigned int line, const char* expr,
                    const Result& rslt) {
  if (rslt) return Logger();
  Logger logger(file, line, 1, LOG_LEVEL_DFATAL);
  logger << "CHECK FAILED: " << expr << ": " << rslt.as_string();
  return logger;
}

void log_check_null_failed(const char* file, unsigned int line,
                           const char* expr) {
  log(LogEntry(file, line, LOG_LEVEL_FATAL,
               std::string("CHECK FAILED: ") + expr + " != nullptr"));
  std::terminate();
}

}  // namespace internal

}  // namespace base
