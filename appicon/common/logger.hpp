#pragma once
#include <array>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>
#include <utility>

namespace appicon {

// Ordered by severity; messages below the logger's minimum level are dropped.
enum class LogLevel { DEBUG, INFO, WARN, ERROR };

constexpr std::array<const char*, 4> kLevelNames{{"debug", "info", "warn", "error"}};

inline const char* level_str(LogLevel L) {
  switch(L){
    case LogLevel::DEBUG:return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR:return "ERROR";
  }
  return "INFO";
}

// Accepts the lower-case names in kLevelNames.
inline bool parse_level(const std::string& s, LogLevel& out) {
  for(size_t i=0;i<kLevelNames.size();++i){
    if(s==kLevelNames[i]){ out=(LogLevel)i; return true; }
  }
  return false;
}

// Line-oriented log: "[time] [LEVEL] tag: message".
// With a log file open, WARN and ERROR lines are also echoed to stderr so a
// failed run is visible on the console.
class Logger {
  std::mutex m_;
  std::string tag_;
  FILE* fp_{nullptr};
  LogLevel min_{LogLevel::INFO};
  bool echo_{true};
  std::array<unsigned, 4> counts_{};

  static void put(FILE* out, const char* stamp, LogLevel L, const std::string& tag, const char* msg){
    std::fprintf(out, "[%s] [%s] %s: %s\n", stamp, level_str(L), tag.c_str(), msg);
    std::fflush(out);
  }

public:
  explicit Logger(std::string tag = "appicon") : tag_(std::move(tag)) {}
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
  ~Logger(){ if(fp_) std::fclose(fp_); }

  // Sends later lines to path (truncated). On failure lines keep going to stderr.
  bool open(const std::string& path){
    std::lock_guard<std::mutex> lk(m_);
    if(fp_) std::fclose(fp_);
    fp_ = std::fopen(path.c_str(), "w");
    return fp_ != nullptr;
  }

  void set_min_level(LogLevel L){
    std::lock_guard<std::mutex> lk(m_);
    min_ = L;
  }

  void set_echo_problems(bool on){
    std::lock_guard<std::mutex> lk(m_);
    echo_ = on;
  }

  // Lines emitted at level L so far; filtered lines are not counted.
  unsigned count(LogLevel L){
    std::lock_guard<std::mutex> lk(m_);
    return counts_[(size_t)L];
  }

  void log(LogLevel L, const char* fmt, ...){
    char msg[1024];
    va_list args; va_start(args, fmt);
    std::vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lk(m_);
    if(L < min_) return;
    counts_[(size_t)L]++;
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
    if(!fp_){ put(stderr, stamp, L, tag_, msg); return; }
    put(fp_, stamp, L, tag_, msg);
    if(echo_ && L >= LogLevel::WARN) put(stderr, stamp, L, tag_, msg);
  }
};

} // namespace appicon
