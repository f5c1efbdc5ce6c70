#include "reclaim/util/Logger.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace reclaim::util {

static thread_local std::map<std::string, std::string> t_ctx;

const char* toString(LogLevel l) {
  switch (l) { case LogLevel::Trace: return "TRACE";
               case LogLevel::Debug: return "DEBUG";
               case LogLevel::Info:  return "INFO";
               case LogLevel::Warn:  return "WARN";
               case LogLevel::Error: return "ERROR"; }
  return "INFO";
}

LogLevel parseLevel(const std::string& s) {
  std::string x=s; for (auto& c:x) c=static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (x=="trace") return LogLevel::Trace;
  if (x=="debug") return LogLevel::Debug;
  if (x=="info")  return LogLevel::Info;
  if (x=="warn" || x=="warning") return LogLevel::Warn;
  if (x=="error") return LogLevel::Error;
  return LogLevel::Info;
}

Logger& logger() {
  static Logger L;
  return L;
}

Logger::Logger() {}

Logger::~Logger() {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = nullptr;
}

void Logger::setLevel(LogLevel lvl) {
  std::lock_guard<std::mutex> lk(mx_);
  lvl_ = lvl;
}

void Logger::setFormatJson(bool json) {
  std::lock_guard<std::mutex> lk(mx_);
  json_ = json;
}

void Logger::setFile(const std::string& path) {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = path.empty() ? stdout : static_cast<void*>(std::fopen(path.c_str(), "a"));
  if (!file_) file_ = stdout;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lk(mx_);
  return lvl_;
}

void Logger::log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  if (!enabled(lvl)) return;
  writeLine(lvl, msg, fields);
}

static std::string nowIso() {
  using namespace std::chrono;
  auto tp = system_clock::now();
  auto t = system_clock::to_time_t(tp);
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
  std::tm tm;
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

static void appendEscaped(std::ostringstream& oss, const std::string& s) {
  for (char c : s) {
    switch (c) {
      case '"':  oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\n': oss << "\\n"; break;
      case '\t': oss << "\\t"; break;
      default:   oss << c;
    }
  }
}

void Logger::writeLine(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  std::lock_guard<std::mutex> lk(mx_);
  FILE* f = static_cast<FILE*>(file_ ? file_ : stdout);

  if (json_) {
    std::ostringstream oss;
    oss << "{\"ts\":\"" << nowIso() << "\",\"lvl\":\"" << toString(lvl) << "\",\"msg\":\"";
    appendEscaped(oss, msg);
    oss << "\"";

    // thread ctx
    for (auto& kv : t_ctx) {
      oss << ",\"" << kv.first << "\":\"";
      appendEscaped(oss, kv.second);
      oss << "\"";
    }
    // ad hoc fields
    for (auto& kv : fields) {
      oss << ",\"" << kv.k << "\":\"";
      appendEscaped(oss, kv.v);
      oss << "\"";
    }
    oss << "}\n";
    const std::string line = oss.str();
    std::fwrite(line.c_str(), 1, line.size(), f);
  } else {
    std::fprintf(f, "[%s] %-5s %s", nowIso().c_str(), toString(lvl), msg.c_str());
    for (auto& kv : t_ctx) std::fprintf(f, " %s=%s", kv.first.c_str(), kv.second.c_str());
    for (auto& kv : fields) std::fprintf(f, " %s=%s", kv.k.c_str(), kv.v.c_str());
    std::fputc('\n', f);
  }
  std::fflush(f);
}

Logger::Scoped::Scoped(const std::vector<Field>& add) {
  for (auto& kv : add) {
    auto it = t_ctx.find(kv.k);
    if (it != t_ctx.end()) {
      saved_.push_back({kv.k, it->second});
      it->second = kv.v;
    } else {
      added_.push_back(kv.k);
      t_ctx.emplace(kv.k, kv.v);
    }
  }
}

Logger::Scoped::~Scoped() {
  for (auto& k : added_) t_ctx.erase(k);
  for (auto& kv : saved_) t_ctx[kv.k] = kv.v;
}

} // namespace reclaim::util
