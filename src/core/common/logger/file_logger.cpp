#include "core/common/logger/logger.hpp"

#include <iostream>
#include <sstream>
#include <utility>

#include "core/common/utils/time_utils.hpp"

namespace devinv::core::common::log {

const char* ToString(Level level) {
  switch (level) {
    case Level::Trace: return "TRACE";
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
    case Level::Fatal: return "FATAL";
  }
  return "UNKNOWN";
}

std::optional<Level> ParseLevel(std::string_view s) {
  std::string t(s);
  for (char& c : t) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  if (t == "trace") return Level::Trace;
  if (t == "debug") return Level::Debug;
  if (t == "info") return Level::Info;
  if (t == "warn" || t == "warning") return Level::Warn;
  if (t == "error") return Level::Error;
  if (t == "fatal") return Level::Fatal;
  return std::nullopt;
}

std::string FormatLine(const Event& e) {
  std::ostringstream oss;
  oss << time::FormatIso8601Utc(e.ts) << " [" << ToString(e.level) << "]";
  if (!e.tag.empty()) oss << " [" << e.tag << "]";
  oss << " " << e.message << "\n";
  return oss.str();
}

Logger::Logger(std::shared_ptr<Sink> sink) : sink_(std::move(sink)) {}

void Logger::SetLevel(Level level) {
  level_.store(level, std::memory_order_relaxed);
}

Level Logger::GetLevel() const {
  return level_.load(std::memory_order_relaxed);
}

bool Logger::Enabled(Level level) const {
  return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(GetLevel());
}

void Logger::Log(Level level, std::string_view msg) {
  Log(level, std::string_view{}, msg);
}

void Logger::Log(Level level, std::string_view tag, std::string_view msg) {
  if (!sink_ || !Enabled(level)) return;

  Event e;
  e.level = level;
  e.ts = std::chrono::system_clock::now();
  e.tag.assign(tag.data(), tag.size());
  e.message.assign(msg.data(), msg.size());
  sink_->Write(e);
}

void Logger::Trace(std::string_view msg) { Log(Level::Trace, msg); }
void Logger::Debug(std::string_view msg) { Log(Level::Debug, msg); }
void Logger::Info(std::string_view msg) { Log(Level::Info, msg); }
void Logger::Warn(std::string_view msg) { Log(Level::Warn, msg); }
void Logger::Error(std::string_view msg) { Log(Level::Error, msg); }
void Logger::Fatal(std::string_view msg) { Log(Level::Fatal, msg); }

void Logger::Flush() {
  if (sink_) sink_->Flush();
}

FileSink::FileSink(std::filesystem::path file_path)
    : file_path_(std::move(file_path)), out_(file_path_, std::ios::out | std::ios::app) {}

bool FileSink::IsOpen() const {
  std::lock_guard<std::mutex> lk(mu_);
  return out_.is_open();
}

void FileSink::Write(const Event& e) {
  const std::string line = FormatLine(e);
  std::lock_guard<std::mutex> lk(mu_);
  if (!out_) return;
  out_ << line;
  if (e.level >= Level::Warn) out_.flush();
}

void FileSink::Flush() {
  std::lock_guard<std::mutex> lk(mu_);
  out_.flush();
}

ConsoleSink::ConsoleSink() : out_(std::cout) {}

ConsoleSink::ConsoleSink(std::ostream& out) : out_(out) {}

void ConsoleSink::Write(const Event& e) {
  const std::string line = FormatLine(e);
  std::lock_guard<std::mutex> lk(mu_);
  out_ << line;
}

void ConsoleSink::Flush() {
  std::lock_guard<std::mutex> lk(mu_);
  out_.flush();
}

}  // namespace devinv::core::common::log
