#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace devinv::core::common::log {

enum class Level : std::uint8_t {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Fatal = 5
};

const char* ToString(Level level);

// Accepts trace|debug|info|warn|warning|error|fatal, case-insensitive.
std::optional<Level> ParseLevel(std::string_view s);

struct Event {
  Level level{};
  std::chrono::system_clock::time_point ts{};
  std::string message;
  // Component that emitted the event ("store", "probe", "http"); may be empty.
  std::string tag;
};

// "<utc timestamp> [LEVEL] [tag] message\n"
std::string FormatLine(const Event& e);

class Sink {
public:
  virtual ~Sink() = default;
  virtual void Write(const Event& e) = 0;
  virtual void Flush() {}
};

// Shared by every component. Sinks are called outside the logger's lock; the
// level check is lock-free so filtered calls cost one atomic load.
class Logger {
public:
  explicit Logger(std::shared_ptr<Sink> sink);

  void SetLevel(Level level);
  Level GetLevel() const;
  bool Enabled(Level level) const;

  void Log(Level level, std::string_view msg);
  void Log(Level level, std::string_view tag, std::string_view msg);

  void Trace(std::string_view msg);
  void Debug(std::string_view msg);
  void Info(std::string_view msg);
  void Warn(std::string_view msg);
  void Error(std::string_view msg);
  void Fatal(std::string_view msg);

  void Flush();

private:
  std::atomic<Level> level_{Level::Info};
  std::shared_ptr<Sink> sink_;
};

// Appends to one file, kept open for the sink's lifetime.
class FileSink final : public Sink {
public:
  explicit FileSink(std::filesystem::path file_path);

  bool IsOpen() const;
  std::filesystem::path Path() const { return file_path_; }

  void Write(const Event& e) override;
  void Flush() override;

private:
  const std::filesystem::path file_path_;
  mutable std::mutex mu_;
  std::ofstream out_;
};

class ConsoleSink final : public Sink {
public:
  ConsoleSink();
  explicit ConsoleSink(std::ostream& out);

  void Write(const Event& e) override;
  void Flush() override;

private:
  std::mutex mu_;
  std::ostream& out_;
};

}  // namespace devinv::core::common::log
