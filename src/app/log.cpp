#include <vigil/app/log.hpp>
#include <array>
#include <atomic>
#include <cstddef>
#include <iostream>
#include <mutex>

namespace vigil::app::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_write_mutex;

constexpr std::size_t kLevelCount = 4;

}  // namespace

void set_level(Level level) noexcept { g_level.store(level); }

Level level() noexcept { return g_level.load(); }

std::optional<Level> parse_level(std::string_view name) noexcept {
  if (name == "debug") return Level::Debug;
  if (name == "info") return Level::Info;
  if (name == "warning" || name == "warn") return Level::Warning;
  if (name == "error") return Level::Error;
  return std::nullopt;
}

bool LogStream::enabled() const noexcept {
  return static_cast<std::uint8_t>(level_) >= static_cast<std::uint8_t>(g_level.load());
}

std::ostringstream& LogStream::pending() {
  thread_local std::array<std::ostringstream, kLevelCount> lines;
  return lines[static_cast<std::size_t>(level_)];
}

LogStream& LogStream::operator<<(const LogStreamEndLine&) {
  std::ostringstream& line = pending();
  if (enabled()) {
    std::lock_guard lock(g_write_mutex);
    (*out_) << "[ " << prefix_ << " ] " << line.str() << std::endl;
  }
  line.str({});
  line.clear();
  return *this;
}

LogStream debug(Level::Debug, "DEBUG", std::clog);
LogStream info(Level::Info, "INFO", std::clog);
LogStream warn(Level::Warning, "WARNING", std::clog);
LogStream err(Level::Error, "ERROR", std::cerr);

}  // namespace vigil::app::log
