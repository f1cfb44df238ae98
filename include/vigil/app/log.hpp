#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string_view>

namespace vigil::app::log {

/// Minimum severity written by the process-wide log streams.
enum class Level : std::uint8_t {
  Debug,
  Info,
  Warning,
  Error,
};

/// Sets the process-wide minimum level (default: Info).
void set_level(Level level) noexcept;
[[nodiscard]] Level level() noexcept;

/// Parses debug | info | warning | error; nullopt otherwise.
[[nodiscard]] std::optional<Level> parse_level(std::string_view name) noexcept;

/// End-of-line marker: terminates the message and writes it out.
class LogStreamEndLine {};

inline constexpr LogStreamEndLine endl;

/// Leveled stream logger: `log::info << "frame " << id << log::endl;`
///
/// Each thread accumulates its own line; the completed line is written under a
/// lock as "[ LEVEL ] message", so lines from worker threads never interleave.
class LogStream {
 public:
  LogStream(Level level, std::string_view prefix, std::ostream& out) noexcept
      : level_(level), prefix_(prefix), out_(&out) {}

  template <class T>
  LogStream& operator<<(const T& arg) {
    if (enabled()) {
      pending() << arg;
    }
    return *this;
  }

  LogStream& operator<<(const LogStreamEndLine&);

  [[nodiscard]] bool enabled() const noexcept;

 private:
  std::ostringstream& pending();

  Level level_;
  std::string_view prefix_;
  std::ostream* out_;
};

extern LogStream debug;
extern LogStream info;
extern LogStream warn;
extern LogStream err;

}  // namespace vigil::app::log
