#include <vigil/app/log.hpp>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace vlog = vigil::app::log;

namespace {

class LevelGuard {
 public:
  explicit LevelGuard(vlog::Level level) : saved_(vlog::level()) { vlog::set_level(level); }
  ~LevelGuard() { vlog::set_level(saved_); }

 private:
  vlog::Level saved_;
};

}  // namespace

TEST(Log, ParseLevel) {
  EXPECT_EQ(vlog::parse_level("debug"), vlog::Level::Debug);
  EXPECT_EQ(vlog::parse_level("info"), vlog::Level::Info);
  EXPECT_EQ(vlog::parse_level("warning"), vlog::Level::Warning);
  EXPECT_EQ(vlog::parse_level("error"), vlog::Level::Error);
  EXPECT_FALSE(vlog::parse_level("verbose").has_value());
}

TEST(Log, WritesPrefixedLine) {
  LevelGuard guard(vlog::Level::Info);
  std::ostringstream out;
  vlog::LogStream stream(vlog::Level::Info, "INFO", out);
  stream << "frame " << 3 << " ok" << vlog::endl;
  EXPECT_EQ(out.str(), "[ INFO ] frame 3 ok\n");
}

TEST(Log, BelowMinimumLevelIsDropped) {
  LevelGuard guard(vlog::Level::Warning);
  std::ostringstream out;
  vlog::LogStream stream(vlog::Level::Info, "INFO", out);
  EXPECT_FALSE(stream.enabled());
  stream << "hidden" << vlog::endl;
  EXPECT_TRUE(out.str().empty());
}

TEST(Log, LinesFromThreadsDoNotInterleave) {
  LevelGuard guard(vlog::Level::Debug);
  std::ostringstream out;
  vlog::LogStream stream(vlog::Level::Warning, "WARNING", out);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&stream, t] {
      for (int i = 0; i < 50; ++i) stream << "thread " << t << " line " << i << vlog::endl;
    });
  }
  for (auto& th : threads) th.join();

  std::istringstream lines(out.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    EXPECT_EQ(line.rfind("[ WARNING ] thread ", 0), 0u) << line;
    ++count;
  }
  EXPECT_EQ(count, 200);
}
