#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <plotscope/logger.hpp>
#include <plotscope/sampler.hpp>
#include <string>
#include <unistd.h>
#include <vector>

using namespace plotscope;

// Captures every entry reaching the global logger while a test runs.
class LoggerFixture : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        auto& log = Logger::instance();
        saved_level_ = log.get_level();
        log.clear_sinks();
        log.add_sink([this](const Logger::LogEntry& e) { entries_.push_back(e); });
    }

    void TearDown() override
    {
        auto& log = Logger::instance();
        log.clear_sinks();
        log.set_level(saved_level_);
        ::unsetenv("PLOTSCOPE_LOG_LEVEL");
    }

    bool has_entry(LogLevel level, const std::string& category) const
    {
        return std::any_of(entries_.begin(),
                           entries_.end(),
                           [&](const Logger::LogEntry& e)
                           { return e.level == level && e.category == category; });
    }

    std::vector<Logger::LogEntry> entries_;
    LogLevel                      saved_level_ = LogLevel::Info;
};

TEST_F(LoggerFixture, LevelFiltering)
{
    Logger::instance().set_level(LogLevel::Warning);

    PLOTSCOPE_LOG_INFO("test", "dropped");
    PLOTSCOPE_LOG_WARN("test", "kept");
    PLOTSCOPE_LOG_ERROR("test", "kept too");

    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].message, "kept");
    EXPECT_EQ(entries_[1].level, LogLevel::Error);
}

TEST_F(LoggerFixture, FormatsPlaceholdersInOrder)
{
    Logger::instance().set_level(LogLevel::Trace);

    PLOTSCOPE_LOG_DEBUG("fmt", "{} of {} in '{}' ok={}", 3, size_t{7}, std::string("grid"), true);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "3 of 7 in 'grid' ok=true");
    EXPECT_EQ(entries_[0].category, "fmt");
}

TEST_F(LoggerFixture, ExtraPlaceholdersStayVerbatim)
{
    Logger::instance().set_level(LogLevel::Trace);
    PLOTSCOPE_LOG_INFO("fmt", "{} and {}", 'x');

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "x and {}");
}

TEST_F(LoggerFixture, FloatingPointArguments)
{
    Logger::instance().set_level(LogLevel::Info);
    PLOTSCOPE_LOG_WARN("fmt", "tolerance {} step {} depth {}", 0.5, 1e-9, -20);

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "tolerance 0.5 step 1e-09 depth -20");
}

TEST_F(LoggerFixture, FormatLine)
{
    Logger::LogEntry entry{std::chrono::system_clock::now(), LogLevel::Error, "grid", "ragged rows"};
    std::string      line = Logger::format_line(entry);

    EXPECT_NE(line.find(" ERROR [grid] ragged rows"), std::string::npos);
    // yyyy-mm-dd hh:mm:ss.mmm
    EXPECT_EQ(line.find(' '), 10u);
    EXPECT_EQ(line[19], '.');
}

TEST_F(LoggerFixture, LevelNames)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_from_string("Debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::level_from_string("warning"), LogLevel::Warning);
    EXPECT_FALSE(Logger::level_from_string("verbose").has_value());
}

TEST_F(LoggerFixture, ConfigureFromEnvironment)
{
    Logger::instance().set_level(LogLevel::Info);

    ::unsetenv("PLOTSCOPE_LOG_LEVEL");
    EXPECT_FALSE(Logger::instance().configure_from_env());

    ::setenv("PLOTSCOPE_LOG_LEVEL", "error", 1);
    EXPECT_TRUE(Logger::instance().configure_from_env());
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Error);

    ::setenv("PLOTSCOPE_LOG_LEVEL", "loud", 1);
    EXPECT_FALSE(Logger::instance().configure_from_env());
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Error);
}

TEST_F(LoggerFixture, NoSinksMeansSilence)
{
    Logger::instance().clear_sinks();
    Logger::instance().set_level(LogLevel::Trace);
    PLOTSCOPE_LOG_CRITICAL("test", "nobody listens");
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggerFixture, FileSinkAppends)
{
    auto path = std::filesystem::temp_directory_path()
                / ("plotscope_log_" + std::to_string(::getpid()) + ".txt");
    std::filesystem::remove(path);

    Logger::instance().add_sink(sinks::file_sink(path.string()));
    PLOTSCOPE_LOG_WARN("io", "first");
    PLOTSCOPE_LOG_WARN("io", "second");
    Logger::instance().clear_sinks();

    std::ifstream in(path);
    std::string   line1;
    std::string   line2;
    std::getline(in, line1);
    std::getline(in, line2);
    EXPECT_NE(line1.find("WARN [io] first"), std::string::npos);
    EXPECT_NE(line2.find("WARN [io] second"), std::string::npos);
    std::filesystem::remove(path);
}

// ─── Library diagnostics ────────────────────────────────────────────────────

TEST_F(LoggerFixture, SamplerWarnsAboutNonFiniteValues)
{
    Logger::instance().set_level(LogLevel::Warning);

    AdaptiveSampler sampler;
    sampler.sample({.function = [](double x) { return 1.0 / x; }, .interval = {-1.0, 1.0}});

    EXPECT_TRUE(has_entry(LogLevel::Warning, "sampler"));
}

TEST_F(LoggerFixture, SamplerQuietForFiniteFunctions)
{
    Logger::instance().set_level(LogLevel::Warning);

    AdaptiveSampler sampler;
    sampler.sample({.function = [](double x) { return x * x; }, .interval = {-1.0, 1.0}});

    EXPECT_TRUE(entries_.empty());
}
