// Options tests
//
// load_options_from_env() against SCOPED_FORCE_FALLBACK and
// SCOPED_BULK_THRESHOLD. Each test saves and restores both the environment
// and Options.

#include "log/log.hpp"
#include "scoped/common.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace scoped;

namespace {

void set_env(const char* name, const std::string& value) {
#ifdef _WIN32
    _putenv_s(name, value.c_str());
#else
    setenv(name, value.c_str(), 1);
#endif
}

void unset_env(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

class WarnCapture : public log::LogSink {
public:
    void write(const log::LogRecord& record) override {
        if (record.level == log::LogLevel::Warn) {
            warnings.push_back(record.message);
        }
    }
    void flush() override {}

    std::vector<std::string> warnings;
};

} // namespace

class OptionsTest : public ::testing::Test {
protected:
    WarnCapture* capture = nullptr;

    void SetUp() override {
        saved_fallback_ = Options::force_fallback;
        saved_threshold_ = Options::bulk_extend_threshold;
        saved_fallback_env_ = read_env("SCOPED_FORCE_FALLBACK");
        saved_threshold_env_ = read_env("SCOPED_BULK_THRESHOLD");
        unset_env("SCOPED_FORCE_FALLBACK");
        unset_env("SCOPED_BULK_THRESHOLD");

        Options::force_fallback = false;
        Options::bulk_extend_threshold = 8;

        auto sink = std::make_unique<WarnCapture>();
        capture = sink.get();
        log::Logger::instance().clear_sinks();
        log::Logger::instance().add_sink(std::move(sink));
        log::Logger::instance().set_filter("options=warn,*=off");
    }

    void TearDown() override {
        restore("SCOPED_FORCE_FALLBACK", saved_fallback_env_);
        restore("SCOPED_BULK_THRESHOLD", saved_threshold_env_);
        Options::force_fallback = saved_fallback_;
        Options::bulk_extend_threshold = saved_threshold_;

        log::LogConfig config;
        config.console = false;
        log::Logger::init(config);
    }

private:
    static void restore(const char* name, const std::optional<std::string>& value) {
        if (value) {
            set_env(name, *value);
        } else {
            unset_env(name);
        }
    }

    bool saved_fallback_ = false;
    std::size_t saved_threshold_ = 8;
    std::optional<std::string> saved_fallback_env_;
    std::optional<std::string> saved_threshold_env_;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(OptionsTest, UnsetEnvironmentKeepsDefaults) {
    load_options_from_env();
    EXPECT_FALSE(Options::force_fallback);
    EXPECT_EQ(Options::bulk_extend_threshold, 8u);
    EXPECT_TRUE(capture->warnings.empty());
}

// ============================================================================
// SCOPED_FORCE_FALLBACK
// ============================================================================

TEST_F(OptionsTest, ForceFallbackAcceptsTrueAndOne) {
    set_env("SCOPED_FORCE_FALLBACK", "true");
    load_options_from_env();
    EXPECT_TRUE(Options::force_fallback);

    Options::force_fallback = false;
    set_env("SCOPED_FORCE_FALLBACK", "1");
    load_options_from_env();
    EXPECT_TRUE(Options::force_fallback);
}

TEST_F(OptionsTest, ForceFallbackFalseOverridesEarlierAssignment) {
    Options::force_fallback = true;
    set_env("SCOPED_FORCE_FALLBACK", "0");
    load_options_from_env();
    EXPECT_FALSE(Options::force_fallback);
}

TEST_F(OptionsTest, UnrecognizedForceFallbackIsIgnored) {
    set_env("SCOPED_FORCE_FALLBACK", "yes please");
    load_options_from_env();

    EXPECT_FALSE(Options::force_fallback);
    ASSERT_EQ(capture->warnings.size(), 1u);
    EXPECT_NE(capture->warnings[0].find("SCOPED_FORCE_FALLBACK=yes please"), std::string::npos);
}

// ============================================================================
// SCOPED_BULK_THRESHOLD
// ============================================================================

TEST_F(OptionsTest, BulkThresholdAcceptsPositiveNumber) {
    set_env("SCOPED_BULK_THRESHOLD", "3");
    load_options_from_env();
    EXPECT_EQ(Options::bulk_extend_threshold, 3u);
    EXPECT_TRUE(capture->warnings.empty());
}

TEST_F(OptionsTest, BulkThresholdRejectsZero) {
    set_env("SCOPED_BULK_THRESHOLD", "0");
    load_options_from_env();
    EXPECT_EQ(Options::bulk_extend_threshold, 8u);
    EXPECT_EQ(capture->warnings.size(), 1u);
}

TEST_F(OptionsTest, BulkThresholdRejectsNonNumeric) {
    set_env("SCOPED_BULK_THRESHOLD", "many");
    load_options_from_env();
    EXPECT_EQ(Options::bulk_extend_threshold, 8u);
    EXPECT_EQ(capture->warnings.size(), 1u);
}

TEST_F(OptionsTest, BulkThresholdRejectsTrailingGarbage) {
    set_env("SCOPED_BULK_THRESHOLD", "12abc");
    load_options_from_env();
    EXPECT_EQ(Options::bulk_extend_threshold, 8u);
    ASSERT_EQ(capture->warnings.size(), 1u);
    EXPECT_NE(capture->warnings[0].find("SCOPED_BULK_THRESHOLD=12abc"), std::string::npos);
}

TEST_F(OptionsTest, BulkThresholdRejectsNegative) {
    set_env("SCOPED_BULK_THRESHOLD", "-4");
    load_options_from_env();
    EXPECT_EQ(Options::bulk_extend_threshold, 8u);
    EXPECT_EQ(capture->warnings.size(), 1u);
}

// ============================================================================
// read_env
// ============================================================================

TEST_F(OptionsTest, ReadEnvDistinguishesUnsetFromEmpty) {
    EXPECT_FALSE(read_env("SCOPED_BULK_THRESHOLD").has_value());
    set_env("SCOPED_BULK_THRESHOLD", "5");
    EXPECT_EQ(read_env("SCOPED_BULK_THRESHOLD"), std::optional<std::string>("5"));
}
