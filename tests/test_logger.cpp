/**
 * @file test_logger.cpp
 * @brief Tests for the SystemLogger facade
 * @brief SystemLogger 门面测试
 *
 * - Construction and tag normalization
 * - The six logging methods (level, privacy, tags)
 * - Formatted logging methods
 * - Shared Main() instance
 * - Concurrent use from many threads
 *
 * @copyright Copyright (c) 2024 systemlog
 */

#include <gtest/gtest.h>
#ifdef SYSTEMLOG_HAS_RAPIDCHECK
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>
#endif

#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include <systemlog/application_id.hpp>
#include <systemlog/logger.hpp>
#include <systemlog/macros.hpp>

#include "recording_sink.hpp"

namespace systemlog {
namespace test {
namespace {

class SystemLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink = std::make_shared<RecordingSink>();
    }

    std::shared_ptr<RecordingSink> sink;
};

// ==============================================================================
// Construction / 构造
// ==============================================================================

TEST_F(SystemLoggerTest, ExplicitSubsystemAndCategory) {
    SystemLogger logger("com.test.app", "Net", sink);
    EXPECT_EQ(logger.Subsystem(), "com.test.app");
    EXPECT_EQ(logger.Category(), "Net");
    EXPECT_EQ(logger.GetSink(), sink);
}

TEST_F(SystemLoggerTest, CategoryDefaultsToDefault) {
    SystemLogger logger("com.test.app");
    EXPECT_EQ(logger.Category(), "default");
}

TEST_F(SystemLoggerTest, EmptyCategoryIsNormalized) {
    SystemLogger logger("com.test.app", "", sink);
    EXPECT_EQ(logger.Category(), "default");
}

TEST_F(SystemLoggerTest, OmittedSubsystemResolvesApplicationIdentifier) {
    SystemLogger first;
    SystemLogger second("", "Net", sink);
    EXPECT_FALSE(first.Subsystem().empty());
    EXPECT_EQ(first.Subsystem(), GetApplicationIdentifier());
    EXPECT_EQ(second.Subsystem(), first.Subsystem());
}

TEST_F(SystemLoggerTest, NullSinkSelectsDefaultSink) {
    SystemLogger logger("com.test.app", "Net", nullptr);
    ASSERT_NE(logger.GetSink(), nullptr);
    EXPECT_EQ(logger.GetSink(), DefaultSink());
}

TEST_F(SystemLoggerTest, ConstructFromConfig) {
    LoggerConfig config;
    config.subsystem = "com.test.config";
    config.category = "Storage";
    config.backend = Backend::Null;

    SystemLogger logger(config);
    EXPECT_EQ(logger.Subsystem(), "com.test.config");
    EXPECT_EQ(logger.Category(), "Storage");
    EXPECT_NE(std::dynamic_pointer_cast<NullSink>(logger.GetSink()), nullptr);
    logger.LogError("discarded");
}

TEST_F(SystemLoggerTest, CopiesShareSink) {
    SystemLogger logger("com.test.app", "Net", sink);
    SystemLogger copy = logger;
    copy.LogInfo("from copy");
    logger.LogInfo("from original");
    EXPECT_EQ(sink->Size(), 2u);
    EXPECT_EQ(copy.Subsystem(), logger.Subsystem());
    EXPECT_EQ(copy.Category(), logger.Category());
}

// ==============================================================================
// Logging Methods / 日志记录方法
// ==============================================================================

TEST_F(SystemLoggerTest, ErrorScenario) {
    SystemLogger logger("com.test.app", "Net", sink);
    logger.LogError("timeout");

    const auto entries = sink->Entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].subsystem, "com.test.app");
    EXPECT_EQ(entries[0].category, "Net");
    EXPECT_EQ(entries[0].level, Level::Error);
    EXPECT_EQ(entries[0].message, "timeout");
    EXPECT_FALSE(entries[0].Redacted());
}

TEST_F(SystemLoggerTest, EachMethodMapsToItsLevelAndPrivacy) {
    SystemLogger logger("com.test.app", "Levels", sink);
    logger.LogInfo("info");
    logger.LogDebug("debug");
    logger.LogWarning("warning");
    logger.LogError("error");
    logger.LogCritical("critical");
    logger.LogPrivate("user email: user@example.com");

    const auto entries = sink->Entries();
    ASSERT_EQ(entries.size(), 6u);

    EXPECT_EQ(entries[0].level, Level::Info);
    EXPECT_EQ(entries[1].level, Level::Debug);
    EXPECT_EQ(entries[2].level, Level::Warn);
    EXPECT_EQ(entries[3].level, Level::Error);
    EXPECT_EQ(entries[4].level, Level::Critical);
    EXPECT_EQ(entries[5].level, Level::Default);

    for (size_t i = 0; i < 5; ++i) {
        EXPECT_FALSE(entries[i].Redacted()) << "entry " << i;
    }
    EXPECT_TRUE(entries[5].Redacted());
    EXPECT_EQ(entries[5].message, "user email: user@example.com");

    for (const auto& entry : entries) {
        EXPECT_EQ(entry.subsystem, "com.test.app");
        EXPECT_EQ(entry.category, "Levels");
    }
}

TEST_F(SystemLoggerTest, LoggingMethodsAreNoexcept) {
    const SystemLogger logger("com.test.app", "Net", sink);
    EXPECT_TRUE(noexcept(logger.LogInfo("x")));
    EXPECT_TRUE(noexcept(logger.LogDebug("x")));
    EXPECT_TRUE(noexcept(logger.LogWarning("x")));
    EXPECT_TRUE(noexcept(logger.LogError("x")));
    EXPECT_TRUE(noexcept(logger.LogCritical("x")));
    EXPECT_TRUE(noexcept(logger.LogPrivate("x")));
    static_assert(std::is_void_v<decltype(logger.LogInfo("x"))>);
}

TEST_F(SystemLoggerTest, EmptyMessageIsForwarded) {
    SystemLogger logger("com.test.app", "Net", sink);
    logger.LogWarning("");
    const auto entries = sink->Entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].message.empty());
}

TEST_F(SystemLoggerTest, PlainMessageKeepsBraces) {
    SystemLogger logger("com.test.app", "Net", sink);
    logger.LogInfo("payload {not a field} {}");
    const auto entries = sink->Entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "payload {not a field} {}");
}

TEST_F(SystemLoggerTest, AcceptsStdString) {
    SystemLogger logger("com.test.app", "Net", sink);
    const std::string message = "owned message";
    logger.LogDebug(message);
    ASSERT_EQ(sink->Size(), 1u);
    EXPECT_EQ(sink->Entries()[0].message, "owned message");
}

// ==============================================================================
// Formatted Logging Methods / 格式化日志方法
// ==============================================================================

TEST_F(SystemLoggerTest, FormattedMethods) {
    SystemLogger logger("com.test.app", "Net", sink);
    logger.LogInfo("connected to {}:{}", "example.com", 443);
    logger.LogError("failed after {} retries", 3);
    logger.LogPrivate("token={}", std::string("secret"));

    const auto entries = sink->Entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].message, "connected to example.com:443");
    EXPECT_EQ(entries[0].level, Level::Info);
    EXPECT_EQ(entries[1].message, "failed after 3 retries");
    EXPECT_EQ(entries[1].level, Level::Error);
    EXPECT_EQ(entries[2].message, "token=secret");
    EXPECT_EQ(entries[2].level, Level::Default);
    EXPECT_TRUE(entries[2].Redacted());
}

TEST_F(SystemLoggerTest, FormatFailureEmitsRawFormatString) {
    SystemLogger logger("com.test.app", "Fmt", sink);
    // {:d} cannot format a string; checked at run time under C++17
    logger.LogPrivate("value {:d}", "abc");
    logger.LogError("count {:d} of {}", "many", 3);

    ASSERT_EQ(sink->Size(), 2u);
    const auto entries = sink->Entries();
    EXPECT_EQ(entries[0].message, "value {:d}");
    EXPECT_EQ(entries[0].level, Level::Default);
    EXPECT_EQ(entries[0].privacy, Privacy::Private);
    EXPECT_EQ(entries[1].message, "count {:d} of {}");
    EXPECT_EQ(entries[1].level, Level::Error);
    EXPECT_EQ(entries[1].privacy, Privacy::Public);
}

TEST_F(SystemLoggerTest, FormattedMethodsKeepLevels) {
    SystemLogger logger("com.test.app", "Net", sink);
    const int value = 7;
    logger.LogDebug("d{}", value);
    logger.LogWarning("w{}", value);
    logger.LogCritical("c{}", value);

    const auto entries = sink->Entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].level, Level::Debug);
    EXPECT_EQ(entries[1].level, Level::Warn);
    EXPECT_EQ(entries[2].level, Level::Critical);
    EXPECT_EQ(entries[2].message, "c7");
    for (const auto& entry : entries) {
        EXPECT_FALSE(entry.Redacted());
    }
}

// ==============================================================================
// Main Instance / 共享实例
// ==============================================================================

TEST(SystemLoggerMainTest, SameInstanceOnEveryAccess) {
    const SystemLogger& first = SystemLogger::Main();
    const SystemLogger& second = SystemLogger::Main();
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(first.Subsystem(), GetApplicationIdentifier());
    EXPECT_EQ(first.Category(), "default");
    EXPECT_EQ(first.GetSink(), DefaultSink());
}

TEST(SystemLoggerMainTest, MainInstanceFromManyThreads) {
    constexpr int kThreads = 8;
    std::vector<const SystemLogger*> seen(kThreads, nullptr);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&seen, i] { seen[i] = &SystemLogger::Main(); });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (const auto* p : seen) {
        EXPECT_EQ(p, &SystemLogger::Main());
    }
}

TEST(SystemLoggerMainTest, MacrosForwardToMain) {
    SYSTEMLOG_DEBUG("macro debug");
    SYSTEMLOG_INFO("macro info {}", 1);
    SYSTEMLOG_WARNING("macro warning");
    SYSTEMLOG_ERROR("macro error {}", "detail");
    SYSTEMLOG_CRITICAL("macro critical");
    SYSTEMLOG_PRIVATE("macro private {}", 42);
    EXPECT_FALSE(SystemLogger::Main().GetSink()->HasError());
}

// ==============================================================================
// Concurrency / 并发
// ==============================================================================

TEST_F(SystemLoggerTest, ConcurrentLogging) {
    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 500;

    SystemLogger logger("com.test.app", "Concurrency", sink);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                if (i % 2 == 0) {
                    logger.LogInfo("thread {} message {}", t, i);
                } else {
                    logger.LogPrivate("secret");
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const auto entries = sink->Entries();
    ASSERT_EQ(entries.size(), static_cast<size_t>(kThreads * kMessagesPerThread));
    size_t redacted = 0;
    for (const auto& entry : entries) {
        EXPECT_EQ(entry.category, "Concurrency");
        if (entry.Redacted()) {
            ++redacted;
        }
    }
    EXPECT_EQ(redacted, static_cast<size_t>(kThreads * kMessagesPerThread / 2));
}

// ==============================================================================
// Property-Based Tests / 基于属性的测试
// ==============================================================================

#ifdef SYSTEMLOG_HAS_RAPIDCHECK

/**
 * @brief Every method forwards the message untouched with the logger's tags
 * @brief 每个方法都原样转发消息并附带日志器的标签
 */
RC_GTEST_PROP(SystemLoggerPropertyTest, ForwardsMessageAndTags, ()) {
    const auto subsystem = *rc::gen::nonEmpty<std::string>();
    const auto category = *rc::gen::nonEmpty<std::string>();
    const auto message = *rc::gen::arbitrary<std::string>();
    const auto method = *rc::gen::inRange(0, 6);

    auto sink = std::make_shared<RecordingSink>();
    SystemLogger logger(subsystem, category, sink);
    switch (method) {
        case 0: logger.LogInfo(message); break;
        case 1: logger.LogDebug(message); break;
        case 2: logger.LogWarning(message); break;
        case 3: logger.LogError(message); break;
        case 4: logger.LogCritical(message); break;
        default: logger.LogPrivate(message); break;
    }

    const auto entries = sink->Entries();
    RC_ASSERT(entries.size() == 1u);
    RC_ASSERT(entries[0].subsystem == subsystem);
    RC_ASSERT(entries[0].category == category);
    RC_ASSERT(entries[0].message == message);
    RC_ASSERT(entries[0].Redacted() == (method == 5));
}

#endif  // SYSTEMLOG_HAS_RAPIDCHECK

}  // namespace
}  // namespace test
}  // namespace systemlog
