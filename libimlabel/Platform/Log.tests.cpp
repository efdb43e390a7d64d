#include "Log.h"

#include <libimlabel/Platform/LogSink.h>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace iml;

namespace
{
    class RecordingSink final : public LogSink {
    public:
        std::vector<LogMessage> messages;
    private:
        void impl_sink_message(const LogMessageView& view) final { messages.emplace_back(view); }
    };
}

TEST(Logger, formats_printf_style_arguments)
{
    auto sink = std::make_shared<RecordingSink>();
    Logger logger{"test", sink};
    logger.info("loaded %zu annotations from %s", static_cast<size_t>(3), "dog.json");

    ASSERT_EQ(sink->messages.size(), 1);
    ASSERT_EQ(sink->messages.front().payload(), "loaded 3 annotations from dog.json");
    ASSERT_EQ(sink->messages.front().logger_name(), "test");
    ASSERT_EQ(sink->messages.front().level(), LogLevel::info);
}

TEST(Logger, sink_level_filters_out_lower_level_messages)
{
    auto sink = std::make_shared<RecordingSink>();
    sink->set_level(LogLevel::warn);
    Logger logger{"test", sink};

    logger.info("ignored");
    logger.warn("kept");
    logger.error("also kept");

    ASSERT_EQ(sink->messages.size(), 2);
    ASSERT_EQ(sink->messages.at(0).payload(), "kept");
    ASSERT_EQ(sink->messages.at(1).level(), LogLevel::err);
}

TEST(Logger, logger_level_filters_before_sinks)
{
    auto sink = std::make_shared<RecordingSink>();
    sink->set_level(LogLevel::trace);
    Logger logger{"test", sink};
    logger.set_level(LogLevel::err);

    logger.warn("ignored");
    ASSERT_TRUE(sink->messages.empty());
}

TEST(Log, traceback_contains_recent_warnings)
{
    log_warn("a traceback test message %d", 42);

    const auto traceback = global_copy_traceback_log();
    ASSERT_FALSE(traceback.empty());
    ASSERT_EQ(traceback.back().payload(), "a traceback test message 42");
}

TEST(Log, traceback_is_bounded)
{
    for (size_t i = 0; i < c_max_log_traceback_messages + 10; ++i) {
        log_warn("spam %zu", i);
    }
    ASSERT_EQ(global_copy_traceback_log().size(), c_max_log_traceback_messages);
}

TEST(LogLevel, try_parse_as_log_level_roundtrips_names)
{
    ASSERT_EQ(try_parse_as_log_level("warning"), LogLevel::warn);
    ASSERT_EQ(try_parse_as_log_level("trace"), LogLevel::trace);
    ASSERT_EQ(try_parse_as_log_level("nonsense"), std::nullopt);
    ASSERT_EQ(to_string_view(LogLevel::err), "error");
}
