#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <string_view>

namespace OC {

/**
 * Synchronous tag-filtered logger writing to stderr.
 *
 * Configuration is read from the environment when the logger is constructed:
 * - OBJCATALOG_LOG / OBJCATALOG_LOG_ENABLED: enable output ("0", "off", "false" disable)
 * - OBJCATALOG_LOG_ENABLE_TAGS: comma separated allow list; every tag of a message must be listed
 * - OBJCATALOG_LOG_SKIP_TAGS: comma separated tags that suppress a message
 * - OBJCATALOG_LOG_CLEAR_DEFAULT_SKIPS: drop the built-in skip list
 *
 * Messages tagged "WARN" are diagnostics and are written even while logging is
 * disabled, unless "WARN" itself is skipped.
 */
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger() = default;

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setLoggingEnabled(bool enabled) -> void;
    auto isLoggingEnabled() const -> bool;
    auto enableTag(std::string tag) -> void;
    auto skipTag(std::string tag) -> void;
    auto clearSkipTags() -> void;

    static std::mutex coutMutex;

private:
    auto shouldWrite(const LogMessage& msg) const -> bool;
    auto writeToStderr(const LogMessage& msg) const -> void;
    auto applyEnvironment() -> void;
    static auto getShortPath(const char* filepath) -> std::string;

    std::atomic<bool>     loggingEnabled{false};
    std::set<std::string> skipTags{"Function Called", "INFO", "Notify", "Resolve"};
    std::set<std::string> enabledTags{};
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    LogMessage const logMessage{.timestamp = std::chrono::system_clock::now(),
                                .tags      = {std::string(std::forward<Tags>(tags))...},
                                .message   = message,
                                .location  = location};
    if (!this->shouldWrite(logMessage))
        return;
    this->writeToStderr(logMessage);
}

#define oc_log(message, ...) ::OC::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_logging_enabled(bool enabled);

} // namespace OC
