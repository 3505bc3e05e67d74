#include "TaggedLogger.hpp"

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>

namespace OC {

namespace {

auto envFlag(char const* name) -> std::optional<bool> {
    char const* raw = std::getenv(name);
    if (!raw)
        return std::nullopt;
    std::string_view const value{raw};
    if (value.empty() || value == "0" || value == "off" || value == "false")
        return false;
    return true;
}

auto splitTags(char const* raw) -> std::set<std::string> {
    std::set<std::string> tags;
    if (!raw)
        return tags;
    std::string_view remaining{raw};
    while (!remaining.empty()) {
        auto const comma = remaining.find(',');
        auto       tag   = remaining.substr(0, comma);
        while (!tag.empty() && tag.front() == ' ')
            tag.remove_prefix(1);
        while (!tag.empty() && tag.back() == ' ')
            tag.remove_suffix(1);
        if (!tag.empty())
            tags.emplace(tag);
        if (comma == std::string_view::npos)
            break;
        remaining.remove_prefix(comma + 1);
    }
    return tags;
}

template <typename Range, typename Delimiter>
std::string join_with_impl(const Range& range, const Delimiter& delim) {
    std::ostringstream oss;
    bool               first = true;
    for (const auto& item : range) {
        if (!first)
            oss << delim;
        oss << item;
        first = false;
    }
    return oss.str();
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    this->applyEnvironment();
}

auto TaggedLogger::applyEnvironment() -> void {
    if (auto flag = envFlag("OBJCATALOG_LOG_ENABLED"))
        this->loggingEnabled.store(*flag, std::memory_order_relaxed);
    else if (auto legacy = envFlag("OBJCATALOG_LOG"))
        this->loggingEnabled.store(*legacy, std::memory_order_relaxed);

    if (envFlag("OBJCATALOG_LOG_CLEAR_DEFAULT_SKIPS").value_or(false))
        this->skipTags.clear();
    for (auto& tag : splitTags(std::getenv("OBJCATALOG_LOG_SKIP_TAGS")))
        this->skipTags.insert(tag);
    this->enabledTags = splitTags(std::getenv("OBJCATALOG_LOG_ENABLE_TAGS"));
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    this->loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::isLoggingEnabled() const -> bool {
    return this->loggingEnabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::enableTag(std::string tag) -> void {
    this->enabledTags.insert(std::move(tag));
}

auto TaggedLogger::skipTag(std::string tag) -> void {
    this->skipTags.insert(std::move(tag));
}

auto TaggedLogger::clearSkipTags() -> void {
    this->skipTags.clear();
}

auto TaggedLogger::shouldWrite(const LogMessage& msg) const -> bool {
    for (auto const& skipTag : this->skipTags)
        if (msg.tags.contains(skipTag))
            return false;
    if (msg.tags.contains("WARN"))
        return true;
    if (!this->isLoggingEnabled())
        return false;
    if (!this->enabledTags.empty())
        for (auto const& tag : msg.tags)
            if (!this->enabledTags.contains(tag))
                return false;
    return true;
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    namespace fs = std::filesystem;
    fs::path p{filepath};
    if (p.has_parent_path()) {
        auto parent = p.parent_path().filename();
        return (parent / p.filename()).string();
    }
    return p.filename().string();
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
    const auto  now      = msg.timestamp;
    const auto  nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto  nowTimeT = std::chrono::system_clock::to_time_t(now);
    std::tm     nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';
    oss << '[' << join_with_impl(msg.tags, std::string("][")) << ']' << ' ';
    oss << "[" << getShortPath(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace OC
