#ifdef RS_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace RS {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

auto parse_truthy(std::string_view value) -> bool {
    std::string lowered{trim(value)};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return !(lowered.empty() || lowered == "0" || lowered == "false" || lowered == "off" || lowered == "no");
}

auto split_tags(std::string_view list) -> std::set<std::string> {
    std::set<std::string> tags;
    while (!list.empty()) {
        auto comma = list.find(',');
        auto token = trim(list.substr(0, comma));
        if (!token.empty())
            tags.emplace(token);
        if (comma == std::string_view::npos)
            break;
        list.remove_prefix(comma + 1);
    }
    return tags;
}

// Parent directory and file name, e.g. "eval/Evaluator.cpp:42".
auto shortLocation(std::source_location const& location) -> std::string {
    std::filesystem::path const file{location.file_name()};
    auto const                  parent = file.parent_path().filename();
    auto                        shown  = parent.empty() ? file.filename() : parent / file.filename();
    return shown.string() + ":" + std::to_string(location.line());
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    this->configureFromEnvironment();
    this->writer = std::thread([this] { this->drain(); });
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->pendingMutex);
        this->running = false;
    }
    this->wake.notify_one();
    if (this->writer.joinable())
        this->writer.join();
}

auto TaggedLogger::configureFromEnvironment() -> void {
    char const* enabled = std::getenv("REFSPACE_LOG_ENABLED");
    if (!enabled)
        enabled = std::getenv("REFSPACE_LOG");
    if (enabled)
        this->loggingEnabled.store(parse_truthy(enabled));

    if (char const* clear = std::getenv("REFSPACE_LOG_CLEAR_DEFAULT_SKIPS"); clear && parse_truthy(clear))
        this->skipTags.clear();
    if (char const* skip = std::getenv("REFSPACE_LOG_SKIP_TAGS"))
        this->skipTags.merge(split_tags(skip));
    if (char const* only = std::getenv("REFSPACE_LOG_ENABLE_TAGS"))
        this->enabledTags = split_tags(only);
}

auto TaggedLogger::setThreadName(std::string const& name) -> void {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    this->threadNames.insert_or_assign(std::this_thread::get_id(), name);
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    this->loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::drain() -> void {
    std::queue<Record> batch;
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(this->pendingMutex);
            this->wake.wait(lock, [this] { return !this->pending.empty() || !this->running; });
            if (this->pending.empty())
                return;
            std::swap(batch, this->pending);
        }
        for (; !batch.empty(); batch.pop()) {
            if (this->accepts(batch.front().tags))
                this->writeToStderr(batch.front());
        }
    }
}

auto TaggedLogger::accepts(std::set<std::string> const& tags) const -> bool {
    auto const listed = [&tags](std::set<std::string> const& filter) {
        return std::any_of(tags.begin(), tags.end(), [&filter](std::string const& tag) { return filter.contains(tag); });
    };
    if (listed(this->skipTags))
        return false;
    if (this->enabledTags.empty())
        return true;
    return std::all_of(tags.begin(), tags.end(), [this](std::string const& tag) { return this->enabledTags.contains(tag); });
}

// 2024-01-31 12:00:00.042 [Tag][Other] [Thread 0] [dir/File.cpp:12] message
auto TaggedLogger::writeToStderr(Record const& msg) const -> void {
    auto const seconds = std::chrono::system_clock::to_time_t(msg.timestamp);
    auto const millis  = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()).count() % 1000;
    std::tm    local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis << " [";
    bool first = true;
    for (auto const& tag : msg.tags) {
        line << (first ? "" : "][") << tag;
        first = false;
    }
    line << "] [" << msg.threadName << "] [" << shortLocation(msg.location) << "] " << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << line.str() << std::flush;
}

auto TaggedLogger::getThreadName(std::thread::id const& id) -> std::string {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    auto [it, inserted] = this->threadNames.try_emplace(id);
    if (inserted)
        it->second = "Thread " + std::to_string(this->nextThreadNumber++);
    return it->second;
}

void set_thread_name(std::string const& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace RS
#endif // RS_LOG_DEBUG
