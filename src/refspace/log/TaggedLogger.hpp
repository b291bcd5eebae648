#ifdef RS_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace RS {

/**
 * Asynchronous tagged logger. Messages are queued by the caller and written to
 * stderr from a worker thread.
 *
 * Runtime configuration is read once at construction:
 *   REFSPACE_LOG_ENABLED / REFSPACE_LOG      enable output ("0", "false", "off", "no" disable)
 *   REFSPACE_LOG_ENABLE_TAGS                 comma list; when set every tag of a message must be listed
 *   REFSPACE_LOG_SKIP_TAGS                   comma list of tags to drop, added to the defaults
 *   REFSPACE_LOG_CLEAR_DEFAULT_SKIPS         drop the built-in skip list
 */
class TaggedLogger {
public:
    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(TaggedLogger const&)            = delete;
    TaggedLogger& operator=(TaggedLogger const&) = delete;

    template <typename... Tags>
    auto log_impl(std::string const& message, std::source_location const& location, Tags&&... tags) -> void;

    auto setThreadName(std::string const& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;

    // Held while a line is written; test reporters take it to avoid interleaving.
    static std::mutex coutMutex;

private:
    struct Record {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    auto configureFromEnvironment() -> void;
    auto drain() -> void;
    auto accepts(std::set<std::string> const& tags) const -> bool;
    auto writeToStderr(Record const& msg) const -> void;
    auto getThreadName(std::thread::id const& id) -> std::string;

    std::atomic<bool>     loggingEnabled{false};
    std::set<std::string> skipTags{"INFO", "Trace", "Cache", "Testcase"};
    std::set<std::string> enabledTags;

    std::mutex              pendingMutex;
    std::condition_variable wake;
    std::queue<Record>      pending;
    bool                    running = true;

    std::mutex                                       threadNamesMutex;
    std::unordered_map<std::thread::id, std::string> threadNames;
    int                                              nextThreadNumber = 0;

    std::thread writer;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(std::string const& message, std::source_location const& location, Tags&&... tags) -> void {
    if (!this->loggingEnabled.load(std::memory_order_relaxed))
        return;

    Record record{.timestamp  = std::chrono::system_clock::now(),
                  .tags       = {std::string(std::forward<Tags>(tags))...},
                  .message    = message,
                  .threadName = this->getThreadName(std::this_thread::get_id()),
                  .location   = location};
    {
        std::lock_guard<std::mutex> lock(this->pendingMutex);
        this->pending.push(std::move(record));
    }
    this->wake.notify_one();
}

#define rs_log(message, ...) ::RS::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(std::string const& name);
void set_logging_enabled(bool enabled);

} // namespace RS

#else
#define rs_log(message, ...) ((void)0)
#endif // RS_LOG_DEBUG
