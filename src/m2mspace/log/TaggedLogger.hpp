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

namespace M2M {

/**
 * @brief Asynchronous, tag-filtered logger writing to stderr from a worker thread.
 *
 * Runtime behaviour is read from the environment at construction:
 * - M2M_LOG_ENABLED / M2M_LOG: enable output ("0", "off", "false" keep it disabled)
 * - M2M_LOG_CLEAR_DEFAULT_SKIPS: drop the built-in skip list
 * - M2M_LOG_ENABLE_TAGS: comma separated allow list; every tag of a message must be listed
 * - M2M_LOG_SKIP_TAGS: comma separated tags appended to the skip list
 */
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    [[nodiscard]] auto loggingEnabled() const -> bool;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::thread             workerThread;
    std::atomic<bool>       running;
    std::atomic<bool>       enabled;
    std::set<std::string>   skipTags{"INFO", "Lock", "Store"};
    std::set<std::string>   enabledTags{};

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber;

    auto        configureFromEnvironment() -> void;
    auto        processQueue() -> void;
    auto        writeToStderr(const LogMessage& msg) const -> void;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!this->enabled.load(std::memory_order_relaxed))
        return;

    auto logMessage = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                                 .tags       = {std::string(std::forward<Tags>(tags))...},
                                 .message    = message,
                                 .threadName = getThreadName(std::this_thread::get_id()),
                                 .location   = location};

    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->messageQueue.push(std::move(logMessage));
        this->cv.notify_one();
    }
}

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace M2M

#ifdef M2M_LOG_DEBUG
#define m2m_log(message, ...) ::M2M::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)
#else
#define m2m_log(message, ...) ((void)0)
#endif // M2M_LOG_DEBUG
