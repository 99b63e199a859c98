#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace M2M {

namespace {

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

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

auto split_tags(std::string_view list) -> std::set<std::string> {
    std::set<std::string> tags;
    while (!list.empty()) {
        auto const comma = list.find(',');
        auto const token = trim(list.substr(0, comma));
        if (!token.empty())
            tags.emplace(token);
        if (comma == std::string_view::npos)
            break;
        list.remove_prefix(comma + 1);
    }
    return tags;
}

auto env_truthy(char const* key) -> bool {
    char const* raw = std::getenv(key);
    if (raw == nullptr)
        return false;
    std::string value{trim(raw)};
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return !(value.empty() || value == "0" || value == "off" || value == "false" || value == "no");
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : running(true), enabled(false), nextThreadNumber(0) {
    this->configureFromEnvironment();
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::configureFromEnvironment() -> void {
    if (env_truthy("M2M_LOG_ENABLED") || env_truthy("M2M_LOG"))
        this->enabled.store(true, std::memory_order_relaxed);
    if (env_truthy("M2M_LOG_CLEAR_DEFAULT_SKIPS"))
        this->skipTags.clear();
    if (char const* raw = std::getenv("M2M_LOG_SKIP_TAGS")) {
        auto extra = split_tags(raw);
        this->skipTags.insert(extra.begin(), extra.end());
    }
    if (char const* raw = std::getenv("M2M_LOG_ENABLE_TAGS"))
        this->enabledTags = split_tags(raw);
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool value) -> void {
    this->enabled.store(value, std::memory_order_relaxed);
}

auto TaggedLogger::loggingEnabled() const -> bool {
    return this->enabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::processQueue() -> void {
    while (true) {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        if (!this->running && this->messageQueue.empty()) {
            return;
        }

        while (!this->messageQueue.empty()) {
            const auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            lock.unlock();
            this->writeToStderr(msg);
            lock.lock();
        }
    }
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
    if (!this->enabledTags.empty())
        for (auto const& tag : msg.tags)
            if (!this->enabledTags.contains(tag))
                return;
    for (auto const& skipTag : this->skipTags)
        if (msg.tags.contains(skipTag))
            return;
    const auto now      = msg.timestamp;
    const auto nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto nowTimeT = std::chrono::system_clock::to_time_t(now);
    std::tm    nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';
    oss << '[' << join_with_impl(msg.tags, std::string("][")) << ']' << ' ';
    oss << "[" << msg.threadName << "] ";
    oss << "[" << getShortPath(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto                        it = threadNames.find(id);
    if (it != threadNames.end()) {
        return it->second;
    }
    std::string name = "Thread " + std::to_string(nextThreadNumber++);
    threadNames[id]  = name;
    return name;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace M2M
