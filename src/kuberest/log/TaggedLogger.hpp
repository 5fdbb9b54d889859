#ifdef KR_LOG_DEBUG
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

namespace KR {

// Asynchronous tagged logger. Messages are queued by the caller and written to stderr by a
// worker thread. Runtime switches are read from the environment at construction:
//   KUBEREST_LOG_ENABLED / KUBEREST_LOG      truthy value enables output (default off)
//   KUBEREST_LOG_ENABLE_TAGS                 comma list, every tag of a message must be listed
//   KUBEREST_LOG_SKIP_TAGS                   comma list added to the default skip set
//   KUBEREST_LOG_CLEAR_DEFAULT_SKIPS         truthy value empties the default skip set
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
    auto isLoggingEnabled() const -> bool;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::thread             workerThread;
    std::atomic<bool>       running;
    std::atomic<bool>       loggingEnabled;
    std::set<std::string>   skipTags{"INFO"};
    std::set<std::string>   enabledTags{};

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber;

    auto        applyEnvironment() -> void;
    auto        processQueue() -> void;
    auto        writeToStderr(const LogMessage& msg) const -> void;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!loggingEnabled)
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

#define kr_log(message, ...) ::KR::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace KR

#else
#define kr_log(message, ...) ((void)0)
#endif // KR_LOG_DEBUG
