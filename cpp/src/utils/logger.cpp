/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * @see include/utils/logger.hpp
 *
 * 1.  **Command Processing**: `Command` is a `std::variant` of a `LogMessage`, a
 *     sink switch, a sink creation error, a flush request or a callback change.
 *     Public API functions are producers that push commands onto the queue.
 *
 * 2.  **Worker Thread (`worker_loop`)**: sleeps on a condition variable until the
 *     queue is non-empty or shutdown is requested, then swaps the whole queue into a
 *     local vector and processes it unlocked via `std::visit`.
 *
 * 3.  **Sink Management**: sinks are created on the calling thread so that a failure
 *     to open a file is reported immediately as a `SinkCreationErrorCommand`; the
 *     worker then swaps them in, announcing the switch in both sinks.
 *
 * 4.  **Error Callback Handling (`CallbackDispatcher`)**: user callbacks run on a
 *     separate thread. A callback that logs would otherwise re-enter the queue from
 *     the worker itself.
 ******************************************************************************/

#include "lcal_service.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#if defined(LEAPCAL_IS_POSIX)
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace leapcal::utils
{

/**
 * @class CallbackDispatcher
 * @brief Runs user-provided callbacks on a thread of its own.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    CallbackDispatcher(const CallbackDispatcher &) = delete;
    CallbackDispatcher &operator=(const CallbackDispatcher &) = delete;

    void post(std::function<void()> fn)
    {
        if (shutdown_requested_.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(mutex_);
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
    }

    void shutdown()
    {
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
        cv_.notify_one();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(mutex_);
                cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
                if (shutdown_requested_.load() && queue_.empty())
                {
                    return;
                }
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &ex)
            {
                // A throwing user callback must not take the dispatcher thread down.
                fmt::print(stderr, "[leapcal::Logger] error callback threw: {}\n", ex.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

// ============================================================================
// Internal Command and Sink Definitions
// ============================================================================

/** @struct LogMessage @brief A single, formatted log entry. */
struct LogMessage
{
    Logger::Level level;
    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id;
    std::string body;
};

/**
 * @class Sink
 * @brief Abstract log destination. Only ever called from the worker thread.
 */
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;
};

// Formats a LogMessage into a final, printable line.
static std::string format_message(const LogMessage &msg)
{
    std::string time_str = format_tools::formatted_time(msg.timestamp);
    return fmt::format("[{}] [{:<6}] [{:5}] {}\n", time_str, level_to_string(msg.level),
                       msg.thread_id, msg.body);
}

static LogMessage make_system_message(std::string body)
{
    return LogMessage{Logger::Level::L_SYSTEM, std::chrono::system_clock::now(),
                      platform::get_native_thread_id(), std::move(body)};
}

/** @brief Writes log lines to stderr. */
class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override { fmt::print(stderr, "{}", format_message(msg)); }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

/** @brief Appends log lines to a file. */
class FileSink : public Sink
{
  public:
    FileSink(const std::string &path, bool use_flock) : path_(path), use_flock_(use_flock)
    {
#if defined(LEAPCAL_PLATFORM_WIN64)
        (void)use_flock_; // Not supported on Windows.
        int needed = MultiByteToWideChar(CP_UTF8, 0, path.c_str(), -1, nullptr, 0);
        if (needed == 0)
            throw std::runtime_error("Failed to convert path to wide string: " + path);
        std::wstring wpath(static_cast<size_t>(needed), L'\0');
        MultiByteToWideChar(CP_UTF8, 0, path.c_str(), -1, &wpath[0], needed);

        handle_ = CreateFileW(wpath.c_str(), FILE_APPEND_DATA, FILE_SHARE_READ | FILE_SHARE_WRITE,
                              nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (handle_ == INVALID_HANDLE_VALUE)
        {
            throw std::runtime_error("Failed to open log file: " + path);
        }
#else
        fd_ = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644);
        if (fd_ == -1)
        {
            throw std::runtime_error(
                fmt::format("Failed to open log file: {} ({})", path, std::strerror(errno)));
        }
#endif
    }

    ~FileSink() override
    {
#if defined(LEAPCAL_PLATFORM_WIN64)
        if (handle_ != INVALID_HANDLE_VALUE)
            CloseHandle(handle_);
#else
        if (fd_ != -1)
            ::close(fd_);
#endif
    }

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override
    {
        const std::string line = format_message(msg);
#if defined(LEAPCAL_PLATFORM_WIN64)
        DWORD bytes_written = 0;
        if (!WriteFile(handle_, line.data(), static_cast<DWORD>(line.size()), &bytes_written,
                       nullptr))
        {
            throw std::runtime_error("Failed to write log file: " + path_);
        }
#else
        if (use_flock_)
            ::flock(fd_, LOCK_EX);
        size_t off = 0;
        while (off < line.size())
        {
            const ssize_t w = ::write(fd_, line.data() + off, line.size() - off);
            if (w < 0)
            {
                if (errno == EINTR)
                    continue;
                const int err = errno;
                if (use_flock_)
                    ::flock(fd_, LOCK_UN);
                throw std::runtime_error(
                    fmt::format("Failed to write log file: {} ({})", path_, std::strerror(err)));
            }
            off += static_cast<size_t>(w);
        }
        if (use_flock_)
            ::flock(fd_, LOCK_UN);
#endif
    }

    void flush() override
    {
#if defined(LEAPCAL_PLATFORM_WIN64)
        FlushFileBuffers(handle_);
#else
        ::fsync(fd_);
#endif
    }

    std::string description() const override { return "File: " + path_; }

  private:
    std::string path_;
    bool use_flock_;
#if defined(LEAPCAL_PLATFORM_WIN64)
    HANDLE handle_ = INVALID_HANDLE_VALUE;
#else
    int fd_ = -1;
#endif
};

// --- Command Definitions ---
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<void>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand>;

// ============================================================================
// Logger Pimpl
// ============================================================================

struct LoggerImpl
{
    LoggerImpl();
    ~LoggerImpl();

    void worker_loop();
    void process(Command &cmd);
    void report_error(std::string message);
    void enqueue_command(Command &&cmd);
    void shutdown();

    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};

    // State exclusively owned and accessed by the worker thread.
    std::unique_ptr<Sink> sink_;
    std::function<void(const std::string &)> error_callback_;
    CallbackDispatcher callback_dispatcher_;
};

LoggerImpl::LoggerImpl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&LoggerImpl::worker_loop, this);
}

LoggerImpl::~LoggerImpl()
{
    if (!shutdown_requested_.load())
    {
        fmt::print(stderr, "[leapcal::Logger WARNING]: Logger was not shut down explicitly. "
                           "Call Logger::instance().shutdown() before main() returns.\n");
        shutdown();
    }
}

void LoggerImpl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!shutdown_requested_.load(std::memory_order_acquire))
        {
            queue_.emplace_back(std::move(cmd));
            cv_.notify_one();
            return;
        }
    }
    // After shutdown there is no worker; keep messages visible instead of dropping them.
    if (const auto *msg = std::get_if<LogMessage>(&cmd))
    {
        fmt::print(stderr, "[leapcal::Logger-fallback] Log after shutdown: {}",
                   format_message(*msg));
    }
    else if (const auto *flush = std::get_if<FlushCommand>(&cmd))
    {
        flush->promise->set_value();
    }
}

void LoggerImpl::report_error(std::string message)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, msg = std::move(message)]() { cb(msg); });
    }
    else
    {
        fmt::print(stderr, "[leapcal::Logger] {}\n", message);
    }
}

void LoggerImpl::process(Command &cmd)
{
    std::visit(
        [this](auto &arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, LogMessage>)
            {
                if (sink_ && arg.level >= level_.load(std::memory_order_relaxed))
                    sink_->write(arg);
            }
            else if constexpr (std::is_same_v<T, SetSinkCommand>)
            {
                const std::string old_desc = sink_ ? sink_->description() : "null";
                const std::string new_desc = arg.new_sink ? arg.new_sink->description() : "null";
                if (sink_)
                {
                    sink_->write(make_system_message("Switching log sink to: " + new_desc));
                    sink_->flush();
                }
                sink_ = std::move(arg.new_sink);
                if (sink_)
                {
                    sink_->write(make_system_message("Log sink switched from: " + old_desc));
                }
            }
            else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
            {
                report_error(std::move(arg.error_message));
            }
            else if constexpr (std::is_same_v<T, FlushCommand>)
            {
                if (sink_)
                    sink_->flush();
                arg.promise->set_value();
            }
            else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
            {
                error_callback_ = std::move(arg.callback);
            }
        },
        cmd);
}

void LoggerImpl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool drained_for_shutdown = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            drained_for_shutdown = shutdown_requested_.load() && queue_.empty();
            local_queue.swap(queue_);
        }

        if (drained_for_shutdown)
        {
            if (sink_)
                sink_->flush();
            break;
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                process(cmd);
            }
            catch (const std::exception &e)
            {
                // A flush request must still be released or its caller blocks forever.
                if (auto *flush = std::get_if<FlushCommand>(&cmd))
                    flush->promise->set_value();
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }
        local_queue.clear();
    }
}

void LoggerImpl::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    // No more callbacks can be generated once the worker is gone.
    callback_dispatcher_.shutdown();
}

// ============================================================================
// Logger Public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

void Logger::set_console()
{
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>()});
}

void Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    try
    {
        pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(utf8_path, use_flock)});
    }
    catch (const std::exception &e)
    {
        pImpl->enqueue_command(
            SinkCreationErrorCommand{fmt::format("Failed to create FileSink: {}", e.what())});
    }
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::flush()
{
    if (pImpl->shutdown_requested_.load())
        return;

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    future.wait();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb)});
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >=
           static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    try
    {
        pImpl->enqueue_command(LogMessage{lvl, std::chrono::system_clock::now(),
                                          platform::get_native_thread_id(), std::move(body)});
    }
    catch (const std::exception &ex)
    {
        // Out of memory or a broken mutex; the message cannot be queued.
        fmt::print(stderr, "[leapcal::Logger] dropped message: {}\n", ex.what());
    }
}

// ============================================================================
// Level helpers
// ============================================================================

const char *level_to_string(Logger::Level lvl) noexcept
{
    switch (lvl)
    {
    case Logger::Level::L_TRACE: return "TRACE";
    case Logger::Level::L_DEBUG: return "DEBUG";
    case Logger::Level::L_INFO: return "INFO";
    case Logger::Level::L_WARNING: return "WARN";
    case Logger::Level::L_ERROR: return "ERROR";
    case Logger::Level::L_SYSTEM: return "SYSTEM";
    default: return "UNK";
    }
}

std::optional<Logger::Level> parse_level(std::string_view name) noexcept
{
    if (name == "trace") return Logger::Level::L_TRACE;
    if (name == "debug") return Logger::Level::L_DEBUG;
    if (name == "info") return Logger::Level::L_INFO;
    if (name == "warn" || name == "warning") return Logger::Level::L_WARNING;
    if (name == "error") return Logger::Level::L_ERROR;
    if (name == "system") return Logger::Level::L_SYSTEM;
    return std::nullopt;
}

} // namespace leapcal::utils
