/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "nj_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using namespace nestjar::format_tools;

namespace nestjar::utils
{

namespace
{

/**
 * Runs user callbacks on their own thread so a slow or throwing callback never
 * stalls the logger worker.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() { worker_ = std::thread([this] { run(); }); }

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
            return;
        cv_.notify_one();
        if (worker_.joinable())
            worker_.join();
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
                if (queue_.empty())
                    return;
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[NESTJAR] logger error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_{false};
};

// --- Commands ---
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command =
    std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                 SetErrorCallbackCommand>;

void promise_set_safe(const std::shared_ptr<std::promise<bool>> &p, bool value)
{
    if (!p)
        return;
    try
    {
        p->set_value(value);
    }
    catch (const std::future_error &e)
    {
        NJ_DEBUG("Logger promise already satisfied: {}", e.what());
    }
}

LogMessage make_internal_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

} // namespace

struct Logger::Impl
{
    Impl();
    ~Impl();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void report_error(const std::string &message);
    bool switch_sink(std::function<std::unique_ptr<Sink>()> factory, std::string_view kind);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::unique_ptr<Sink> sink_;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex shutdown_mutex_;
    CallbackDispatcher callback_dispatcher_;
    std::thread worker_thread_;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
}

Logger::Impl::~Impl()
{
    shutdown();
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!shutdown_requested_.load(std::memory_order_acquire))
        {
            queue_.emplace_back(std::move(cmd));
            cv_.notify_one();
            return true;
        }
    }
    // Rejected: release any waiter.
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
                promise_set_safe(arg.promise, false);
        },
        cmd);
    return false;
}

void Logger::Impl::report_error(const std::string &message)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, message]() { cb(message); });
    }
    else
    {
        NJ_DEBUG("Logger error with no error callback installed: {}", message);
    }
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
            // Commands are rejected once the flag is set, so this batch is the last.
            stopping = shutdown_requested_.load();
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&cmd))
                {
                    if (sink_ && msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                        sink_->write(*msg);
                    continue;
                }

                std::visit(
                    [this](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            const std::string old_desc = sink_ ? sink_->description() : "null";
                            const std::string new_desc =
                                arg.new_sink ? arg.new_sink->description() : "null";
                            if (sink_)
                            {
                                sink_->write(make_internal_message(
                                    Logger::Level::L_SYSTEM,
                                    make_buffer("Switching log sink to: {}", new_desc)));
                                sink_->flush();
                            }
                            sink_ = std::move(arg.new_sink);
                            if (sink_)
                            {
                                sink_->write(make_internal_message(
                                    Logger::Level::L_SYSTEM,
                                    make_buffer("Log sink switched from: {}", old_desc)));
                            }
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            if (sink_)
                            {
                                sink_->write(make_internal_message(
                                    Logger::Level::L_ERROR, make_buffer("{}", arg.error_message)));
                            }
                            report_error(arg.error_message);
                            promise_set_safe(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            if (sink_)
                                sink_->flush();
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    cmd);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }
        local_queue.clear();

        if (stopping)
        {
            if (sink_)
            {
                try
                {
                    sink_->write(make_internal_message(Logger::Level::L_SYSTEM,
                                                       make_buffer("Logger is shutting down.")));
                    sink_->flush();
                }
                catch (const std::exception &e)
                {
                    report_error(fmt::format("Logger worker error: {}", e.what()));
                }
            }
            sink_.reset();
            NJ_DEBUG("Logger worker thread exiting.");
            return;
        }
    }
}

bool Logger::Impl::switch_sink(std::function<std::unique_ptr<Sink>()> factory,
                               std::string_view kind)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    try
    {
        enqueue_command(SetSinkCommand{factory(), promise});
    }
    catch (const std::exception &e)
    {
        enqueue_command(SinkCreationErrorCommand{
            fmt::format("Failed to create {}: {}", kind, e.what()), promise});
    }
    return future.get();
}

void Logger::Impl::shutdown()
{
    std::lock_guard<std::mutex> guard(shutdown_mutex_);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_requested_.store(true, std::memory_order_release);
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
        worker_thread_.join();
    callback_dispatcher_.shutdown();
}

// --- Public API ---

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::set_console()
{
    return pImpl->switch_sink([] { return std::make_unique<ConsoleSink>(); }, "ConsoleSink");
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    return pImpl->switch_sink(
        [&] { return std::make_unique<FileSink>(std::filesystem::path(utf8_path), use_flock); },
        "FileSink");
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

bool Logger::is_running() const noexcept
{
    return !pImpl->shutdown_requested_.load(std::memory_order_acquire);
}

void Logger::flush()
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
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
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name) noexcept
{
    const auto iequals = [name](std::string_view candidate)
    {
        return std::equal(name.begin(), name.end(), candidate.begin(), candidate.end(),
                          [](char a, char b)
                          {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };
    if (iequals("trace"))
        return Level::L_TRACE;
    if (iequals("debug"))
        return Level::L_DEBUG;
    if (iequals("info"))
        return Level::L_INFO;
    if (iequals("warn") || iequals("warning"))
        return Level::L_WARNING;
    if (iequals("error"))
        return Level::L_ERROR;
    if (iequals("system"))
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::should_log(Level lvl) const noexcept
{
    return !pImpl->shutdown_requested_.load(std::memory_order_relaxed) &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    try
    {
        pImpl->enqueue_command(make_internal_message(lvl, std::move(body)));
    }
    catch (const std::bad_alloc &)
    {
        std::fputs("[NESTJAR] logger out of memory; message dropped\n", stderr);
    }
}

} // namespace nestjar::utils
