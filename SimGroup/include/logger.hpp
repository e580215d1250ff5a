#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>
#include <charconv>

#define SIMGROUP_TRACE(...) ::simgroup::logger::trace(__VA_ARGS__)
#define SIMGROUP_DEBUG(...) ::simgroup::logger::debug(__VA_ARGS__)
#define SIMGROUP_INFO(...) ::simgroup::logger::info(__VA_ARGS__)
#define SIMGROUP_WARN(...) ::simgroup::logger::warn(__VA_ARGS__)
#define SIMGROUP_ERROR(...) ::simgroup::logger::error(__VA_ARGS__)

/**
 * -------------
 * USAGE OVERVIEW
 * -------------
 *
 * // Initialize once, specifying log level, ring size (power-of-two) and an optional log file:
 * simgroup::logger::init(simgroup::logger::Level::INFO, 4096, "simgroup.log");
 *
 * // Log from multiple threads with:
 * SIMGROUP_INFO("component", arg1, argN);
 *
 * // On shutdown (drains pending messages):
 * simgroup::logger::shutdown();
 *
 * Messages logged before init() or after shutdown() are dropped.
*/

namespace simgroup::logger
{
    enum Level : uint8_t
    {
        TRACE = 0,
        DEBUG,
        INFO,
        WARN,
        ERROR_L
    };

    constexpr const char* levelToStr(Level lv) noexcept
    {
        switch (lv)
        {
        case TRACE: return "TRACE";
        case DEBUG: return "DEBUG";
        case INFO:  return "INFO";
        case WARN:  return "WARN";
        case ERROR_L: return "ERROR";
        }
        return "UNKNOWN";
    }

    //-----------------------------------
    // Internal Helper to Build Strings
    //-----------------------------------
    namespace detail
    {
        inline void appendOne(std::string& dest, const char* str)
        {
            if (str) {
                dest += str;
            }
        }

        inline void appendOne(std::string& dest, const std::string& s)
        {
            dest += s;
        }

        inline void appendOne(std::string& dest, const std::filesystem::path& p)
        {
            dest += p.string();
        }

        template <typename T>
        inline constexpr bool isCharsInteger = std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>;

        // Integers go through std::to_chars
        template <typename T,
            typename std::enable_if_t<isCharsInteger<T>, int> = 0>
        inline void appendOne(std::string& dest, T val)
        {
            char buf[32];
            auto end = std::to_chars(buf, buf + sizeof(buf), val).ptr;
            dest.append(buf, static_cast<size_t>(end - buf));
        }

        // Fallback for any other type that implements operator<<
        template <typename T,
            typename std::enable_if_t<!isCharsInteger<std::decay_t<T>> &&
            !std::is_same_v<std::decay_t<T>, std::string> &&
            !std::is_same_v<std::decay_t<T>, std::filesystem::path> &&
            !std::is_convertible_v<T, const char*>, int> = 0>
        inline void appendOne(std::string& dest, const T& val)
        {
            thread_local std::ostringstream oss;
            oss.str(std::string{});
            oss.clear();
            oss << val;
            dest += oss.str();
        }

        template <typename... Ts>
        inline void buildString(std::string& dest, Ts&&... args)
        {
            (appendOne(dest, std::forward<Ts>(args)), ...);
        }
    } // namespace detail

    //-----------------------------------
    // Internal Ring Buffer
    //-----------------------------------
    struct LogMessage
    {
        Level level = INFO;
        int64_t microsSinceEpoch = 0;
        std::string id;
        std::string text;
    };

    class LogRing
    {
    public:
        explicit LogRing(size_t size)
            : size_(size), mask_(size - 1), slots_(new Slot[size]), head_(0), tail_(0) {}

        LogRing(const LogRing&) = delete;
        LogRing& operator=(const LogRing&) = delete;

        // Non-blocking multi-producer push. Returns false if the ring was full.
        bool tryPush(LogMessage&& msg)
        {
            auto pos = tail_.load(std::memory_order_relaxed);
            for (;;) {
                if (pos - head_.load(std::memory_order_acquire) >= size_) return false;
                if (tail_.compare_exchange_weak(pos, pos + 1, std::memory_order_acq_rel)) break;
            }

            Slot& slot = slots_[pos & mask_];
            slot.message = std::move(msg);
            slot.ready.store(true, std::memory_order_release);
            return true;
        }

        // Single-consumer pop. A slot is only handed out once its producer has published it.
        bool tryPop(LogMessage& out)
        {
            const auto currentHead = head_.load(std::memory_order_relaxed);
            if (currentHead >= tail_.load(std::memory_order_acquire)) return false;

            Slot& slot = slots_[currentHead & mask_];
            if (!slot.ready.load(std::memory_order_acquire)) return false;

            out = std::move(slot.message);
            slot.ready.store(false, std::memory_order_relaxed);
            head_.store(currentHead + 1, std::memory_order_release);
            return true;
        }

    private:
        struct Slot
        {
            std::atomic<bool> ready{ false };
            LogMessage message;
        };

        size_t size_;
        size_t mask_;
        std::unique_ptr<Slot[]> slots_;
        alignas(64) std::atomic<uint64_t> head_;
        alignas(64) std::atomic<uint64_t> tail_;
    };

    //-----------------------------------
    // The Logger Singleton
    //-----------------------------------
    class Logger
    {
    public:
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        static Logger& instance()
        {
            static Logger s;
            return s;
        }

        // Called once at startup. ringSize is rounded up to a power of two.
        void init(Level level, size_t ringSize, const std::filesystem::path& logFile)
        {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            if (ring_) return;

            size_t size = 1;
            while (size < ringSize) size <<= 1;

            if (!logFile.empty()) {
                std::error_code ec;
                if (logFile.has_parent_path()) std::filesystem::create_directories(logFile.parent_path(), ec);
                file_.open(logFile, std::ios::out | std::ios::trunc);
                if (!file_) {
                    std::cerr << "Warning: Cannot open log file '" << logFile.string() << "'\n";
                }
            }

            ring_ = std::make_unique<LogRing>(size);
            currentLevel_.store(level, std::memory_order_relaxed);
            running_.store(true, std::memory_order_release);
            consumerThread_ = std::thread(&Logger::consumerLoop, this);
        }

        void setLevel(Level level) { currentLevel_.store(level, std::memory_order_relaxed); }

        bool enabled(Level lv) const
        {
            return running_.load(std::memory_order_acquire) && lv >= currentLevel_.load(std::memory_order_relaxed);
        }

        // Non-blocking log function
        template<typename IdType, typename... Args>
        void log(Level lv, IdType&& id, Args&&... args)
        {
            if (!enabled(lv)) return;

            std::string text;
            text.reserve(128);
            detail::buildString(text, std::forward<Args>(args)...);

            LogMessage msg;
            msg.level = lv;
            msg.microsSinceEpoch = nowMicrosSinceEpoch();
            msg.id = std::forward<IdType>(id);
            msg.text = std::move(text);

            std::lock_guard<std::mutex> lock(pushMutex_);
            if (ring_) ring_->tryPush(std::move(msg));
        }

        void shutdown()
        {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            if (running_.exchange(false, std::memory_order_acq_rel))
            {
                if (consumerThread_.joinable()) {
                    consumerThread_.join();
                }

                std::lock_guard<std::mutex> pushLock(pushMutex_);
                ring_.reset();
                if (file_.is_open()) file_.close();
            }
        }

    private:
        Logger() = default;
        ~Logger() { shutdown(); }

        static int64_t nowMicrosSinceEpoch()
        {
            using namespace std::chrono;
            return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
        }

        void consumerLoop()
        {
            while (running_.load(std::memory_order_acquire))
            {
                LogMessage msg;
                while (ring_->tryPop(msg)) { printMessage(msg); }

                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }

            // Drain any remaining
            LogMessage leftover;
            while (ring_->tryPop(leftover)) { printMessage(leftover); }
            std::cout << std::flush;
            if (file_.is_open()) file_.flush();
        }

        void printMessage(const LogMessage& lm)
        {
            using namespace std::chrono;
            auto tp = system_clock::time_point(microseconds(lm.microsSinceEpoch));

            std::time_t t = system_clock::to_time_t(tp);
            std::tm tmBuf{};
#ifdef _WIN32
            localtime_s(&tmBuf, &t);
#else
            localtime_r(&t, &tmBuf);
#endif

            auto msPart = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;

            char timeBuf[32];
            std::snprintf(timeBuf, sizeof(timeBuf),
                "%02d:%02d:%02d.%03d",
                tmBuf.tm_hour, tmBuf.tm_min, tmBuf.tm_sec,
                static_cast<int>(msPart));

            std::string line;
            line.reserve(lm.text.size() + 48);
            line += '[';
            line += timeBuf;
            line += "] [";
            line += levelToStr(lm.level);
            line += "] ";
            if (!lm.id.empty()) {
                line += '[';
                line += lm.id;
                line += "] ";
            }
            line += lm.text;
            line += '\n';

            std::cout << line;
            if (file_.is_open()) file_ << line;
        }

        std::unique_ptr<LogRing> ring_;
        std::atomic<Level> currentLevel_{ INFO };
        std::atomic<bool> running_{ false };
        std::thread consumerThread_;
        std::ofstream file_;
        std::mutex lifecycleMutex_;
        std::mutex pushMutex_;
    };

    //-----------------------------------
    // Public API
    //-----------------------------------
    inline void init(Level lv, size_t ringSize = 4096, const std::filesystem::path& logFile = {})
    {
        Logger::instance().init(lv, ringSize, logFile);
    }

    inline void shutdown()
    {
        Logger::instance().shutdown();
    }

    template<typename IdType, typename... Args>
    inline void log(Level lv, IdType&& id, Args&&... args)
    {
        Logger::instance().log(lv, std::forward<IdType>(id), std::forward<Args>(args)...);
    }

    template<typename IdType, typename... Args>
    inline void trace(IdType&& id, Args&&... args) { log(TRACE, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void debug(IdType&& id, Args&&... args) { log(DEBUG, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void info(IdType&& id, Args&&... args) { log(INFO, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void warn(IdType&& id, Args&&... args) { log(WARN, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void error(IdType&& id, Args&&... args) { log(ERROR_L, std::forward<IdType>(id), std::forward<Args>(args)...); }

} // namespace simgroup::logger
