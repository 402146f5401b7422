#pragma once
#include <functional>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace logging {

    enum class Level { Trace, Debug, Info, Warn, Error, None };

    struct LogEntry {
        Level level{Level::Info};
        std::string logger;
        std::string event;
        std::string message;
        std::vector<std::pair<std::string, std::string>> contexts;
        std::string cause;
    };

    /**
     * Process-wide log state: threshold, output sink and an optional watch used to intercept
     * entries (tests use it to capture what was logged).
     */
    class LogManager {
    public:
        // Return true to consume the entry so it is not written to the output sink
        using WatchFn = std::function<bool(const LogEntry &entry)>;

    private:
        mutable std::shared_mutex _mutex;
        // Held only while a formatted line is written, so lines never interleave
        mutable std::mutex _outputMutex;
        Level _threshold{Level::Info};
        std::ostream *_output;
        WatchFn _watch;

        LogManager();

    public:
        static constexpr auto LEVEL_ENV = "GEOACL_LOG_LEVEL";

        LogManager(const LogManager &) = delete;
        LogManager(LogManager &&) = delete;
        LogManager &operator=(const LogManager &) = delete;
        LogManager &operator=(LogManager &&) = delete;
        ~LogManager() = default;

        static LogManager &get();

        [[nodiscard]] bool isEnabled(Level level) const;
        [[nodiscard]] Level level() const;
        void setLevel(Level level);
        void setOutput(std::ostream &output);
        void setWatch(WatchFn watch);
        void clearWatch();
        void publish(const LogEntry &entry) const;

        static std::optional<Level> parseLevel(std::string_view name);
        static std::string_view levelName(Level level) noexcept;
        static std::string format(const LogEntry &entry);
    };

} // namespace logging
