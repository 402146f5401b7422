#pragma once
#include "logging/log_manager.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace test_support {

    inline std::optional<std::string> contextOf(
        const logging::LogEntry &entry, const std::string &key) {
        for(const auto &[name, value] : entry.contexts) {
            if(name == key) {
                return value;
            }
        }
        return {};
    }

    /**
     * Captures every log entry at or above the given level for the lifetime of the object and
     * keeps them off the output sink.
     */
    class LogCapture {
        logging::Level _previous;
        mutable std::mutex _mutex;
        std::vector<logging::LogEntry> _entries;

    public:
        explicit LogCapture(logging::Level level = logging::Level::Trace)
            : _previous(logging::LogManager::get().level()) {
            logging::LogManager::get().setLevel(level);
            logging::LogManager::get().setWatch([this](const logging::LogEntry &entry) {
                std::lock_guard guard{_mutex};
                _entries.push_back(entry);
                return true;
            });
        }
        LogCapture(const LogCapture &) = delete;
        LogCapture(LogCapture &&) = delete;
        LogCapture &operator=(const LogCapture &) = delete;
        LogCapture &operator=(LogCapture &&) = delete;
        ~LogCapture() {
            logging::LogManager::get().clearWatch();
            logging::LogManager::get().setLevel(_previous);
        }

        [[nodiscard]] std::vector<logging::LogEntry> entries() const {
            std::lock_guard guard{_mutex};
            return _entries;
        }

        [[nodiscard]] bool hasEvent(const std::string &event) const {
            std::lock_guard guard{_mutex};
            for(const auto &entry : _entries) {
                if(entry.event == event) {
                    return true;
                }
            }
            return false;
        }

        [[nodiscard]] std::optional<logging::LogEntry> find(const std::string &event) const {
            std::lock_guard guard{_mutex};
            for(const auto &entry : _entries) {
                if(entry.event == event) {
                    return entry;
                }
            }
            return {};
        }
    };

} // namespace test_support
