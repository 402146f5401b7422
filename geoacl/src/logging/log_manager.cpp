#include "logging/log_manager.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace logging {

    LogManager::LogManager() : _output(&std::cerr) {
        const char *envLevel = std::getenv(LEVEL_ENV);
        if(envLevel != nullptr) {
            _threshold = parseLevel(envLevel).value_or(Level::Info);
        }
    }

    LogManager &LogManager::get() {
        static LogManager instance{};
        return instance;
    }

    bool LogManager::isEnabled(Level level) const {
        std::shared_lock guard{_mutex};
        return level != Level::None && level >= _threshold;
    }

    Level LogManager::level() const {
        std::shared_lock guard{_mutex};
        return _threshold;
    }

    void LogManager::setLevel(Level level) {
        std::unique_lock guard{_mutex};
        _threshold = level;
    }

    void LogManager::setOutput(std::ostream &output) {
        std::unique_lock guard{_mutex};
        _output = &output;
    }

    void LogManager::setWatch(WatchFn watch) {
        std::unique_lock guard{_mutex};
        _watch = std::move(watch);
    }

    void LogManager::clearWatch() {
        std::unique_lock guard{_mutex};
        _watch = nullptr;
    }

    void LogManager::publish(const LogEntry &entry) const {
        WatchFn watch;
        std::ostream *output;
        {
            std::shared_lock guard{_mutex};
            watch = _watch;
            output = _output;
        }
        // Called unlocked so a watch may log or change the level itself
        if(watch && watch(entry)) {
            return;
        }
        auto line = format(entry);
        std::lock_guard writing{_outputMutex};
        *output << line << '\n';
        output->flush();
    }

    std::optional<Level> LogManager::parseLevel(std::string_view name) {
        std::string lower{name};
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if(lower == "trace") {
            return Level::Trace;
        }
        if(lower == "debug") {
            return Level::Debug;
        }
        if(lower == "info") {
            return Level::Info;
        }
        if(lower == "warn" || lower == "warning") {
            return Level::Warn;
        }
        if(lower == "error") {
            return Level::Error;
        }
        if(lower == "none" || lower == "off") {
            return Level::None;
        }
        return {};
    }

    std::string_view LogManager::levelName(Level level) noexcept {
        switch(level) {
            case Level::Trace:
                return "TRACE";
            case Level::Debug:
                return "DEBUG";
            case Level::Info:
                return "INFO";
            case Level::Warn:
                return "WARN";
            case Level::Error:
                return "ERROR";
            case Level::None:
                return "NONE";
        }
        return "UNKNOWN";
    }

    std::string LogManager::format(const LogEntry &entry) {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        auto levelStr = levelName(entry.level);
        writer.StartObject();
        writer.Key("level");
        writer.String(levelStr.data(), static_cast<rapidjson::SizeType>(levelStr.size()));
        writer.Key("logger");
        writer.String(entry.logger.c_str(), static_cast<rapidjson::SizeType>(entry.logger.size()));
        if(!entry.event.empty()) {
            writer.Key("event");
            writer.String(
                entry.event.c_str(), static_cast<rapidjson::SizeType>(entry.event.size()));
        }
        writer.Key("message");
        writer.String(
            entry.message.c_str(), static_cast<rapidjson::SizeType>(entry.message.size()));
        if(!entry.contexts.empty()) {
            writer.Key("contexts");
            writer.StartObject();
            for(const auto &[key, value] : entry.contexts) {
                writer.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
                writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
            }
            writer.EndObject();
        }
        if(!entry.cause.empty()) {
            writer.Key("cause");
            writer.String(
                entry.cause.c_str(), static_cast<rapidjson::SizeType>(entry.cause.size()));
        }
        writer.EndObject();
        return {buffer.GetString(), buffer.GetSize()};
    }

} // namespace logging
