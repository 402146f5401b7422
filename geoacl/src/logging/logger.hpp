#pragma once
#include "logging/log_manager.hpp"
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace logging {

    /**
     * A single log entry under construction. Nothing is formatted unless the level is enabled.
     */
    class Event {
        bool _enabled;
        LogEntry _entry;

        template<typename T>
        static std::string toString(const T &value) {
            if constexpr(std::is_same_v<T, bool>) {
                return value ? "true" : "false";
            } else if constexpr(std::is_arithmetic_v<T>) {
                return std::to_string(value);
            } else {
                return std::string(value);
            }
        }

    public:
        Event(Level level, std::string_view logger);

        Event &event(std::string_view name) {
            if(_enabled) {
                _entry.event = name;
            }
            return *this;
        }

        template<typename T>
        Event &kv(std::string_view key, const T &value) {
            if(_enabled) {
                _entry.contexts.emplace_back(std::string(key), toString(value));
            }
            return *this;
        }

        template<typename T>
        Event &kv(std::string_view key, const std::optional<T> &value) {
            if(_enabled && value.has_value()) {
                _entry.contexts.emplace_back(std::string(key), toString(value.value()));
            }
            return *this;
        }

        Event &cause(const std::exception &e) {
            if(_enabled) {
                _entry.cause = e.what();
            }
            return *this;
        }

        void log(std::string_view message = {});

        template<typename E>
        [[noreturn]] void logAndThrow(const E &error) {
            static_assert(std::is_base_of_v<std::exception, E>);
            if(_enabled) {
                _entry.cause = error.what();
            }
            log();
            throw error;
        }
    };

    /**
     * Named logger. Typical use:
     *   static const auto LOG = logging::Logger::of("geoacl.rules");
     *   LOG.atWarn().event("rule-skipped").kv("rule", id).log("Rule has no patterns");
     */
    class Logger {
        std::string _name;

        explicit Logger(std::string_view name) : _name(name) {
        }

    public:
        static Logger of(std::string_view name) {
            return Logger(name);
        }

        [[nodiscard]] const std::string &name() const noexcept {
            return _name;
        }

        [[nodiscard]] Event at(Level level) const {
            return Event(level, _name);
        }

        [[nodiscard]] Event atError() const {
            return at(Level::Error);
        }

        [[nodiscard]] Event atWarn() const {
            return at(Level::Warn);
        }

        [[nodiscard]] Event atInfo() const {
            return at(Level::Info);
        }

        [[nodiscard]] Event atDebug() const {
            return at(Level::Debug);
        }

        [[nodiscard]] Event atTrace() const {
            return at(Level::Trace);
        }
    };

} // namespace logging
