#include "logging/logger.hpp"

namespace logging {

    Event::Event(Level level, std::string_view logger)
        : _enabled(LogManager::get().isEnabled(level)) {
        if(_enabled) {
            _entry.level = level;
            _entry.logger = logger;
        }
    }

    void Event::log(std::string_view message) {
        if(!_enabled) {
            return;
        }
        _entry.message = message;
        LogManager::get().publish(_entry);
    }

} // namespace logging
