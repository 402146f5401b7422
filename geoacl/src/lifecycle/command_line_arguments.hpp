#pragma once
#include "errors/error_base.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lifecycle {

    /**
     * One entry of a command line table: a short option ("-c"), a long option ("--config") and
     * a description for the usage text.
     */
    class argument {
    protected:
        const std::string _option;
        const std::string _longOption;
        const std::string _description;

        [[nodiscard]] bool isMatch(const std::string &argString) const {
            std::string a = argString;
            std::transform(a.begin(), a.end(), a.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return a == _option || a == _longOption;
        }

        argument(
            const std::string_view option,
            const std::string_view longOption,
            const std::string_view description)
            : _option(std::string("-") + std::string(option)),
              _longOption(std::string("--") + std::string(longOption)), _description(description) {
        }

    public:
        virtual ~argument() = default;

        argument(argument &&) = delete;
        argument &operator=(const argument &rhs) = delete;
        argument(const argument &) = delete;
        argument &operator=(argument &&) = delete;

        [[nodiscard]] std::string getDescription() const {
            return _option + "\t" + _longOption + " : " + _description;
        }

        /**
         * Consumes the argument at i (and its value, if any) when it matches. `end` bounds the
         * argument list.
         */
        virtual bool process(
            void *handlerParent,
            std::vector<std::string>::const_iterator &i,
            std::vector<std::string>::const_iterator end) const = 0;
    };

    class argumentFlag : public argument {
        using handlerType = std::function<void(void *)>;
        handlerType _handler;

    public:
        template<typename... A>
        explicit argumentFlag(handlerType handler, A &&...a)
            : argument(std::forward<A>(a)...), _handler(std::move(handler)) {
        }

        bool process(
            void *handlerParent,
            std::vector<std::string>::const_iterator &i,
            std::vector<std::string>::const_iterator) const override {
            if(isMatch(*i)) {
                _handler(handlerParent);
                return true;
            }
            return false;
        }
    };

    template<class T>
    class argumentValue : public argument {
    protected:
        T _extractValue(const std::string &val) const;

        using handlerType = std::function<void(void *, T)>;
        handlerType _handler;

    public:
        template<typename... A>
        explicit argumentValue(handlerType handler, A &&...a)
            : argument(std::forward<A>(a)...), _handler(std::move(handler)) {
        }

        bool process(
            void *handlerParent,
            std::vector<std::string>::const_iterator &i,
            std::vector<std::string>::const_iterator end) const override {
            if(!isMatch(*i)) {
                return false;
            }
            if(std::next(i) == end) {
                throw errors::CommandLineArgumentError("Missing a value for " + _longOption);
            }
            ++i;
            try {
                _handler(handlerParent, _extractValue(*i));
            } catch(const std::invalid_argument &e) {
                throw errors::CommandLineArgumentError(
                    "Invalid argument for " + _longOption + ": " + e.what());
            }
            return true;
        }
    };

    template<>
    inline std::string argumentValue<std::string>::_extractValue(const std::string &val) const {
        if(val.empty()) {
            throw std::invalid_argument("Missing a parameter");
        }
        return val;
    }

} // namespace lifecycle
