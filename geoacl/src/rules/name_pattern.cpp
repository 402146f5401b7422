#include "rules/name_pattern.hpp"
#include "errors/error_base.hpp"
#include <algorithm>
#include <cctype>

namespace rules {

    char NamePattern::getActualChar(std::string_view str) {
        if(str.size() < 4) {
            return nullChar;
        }
        // Match the escape format ${c}
        if(str[0] == escapeChar && str[1] == '{' && str[3] == '}') {
            return str[2];
        }
        return nullChar;
    }

    bool NamePattern::isSpecialChar(char actualChar) {
        return actualChar == wildcardChar || actualChar == escapeChar
               || actualChar == singleCharWildcard;
    }

    NamePattern NamePattern::compile(std::string_view pattern, bool ignoreCase) {
        NamePattern out;
        out._source = pattern;
        if(ignoreCase) {
            std::transform(
                out._source.begin(), out._source.end(), out._source.begin(), [](unsigned char c) {
                    return static_cast<char>(std::toupper(c));
                });
        }
        const std::string &subject = out._source;
        if(subject.empty()) {
            throw errors::RuleError("Pattern cannot be empty");
        }
        if(subject == GLOBAL_WILDCARD) {
            out._kind = Kind::ANY;
            return out;
        }

        std::string current;
        bool sawWildcard = false;
        auto length = subject.size();
        for(size_t i = 0; i < length; i++) {
            char currentChar = subject[i];
            if(currentChar == escapeChar && i + 1 < length && subject[i + 1] == '{') {
                char actualChar = getActualChar(std::string_view(subject).substr(i));
                if(actualChar == nullChar || !isSpecialChar(actualChar)) {
                    throw errors::RuleError(
                        "Pattern contains an invalid escape sequence. You can use *, $, or ?");
                }
                current.push_back(actualChar);
                out._trailingWildcard = false;
                // skip the rest of the escape sequence
                i = i + 3;
                continue;
            }
            if(currentChar == singleCharWildcard) {
                throw errors::RuleError(
                    "Pattern contains invalid character: '?'. Use an escape sequence: ${?}. The "
                    "'?' character isn't supported as a wildcard");
            }
            if(currentChar == wildcardChar) {
                if(!sawWildcard && current.empty()) {
                    out._leadingWildcard = true;
                }
                if(!current.empty()) {
                    out._segments.push_back(current);
                    current.clear();
                }
                sawWildcard = true;
                out._trailingWildcard = true;
                continue;
            }
            out._trailingWildcard = false;
            current.push_back(currentChar);
        }
        if(!current.empty()) {
            out._segments.push_back(current);
        }
        if(!sawWildcard) {
            out._kind = Kind::EXACT;
            if(out._segments.empty()) {
                out._segments.emplace_back();
            }
            return out;
        }
        // "**" and friends degenerate to the global wildcard
        out._kind = out._segments.empty() ? Kind::ANY : Kind::GLOB;
        return out;
    }

    int NamePattern::specificity() const noexcept {
        switch(_kind) {
            case Kind::EXACT:
                return 2;
            case Kind::GLOB:
                return 1;
            case Kind::ANY:
                return 0;
        }
        return 0;
    }

    bool NamePattern::matches(const std::optional<std::string> &value) const {
        if(_kind == Kind::ANY) {
            return true;
        }
        return value.has_value() && matches(std::string_view(value.value()));
    }

    bool NamePattern::matches(std::string_view value) const {
        switch(_kind) {
            case Kind::ANY:
                return true;
            case Kind::EXACT:
                return value == _segments.front();
            case Kind::GLOB:
                return matchesGlob(value);
        }
        return false;
    }

    bool NamePattern::matchesGlob(std::string_view value) const {
        size_t pos = 0;
        size_t first = 0;
        size_t last = _segments.size();
        if(!_leadingWildcard) {
            const auto &prefix = _segments.front();
            if(value.substr(0, prefix.size()) != prefix) {
                return false;
            }
            pos = prefix.size();
            first = 1;
        }
        if(!_trailingWildcard && last > first) {
            // The final literal must sit at the very end and must not overlap what was consumed
            const auto &suffix = _segments.back();
            if(value.size() < pos + suffix.size()
               || value.substr(value.size() - suffix.size()) != suffix) {
                return false;
            }
            value = value.substr(0, value.size() - suffix.size());
            last--;
        }
        // Middle segments are matched greedily left to right
        for(size_t i = first; i < last; i++) {
            auto found = value.find(_segments[i], pos);
            if(found == std::string_view::npos) {
                return false;
            }
            pos = found + _segments[i].size();
        }
        return true;
    }

} // namespace rules
