#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rules {

    /**
     * A compiled name pattern. Three shapes are recognised:
     * - ANY: the global wildcard "*", matches every value including an unset one.
     * - EXACT: no unescaped wildcard, matches the literal value.
     * - GLOB: one or more "*" inside a name ("roads_*", "*_2024", "a*b*c"), each "*" matching
     *   any run of characters.
     * A literal "*" or "$" is written with the escape sequence "${*}" / "${$}". The character
     * "?" is not a wildcard and must be escaped as "${?}".
     */
    class NamePattern {
    public:
        enum class Kind { ANY, EXACT, GLOB };

        static constexpr auto GLOBAL_WILDCARD = "*";
        static constexpr auto wildcardChar = '*';
        static constexpr auto escapeChar = '$';
        static constexpr auto singleCharWildcard = '?';
        static constexpr auto nullChar = '\0';

    private:
        Kind _kind{Kind::ANY};
        std::string _source{GLOBAL_WILDCARD};
        // For EXACT, a single literal; for GLOB, the literal segments between wildcards
        std::vector<std::string> _segments;
        bool _leadingWildcard{false};
        bool _trailingWildcard{false};

        [[nodiscard]] bool matchesGlob(std::string_view value) const;

    public:
        NamePattern() = default;

        /**
         * Compile a pattern; raises errors::RuleError for an invalid escape or a bare '?'.
         * With ignoreCase the pattern is upper-cased and must be matched against upper-cased
         * values.
         */
        static NamePattern compile(std::string_view pattern, bool ignoreCase = false);
        static NamePattern any() {
            return NamePattern{};
        }

        [[nodiscard]] Kind kind() const noexcept {
            return _kind;
        }
        [[nodiscard]] const std::string &source() const noexcept {
            return _source;
        }
        [[nodiscard]] bool isAny() const noexcept {
            return _kind == Kind::ANY;
        }

        /**
         * Exact = 2, glob = 1, wildcard = 0.
         */
        [[nodiscard]] int specificity() const noexcept;

        [[nodiscard]] bool matches(std::string_view value) const;
        [[nodiscard]] bool matches(const std::optional<std::string> &value) const;

        static char getActualChar(std::string_view str);
        static bool isSpecialChar(char actualChar);
    };

} // namespace rules
