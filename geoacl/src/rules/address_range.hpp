#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rules {

    /**
     * CIDR address range ("10.0.0.0/8", "2001:db8::/32"). A bare address is a /32 (or /128).
     */
    class AddressRange {
        int _family{0};
        std::array<uint8_t, 16> _network{};
        unsigned _prefixBits{0};
        std::string _source;

        static bool parseAddress(std::string_view text, int &family, std::array<uint8_t, 16> &out);

    public:
        /**
         * Raises errors::RuleError when the range is malformed.
         */
        static AddressRange parse(std::string_view cidr);

        [[nodiscard]] bool contains(std::string_view address) const;
        [[nodiscard]] bool contains(const std::optional<std::string> &address) const {
            return address.has_value() && contains(std::string_view(address.value()));
        }

        [[nodiscard]] const std::string &source() const noexcept {
            return _source;
        }
    };

} // namespace rules
