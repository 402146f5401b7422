#include "rules/address_range.hpp"
#include "errors/error_base.hpp"
#include <arpa/inet.h>
#include <cstdlib>

namespace rules {

    bool AddressRange::parseAddress(
        std::string_view text, int &family, std::array<uint8_t, 16> &out) {
        std::string address{text};
        out.fill(0);
        if(inet_pton(AF_INET, address.c_str(), out.data()) == 1) {
            family = AF_INET;
            return true;
        }
        if(inet_pton(AF_INET6, address.c_str(), out.data()) == 1) {
            family = AF_INET6;
            return true;
        }
        return false;
    }

    AddressRange AddressRange::parse(std::string_view cidr) {
        AddressRange range;
        range._source = cidr;
        auto slash = cidr.find('/');
        auto addressPart = cidr.substr(0, slash);
        if(!parseAddress(addressPart, range._family, range._network)) {
            throw errors::RuleError("Invalid address range: " + std::string(cidr));
        }
        unsigned maxBits = range._family == AF_INET ? 32 : 128;
        range._prefixBits = maxBits;
        if(slash != std::string_view::npos) {
            std::string bits{cidr.substr(slash + 1)};
            char *end = nullptr;
            unsigned long value = std::strtoul(bits.c_str(), &end, 10);
            if(bits.empty() || end == nullptr || *end != '\0' || value > maxBits) {
                throw errors::RuleError("Invalid prefix length in address range: " + std::string(cidr));
            }
            range._prefixBits = static_cast<unsigned>(value);
        }
        return range;
    }

    bool AddressRange::contains(std::string_view address) const {
        int family = 0;
        std::array<uint8_t, 16> candidate{};
        if(!parseAddress(address, family, candidate) || family != _family) {
            return false;
        }
        unsigned fullBytes = _prefixBits / 8;
        for(unsigned i = 0; i < fullBytes; i++) {
            if(candidate[i] != _network[i]) {
                return false;
            }
        }
        unsigned remaining = _prefixBits % 8;
        if(remaining == 0) {
            return true;
        }
        auto mask = static_cast<uint8_t>(0xFFu << (8 - remaining));
        return (candidate[fullBytes] & mask) == (_network[fullBytes] & mask);
    }

} // namespace rules
