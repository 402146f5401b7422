#pragma once
#include "request/decision_key.hpp"
#include "rules/rule.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace rules {

    /**
     * JSON wire format of the remote authorization backend.
     *
     * Query:    {"user":..,"roles":[..],"service":..,"request":..,"workspace":..,"layer":..,
     *            "subfield":..,"sourceAddress":..}   (unset fields are omitted)
     * Response: {"rules":[{"id":..,"priority":..,"grant":"ALLOW|DENY","access":"READ|WRITE|ADMIN",
     *            "workspace":..,"layer":..,"service":..,"request":..,"roles":[..],
     *            "addressRange":..}]}   (missing patterns mean "*")
     */
    class RuleCodec {
    public:
        [[nodiscard]] static std::string encodeQuery(const request::DecisionKey &key);

        /**
         * Raises errors::RuleError when the body is not a valid rule list.
         */
        [[nodiscard]] static std::vector<Rule> decodeRules(std::string_view body);
    };

} // namespace rules
