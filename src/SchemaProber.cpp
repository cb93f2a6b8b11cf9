#include "SchemaProber.hpp"
#include <algorithm>
#include <cctype>

namespace querymind {

ReferentialAction parseReferentialAction(const std::string& rule) {
    std::string upper = rule;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    std::replace(upper.begin(), upper.end(), '_', ' ');

    if (upper == "CASCADE") {
        return ReferentialAction::Cascade;
    } else if (upper == "SET NULL") {
        return ReferentialAction::SetNull;
    } else if (upper == "SET DEFAULT") {
        return ReferentialAction::SetDefault;
    } else if (upper == "RESTRICT") {
        return ReferentialAction::Restrict;
    }
    return ReferentialAction::NoAction;
}

std::string referentialActionToString(ReferentialAction action) {
    switch (action) {
        case ReferentialAction::Cascade:
            return "CASCADE";
        case ReferentialAction::SetNull:
            return "SET NULL";
        case ReferentialAction::SetDefault:
            return "SET DEFAULT";
        case ReferentialAction::Restrict:
            return "RESTRICT";
        case ReferentialAction::NoAction:
        default:
            return "NO ACTION";
    }
}

}  // namespace querymind
