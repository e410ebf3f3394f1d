#include "firmlink/types.h"

#include <algorithm>
#include <cctype>

namespace firmlink {

std::string format_entity_id(EntityId id) {
    return "E" + std::to_string(id);
}

EntityId parse_entity_id(const std::string& text) {
    std::size_t pos = 0;
    if (!text.empty() && (text[0] == 'E' || text[0] == 'e')) {
        pos = 1;
    }
    if (pos >= text.size()) {
        return kNoEntity;
    }
    EntityId value = 0;
    for (; pos < text.size(); ++pos) {
        unsigned char c = static_cast<unsigned char>(text[pos]);
        if (!std::isdigit(c)) {
            return kNoEntity;
        }
        value = value * 10 + static_cast<EntityId>(c - '0');
    }
    return value;
}

int inventor_count(const FactRecord& fact) {
    int listed = 0;
    for (const auto& inventor : fact.inventors) {
        if (!inventor.empty()) {
            ++listed;
        }
    }
    return std::max(fact.declared_inventors, listed);
}

const char* tier_name(MatchTier tier) {
    switch (tier) {
        case MatchTier::Exact: return "exact";
        case MatchTier::StrictRule: return "strict-rule";
        case MatchTier::Fuzzy: return "fuzzy";
    }
    return "exact";
}

const char* decision_name(MatchDecision decision) {
    switch (decision) {
        case MatchDecision::AutoAccepted: return "auto-accepted";
        case MatchDecision::NeedsReview: return "needs-review";
        case MatchDecision::Rejected: return "rejected";
    }
    return "rejected";
}

bool parse_decision(const std::string& text, MatchDecision& decision) {
    if (text == "auto-accepted") {
        decision = MatchDecision::AutoAccepted;
    } else if (text == "needs-review") {
        decision = MatchDecision::NeedsReview;
    } else if (text == "rejected") {
        decision = MatchDecision::Rejected;
    } else {
        return false;
    }
    return true;
}

std::string describe(const IdentifierSet& ids) {
    return "gvkey=" + ids.gvkey + " cusip=" + ids.cusip + " cik=" + ids.cik;
}

} // namespace firmlink
