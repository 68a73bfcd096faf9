#include "pomelo/response_filter.hpp"
#include <algorithm>

namespace pomelo {

ResponseFilter::ResponseFilter(const GeoLookup* geo, FilterPolicy policy)
    : geo_(geo), policy_(policy) {}

bool ResponseFilter::passesStatic(
    const CandidateRecord& record,
    const PolicyDecision& decision
) const {
    if (!decision.allowed_types.contains(record.rrtype)) {
        return false;
    }

    // 以下只作用于 AAAA
    if (record.rrtype != dns_type::AAAA) {
        return true;
    }

    for (const auto& net : decision.destination_deny) {
        if (net.contains(record.address)) {
            return false;
        }
    }

    if (!decision.country_filter.empty() && !countryAllowed(record.address, decision)) {
        return false;
    }
    return true;
}

bool ResponseFilter::countryAllowed(
    const boost::asio::ip::address& addr,
    const PolicyDecision& decision
) const {
    std::optional<std::string> country;
    if (geo_) {
        country = geo_->countryOf(addr);
    }
    if (!country) {
        return policy_.unknown_country_allowed;
    }

    std::string code = *country;
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return decision.country_filter.count(code) > 0;
}

bool ResponseFilter::probeAllowed(
    const boost::asio::ip::address& addr,
    const ProbeResults& probes
) const {
    auto it = probes.find(addr);
    ProbeResult result = it == probes.end() ? ProbeResult::Indeterminate : it->second;

    switch (result) {
        case ProbeResult::Reachable:
            return true;
        case ProbeResult::Unreachable:
            return false;
        case ProbeResult::Indeterminate:
            return policy_.indeterminate_allowed;
    }
    return false;
}

std::vector<boost::asio::ip::address> ResponseFilter::probeTargets(
    const AggregatedAnswer& answer,
    const PolicyDecision& decision
) const {
    std::vector<boost::asio::ip::address> targets;
    if (!decision.reachability_required) {
        return targets;
    }

    for (const auto& rr : answer.records) {
        if (rr.rrtype != dns_type::AAAA || !passesStatic(rr, decision)) {
            continue;
        }
        if (std::find(targets.begin(), targets.end(), rr.address) == targets.end()) {
            targets.push_back(rr.address);
        }
    }
    return targets;
}

ResolvedAnswer ResponseFilter::apply(
    const AggregatedAnswer& answer,
    const PolicyDecision& decision,
    const ProbeResults& probes
) const {
    ResolvedAnswer result;
    result.rcode = answer.rcode;

    for (const auto& rr : answer.records) {
        if (!passesStatic(rr, decision)) {
            continue;
        }
        if (rr.rrtype == dns_type::AAAA && decision.reachability_required &&
            !probeAllowed(rr.address, probes)) {
            continue;
        }
        result.records.push_back(rr);
    }
    return result;
}

} // namespace pomelo
