#pragma once

#include <ens_mcp/ens/i_ens_resolver.hpp>
#include <ens_mcp/ens/result_envelope.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ens_mcp {

// Text records fetched by GetFullInfo, in output order.
constexpr std::array<const char*, 7> kProfileTextKeys = {
    "url", "email", "twitter", "github", "discord", "telegram", "description"};

// ---------------------------------------------------------------------------
// ENS operations. Each normalizes its input (trim; names and keys are also
// lowercased), calls the resolver, and reports the outcome as an envelope.
// None of them throws: resolver failures, including exceptions, become
// failed envelopes.
// ---------------------------------------------------------------------------

// Success fields: ens_name, address, coin_type.
ResultEnvelope ResolveName(IEnsResolver& resolver, std::string_view name,
                           int64_t coin_type = kEthCoinType);

// Success fields: address (checksummed), ens_name.
ResultEnvelope ReverseResolve(IEnsResolver& resolver, std::string_view address);

// Success fields: ens_name, key, value (null when the record is unset).
// A missing record is still a success.
ResultEnvelope GetTextRecord(IEnsResolver& resolver, std::string_view name,
                             std::string_view key);

// Success fields: ens_name, address, owner, resolver, text_records.
ResultEnvelope GetFullInfo(IEnsResolver& resolver, std::string_view name);

// ---------------------------------------------------------------------------
// GetFullInfo internals, exposed for testing: every sub-lookup is captured as
// its own Lookup, then merged. A failed or empty lookup becomes null (or is
// omitted, for text records); it never fails the aggregate.
// ---------------------------------------------------------------------------
struct FullInfoLookups {
    Lookup address = Lookup::Ok(std::nullopt);
    Lookup owner = Lookup::Ok(std::nullopt);
    Lookup resolver = Lookup::Ok(std::nullopt);
    std::vector<std::pair<std::string, Lookup>> text_records;
};

FullInfoLookups CollectFullInfo(IEnsResolver& resolver, const std::string& name);

ResultEnvelope AggregateFullInfo(const std::string& name,
                                 const FullInfoLookups& lookups);

} // namespace ens_mcp
