#include <ens_mcp/ens/ens_operations.hpp>

#include <ens_mcp/core/log.hpp>
#include <ens_mcp/core/strings.hpp>
#include <ens_mcp/ens/namehash.hpp>

#include <exception>

namespace ens_mcp {

namespace {

// Run one resolver call, turning any escaping exception into an Err so
// callers only ever see Lookup values.
template <typename Fn>
Lookup Attempt(const char* operation, Fn&& fn) {
    try {
        return std::forward<Fn>(fn)();
    } catch (const std::exception& e) {
        return Lookup::Err(Error{operation, "", e.what(),
                                 ErrorCategory::Internal, std::nullopt});
    } catch (...) {
        return Lookup::Err(Error{operation, "", "unknown exception",
                                 ErrorCategory::Internal, std::nullopt});
    }
}

// Contract-level and input problems are "ENS errors"; transport and
// everything else are "unexpected".
std::string DescribeResolveFailure(const Error& error) {
    if (error.category == ErrorCategory::Ens ||
        error.category == ErrorCategory::InvalidInput) {
        return "ENS error: " + error.message;
    }
    return "Unexpected error: " + error.message;
}

nlohmann::json ValueOrNull(const Lookup& lookup) {
    if (lookup.IsOk() && lookup.Value().has_value()) {
        return *lookup.Value();
    }
    return nullptr;
}

void LogDegraded(const std::string& name, const std::string& field,
                 const Lookup& lookup) {
    if (lookup.IsErr()) {
        LogDebug("ens", name + ": " + field + " lookup failed, reporting null: " +
                            lookup.Error().ToString());
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ResolveName
// ---------------------------------------------------------------------------
ResultEnvelope ResolveName(IEnsResolver& resolver, std::string_view name,
                           int64_t coin_type) {
    auto cleaned = ToLowerAscii(Trim(name));
    auto normalized = NormalizeEnsName(cleaned);
    if (normalized.IsErr()) {
        return ResultEnvelope::Fail("ENS error: " + normalized.Error(),
                                    {{"ens_name", cleaned}, {"coin_type", coin_type}});
    }
    const auto& ens_name = normalized.Value();
    nlohmann::json fields = {{"ens_name", ens_name}, {"coin_type", coin_type}};

    auto lookup = Attempt("Resolve", [&] { return resolver.Resolve(ens_name, coin_type); });
    if (lookup.IsErr()) {
        return ResultEnvelope::Fail(DescribeResolveFailure(lookup.Error()), fields);
    }
    if (!lookup.Value().has_value()) {
        return ResultEnvelope::Fail("No address found for ENS name: " + ens_name,
                                    fields);
    }

    fields["address"] = *lookup.Value();
    return ResultEnvelope::Ok(std::move(fields));
}

// ---------------------------------------------------------------------------
// ReverseResolve
// ---------------------------------------------------------------------------
ResultEnvelope ReverseResolve(IEnsResolver& resolver, std::string_view address) {
    const auto cleaned = Trim(address);
    const std::string kPrefix = "Error during reverse resolution: ";

    try {
        if (!resolver.IsValidAddressFormat(cleaned)) {
            return ResultEnvelope::Fail(
                "Invalid Ethereum address format: " + cleaned,
                {{"address", cleaned}});
        }

        auto canonical = resolver.ToChecksumAddress(cleaned);
        if (canonical.IsErr()) {
            return ResultEnvelope::Fail(kPrefix + canonical.Error().message,
                                        {{"address", cleaned}});
        }
        const auto& checksum_address = canonical.Value();

        auto lookup = resolver.ReverseResolve(checksum_address);
        if (lookup.IsErr()) {
            return ResultEnvelope::Fail(kPrefix + lookup.Error().message,
                                        {{"address", checksum_address}});
        }
        if (!lookup.Value().has_value()) {
            return ResultEnvelope::Fail(
                "No ENS name found for address: " + checksum_address,
                {{"address", checksum_address}});
        }

        return ResultEnvelope::Ok(
            {{"address", checksum_address}, {"ens_name", *lookup.Value()}});
    } catch (const std::exception& e) {
        return ResultEnvelope::Fail(kPrefix + e.what(), {{"address", cleaned}});
    } catch (...) {
        return ResultEnvelope::Fail(kPrefix + "unknown exception", {{"address", cleaned}});
    }
}

// ---------------------------------------------------------------------------
// GetTextRecord
// ---------------------------------------------------------------------------
ResultEnvelope GetTextRecord(IEnsResolver& resolver, std::string_view name,
                             std::string_view key) {
    const std::string kPrefix = "Error getting text record: ";
    auto cleaned_name = ToLowerAscii(Trim(name));
    auto cleaned_key = ToLowerAscii(Trim(key));
    nlohmann::json fields = {{"ens_name", cleaned_name}, {"key", cleaned_key}};

    auto normalized = NormalizeEnsName(cleaned_name);
    if (normalized.IsErr()) {
        return ResultEnvelope::Fail(kPrefix + normalized.Error(), fields);
    }
    if (cleaned_key.empty()) {
        return ResultEnvelope::Fail(kPrefix + "text record key must not be empty",
                                    fields);
    }

    auto lookup = Attempt("GetText", [&] {
        return resolver.GetText(normalized.Value(), cleaned_key);
    });
    if (lookup.IsErr()) {
        return ResultEnvelope::Fail(kPrefix + lookup.Error().message, fields);
    }

    fields["ens_name"] = normalized.Value();
    fields["value"] = ValueOrNull(lookup);
    return ResultEnvelope::Ok(std::move(fields));
}

// ---------------------------------------------------------------------------
// GetFullInfo
// ---------------------------------------------------------------------------
FullInfoLookups CollectFullInfo(IEnsResolver& resolver, const std::string& name) {
    FullInfoLookups lookups;
    lookups.address = Attempt("Resolve", [&] {
        return resolver.Resolve(name, kEthCoinType);
    });
    lookups.owner = Attempt("GetOwner", [&] { return resolver.GetOwner(name); });
    lookups.resolver = Attempt("GetResolverAddress", [&] {
        return resolver.GetResolverAddress(name);
    });
    for (const char* key : kProfileTextKeys) {
        lookups.text_records.emplace_back(
            key, Attempt("GetText", [&] { return resolver.GetText(name, key); }));
    }
    return lookups;
}

ResultEnvelope AggregateFullInfo(const std::string& name,
                                 const FullInfoLookups& lookups) {
    LogDegraded(name, "address", lookups.address);
    LogDegraded(name, "owner", lookups.owner);
    LogDegraded(name, "resolver", lookups.resolver);

    nlohmann::json text_records = nlohmann::json::object();
    for (const auto& [key, lookup] : lookups.text_records) {
        LogDegraded(name, "text." + key, lookup);
        if (lookup.IsOk() && lookup.Value().has_value() &&
            !lookup.Value()->empty()) {
            text_records[key] = *lookup.Value();
        }
    }

    return ResultEnvelope::Ok({
        {"ens_name", name},
        {"address", ValueOrNull(lookups.address)},
        {"owner", ValueOrNull(lookups.owner)},
        {"resolver", ValueOrNull(lookups.resolver)},
        {"text_records", std::move(text_records)},
    });
}

ResultEnvelope GetFullInfo(IEnsResolver& resolver, std::string_view name) {
    auto cleaned = ToLowerAscii(Trim(name));
    auto normalized = NormalizeEnsName(cleaned);
    if (normalized.IsErr()) {
        return ResultEnvelope::Fail("Error getting ENS info: " + normalized.Error(),
                                    {{"ens_name", cleaned}});
    }
    return AggregateFullInfo(normalized.Value(),
                             CollectFullInfo(resolver, normalized.Value()));
}

} // namespace ens_mcp
