#include <catch2/catch_test_macros.hpp>

#include <ens_mcp/ens/ens_operations.hpp>
#include "../../test/mocks/mock_ens_resolver.hpp"

#include <string>

using namespace ens_mcp;
using namespace ens_mcp::testing;

namespace {

const std::string kVitalik = "0xd8dA6BF26964aF9D7eEd9e03E53415D37aA96045";
const std::string kVitalikLower = "0xd8da6bf26964af9d7eed9e03e53415d37aa96045";
const std::string kResolverAddr = "0x231b0Ee14048e9dCcD1d247744d114a4EB5E8E63";

Lookup Failed(ErrorCategory category, const std::string& message) {
    return Lookup::Err(Error{"Mock", "", message, category, std::nullopt});
}

} // anonymous namespace

// ===========================================================================
// ResolveName
// ===========================================================================

TEST_CASE("ResolveName: success carries name, address and coin type", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetAddress("vitalik.eth", kVitalik);

    auto json = ResolveName(mock, "vitalik.eth").ToJson();

    CHECK(json["success"] == true);
    CHECK(json["ens_name"] == "vitalik.eth");
    CHECK(json["address"] == kVitalik);
    CHECK(json["coin_type"] == 60);
    CHECK(json.contains("timestamp"));
    CHECK(json["address"].get<std::string>().size() == 42);
}

TEST_CASE("ResolveName: input is trimmed and lowercased before lookup", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetAddress("vitalik.eth", kVitalik);

    auto json = ResolveName(mock, "  Vitalik.ETH ").ToJson();

    CHECK(json["success"] == true);
    CHECK(json["ens_name"] == "vitalik.eth");
    REQUIRE(mock.CallCount("Resolve") == 1);
    CHECK(mock.Calls()[0].args[0] == "vitalik.eth");
}

TEST_CASE("ResolveName: passes the coin type through", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetAddress("vitalik.eth", "0x0014abcd", 0);

    auto json = ResolveName(mock, "vitalik.eth", 0).ToJson();

    CHECK(json["success"] == true);
    CHECK(json["address"] == "0x0014abcd");
    CHECK(json["coin_type"] == 0);
}

TEST_CASE("ResolveName: no address is a domain failure", "[ens][ops]") {
    MockEnsResolver mock;

    auto json = ResolveName(mock, "nobody.eth").ToJson();

    CHECK(json["success"] == false);
    CHECK(json["error"] == "No address found for ENS name: nobody.eth");
    CHECK(json["ens_name"] == "nobody.eth");
    CHECK(json["coin_type"] == 60);
    CHECK_FALSE(json.contains("timestamp"));
}

TEST_CASE("ResolveName: protocol errors are ENS errors", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetAddressResult("vitalik.eth", Failed(ErrorCategory::Ens, "execution reverted"));

    auto json = ResolveName(mock, "vitalik.eth").ToJson();

    CHECK(json["success"] == false);
    CHECK(json["error"] == "ENS error: execution reverted");
}

TEST_CASE("ResolveName: transport errors are unexpected errors", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetAddressResult("vitalik.eth",
                          Failed(ErrorCategory::Connection, "connection refused"));

    auto json = ResolveName(mock, "vitalik.eth").ToJson();

    CHECK(json["error"] == "Unexpected error: connection refused");
}

TEST_CASE("ResolveName: a throwing resolver becomes an unexpected error", "[ens][ops]") {
    MockEnsResolver mock;
    mock.ThrowOn("Resolve");

    auto json = ResolveName(mock, "vitalik.eth").ToJson();

    CHECK(json["success"] == false);
    CHECK(json["error"] == "Unexpected error: MockEnsResolver: Resolve failed");
}

TEST_CASE("ResolveName: a non-standard exception becomes an unexpected error",
          "[ens][ops]") {
    MockEnsResolver mock;
    mock.ThrowNonStandardOn("Resolve");

    ResultEnvelope envelope = ResultEnvelope::Fail("unset");
    REQUIRE_NOTHROW(envelope = ResolveName(mock, "vitalik.eth"));

    auto json = envelope.ToJson();
    CHECK(json["success"] == false);
    CHECK(json["error"] == "Unexpected error: unknown exception");
}

TEST_CASE("ResolveName: invalid names fail without a lookup", "[ens][ops]") {
    MockEnsResolver mock;

    auto json = ResolveName(mock, "a..eth").ToJson();

    CHECK(json["success"] == false);
    CHECK(json["error"].get<std::string>().rfind("ENS error: ", 0) == 0);
    CHECK(mock.CallCount() == 0);
}

// ===========================================================================
// ReverseResolve
// ===========================================================================

TEST_CASE("ReverseResolve: success carries checksummed address and name", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetChecksum(kVitalikLower, kVitalik);
    mock.SetReverse(kVitalik, "vitalik.eth");

    auto json = ReverseResolve(mock, kVitalikLower).ToJson();

    CHECK(json["success"] == true);
    CHECK(json["address"] == kVitalik);
    CHECK(json["ens_name"] == "vitalik.eth");
    REQUIRE(mock.CallCount("ReverseResolve") == 1);
    CHECK(mock.Calls()[0].args[0] == kVitalik);
}

TEST_CASE("ReverseResolve: malformed address fails without a lookup", "[ens][ops]") {
    MockEnsResolver mock;

    auto json = ReverseResolve(mock, "0x1234").ToJson();

    CHECK(json["success"] == false);
    CHECK(json["error"] == "Invalid Ethereum address format: 0x1234");
    CHECK(json["address"] == "0x1234");
    CHECK(mock.CallCount() == 0);
}

TEST_CASE("ReverseResolve: no primary name", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetChecksum(kVitalikLower, kVitalik);

    auto json = ReverseResolve(mock, kVitalikLower).ToJson();

    CHECK(json["success"] == false);
    CHECK(json["error"] == "No ENS name found for address: " + kVitalik);
    CHECK(json["address"] == kVitalik);
}

TEST_CASE("ReverseResolve: resolver failure", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetReverseResult(kVitalikLower, Failed(ErrorCategory::Timeout, "read timeout"));

    auto json = ReverseResolve(mock, kVitalikLower).ToJson();

    CHECK(json["success"] == false);
    CHECK(json["error"] == "Error during reverse resolution: read timeout");
}

TEST_CASE("ReverseResolve: thrown exception is reported", "[ens][ops]") {
    MockEnsResolver mock;
    mock.ThrowOn("ReverseResolve");

    auto json = ReverseResolve(mock, kVitalikLower).ToJson();

    CHECK(json["success"] == false);
    CHECK(json["error"] ==
          "Error during reverse resolution: MockEnsResolver: ReverseResolve failed");
}

// ===========================================================================
// GetTextRecord
// ===========================================================================

TEST_CASE("ReverseResolve: a non-standard exception is reported", "[ens][ops]") {
    MockEnsResolver mock;
    mock.ThrowNonStandardOn("ReverseResolve");

    auto json = ReverseResolve(mock, kVitalikLower).ToJson();

    CHECK(json["success"] == false);
    CHECK(json["error"] == "Error during reverse resolution: unknown exception");
}

TEST_CASE("GetTextRecord: present value", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetText("vitalik.eth", "url", "https://vitalik.ca");

    auto json = GetTextRecord(mock, "vitalik.eth", "url").ToJson();

    CHECK(json["success"] == true);
    CHECK(json["ens_name"] == "vitalik.eth");
    CHECK(json["key"] == "url");
    CHECK(json["value"] == "https://vitalik.ca");
}

TEST_CASE("GetTextRecord: absent value is still a success", "[ens][ops]") {
    MockEnsResolver mock;

    auto json = GetTextRecord(mock, "vitalik.eth", "email").ToJson();

    CHECK(json["success"] == true);
    CHECK(json["value"].is_null());
}

TEST_CASE("GetTextRecord: name and key are normalized", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetText("vitalik.eth", "com.twitter", "VitalikButerin");

    auto json = GetTextRecord(mock, " Vitalik.eth", " COM.Twitter ").ToJson();

    CHECK(json["success"] == true);
    CHECK(json["key"] == "com.twitter");
    CHECK(json["value"] == "VitalikButerin");
}

TEST_CASE("GetTextRecord: repeated lookups are idempotent", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetText("vitalik.eth", "url", "https://vitalik.ca");

    auto first = GetTextRecord(mock, "vitalik.eth", "url").ToJson();
    auto second = GetTextRecord(mock, "vitalik.eth", "url").ToJson();
    first.erase("timestamp");
    second.erase("timestamp");

    CHECK(first == second);
}

TEST_CASE("GetTextRecord: resolver failure", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetTextResult("vitalik.eth", "url",
                       Failed(ErrorCategory::Connection, "connection reset"));

    auto json = GetTextRecord(mock, "vitalik.eth", "url").ToJson();

    CHECK(json["success"] == false);
    CHECK(json["error"] == "Error getting text record: connection reset");
    CHECK(json["key"] == "url");
}

TEST_CASE("GetTextRecord: blank key is rejected", "[ens][ops]") {
    MockEnsResolver mock;

    auto json = GetTextRecord(mock, "vitalik.eth", "   ").ToJson();

    CHECK(json["success"] == false);
    CHECK(mock.CallCount() == 0);
}

// ===========================================================================
// GetFullInfo
// ===========================================================================

TEST_CASE("GetFullInfo: aggregates every lookup", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetAddress("vitalik.eth", kVitalik);
    mock.SetOwner("vitalik.eth", kVitalik);
    mock.SetResolver("vitalik.eth", kResolverAddr);
    mock.SetText("vitalik.eth", "url", "https://vitalik.ca");
    mock.SetText("vitalik.eth", "twitter", "VitalikButerin");
    mock.SetText("vitalik.eth", "email", "");

    auto json = GetFullInfo(mock, "vitalik.eth").ToJson();

    CHECK(json["success"] == true);
    CHECK(json["ens_name"] == "vitalik.eth");
    CHECK(json["address"] == kVitalik);
    CHECK(json["owner"] == kVitalik);
    CHECK(json["resolver"] == kResolverAddr);
    CHECK(json["text_records"] ==
          nlohmann::json{{"url", "https://vitalik.ca"}, {"twitter", "VitalikButerin"}});
    CHECK(mock.CallCount("GetText") == kProfileTextKeys.size());
}

TEST_CASE("GetFullInfo: a failing owner lookup degrades to null", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetAddress("vitalik.eth", kVitalik);
    mock.SetResolver("vitalik.eth", kResolverAddr);
    mock.SetText("vitalik.eth", "url", "https://vitalik.ca");
    mock.ThrowOn("GetOwner");

    auto json = GetFullInfo(mock, "vitalik.eth").ToJson();

    CHECK(json["success"] == true);
    CHECK(json["address"] == kVitalik);
    CHECK(json["owner"].is_null());
    CHECK(json["resolver"] == kResolverAddr);
    CHECK(json["text_records"]["url"] == "https://vitalik.ca");
}

TEST_CASE("GetFullInfo: a non-standard exception degrades only its field",
          "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetAddress("vitalik.eth", kVitalik);
    mock.SetOwner("vitalik.eth", kVitalik);
    mock.ThrowNonStandardOn("GetResolverAddress");

    auto json = GetFullInfo(mock, "vitalik.eth").ToJson();

    CHECK(json["success"] == true);
    CHECK(json["address"] == kVitalik);
    CHECK(json["owner"] == kVitalik);
    CHECK(json["resolver"].is_null());
    CHECK(mock.CallCount("GetText") == kProfileTextKeys.size());
}

TEST_CASE("GetFullInfo: a text record that failed to decode is omitted",
          "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetAddress("vitalik.eth", kVitalik);
    mock.SetText("vitalik.eth", "url", "https://vitalik.ca");
    mock.SetTextResult("vitalik.eth", "description",
                       Failed(ErrorCategory::Ens, "Return data is not valid UTF-8"));

    auto json = GetFullInfo(mock, "vitalik.eth").ToJson();

    CHECK(json["success"] == true);
    CHECK(json["address"] == kVitalik);
    CHECK(json["text_records"] == nlohmann::json{{"url", "https://vitalik.ca"}});
}

TEST_CASE("GetFullInfo: everything absent still succeeds", "[ens][ops]") {
    MockEnsResolver mock;
    mock.SetTextResult("nobody.eth", "url", Failed(ErrorCategory::Ens, "reverted"));

    auto json = GetFullInfo(mock, "Nobody.eth").ToJson();

    CHECK(json["success"] == true);
    CHECK(json["ens_name"] == "nobody.eth");
    CHECK(json["address"].is_null());
    CHECK(json["owner"].is_null());
    CHECK(json["resolver"].is_null());
    CHECK(json["text_records"] == nlohmann::json::object());
}

TEST_CASE("GetFullInfo: invalid name is the only failure", "[ens][ops]") {
    MockEnsResolver mock;

    auto json = GetFullInfo(mock, "   ").ToJson();

    CHECK(json["success"] == false);
    CHECK(json["error"].get<std::string>().rfind("Error getting ENS info: ", 0) == 0);
    CHECK(mock.CallCount() == 0);
}

TEST_CASE("AggregateFullInfo: merges explicit lookups", "[ens][ops]") {
    FullInfoLookups lookups;
    lookups.address = Lookup::Ok(std::optional<std::string>(kVitalik));
    lookups.owner = Failed(ErrorCategory::Timeout, "timeout");
    lookups.text_records.emplace_back("github", Lookup::Ok(std::optional<std::string>("vbuterin")));
    lookups.text_records.emplace_back("discord", Lookup::Ok(std::nullopt));
    lookups.text_records.emplace_back("email", Failed(ErrorCategory::Ens, "reverted"));

    auto json = AggregateFullInfo("vitalik.eth", lookups).ToJson();

    CHECK(json["address"] == kVitalik);
    CHECK(json["owner"].is_null());
    CHECK(json["resolver"].is_null());
    CHECK(json["text_records"] == nlohmann::json{{"github", "vbuterin"}});
}
