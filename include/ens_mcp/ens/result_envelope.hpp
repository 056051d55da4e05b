#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ens_mcp {

// ---------------------------------------------------------------------------
// ResultEnvelope — normalized outcome of one ENS operation.
//
// Serializes to {"success": bool, ...fields, "error"|"timestamp": string}.
// A successful envelope carries a UTC timestamp and never an error; a failed
// one carries an error and never a timestamp. The factories are the only way
// to build one, so the two shapes cannot mix.
// ---------------------------------------------------------------------------
class ResultEnvelope {
public:
    // Success, stamped with the current UTC time.
    static ResultEnvelope Ok(nlohmann::json fields);

    // Success with an explicit timestamp.
    static ResultEnvelope Ok(nlohmann::json fields, std::string timestamp);

    static ResultEnvelope Fail(std::string error,
                               nlohmann::json fields = nlohmann::json::object());

    [[nodiscard]] bool Success() const noexcept { return !error_.has_value(); }
    [[nodiscard]] const std::optional<std::string>& ErrorMessage() const noexcept {
        return error_;
    }
    [[nodiscard]] const std::optional<std::string>& Timestamp() const noexcept {
        return timestamp_;
    }
    [[nodiscard]] const nlohmann::json& Fields() const noexcept { return fields_; }

    [[nodiscard]] nlohmann::json ToJson() const;

private:
    ResultEnvelope(nlohmann::json fields,
                   std::optional<std::string> error,
                   std::optional<std::string> timestamp);

    nlohmann::json fields_;
    std::optional<std::string> error_;
    std::optional<std::string> timestamp_;
};

} // namespace ens_mcp
