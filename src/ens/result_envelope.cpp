#include <ens_mcp/ens/result_envelope.hpp>

#include <ens_mcp/core/timestamp.hpp>

namespace ens_mcp {

ResultEnvelope::ResultEnvelope(nlohmann::json fields,
                               std::optional<std::string> error,
                               std::optional<std::string> timestamp)
    : fields_(fields.is_object() ? std::move(fields) : nlohmann::json::object()),
      error_(std::move(error)),
      timestamp_(std::move(timestamp)) {
    // Reserved keys are owned by the envelope itself.
    fields_.erase("success");
    fields_.erase("error");
    fields_.erase("timestamp");
}

ResultEnvelope ResultEnvelope::Ok(nlohmann::json fields) {
    return Ok(std::move(fields), Iso8601Now());
}

ResultEnvelope ResultEnvelope::Ok(nlohmann::json fields, std::string timestamp) {
    return ResultEnvelope(std::move(fields), std::nullopt, std::move(timestamp));
}

ResultEnvelope ResultEnvelope::Fail(std::string error, nlohmann::json fields) {
    return ResultEnvelope(std::move(fields), std::move(error), std::nullopt);
}

nlohmann::json ResultEnvelope::ToJson() const {
    nlohmann::json out = fields_;
    out["success"] = Success();
    if (error_) {
        out["error"] = *error_;
    }
    if (timestamp_) {
        out["timestamp"] = *timestamp_;
    }
    return out;
}

} // namespace ens_mcp
