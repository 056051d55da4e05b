#pragma once

#include <ens_mcp/ens/i_rpc_session.hpp>

#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace ens_mcp {
namespace testing {

// ---------------------------------------------------------------------------
// MockRpcSession — hand-written IRpcSession for offline resolver tests.
//
// Usage:
//   MockRpcSession mock;
//   mock.EnqueueResult(nlohmann::json("0x" + std::string(64, '0')));
//   auto result = mock.Call("eth_call", params);
//   CHECK(mock.CallCount() == 1);
//   CHECK(mock.Calls()[0].method == "eth_call");
//
// Responses are consumed FIFO. If the queue is empty when Call() runs, the
// mock returns a descriptive error rather than crashing.
// ---------------------------------------------------------------------------

struct RpcCall {
    std::string method;
    nlohmann::json params;

    // eth_call helpers: params[0].to and params[0].data.
    [[nodiscard]] std::string To() const {
        return params.at(0).value("to", "");
    }
    [[nodiscard]] std::string Data() const {
        return params.at(0).value("data", "");
    }
};

class MockRpcSession : public IRpcSession {
public:
    MockRpcSession() = default;

    void Enqueue(Result<nlohmann::json, Error> response) {
        responses_.push_back(std::move(response));
    }

    void EnqueueResult(nlohmann::json result) {
        Enqueue(Result<nlohmann::json, Error>::Ok(std::move(result)));
    }

    void EnqueueError(ErrorCategory category, std::string message,
                      std::optional<int> rpc_code = std::nullopt) {
        Enqueue(Result<nlohmann::json, Error>::Err(
            Error{"Call", "mock", std::move(message), category, rpc_code}));
    }

    [[nodiscard]] const std::vector<RpcCall>& Calls() const noexcept {
        return calls_;
    }
    [[nodiscard]] size_t CallCount() const noexcept { return calls_.size(); }
    [[nodiscard]] size_t Pending() const noexcept { return responses_.size(); }

    void Reset() {
        responses_.clear();
        calls_.clear();
    }

    Result<nlohmann::json, Error> Call(std::string_view method,
                                       const nlohmann::json& params) override {
        calls_.push_back({std::string(method), params});
        if (responses_.empty()) {
            return Result<nlohmann::json, Error>::Err(Error{
                std::string(method), "mock",
                "MockRpcSession: no responses enqueued",
                ErrorCategory::Internal, std::nullopt});
        }
        auto response = std::move(responses_.front());
        responses_.pop_front();
        return response;
    }

private:
    std::deque<Result<nlohmann::json, Error>> responses_;
    std::vector<RpcCall> calls_;
};

} // namespace testing
} // namespace ens_mcp
