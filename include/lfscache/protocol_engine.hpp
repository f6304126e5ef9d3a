#pragma once

#include "lfscache/channel.hpp"
#include "lfscache/protocol.hpp"
#include "lfscache/transfer_orchestrator.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace lfscache {

/// One line from the host after decoding: either an event or the reason the
/// line could not be decoded.
struct InboundMessage {
    std::optional<ProtocolEvent> event;
    std::string error;

    static InboundMessage decoded(ProtocolEvent ev) { return {std::move(ev), {}}; }
    static InboundMessage malformed(std::string why) { return {std::nullopt, std::move(why)}; }
};

/// Exit statuses of a transfer-agent session.
namespace exit_code {
constexpr int OK = 0;
constexpr int SESSION_FAILED = 1;  // init rejected or input ended without terminate
constexpr int PROTOCOL_ERROR = 2;
}  // namespace exit_code

/// Session state machine for the custom transfer protocol.
///
///   AwaitInit --init--> Active --terminate--> Draining --> Done
///
/// Consumes decoded input from `in` and writes encoded reply lines to `out`.
/// Transfers are handed to the orchestrator created at init; its progress and
/// completion callbacks feed `out` directly so replies go out as soon as they
/// are ready, in completion order. `out` is closed when run() returns.
class ProtocolEngine {
public:
    enum class State { AwaitInit, Active, Draining, Done };

    /// Builds the orchestrator for a session. Throwing rejects the init.
    using OrchestratorFactory = std::function<std::unique_ptr<TransferOrchestrator>(
        const InitEvent&, TransferOrchestrator::ProgressSink, TransferOrchestrator::CompletionSink)>;

    ProtocolEngine(Channel<InboundMessage>& in, Channel<std::string>& out,
                   OrchestratorFactory factory);
    ~ProtocolEngine();

    ProtocolEngine(const ProtocolEngine&) = delete;
    ProtocolEngine& operator=(const ProtocolEngine&) = delete;

    /// Process input until terminate, end of input or a fatal error.
    /// Returns the process exit status.
    int run();

    State state() const { return state_; }

private:
    bool handle_init(const InitEvent& init);
    int protocol_error(const std::string& message);
    int finish(int code);

    Channel<InboundMessage>& in_;
    Channel<std::string>& out_;
    OrchestratorFactory factory_;
    std::unique_ptr<TransferOrchestrator> orchestrator_;
    Operation operation_ = Operation::Download;
    State state_ = State::AwaitInit;
};

const char* engine_state_name(ProtocolEngine::State state);

}  // namespace lfscache
