#include "lfscache/protocol_engine.hpp"
#include "lfscache/constants.hpp"
#include "lfscache/logging.hpp"

namespace lfscache {

const char* engine_state_name(ProtocolEngine::State state) {
    switch (state) {
        case ProtocolEngine::State::AwaitInit: return "await-init";
        case ProtocolEngine::State::Active: return "active";
        case ProtocolEngine::State::Draining: return "draining";
        case ProtocolEngine::State::Done: return "done";
    }
    return "done";
}

ProtocolEngine::ProtocolEngine(Channel<InboundMessage>& in, Channel<std::string>& out,
                               OrchestratorFactory factory)
    : in_(in), out_(out), factory_(std::move(factory)) {}

ProtocolEngine::~ProtocolEngine() {
    if (orchestrator_) orchestrator_->drain();
}

int ProtocolEngine::run() {
    while (auto msg = in_.pop()) {
        if (!msg->event) {
            return protocol_error(msg->error);
        }
        auto& ev = *msg->event;

        switch (ev.type) {
            case EventType::Init:
                if (state_ != State::AwaitInit) {
                    return protocol_error("duplicate init event");
                }
                if (!handle_init(ev.init)) {
                    return finish(exit_code::SESSION_FAILED);
                }
                break;

            case EventType::Download:
            case EventType::Upload:
                if (state_ != State::Active) {
                    return protocol_error(std::string(event_type_name(ev.type)) +
                                          " event before init");
                }
                if (ev.transfer.operation != operation_) {
                    return protocol_error(std::string(event_type_name(ev.type)) +
                                          " event in a " + operation_name(operation_) + " session");
                }
                log_debug("admit %s %s (%llu bytes)", event_type_name(ev.type),
                          ev.transfer.oid.c_str(),
                          static_cast<unsigned long long>(ev.transfer.size));
                if (!orchestrator_->dispatch(std::move(ev.transfer))) {
                    return protocol_error("transfer rejected: orchestrator is draining");
                }
                break;

            case EventType::Terminate:
                log_debug("terminate received in state %s", engine_state_name(state_));
                return finish(exit_code::OK);
        }
    }

    if (state_ == State::AwaitInit) {
        log_error("input ended before init");
    } else {
        log_error("input ended without terminate");
    }
    return finish(exit_code::SESSION_FAILED);
}

bool ProtocolEngine::handle_init(const InitEvent& init) {
    operation_ = init.operation;
    try {
        orchestrator_ = factory_(
            init,
            [this](const ProgressUpdate& p) { out_.push(encode_progress(p)); },
            [this](const TransferOutcome& o) { out_.push(encode_complete(o)); });
    } catch (const std::exception& e) {
        log_error("init failed: %s", e.what());
        out_.push(encode_init_response(TransferError{constants::ERROR_CODE_INTERNAL, e.what()}));
        return false;
    }
    if (!orchestrator_) {
        out_.push(encode_init_response(
            TransferError{constants::ERROR_CODE_INTERNAL, "transfer agent could not start"}));
        return false;
    }

    log_info("session started: %s, remote '%s', %zu concurrent transfers",
             operation_name(init.operation), init.remote.c_str(), orchestrator_->concurrency());
    out_.push(encode_init_response());
    state_ = State::Active;
    return true;
}

int ProtocolEngine::protocol_error(const std::string& message) {
    log_error("protocol error: %s", message.c_str());
    out_.push(encode_fatal_error(TransferError{constants::ERROR_CODE_PROTOCOL, message}));
    return finish(exit_code::PROTOCOL_ERROR);
}

int ProtocolEngine::finish(int code) {
    state_ = State::Draining;
    if (orchestrator_) {
        orchestrator_->drain();
    }
    state_ = State::Done;
    out_.close();
    return code;
}

}  // namespace lfscache
