#include "lfscache/protocol.hpp"

#include <nlohmann/json.hpp>

namespace lfscache {

// ============================================================================
// Domain helpers
// ============================================================================

const char* operation_name(Operation op) {
    return op == Operation::Upload ? "upload" : "download";
}

std::optional<Operation> parse_operation(std::string_view name) {
    if (name == "download") return Operation::Download;
    if (name == "upload") return Operation::Upload;
    return std::nullopt;
}

TransferOutcome TransferOutcome::completed(const std::string& oid, std::filesystem::path path) {
    TransferOutcome o;
    o.oid = oid;
    o.success = true;
    o.path = std::move(path);
    return o;
}

TransferOutcome TransferOutcome::failed(const std::string& oid, int code, std::string message) {
    TransferOutcome o;
    o.oid = oid;
    o.error.code = code;
    o.error.message = std::move(message);
    return o;
}

const char* event_type_name(EventType type) {
    switch (type) {
        case EventType::Init: return "init";
        case EventType::Download: return "download";
        case EventType::Upload: return "upload";
        case EventType::Terminate: return "terminate";
    }
    return "terminate";
}

// ============================================================================
// Decoding
// ============================================================================

namespace {

using nlohmann::json;

const json& require(const json& j, const char* field, const char* event) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        throw ProtocolError(std::string(event) + " event is missing '" + field + "'");
    }
    return *it;
}

std::string require_string(const json& j, const char* field, const char* event) {
    const auto& v = require(j, field, event);
    if (!v.is_string()) {
        throw ProtocolError(std::string(event) + " event field '" + field + "' must be a string");
    }
    return v.get<std::string>();
}

uint64_t require_size(const json& j, const char* field, const char* event) {
    const auto& v = require(j, field, event);
    if (!v.is_number_unsigned()) {
        throw ProtocolError(std::string(event) + " event field '" + field +
                            "' must be a non-negative integer");
    }
    return v.get<uint64_t>();
}

TransferAction decode_action(const json& j, const char* event) {
    if (!j.is_object()) {
        throw ProtocolError(std::string(event) + " event 'action' must be an object");
    }
    TransferAction action;
    action.href = require_string(j, "href", "action");

    if (auto it = j.find("header"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) throw ProtocolError("action 'header' must be an object");
        for (auto& [name, value] : it->items()) {
            if (!value.is_string()) {
                throw ProtocolError("action header '" + name + "' must be a string");
            }
            action.headers[name] = value.get<std::string>();
        }
    }

    if (auto it = j.find("expires_at"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) throw ProtocolError("action 'expires_at' must be a string");
        auto text = it->get<std::string>();
        // Go's zero time means "no expiry"
        if (!text.starts_with("0001-01-01")) {
            auto tp = parse_rfc3339(text);
            if (!tp) throw ProtocolError("action 'expires_at' is not RFC 3339: " + text);
            action.expires_at = tp;
        }
    }

    if (auto it = j.find("expires_in"); it != j.end() && !it->is_null()) {
        if (!it->is_number_integer()) throw ProtocolError("action 'expires_in' must be an integer");
        auto secs = it->get<int64_t>();
        if (secs != 0) {
            auto tp = std::chrono::system_clock::now() + std::chrono::seconds(secs);
            if (!action.expires_at || tp < *action.expires_at) action.expires_at = tp;
        }
    }
    return action;
}

TransferRequest decode_transfer(const json& j, Operation op) {
    const char* event = operation_name(op);
    TransferRequest req;
    req.operation = op;
    req.oid = require_string(j, "oid", event);
    req.size = require_size(j, "size", event);
    if (op == Operation::Upload) {
        req.path = require_string(j, "path", event);
    }
    if (auto it = j.find("action"); it != j.end() && !it->is_null()) {
        req.action = decode_action(*it, event);
    }
    return req;
}

// Messages carry raw origin bodies and host input; invalid UTF-8 becomes U+FFFD.
std::string to_line(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

ProtocolEvent decode_event(const std::string& line) {
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded()) {
        throw ProtocolError("unparseable input line: " + line.substr(0, 200));
    }
    if (!j.is_object()) {
        throw ProtocolError("input line is not a JSON object");
    }

    auto name = require_string(j, "event", "input");
    ProtocolEvent ev;

    if (name == "init") {
        ev.type = EventType::Init;
        auto op = parse_operation(require_string(j, "operation", "init"));
        if (!op) throw ProtocolError("init event has unknown operation");
        ev.init.operation = *op;
        if (auto it = j.find("remote"); it != j.end() && it->is_string()) {
            ev.init.remote = it->get<std::string>();
        }
        if (auto it = j.find("concurrent"); it != j.end() && it->is_boolean()) {
            ev.init.concurrent = it->get<bool>();
        }
        if (auto it = j.find("concurrenttransfers"); it != j.end() && !it->is_null()) {
            if (!it->is_number_unsigned()) {
                throw ProtocolError("init event 'concurrenttransfers' must be a non-negative integer");
            }
            ev.init.concurrent_transfers = it->get<size_t>();
        }
    } else if (name == "download") {
        ev.type = EventType::Download;
        ev.transfer = decode_transfer(j, Operation::Download);
    } else if (name == "upload") {
        ev.type = EventType::Upload;
        ev.transfer = decode_transfer(j, Operation::Upload);
    } else if (name == "terminate") {
        ev.type = EventType::Terminate;
    } else {
        throw ProtocolError("unknown event '" + name + "'");
    }
    return ev;
}

// ============================================================================
// Encoding
// ============================================================================

std::string encode_init_response(const std::optional<TransferError>& error) {
    json j = json::object();
    if (error) {
        j["error"] = {{"code", error->code}, {"message", error->message}};
    }
    return to_line(j);
}

std::string encode_complete(const TransferOutcome& outcome) {
    json j;
    j["event"] = "complete";
    j["oid"] = outcome.oid;
    if (outcome.success) {
        if (!outcome.path.empty()) j["path"] = outcome.path.string();
    } else {
        j["error"] = {{"code", outcome.error.code}, {"message", outcome.error.message}};
    }
    return to_line(j);
}

std::string encode_progress(const ProgressUpdate& progress) {
    json j;
    j["event"] = "progress";
    j["oid"] = progress.oid;
    j["bytesSoFar"] = progress.bytes_so_far;
    j["bytesSinceLast"] = progress.bytes_since_last;
    return to_line(j);
}

std::string encode_fatal_error(const TransferError& error) {
    json j;
    j["error"] = {{"code", error.code}, {"message", error.message}};
    return to_line(j);
}

}  // namespace lfscache
