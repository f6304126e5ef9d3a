#pragma once

#include "lfscache/transfer.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace lfscache {

/// Malformed or out-of-sequence input from the host. Always fatal.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class EventType { Init, Download, Upload, Terminate };

const char* event_type_name(EventType type);

struct InitEvent {
    Operation operation = Operation::Download;
    std::string remote;
    bool concurrent = true;
    size_t concurrent_transfers = 0;  // 0 = not specified
};

/// One decoded line from the host. `init` is meaningful for Init,
/// `transfer` for Download and Upload.
struct ProtocolEvent {
    EventType type = EventType::Terminate;
    InitEvent init;
    TransferRequest transfer;
};

/// Decode one input line. Throws ProtocolError on malformed JSON, unknown
/// events and missing or ill-typed required fields.
ProtocolEvent decode_event(const std::string& line);

// Encoders produce a single line without the trailing newline.
std::string encode_init_response(const std::optional<TransferError>& error = std::nullopt);
std::string encode_complete(const TransferOutcome& outcome);
std::string encode_progress(const ProgressUpdate& progress);
std::string encode_fatal_error(const TransferError& error);

}  // namespace lfscache
