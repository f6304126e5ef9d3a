#pragma once

#include "lfscache/origin_transport.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lfscache {

enum class Operation { Download, Upload };

const char* operation_name(Operation op);
std::optional<Operation> parse_operation(std::string_view name);

/// One object transfer requested by the host.
struct TransferRequest {
    Operation operation = Operation::Download;
    std::string oid;
    uint64_t size = 0;
    std::filesystem::path path;            // upload: local file holding the object
    std::optional<TransferAction> action;  // absent when the host sent none
};

struct TransferError {
    int code = 0;
    std::string message;
};

/// Terminal result for one object; exactly one per TransferRequest.
struct TransferOutcome {
    std::string oid;
    bool success = false;
    std::filesystem::path path;  // download: installed file
    TransferError error;

    static TransferOutcome completed(const std::string& oid, std::filesystem::path path = {});
    static TransferOutcome failed(const std::string& oid, int code, std::string message);
};

struct ProgressUpdate {
    std::string oid;
    uint64_t bytes_so_far = 0;
    uint64_t bytes_since_last = 0;
};

}  // namespace lfscache
