#pragma once

#include "lfscache/agent_config.hpp"
#include "lfscache/protocol.hpp"

#include <iosfwd>

namespace lfscache {

/// Concurrency for a session: the host's request when given, else the
/// configured default, clamped to [1, MAX_CONCURRENT_TRANSFERS]. A host that
/// disables concurrency gets one worker.
size_t session_concurrency(const InitEvent& init, const AgentConfig& config);

/// Run one transfer-agent session over the given streams until terminate,
/// end of input or a fatal error. Returns the process exit status.
///
/// The host is expected to close the input once it has sent terminate or
/// seen a fatal error. If the input is still open when the session ends, the
/// reader thread stays blocked on it and is detached; it owns only its share
/// of the inbound queue, so `input` must outlive it (std::cin does). The
/// caller should exit the process once this returns.
int run_transfer_agent(const AgentConfig& config, std::istream& input, std::ostream& output);

}  // namespace lfscache
