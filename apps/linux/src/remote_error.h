#pragma once
#include <string>

// Every failure a run can end with. Produced directly by the layer where
// the failure happens; PairingInvalidPin is the only recoverable one.
enum class RemoteError {
    None = 0,
    Config,
    Identity,
    Storage,
    PairingRejected,
    PairingInvalidPin,
    PairingProtocol,
    ConnectTimeout,
    ConnectRefused,
    ResolutionFailure,
    NetworkUnreachable,
    ConnectOtherIO,
    ConnectAuth,
    Send
};

// Short name for trace output ("ConnectTimeout").
const char* remote_error_name(RemoteError err);

// One-line diagnostic ("Connection timeout").
std::string remote_error_message(RemoteError err);

// Actionable follow-up for the user; empty when there is nothing to add.
std::string remote_error_hint(RemoteError err, const std::string& host);

bool is_connect_error(RemoteError err);

// Prints "Error: ..." plus detail and hint lines on stderr.
void report_remote_error(RemoteError err,
                         const std::string& host,
                         const std::string& detail);
