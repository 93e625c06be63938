#pragma once
#include "remote_link.h"
#include "credential_store.h"
#include "pairing_negotiator.h"
#include <string>
#include <optional>

struct CliOptions {
    std::optional<std::string> host;
    bool repair  = false;
    bool verbose = false;
    bool help    = false;
    int  max_pin_attempts = DEFAULT_MAX_PIN_ATTEMPTS;
    std::string config_dir;     // empty = current directory
};

// Accepts "--host <ip>" and "--host=<ip>". Returns false with 'err' set on
// unknown arguments or missing values; the IP itself is checked later.
bool parse_cli_args(int argc, const char* const* argv,
                    CliOptions& out,
                    std::string& err);

void print_usage(const char* prog);

// --host, else the stored host, else ask until a valid IPv4 is entered
// (and save it).
RemoteError resolve_host(const CliOptions& options,
                         CredentialStore& store,
                         LinePrompt& prompt,
                         std::string& host_out);

// Whole run; returns the process exit code.
int run_shield_pause(const CliOptions& options,
                     CredentialStore& store,
                     LinePrompt& prompt,
                     PairingLink& pairing,
                     RemoteConnector& connector);
