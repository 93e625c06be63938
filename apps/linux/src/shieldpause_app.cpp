#include "shieldpause_app.h"
#include "connection_orchestrator.h"
#include "validators.h"
#include "debug_utils.h"
#include <iostream>
#include <cstdlib>

using namespace std;

void print_usage(const char* prog) {
    cerr << "Usage:\n"
         << "  " << prog << " [--host <ip>] [--repair]\n"
         << "\n"
         << "Options:\n"
         << "  --host <ip>              Device IPv4 address (overrides saved configuration)\n"
         << "  --repair                 Force pairing again\n"
         << "  --max-pin-attempts=<n>   Wrong PINs allowed before giving up (default "
         << DEFAULT_MAX_PIN_ATTEMPTS << ")\n"
         << "  --config-dir=<dir>       Where .env and the certificate live (default: .)\n"
         << "  --verbose                Trace connection steps on stderr\n"
         << "  --help                   Show this help\n"
         << "\n"
         << "Files: .env (" << ENV_KEY_HOST << ", " << ENV_KEY_CERT << "), "
         << CERT_FILE_NAME << ", " << KEY_FILE_NAME << "\n";
}

bool parse_cli_args(int argc, const char* const* argv,
                    CliOptions& out,
                    string& err) {
    for (int i = 1; i < argc; ++i) {
        string a   = argv[i];
        auto eq    = a.find('=');
        string key = (eq == string::npos) ? a : a.substr(0, eq);
        bool has_val = (eq != string::npos);
        string val = has_val ? a.substr(eq + 1) : "";

        if (key == "--host") {
            if (!has_val) {
                if (i + 1 >= argc) {
                    err = "--host needs a value";
                    return false;
                }
                val = argv[++i];
            }
            out.host = trim(val);
        } else if (key == "--repair") {
            out.repair = true;
        } else if (key == "--verbose" || key == "-v") {
            out.verbose = true;
        } else if (key == "--help" || key == "-h") {
            out.help = true;
        } else if (key == "--max-pin-attempts") {
            if (!has_val) {
                if (i + 1 >= argc) {
                    err = "--max-pin-attempts needs a value";
                    return false;
                }
                val = argv[++i];
            }
            out.max_pin_attempts = std::atoi(val.c_str());
            if (out.max_pin_attempts <= 0) {
                err = "--max-pin-attempts must be a positive number";
                return false;
            }
        } else if (key == "--config-dir") {
            if (!has_val) {
                if (i + 1 >= argc) {
                    err = "--config-dir needs a value";
                    return false;
                }
                val = argv[++i];
            }
            out.config_dir = val;
        } else {
            err = "unknown argument: " + a;
            return false;
        }
    }
    return true;
}

RemoteError resolve_host(const CliOptions& options,
                         CredentialStore& store,
                         LinePrompt& prompt,
                         string& host_out) {
    if (options.host) {
        if (!parse_ipv4(*options.host, host_out)) {
            return RemoteError::Config;
        }
        return RemoteError::None;
    }

    auto saved = store.host();
    if (saved && parse_ipv4(*saved, host_out)) {
        return RemoteError::None;
    }
    if (saved) {
        prompt.notice("Saved host '" + *saved + "' is not a valid IP address.");
    }

    while (true) {
        string line;
        if (!prompt.read_line("Enter device IP address: ", line)) {
            return RemoteError::Config;
        }
        string host;
        if (parse_ipv4(trim(line), host)) {
            if (!store.save_host(host)) {
                return RemoteError::Storage;
            }
            prompt.notice("Saved IP address to " + store.env_path());
            host_out = host;
            return RemoteError::None;
        }
        prompt.notice("Invalid IP address format. Please enter a valid IP (e.g., 192.168.1.238)");
    }
}

int run_shield_pause(const CliOptions& options,
                     CredentialStore& store,
                     LinePrompt& prompt,
                     PairingLink& pairing,
                     RemoteConnector& connector) {
    // Reject a bad --host before touching the store, the prompt or the network.
    if (options.host && !is_valid_ipv4(*options.host)) {
        report_remote_error(RemoteError::Config, *options.host,
                            "'" + *options.host + "' is not a valid IP address. Use format: xxx.xxx.xxx.xxx");
        return 1;
    }

    if (!store.load()) {
        cerr << "Warning: could not read " << store.env_path() << "\n";
    }

    string host;
    RemoteError err = resolve_host(options, store, prompt, host);
    if (err != RemoteError::None) {
        report_remote_error(err, string(),
                            err == RemoteError::Storage ? "cannot write " + store.env_path()
                                                        : string("no device address entered"));
        return 1;
    }
    cout << "Device host: " << host << "\n";

    SessionConfig config;
    config.host             = host;
    config.force_repair     = options.repair;
    config.max_pin_attempts = options.max_pin_attempts;

    ConnectionOrchestrator orchestrator(store, pairing, connector, prompt);
    err = orchestrator.run(config);
    DPRINT("run finished: " << remote_error_name(err));
    return err == RemoteError::None ? 0 : 1;
}
