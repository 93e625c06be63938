#include "shieldpause_app.h"
#include "atv_proto.h"
#include "console_prompt.h"
#include "debug_utils.h"
#include <iostream>
#include <csignal>

using namespace std;

int main(int argc, char** argv) {
    CliOptions options;
    string err;
    if (!parse_cli_args(argc, argv, options, err)) {
        cerr << "Error: " << err << "\n\n";
        print_usage(argv[0]);
        return 1;
    }
    if (options.help) {
        print_usage(argv[0]);
        return 0;
    }
    set_debug_enabled(options.verbose);

    // A device dropping the socket must surface as a write error, not kill us.
    signal(SIGPIPE, SIG_IGN);

    CredentialStore store(options.config_dir);
    ConsolePrompt   prompt;
    AtvPairingLink  pairing;
    AtvConnector    connector;

    return run_shield_pause(options, store, prompt, pairing, connector);
}
