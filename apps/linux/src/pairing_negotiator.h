#pragma once
#include "remote_link.h"
#include <string>

static const int DEFAULT_MAX_PIN_ATTEMPTS = 5;

// Interactive PIN exchange. Malformed input is re-prompted for free; each
// PIN actually submitted counts against 'max_attempts'.
class PairingNegotiator {
public:
    PairingNegotiator(PairingLink& link,
                      LinePrompt& prompt,
                      int max_attempts = DEFAULT_MAX_PIN_ATTEMPTS);

    // On success fills 'marker_out' and returns RemoteError::None.
    RemoteError negotiate(const DeviceEndpoint& endpoint,
                          const DeviceIdentity& identity,
                          std::string& marker_out,
                          std::string& detail);

    int attempts_used() const { return m_attempts; }

private:
    RemoteError pin_loop(const DeviceEndpoint& endpoint,
                         std::string& marker_out,
                         std::string& detail);

    PairingLink& m_link;
    LinePrompt&  m_prompt;
    int m_max_attempts;
    int m_attempts = 0;
};
