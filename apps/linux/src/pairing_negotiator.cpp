#include "pairing_negotiator.h"
#include "validators.h"
#include "atv_crypto.h"
#include "debug_utils.h"

using namespace std;

PairingNegotiator::PairingNegotiator(PairingLink& link,
                                     LinePrompt& prompt,
                                     int max_attempts)
    : m_link(link),
      m_prompt(prompt),
      m_max_attempts(max_attempts > 0 ? max_attempts : 1) {
}

RemoteError PairingNegotiator::negotiate(const DeviceEndpoint& endpoint,
                                         const DeviceIdentity& identity,
                                         string& marker_out,
                                         string& detail) {
    m_attempts = 0;
    m_prompt.notice("Initiating pairing with device at " + endpoint.host + "...");

    RemoteError err = m_link.start_pairing(endpoint, identity, detail);
    if (err != RemoteError::None) {
        m_link.close();
        return err;
    }
    m_prompt.notice("A PIN code should now appear on your TV screen.");

    err = pin_loop(endpoint, marker_out, detail);
    m_link.close();
    return err;
}

RemoteError PairingNegotiator::pin_loop(const DeviceEndpoint& endpoint,
                                        string& marker_out,
                                        string& detail) {
    while (true) {
        string line;
        if (!m_prompt.read_line("Enter PIN from TV screen: ", line)) {
            detail = "PIN entry aborted";
            return RemoteError::PairingProtocol;
        }

        string pin = normalize_pin(line);
        if (!is_valid_pin(pin)) {
            m_prompt.notice("Invalid PIN format. Please enter the 6-character hex PIN shown on screen (e.g., 4D292B).");
            continue;
        }

        ++m_attempts;
        DPRINT("pairing: attempt " << m_attempts << "/" << m_max_attempts);

        string why;
        RemoteError err = m_link.finish_pairing(pin, why);
        if (err == RemoteError::None) {
            m_prompt.notice("Pairing successful!");
            marker_out = make_credential_marker(endpoint.host);
            return RemoteError::None;
        }

        if (err != RemoteError::PairingInvalidPin) {
            detail = why;
            return err;
        }

        if (m_attempts >= m_max_attempts) {
            detail = "Too many wrong PINs (" + to_string(m_attempts) + ")";
            return RemoteError::PairingProtocol;
        }
        m_prompt.notice("Invalid PIN. Please try again.");
    }
}
