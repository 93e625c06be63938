#include "connection_orchestrator.h"
#include "command_dispatcher.h"
#include "atv_crypto.h"
#include "debug_utils.h"
#include <iostream>
#include <memory>

using namespace std;

const char* session_state_name(SessionState s) {
    switch (s) {
    case SessionState::Start:         return "START";
    case SessionState::NeedsPairing:  return "NEEDS_PAIRING";
    case SessionState::HasCredential: return "HAS_CREDENTIAL";
    case SessionState::CertReady:     return "CERT_READY";
    case SessionState::Pairing:       return "PAIRING";
    case SessionState::Paired:        return "PAIRED";
    case SessionState::Connecting:    return "CONNECTING";
    case SessionState::Connected:     return "CONNECTED";
    case SessionState::Done:          return "DONE";
    case SessionState::Failed:        return "FAILED";
    }
    return "?";
}

ConnectionOrchestrator::ConnectionOrchestrator(CredentialStore& store,
                                               PairingLink& pairing,
                                               RemoteConnector& connector,
                                               LinePrompt& prompt)
    : m_store(store),
      m_pairing(pairing),
      m_connector(connector),
      m_prompt(prompt) {
}

void ConnectionOrchestrator::enter(SessionState s) {
    DPRINT("session: " << session_state_name(m_state) << " -> " << session_state_name(s));
    m_state = s;
    m_history.push_back(s);
}

RemoteError ConnectionOrchestrator::fail(RemoteError err, const string& host) {
    enter(SessionState::Failed);
    report_remote_error(err, host, m_detail);
    return err;
}

RemoteError ConnectionOrchestrator::run(const SessionConfig& config) {
    m_history.clear();
    m_detail.clear();
    m_state = SessionState::Start;
    m_history.push_back(SessionState::Start);

    DeviceEndpoint endpoint;
    endpoint.host = config.host;
    const DeviceIdentity identity = m_store.identity();

    // START
    bool needs_pairing = config.force_repair || !m_store.has_valid_credential();
    enter(needs_pairing ? SessionState::NeedsPairing : SessionState::HasCredential);
    if (config.force_repair) {
        cout << "Force repair requested - pairing again\n";
    }

    // identity must exist before either port will talk to us
    bool generated = false;
    if (!ensure_identity(identity, generated, m_detail)) {
        return fail(RemoteError::Identity, endpoint.host);
    }
    if (generated) {
        cout << "Generated client certificate " << identity.cert_path << "\n";
    }
    enter(SessionState::CertReady);

    if (needs_pairing) {
        enter(SessionState::Pairing);

        PairingNegotiator negotiator(m_pairing, m_prompt, config.max_pin_attempts);
        string marker;
        RemoteError err = negotiator.negotiate(endpoint, identity, marker, m_detail);
        if (err != RemoteError::None) {
            cerr << "Pairing failed.\n";
            return fail(err, endpoint.host);
        }

        if (!m_store.save_credential(endpoint.host, marker)) {
            m_detail = "cannot write " + m_store.env_path();
            return fail(RemoteError::Storage, endpoint.host);
        }
        cout << "Credentials saved to " << m_store.env_path() << "\n";
        enter(SessionState::Paired);
    }

    enter(SessionState::Connecting);
    RemoteError conn_err = RemoteError::None;
    unique_ptr<RemoteChannel> channel = m_connector.open(endpoint, identity, conn_err, m_detail);
    if (!channel) {
        if (conn_err == RemoteError::None) {
            conn_err = RemoteError::ConnectOtherIO;
        }
        return fail(conn_err, endpoint.host);
    }
    enter(SessionState::Connected);

    RemoteError send_err = dispatch_play_pause(*channel, m_detail);
    channel->close();
    channel.reset();

    if (send_err != RemoteError::None) {
        return fail(send_err, endpoint.host);
    }

    enter(SessionState::Done);
    cout << "Done!\n";
    return RemoteError::None;
}
