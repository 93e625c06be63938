#pragma once
#include "remote_link.h"
#include "credential_store.h"
#include "pairing_negotiator.h"
#include <string>
#include <vector>

enum class SessionState {
    Start,
    NeedsPairing,
    HasCredential,
    CertReady,
    Pairing,
    Paired,
    Connecting,
    Connected,
    Done,
    Failed
};

const char* session_state_name(SessionState s);

struct SessionConfig {
    std::string host;
    bool force_repair = false;
    int  max_pin_attempts = DEFAULT_MAX_PIN_ATTEMPTS;
};

// Pair-if-needed, connect, send play/pause, close. One run per call.
class ConnectionOrchestrator {
public:
    ConnectionOrchestrator(CredentialStore& store,
                           PairingLink& pairing,
                           RemoteConnector& connector,
                           LinePrompt& prompt);

    RemoteError run(const SessionConfig& config);

    SessionState state() const { return m_state; }

    // Every state entered during the last run, in order.
    const std::vector<SessionState>& history() const { return m_history; }

private:
    void enter(SessionState s);
    RemoteError fail(RemoteError err, const std::string& host);

    CredentialStore& m_store;
    PairingLink&     m_pairing;
    RemoteConnector& m_connector;
    LinePrompt&      m_prompt;

    SessionState m_state = SessionState::Start;
    std::vector<SessionState> m_history;
    std::string m_detail;
};
