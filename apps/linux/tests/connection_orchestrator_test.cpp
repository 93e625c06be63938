#include "connection_orchestrator.h"
#include "atv_crypto.h"
#include "fakes.h"
#include <gtest/gtest.h>
#include <algorithm>

namespace {
    bool visited(const ConnectionOrchestrator& o, SessionState s) {
        const auto& h = o.history();
        return std::find(h.begin(), h.end(), s) != h.end();
    }

    // marker plus both identity files
    void seed_credential(const TempDir& dir, const std::string& host) {
        write_file(dir.file(".env"),
                   "SHIELD_HOST=" + host + "\nSHIELD_CERT=" + make_credential_marker(host) + "\n");
        write_file(dir.file(".shield_cert.pem"), "cert");
        write_file(dir.file(".shield_key.pem"), "key");
    }

    SessionConfig config_for(const std::string& host, bool repair = false) {
        SessionConfig c;
        c.host = host;
        c.force_repair = repair;
        return c;
    }
}

TEST(Orchestrator, ValidCredentialSkipsPairing) {
    TempDir dir;
    seed_credential(dir, "10.0.0.5");
    CredentialStore store(dir.path());
    ASSERT_TRUE(store.load());

    FakePairingLink link;
    FakeConnector connector;
    ScriptedPrompt prompt;
    ConnectionOrchestrator orch(store, link, connector, prompt);

    EXPECT_EQ(orch.run(config_for("10.0.0.5")), RemoteError::None);
    EXPECT_FALSE(link.started);
    EXPECT_EQ(connector.opens, 1);
    EXPECT_EQ(connector.log.keys, (std::vector<uint32_t>{ KEYCODE_MEDIA_PLAY_PAUSE }));
    EXPECT_EQ(connector.log.closes, 1);
    EXPECT_EQ(orch.state(), SessionState::Done);
    EXPECT_EQ(orch.history(),
              (std::vector<SessionState>{ SessionState::Start,
                                          SessionState::HasCredential,
                                          SessionState::CertReady,
                                          SessionState::Connecting,
                                          SessionState::Connected,
                                          SessionState::Done }));
    // existing identity untouched
    EXPECT_EQ(read_file(dir.file(".shield_cert.pem")), "cert");
}

TEST(Orchestrator, ForceRepairAlwaysPairs) {
    TempDir dir;
    seed_credential(dir, "10.0.0.5");
    CredentialStore store(dir.path());
    ASSERT_TRUE(store.load());

    FakePairingLink link;
    link.finish_results = { RemoteError::None };
    FakeConnector connector;
    ScriptedPrompt prompt;
    prompt.lines = { "4D292B" };
    ConnectionOrchestrator orch(store, link, connector, prompt);

    EXPECT_EQ(orch.run(config_for("10.0.0.5", true)), RemoteError::None);
    EXPECT_TRUE(link.started);
    EXPECT_TRUE(visited(orch, SessionState::NeedsPairing));
    EXPECT_TRUE(visited(orch, SessionState::Paired));
    EXPECT_EQ(connector.opens, 1);
}

TEST(Orchestrator, StaleMarkerForcesPairingAndPersists) {
    TempDir dir;
    write_file(dir.file(".env"), "SHIELD_HOST=10.0.0.5\nSHIELD_CERT=old\n");
    CredentialStore store(dir.path());
    ASSERT_TRUE(store.load());

    FakePairingLink link;
    link.finish_results = { RemoteError::None };
    FakeConnector connector;
    ScriptedPrompt prompt;
    prompt.lines = { "4D292B" };
    ConnectionOrchestrator orch(store, link, connector, prompt);

    EXPECT_EQ(orch.run(config_for("10.0.0.5")), RemoteError::None);
    EXPECT_TRUE(link.started);

    CredentialStore reread(dir.path());
    ASSERT_TRUE(reread.load());
    EXPECT_EQ(reread.credential_marker().value_or(""), make_credential_marker("10.0.0.5"));
    EXPECT_TRUE(reread.has_valid_credential());
}

TEST(Orchestrator, PairingFailureNeverConnects) {
    for (RemoteError err : { RemoteError::PairingRejected, RemoteError::PairingProtocol }) {
        TempDir dir;
        CredentialStore store(dir.path());
        ASSERT_TRUE(store.load());

        FakePairingLink link;
        link.finish_results = { err };
        FakeConnector connector;
        ScriptedPrompt prompt;
        prompt.lines = { "4D292B" };
        ConnectionOrchestrator orch(store, link, connector, prompt);

        EXPECT_EQ(orch.run(config_for("10.0.0.5")), err);
        EXPECT_EQ(connector.opens, 0);
        EXPECT_EQ(orch.state(), SessionState::Failed);
        EXPECT_FALSE(store.credential_marker());
    }
}

TEST(Orchestrator, ConnectFailureIsNotRetried) {
    TempDir dir;
    seed_credential(dir, "10.0.0.5");
    CredentialStore store(dir.path());
    ASSERT_TRUE(store.load());

    FakePairingLink link;
    FakeConnector connector;
    connector.open_result = RemoteError::ConnectRefused;
    ScriptedPrompt prompt;
    ConnectionOrchestrator orch(store, link, connector, prompt);

    EXPECT_EQ(orch.run(config_for("10.0.0.5")), RemoteError::ConnectRefused);
    EXPECT_EQ(connector.opens, 1);
    EXPECT_EQ(connector.log.closes, 0);
    EXPECT_FALSE(visited(orch, SessionState::Connected));
}

TEST(Orchestrator, FailedSendStillClosesChannel) {
    TempDir dir;
    seed_credential(dir, "10.0.0.5");
    CredentialStore store(dir.path());
    ASSERT_TRUE(store.load());

    FakePairingLink link;
    FakeConnector connector;
    connector.send_ok = false;
    ScriptedPrompt prompt;
    ConnectionOrchestrator orch(store, link, connector, prompt);

    EXPECT_EQ(orch.run(config_for("10.0.0.5")), RemoteError::Send);
    EXPECT_EQ(connector.log.keys.size(), 1u);
    EXPECT_EQ(connector.log.closes, 1);
    EXPECT_EQ(orch.state(), SessionState::Failed);
}

TEST(Orchestrator, UnwritableConfigDirFailsOnIdentity) {
    TempDir dir;
    CredentialStore store(dir.file("missing"));
    ASSERT_TRUE(store.load());

    FakePairingLink link;
    FakeConnector connector;
    ScriptedPrompt prompt;
    ConnectionOrchestrator orch(store, link, connector, prompt);

    EXPECT_EQ(orch.run(config_for("10.0.0.5")), RemoteError::Identity);
    EXPECT_FALSE(link.started);
    EXPECT_EQ(connector.opens, 0);
}

TEST(Orchestrator, StateNames) {
    EXPECT_STREQ(session_state_name(SessionState::NeedsPairing), "NEEDS_PAIRING");
    EXPECT_STREQ(session_state_name(SessionState::Failed), "FAILED");
}

TEST(Orchestrator, UnwritableCredentialIsStorageError) {
    TempDir dir;
    std::filesystem::create_directory(dir.file(".env"));
    CredentialStore store(dir.path());
    ASSERT_TRUE(store.load());

    FakePairingLink link;
    link.finish_results = { RemoteError::None };
    FakeConnector connector;
    ScriptedPrompt prompt;
    prompt.lines = { "4D292B" };
    ConnectionOrchestrator orch(store, link, connector, prompt);

    EXPECT_EQ(orch.run(config_for("10.0.0.5")), RemoteError::Storage);
    EXPECT_EQ(connector.opens, 0);
}
