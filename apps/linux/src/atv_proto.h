#pragma once

#include "remote_link.h"
#include "tls_transport.h"
#include "atv_crypto.h"
#include "atv_messages.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

// Names this client announces to the device.
static const char* const ATV_CLIENT_NAME  = "shieldpause";
static const char* const ATV_SERVICE_NAME = "atvremote";
static const char* const ATV_PACKAGE_NAME = "shieldpause";
static const char* const ATV_APP_VERSION  = "1.0.0";

// Pairing over port 6467 (request / option / configuration / secret).
class AtvPairingLink : public PairingLink {
public:
    explicit AtvPairingLink(uint16_t port = ATV_PAIRING_PORT);

    RemoteError start_pairing(const DeviceEndpoint& endpoint,
                              const DeviceIdentity& identity,
                              std::string& detail) override;

    RemoteError finish_pairing(const std::string& pin,
                               std::string& detail) override;

    void close() override;

private:
    // Sends 'msg' and waits for a reply carrying STATUS_OK.
    RemoteError exchange(const atv::polo::OuterMessage& msg,
                         atv::polo::OuterMessage& reply,
                         const char* step,
                         std::string& detail);

    uint16_t m_port;
    TlsTransport m_tls;

    RsaPublicParts m_client_key;
    RsaPublicParts m_server_key;
    bool m_ready = false;
};

// Remote control session over port 6466.
class AtvRemoteChannel : public RemoteChannel {
public:
    explicit AtvRemoteChannel(uint16_t port = ATV_REMOTE_PORT);

    RemoteError open(const DeviceEndpoint& endpoint,
                     const DeviceIdentity& identity,
                     std::string& detail);

    bool send_key(uint32_t key_code, std::string& detail) override;

    void close() override;

private:
    // Answers configure / set_active / ping until the device is ready.
    RemoteError run_configure_handshake(std::string& detail);

    uint16_t m_port;
    TlsTransport m_tls;
};

class AtvConnector : public RemoteConnector {
public:
    explicit AtvConnector(uint16_t port = ATV_REMOTE_PORT);

    std::unique_ptr<RemoteChannel> open(const DeviceEndpoint& endpoint,
                                        const DeviceIdentity& identity,
                                        RemoteError& err,
                                        std::string& detail) override;

private:
    uint16_t m_port;
};
