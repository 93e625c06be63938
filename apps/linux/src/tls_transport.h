#pragma once
#include "remote_link.h"
#include "atv_crypto.h"
#include <string>
#include <vector>
#include <cstdint>

typedef struct _GError GError;

// Maps a failed GIO connect to one of the connect-class errors.
RemoteError classify_connect_error(const GError* error);

enum class ReadStatus {
    Ok,
    Timeout,
    Closed,     // peer closed the session
    Error       // TLS alert, I/O error or malformed framing
};

// TLS client socket carrying varint length-prefixed messages, authenticated
// with the local certificate. The TCP connect goes through GIO so that
// failures arrive as typed GErrors; the TLS layer is OpenSSL on the same fd.
class TlsTransport {
public:
    TlsTransport();
    ~TlsTransport();

    TlsTransport(const TlsTransport&) = delete;
    TlsTransport& operator=(const TlsTransport&) = delete;

    // Blocking connect + TLS handshake. Returns RemoteError::None or one of
    // the connect-class errors.
    RemoteError connect(const std::string& host,
                        uint16_t port,
                        const DeviceIdentity& identity,
                        int timeout_ms,
                        std::string& detail);

    // Sends close_notify and releases the socket. Safe to call twice.
    void disconnect();

    bool is_connected() const;

    bool write_message(const std::vector<uint8_t>& payload,
                       std::string& detail);

    // Blocking wait for the next complete message.
    ReadStatus read_message(int timeout_ms,
                            std::vector<uint8_t>& out,
                            std::string& detail);

    // RSA components of the device certificate
    bool peer_rsa_parts(RsaPublicParts& out);

private:
    struct Impl;
    Impl* m_impl;
};
