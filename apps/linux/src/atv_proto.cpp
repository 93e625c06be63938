#include "atv_proto.h"
#include "debug_utils.h"
#include <iostream>
#include <chrono>
#include <thread>
#include <stdexcept>

using namespace std;
using atv::polo::OuterMessage;
using atv::remote::RemoteMessage;

static const int CONNECT_TIMEOUT_MS      = 10000;
static const int PAIRING_READ_TIMEOUT_MS = 10000;
static const int REMOTE_READ_TIMEOUT_MS  = 3000;
static const int MAX_HANDSHAKE_MESSAGES  = 16;
// give the device time to consume the key before close_notify
static const int KEY_SETTLE_MS           = 500;

static bool write_proto(TlsTransport& tls,
                        const google::protobuf::MessageLite& msg,
                        string& detail) {
    vector<uint8_t> payload = serialize_message(msg);
    if (payload.empty() && msg.ByteSizeLong() != 0) {
        detail = "cannot serialize " + msg.GetTypeName();
        return false;
    }
    return tls.write_message(payload, detail);
}

// --- AtvPairingLink ---

AtvPairingLink::AtvPairingLink(uint16_t port)
    : m_port(port) {
}

RemoteError AtvPairingLink::exchange(const OuterMessage& msg,
                                     OuterMessage& reply,
                                     const char* step,
                                     string& detail) {
    string io;
    if (!write_proto(m_tls, msg, io)) {
        detail = string("Failed to send ") + step + ": " + io;
        return RemoteError::PairingProtocol;
    }

    vector<uint8_t> raw;
    ReadStatus rs = m_tls.read_message(PAIRING_READ_TIMEOUT_MS, raw, io);
    if (rs != ReadStatus::Ok) {
        detail = string("No reply to ") + step + ": " + io;
        return RemoteError::PairingProtocol;
    }

    reply.Clear();
    if (!parse_message(raw, reply)) {
        detail = string("Malformed reply to ") + step;
        return RemoteError::PairingProtocol;
    }
    if (reply.status() != OuterMessage::STATUS_OK) {
        detail = string("Device answered ") + step + " with status " +
                 to_string(static_cast<int>(reply.status()));
        return RemoteError::PairingProtocol;
    }
    return RemoteError::None;
}

RemoteError AtvPairingLink::start_pairing(const DeviceEndpoint& endpoint,
                                          const DeviceIdentity& identity,
                                          string& detail) {
    close();

    string io;
    if (!rsa_parts_from_cert_file(identity.cert_path, m_client_key, io)) {
        detail = "Cannot initiate pairing: " + io;
        return RemoteError::PairingProtocol;
    }

    cout << "Connecting to " << endpoint.host << ":" << m_port << "...\n";
    RemoteError conn_err = m_tls.connect(endpoint.host, m_port, identity,
                                         CONNECT_TIMEOUT_MS, io);
    if (conn_err != RemoteError::None) {
        detail = "Cannot initiate pairing: " + remote_error_message(conn_err) + ": " + io;
        return RemoteError::PairingProtocol;
    }

    OuterMessage reply;
    RemoteError err = exchange(make_pairing_request(ATV_SERVICE_NAME, ATV_CLIENT_NAME),
                               reply, "pairing request", detail);
    if (err != RemoteError::None) {
        close();
        return err;
    }

    err = exchange(make_pairing_option(), reply, "pairing option", detail);
    if (err != RemoteError::None) {
        close();
        return err;
    }
    auto encoding = preferred_encoding(reply);
    DPRINT("pairing: device encoding type " << encoding);

    err = exchange(make_pairing_configuration(encoding), reply, "pairing configuration", detail);
    if (err != RemoteError::None) {
        close();
        return err;
    }

    if (!m_tls.peer_rsa_parts(m_server_key)) {
        detail = "Device certificate carries no RSA key";
        close();
        return RemoteError::PairingProtocol;
    }

    m_ready = true;
    return RemoteError::None;
}

RemoteError AtvPairingLink::finish_pairing(const string& pin,
                                           string& detail) {
    if (!m_ready) {
        detail = "Pairing session is not open";
        return RemoteError::PairingProtocol;
    }

    vector<uint8_t> pin_bytes;
    vector<uint8_t> secret;
    try {
        pin_bytes = hex_decode(pin);
        secret = pairing_secret(m_client_key, m_server_key, pin_bytes);
    } catch (const exception& e) {
        detail = e.what();
        return RemoteError::PairingInvalidPin;
    }

    // The first PIN byte checks the rest; a mismatch is a typo, not worth a round-trip.
    if (!pin_matches_secret(secret, pin_bytes)) {
        detail = "PIN does not match this pairing session";
        return RemoteError::PairingInvalidPin;
    }

    string io;
    if (!write_proto(m_tls, make_pairing_secret(secret), io)) {
        detail = "Failed to send pairing secret: " + io;
        close();
        return RemoteError::PairingProtocol;
    }

    vector<uint8_t> raw;
    ReadStatus rs = m_tls.read_message(PAIRING_READ_TIMEOUT_MS, raw, io);
    if (rs == ReadStatus::Closed) {
        detail = io;
        close();
        return RemoteError::PairingRejected;
    }
    if (rs != ReadStatus::Ok) {
        detail = "No reply to pairing secret: " + io;
        close();
        return RemoteError::PairingProtocol;
    }

    OuterMessage reply;
    if (!parse_message(raw, reply)) {
        detail = "Malformed reply to pairing secret";
        close();
        return RemoteError::PairingProtocol;
    }

    switch (reply.status()) {
    case OuterMessage::STATUS_OK:
        close();
        return RemoteError::None;
    case OuterMessage::STATUS_BAD_SECRET:
        detail = "Device reported a wrong PIN";
        return RemoteError::PairingInvalidPin;
    case OuterMessage::STATUS_ERROR:
        detail = "Device reported status 400";
        close();
        return RemoteError::PairingRejected;
    default:
        detail = "Device reported status " + to_string(static_cast<int>(reply.status()));
        close();
        return RemoteError::PairingProtocol;
    }
}

void AtvPairingLink::close() {
    m_ready = false;
    m_tls.disconnect();
}

// --- AtvRemoteChannel ---

AtvRemoteChannel::AtvRemoteChannel(uint16_t port)
    : m_port(port) {
}

RemoteError AtvRemoteChannel::open(const DeviceEndpoint& endpoint,
                                   const DeviceIdentity& identity,
                                   string& detail) {
    cout << "Connecting to " << endpoint.host << ":" << m_port << "...\n";
    RemoteError err = m_tls.connect(endpoint.host, m_port, identity,
                                    CONNECT_TIMEOUT_MS, detail);
    if (err != RemoteError::None) {
        return err;
    }

    err = run_configure_handshake(detail);
    if (err != RemoteError::None) {
        m_tls.disconnect();
        return err;
    }
    cout << "Connected!\n";
    return RemoteError::None;
}

RemoteError AtvRemoteChannel::run_configure_handshake(string& detail) {
    bool configured = false;

    for (int i = 0; i < MAX_HANDSHAKE_MESSAGES; ++i) {
        vector<uint8_t> raw;
        string io;
        ReadStatus rs = m_tls.read_message(REMOTE_READ_TIMEOUT_MS, raw, io);

        if (rs == ReadStatus::Timeout) {
            if (configured) {
                // some firmwares never send set_active
                DPRINT("remote: no set_active, continuing");
                return RemoteError::None;
            }
            detail = "Device sent no configuration: " + io;
            return RemoteError::ConnectTimeout;
        }
        if (rs != ReadStatus::Ok) {
            detail = io;
            // An unpaired certificate gets the session dropped right after the handshake.
            return configured ? RemoteError::ConnectOtherIO : RemoteError::ConnectAuth;
        }

        RemoteMessage msg;
        if (!parse_message(raw, msg)) {
            DPRINT("remote: unparseable message of " << raw.size() << " bytes");
            continue;
        }
        DPRINT("remote: message field " << msg.payload_case());

        switch (msg.payload_case()) {
        case RemoteMessage::kRemoteConfigure:
            if (!write_proto(m_tls, make_remote_configure(ATV_PACKAGE_NAME, ATV_APP_VERSION), io)) {
                detail = "Failed to answer configure: " + io;
                return RemoteError::ConnectOtherIO;
            }
            configured = true;
            break;

        case RemoteMessage::kRemoteSetActive:
            if (!write_proto(m_tls, make_remote_set_active(), io)) {
                detail = "Failed to answer set_active: " + io;
                return RemoteError::ConnectOtherIO;
            }
            return RemoteError::None;

        case RemoteMessage::kRemotePingRequest:
            if (!write_proto(m_tls, make_remote_ping_response(msg.remote_ping_request().val1()), io)) {
                detail = "Failed to answer ping: " + io;
                return RemoteError::ConnectOtherIO;
            }
            break;

        case RemoteMessage::kRemoteStart:
            if (configured) {
                return RemoteError::None;
            }
            break;

        case RemoteMessage::kRemoteError:
            detail = "Device reported a remote error";
            return RemoteError::ConnectOtherIO;

        default:
            // volume / IME / app-info notifications are of no interest here
            break;
        }
    }

    if (configured) {
        return RemoteError::None;
    }
    detail = "Device never sent its configuration";
    return RemoteError::ConnectOtherIO;
}

bool AtvRemoteChannel::send_key(uint32_t key_code, string& detail) {
    if (!m_tls.is_connected()) {
        detail = "channel is closed";
        return false;
    }
    DPRINT("remote: key " << key_code);
    if (!write_proto(m_tls, make_remote_key_inject(static_cast<int32_t>(key_code)), detail)) {
        return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(KEY_SETTLE_MS));
    return true;
}

void AtvRemoteChannel::close() {
    m_tls.disconnect();
}

// --- AtvConnector ---

AtvConnector::AtvConnector(uint16_t port)
    : m_port(port) {
}

unique_ptr<RemoteChannel> AtvConnector::open(const DeviceEndpoint& endpoint,
                                             const DeviceIdentity& identity,
                                             RemoteError& err,
                                             string& detail) {
    unique_ptr<AtvRemoteChannel> channel(new AtvRemoteChannel(m_port));
    err = channel->open(endpoint, identity, detail);
    if (err != RemoteError::None) {
        return nullptr;
    }
    return unique_ptr<RemoteChannel>(channel.release());
}
