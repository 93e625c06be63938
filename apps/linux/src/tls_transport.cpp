#include "tls_transport.h"
#include "atv_messages.h"
#include "debug_utils.h"
#include <gio/gio.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <chrono>
#include <deque>
#include <cerrno>
#include <cstring>

using namespace std;

static const int WRITE_TIMEOUT_MS = 5000;

struct TlsTransport::Impl {
    GSocketConnection* conn = nullptr;
    GSocket* socket = nullptr;          // owned by conn

    SSL_CTX* ctx = nullptr;
    SSL* ssl = nullptr;

    Framer framer;
    deque<vector<uint8_t>> inbox;
};

namespace {
    typedef chrono::steady_clock::time_point Deadline;

    Deadline deadline_in(int timeout_ms) {
        return chrono::steady_clock::now() + chrono::milliseconds(timeout_ms);
    }

    long long remaining_us(const Deadline& d) {
        auto left = chrono::duration_cast<chrono::microseconds>(d - chrono::steady_clock::now()).count();
        return left > 0 ? left : 0;
    }

    string ssl_error_string() {
        unsigned long code = ERR_get_error();
        if (code == 0) {
            return "unknown TLS error";
        }
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        ERR_clear_error();
        return buf;
    }

    enum class IoWait { Ready, Timeout, Failed };

    // GSockets are non-blocking underneath, so every WANT_READ / WANT_WRITE
    // from OpenSSL parks here until the fd is ready or the deadline passes.
    IoWait wait_io(GSocket* socket, int ssl_err, const Deadline& deadline, string& detail) {
        long long us = remaining_us(deadline);
        if (us == 0) {
            return IoWait::Timeout;
        }
        GIOCondition cond = (ssl_err == SSL_ERROR_WANT_WRITE)
                          ? G_IO_OUT
                          : static_cast<GIOCondition>(G_IO_IN | G_IO_HUP | G_IO_ERR);
        GError* error = nullptr;
        if (g_socket_condition_timed_wait(socket, cond, us, nullptr, &error)) {
            return IoWait::Ready;
        }
        IoWait result = IoWait::Failed;
        if (error && error->domain == G_IO_ERROR && error->code == G_IO_ERROR_TIMED_OUT) {
            result = IoWait::Timeout;
        } else {
            detail = error ? error->message : "socket wait failed";
        }
        if (error) g_error_free(error);
        return result;
    }
}

RemoteError classify_connect_error(const GError* error) {
    if (!error) {
        return RemoteError::ConnectOtherIO;
    }
    if (error->domain == G_RESOLVER_ERROR) {
        return RemoteError::ResolutionFailure;
    }
    if (error->domain == G_IO_ERROR) {
        switch (error->code) {
        case G_IO_ERROR_TIMED_OUT:
            return RemoteError::ConnectTimeout;
        case G_IO_ERROR_CONNECTION_REFUSED:
            return RemoteError::ConnectRefused;
        case G_IO_ERROR_NETWORK_UNREACHABLE:
        case G_IO_ERROR_HOST_UNREACHABLE:
            return RemoteError::NetworkUnreachable;
        default:
            break;
        }
    }
    return RemoteError::ConnectOtherIO;
}

TlsTransport::TlsTransport()
    : m_impl(new Impl()) {
}

TlsTransport::~TlsTransport() {
    disconnect();
    delete m_impl;
    m_impl = nullptr;
}

bool TlsTransport::is_connected() const {
    return m_impl->ssl != nullptr;
}

RemoteError TlsTransport::connect(const string& host,
                                  uint16_t port,
                                  const DeviceIdentity& identity,
                                  int timeout_ms,
                                  string& detail) {
    disconnect();

    // Load our identity first: no point opening a socket without it.
    m_impl->ctx = SSL_CTX_new(TLS_client_method());
    if (!m_impl->ctx) {
        detail = "SSL_CTX_new failed: " + ssl_error_string();
        return RemoteError::ConnectOtherIO;
    }
    // Devices present self-signed certificates; trust is established by pairing.
    SSL_CTX_set_verify(m_impl->ctx, SSL_VERIFY_NONE, nullptr);
    SSL_CTX_set_options(m_impl->ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
    if (SSL_CTX_use_certificate_file(m_impl->ctx, identity.cert_path.c_str(), SSL_FILETYPE_PEM) != 1 ||
        SSL_CTX_use_PrivateKey_file(m_impl->ctx, identity.key_path.c_str(), SSL_FILETYPE_PEM) != 1 ||
        SSL_CTX_check_private_key(m_impl->ctx) != 1) {
        detail = "cannot load client certificate: " + ssl_error_string();
        disconnect();
        return RemoteError::ConnectAuth;
    }

    DPRINT("tls: connect " << host << ":" << port << " timeout=" << timeout_ms << "ms");
    auto deadline = deadline_in(timeout_ms);

    GSocketClient* client = g_socket_client_new();
    g_socket_client_set_timeout(client, static_cast<guint>((timeout_ms + 999) / 1000));

    GError* error = nullptr;
    m_impl->conn = g_socket_client_connect_to_host(client, host.c_str(), port, nullptr, &error);
    g_object_unref(client);
    if (!m_impl->conn) {
        RemoteError err = classify_connect_error(error);
        detail = error ? error->message : "connect failed";
        if (error) g_error_free(error);
        DPRINT("tls: TCP connect failed: " << detail);
        disconnect();
        return err;
    }
    m_impl->socket = g_socket_connection_get_socket(m_impl->conn);
    DPRINT("tls: TCP connected, starting handshake");

    m_impl->ssl = SSL_new(m_impl->ctx);
    if (!m_impl->ssl || SSL_set_fd(m_impl->ssl, g_socket_get_fd(m_impl->socket)) != 1) {
        detail = "cannot set up TLS session: " + ssl_error_string();
        disconnect();
        return RemoteError::ConnectOtherIO;
    }

    while (true) {
        errno = 0;
        int rc = SSL_connect(m_impl->ssl);
        if (rc == 1) {
            break;
        }
        int e = SSL_get_error(m_impl->ssl, rc);
        if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) {
            IoWait w = wait_io(m_impl->socket, e, deadline, detail);
            if (w == IoWait::Ready) {
                continue;
            }
            if (w == IoWait::Timeout) {
                detail = "TLS handshake timed out";
                disconnect();
                return RemoteError::ConnectTimeout;
            }
            disconnect();
            return RemoteError::ConnectOtherIO;
        }

        RemoteError err = RemoteError::ConnectAuth;
        if (e == SSL_ERROR_SYSCALL && errno != 0) {
            detail = string("TLS handshake: ") + strerror(errno);
            err = RemoteError::ConnectOtherIO;
        } else if (e == SSL_ERROR_SSL) {
            detail = "TLS handshake rejected: " + ssl_error_string();
        } else {
            detail = "device closed the connection during TLS handshake";
        }
        disconnect();
        return err;
    }

    DPRINT("tls: handshake done, " << SSL_get_version(m_impl->ssl));
    return RemoteError::None;
}

void TlsTransport::disconnect() {
    if (!m_impl) {
        return;
    }
    if (m_impl->ssl) {
        // best-effort close_notify; the peer may already be gone
        SSL_shutdown(m_impl->ssl);
        SSL_free(m_impl->ssl);
        m_impl->ssl = nullptr;
        ERR_clear_error();
    }
    if (m_impl->ctx) {
        SSL_CTX_free(m_impl->ctx);
        m_impl->ctx = nullptr;
    }
    if (m_impl->conn) {
        GError* error = nullptr;
        if (!g_io_stream_close(G_IO_STREAM(m_impl->conn), nullptr, &error)) {
            DPRINT("tls: close failed: " << (error ? error->message : "unknown"));
        }
        if (error) g_error_free(error);
        g_object_unref(m_impl->conn);
        m_impl->conn = nullptr;
        m_impl->socket = nullptr;
    }
    m_impl->framer = Framer();
    m_impl->inbox.clear();
}

bool TlsTransport::write_message(const vector<uint8_t>& payload,
                                 string& detail) {
    if (!m_impl->ssl) {
        detail = "not connected";
        return false;
    }

    vector<uint8_t> frame = frame_message(payload);
    auto deadline = deadline_in(WRITE_TIMEOUT_MS);

    while (true) {
        errno = 0;
        int rc = SSL_write(m_impl->ssl, frame.data(), static_cast<int>(frame.size()));
        if (rc > 0) {
            return true;
        }
        int e = SSL_get_error(m_impl->ssl, rc);
        if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) {
            IoWait w = wait_io(m_impl->socket, e, deadline, detail);
            if (w == IoWait::Ready) {
                continue;
            }
            if (w == IoWait::Timeout) {
                detail = "write timed out";
            }
            return false;
        }
        if (e == SSL_ERROR_SYSCALL && errno != 0) {
            detail = string("write failed: ") + strerror(errno);
        } else {
            detail = "write failed: " + ssl_error_string();
        }
        return false;
    }
}

ReadStatus TlsTransport::read_message(int timeout_ms,
                                      vector<uint8_t>& out,
                                      string& detail) {
    if (!m_impl->ssl) {
        detail = "not connected";
        return ReadStatus::Error;
    }

    auto deadline = deadline_in(timeout_ms);

    while (m_impl->inbox.empty()) {
        uint8_t buf[4096];
        errno = 0;
        int rc = SSL_read(m_impl->ssl, buf, sizeof(buf));
        if (rc > 0) {
            vector<uint8_t> chunk(buf, buf + rc);
            vector<vector<uint8_t>> msgs;
            if (!m_impl->framer.push(chunk, msgs)) {
                detail = "malformed message length";
                return ReadStatus::Error;
            }
            for (auto& m : msgs) {
                m_impl->inbox.push_back(std::move(m));
            }
            continue;
        }

        int e = SSL_get_error(m_impl->ssl, rc);
        if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) {
            IoWait w = wait_io(m_impl->socket, e, deadline, detail);
            if (w == IoWait::Ready) {
                continue;
            }
            if (w == IoWait::Timeout) {
                detail = "timed out waiting for device";
                return ReadStatus::Timeout;
            }
            return ReadStatus::Error;
        }
        if (e == SSL_ERROR_ZERO_RETURN) {
            detail = "device closed the connection";
            return ReadStatus::Closed;
        }
        if (e == SSL_ERROR_SYSCALL && errno != 0) {
            detail = string("read failed: ") + strerror(errno);
        } else {
            detail = "read failed: " + ssl_error_string();
        }
        return ReadStatus::Error;
    }

    out = std::move(m_impl->inbox.front());
    m_impl->inbox.pop_front();
    DPRINT("tls: rx " << out.size() << " bytes");
    return ReadStatus::Ok;
}

bool TlsTransport::peer_rsa_parts(RsaPublicParts& out) {
    if (!m_impl->ssl) {
        return false;
    }
    X509* cert = SSL_get1_peer_certificate(m_impl->ssl);
    if (!cert) {
        return false;
    }
    bool ok = rsa_parts_from_cert(cert, out);
    X509_free(cert);
    return ok;
}
