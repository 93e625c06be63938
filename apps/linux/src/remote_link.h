#pragma once
#include "remote_error.h"
#include <string>
#include <memory>
#include <cstdint>

// Fixed Android TV Remote v2 ports
static const uint16_t ATV_REMOTE_PORT  = 6466;
static const uint16_t ATV_PAIRING_PORT = 6467;

// Android keycode for the media play/pause toggle
static const uint32_t KEYCODE_MEDIA_PLAY_PAUSE = 85;

struct DeviceEndpoint {
    std::string host;
};

// Locations of the client certificate and private key (PEM).
struct DeviceIdentity {
    std::string cert_path;
    std::string key_path;
};

// Pairing handshake with one device. start_pairing() leaves a PIN on the
// TV screen; finish_pairing() may be called again after PairingInvalidPin.
class PairingLink {
public:
    virtual ~PairingLink() {}

    virtual RemoteError start_pairing(const DeviceEndpoint& endpoint,
                                      const DeviceIdentity& identity,
                                      std::string& detail) = 0;

    // 'pin' is already normalized (6 uppercase hex chars).
    virtual RemoteError finish_pairing(const std::string& pin,
                                       std::string& detail) = 0;

    virtual void close() = 0;
};

// An open, authenticated session with the device.
class RemoteChannel {
public:
    virtual ~RemoteChannel() {}

    virtual bool send_key(uint32_t key_code, std::string& detail) = 0;

    virtual void close() = 0;
};

class RemoteConnector {
public:
    virtual ~RemoteConnector() {}

    // Returns nullptr and sets 'err' to one of the connect-class errors.
    virtual std::unique_ptr<RemoteChannel> open(const DeviceEndpoint& endpoint,
                                                const DeviceIdentity& identity,
                                                RemoteError& err,
                                                std::string& detail) = 0;
};

// Line-oriented user input.
class LinePrompt {
public:
    virtual ~LinePrompt() {}

    // false on end of input
    virtual bool read_line(const std::string& prompt, std::string& out) = 0;

    virtual void notice(const std::string& text) = 0;
};
