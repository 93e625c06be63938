#pragma once
#include "polo.pb.h"
#include "remotemessage.pb.h"
#include <string>
#include <vector>
#include <cstdint>

// Android TV Remote v2 messages are protobuf bodies (polo.proto on the
// pairing port, remotemessage.proto on the remote port), each prefixed
// with its length as a base-128 varint.

static const uint32_t POLO_PROTOCOL_VERSION = 2;
static const uint32_t PIN_SYMBOL_LENGTH     = 6;

// PING | KEY | POWER | VOLUME | APP_LINK
static const int32_t REMOTE_FEATURES = 611;

// --- varint + framing ---

void put_varint(std::vector<uint8_t>& out, uint64_t v);

// Returns bytes consumed, 0 if 'len' ends mid-varint or it is too long.
size_t get_varint(const uint8_t* data, size_t len, uint64_t& v);

// length prefix + payload
std::vector<uint8_t> frame_message(const std::vector<uint8_t>& payload);

class Framer {
public:
    // Feed raw bytes; complete message bodies are appended to 'out'.
    // Returns false when a length prefix is malformed or oversized.
    bool push(const std::vector<uint8_t>& chunk,
              std::vector<std::vector<uint8_t>>& out);

    bool has_partial() const { return !m_buf.empty(); }

private:
    std::vector<uint8_t> m_buf;
};

// --- protobuf <-> bytes ---

std::vector<uint8_t> serialize_message(const google::protobuf::MessageLite& msg);
bool parse_message(const std::vector<uint8_t>& bytes,
                   google::protobuf::MessageLite& msg);

// --- pairing (port 6467) ---

atv::polo::OuterMessage make_pairing_request(const std::string& service_name,
                                             const std::string& client_name);
atv::polo::OuterMessage make_pairing_option();
atv::polo::OuterMessage make_pairing_configuration(atv::polo::PairingEncoding::EncodingType type);
atv::polo::OuterMessage make_pairing_secret(const std::vector<uint8_t>& secret);

// Encoding the device asks for in its option reply: output encodings
// first, then input encodings, HEXADECIMAL if it names none.
atv::polo::PairingEncoding::EncodingType preferred_encoding(const atv::polo::OuterMessage& reply);

// --- remote (port 6466) ---

atv::remote::RemoteMessage make_remote_configure(const std::string& package_name,
                                                 const std::string& app_version);
atv::remote::RemoteMessage make_remote_set_active();
atv::remote::RemoteMessage make_remote_ping_response(int32_t val1);
atv::remote::RemoteMessage make_remote_key_inject(int32_t key_code,
                                                  atv::remote::RemoteDirection direction = atv::remote::SHORT);
