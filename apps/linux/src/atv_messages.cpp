#include "atv_messages.h"

using namespace std;
using atv::polo::OuterMessage;
using atv::polo::PairingEncoding;
using atv::polo::PairingOption;
using atv::remote::RemoteMessage;

namespace {
    const size_t MAX_MESSAGE_LEN = 64 * 1024;

    // protocol_version + status header every pairing message carries
    OuterMessage pairing_outer() {
        OuterMessage msg;
        msg.set_protocol_version(POLO_PROTOCOL_VERSION);
        msg.set_status(OuterMessage::STATUS_OK);
        return msg;
    }

    void fill_encoding(PairingEncoding* enc, PairingEncoding::EncodingType type) {
        enc->set_type(type);
        enc->set_symbol_length(PIN_SYMBOL_LENGTH);
    }

    bool first_known_type(const google::protobuf::RepeatedPtrField<PairingEncoding>& encodings,
                          PairingEncoding::EncodingType& type) {
        for (const auto& enc : encodings) {
            if (enc.type() != PairingEncoding::ENCODING_TYPE_UNKNOWN) {
                type = enc.type();
                return true;
            }
        }
        return false;
    }
}

// --- varint + framing ---

void put_varint(vector<uint8_t>& out, uint64_t v) {
    while (v >= 0x80) {
        out.push_back(static_cast<uint8_t>((v & 0x7F) | 0x80));
        v >>= 7;
    }
    out.push_back(static_cast<uint8_t>(v));
}

size_t get_varint(const uint8_t* data, size_t len, uint64_t& v) {
    v = 0;
    for (size_t i = 0; i < len && i < 10; ++i) {
        v |= static_cast<uint64_t>(data[i] & 0x7F) << (7 * i);
        if ((data[i] & 0x80) == 0) {
            return i + 1;
        }
    }
    return 0;
}

vector<uint8_t> frame_message(const vector<uint8_t>& payload) {
    vector<uint8_t> frame;
    frame.reserve(payload.size() + 3);
    put_varint(frame, payload.size());
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

bool Framer::push(const vector<uint8_t>& chunk,
                  vector<vector<uint8_t>>& out) {
    m_buf.insert(m_buf.end(), chunk.begin(), chunk.end());
    size_t i = 0;

    while (i < m_buf.size()) {
        uint64_t len = 0;
        size_t hdr = get_varint(&m_buf[i], m_buf.size() - i, len);
        if (hdr == 0) {
            // prefix incomplete, or garbage if it already spans 10 bytes
            if (m_buf.size() - i >= 10) {
                return false;
            }
            break;
        }
        if (len > MAX_MESSAGE_LEN) {
            return false;
        }
        if (i + hdr + len > m_buf.size()) {
            break;
        }
        out.emplace_back(m_buf.begin() + i + hdr,
                         m_buf.begin() + i + hdr + len);
        i += hdr + len;
    }

    if (i > 0) {
        vector<uint8_t> rest(m_buf.begin() + i, m_buf.end());
        m_buf.swap(rest);
    }
    return true;
}

// --- protobuf <-> bytes ---

vector<uint8_t> serialize_message(const google::protobuf::MessageLite& msg) {
    string data;
    if (!msg.SerializeToString(&data)) {
        return vector<uint8_t>();
    }
    return vector<uint8_t>(data.begin(), data.end());
}

bool parse_message(const vector<uint8_t>& bytes,
                   google::protobuf::MessageLite& msg) {
    return msg.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()));
}

// --- pairing ---

OuterMessage make_pairing_request(const string& service_name,
                                  const string& client_name) {
    OuterMessage msg = pairing_outer();
    auto* req = msg.mutable_pairing_request();
    req->set_service_name(service_name);
    req->set_client_name(client_name);
    return msg;
}

OuterMessage make_pairing_option() {
    OuterMessage msg = pairing_outer();
    auto* option = msg.mutable_pairing_option();
    fill_encoding(option->add_input_encodings(), PairingEncoding::ENCODING_TYPE_HEXADECIMAL);
    option->set_preferred_role(PairingOption::ROLE_TYPE_INPUT);
    return msg;
}

OuterMessage make_pairing_configuration(PairingEncoding::EncodingType type) {
    OuterMessage msg = pairing_outer();
    auto* config = msg.mutable_pairing_configuration();
    fill_encoding(config->mutable_encoding(), type);
    config->set_client_role(PairingOption::ROLE_TYPE_INPUT);
    return msg;
}

OuterMessage make_pairing_secret(const vector<uint8_t>& secret) {
    OuterMessage msg = pairing_outer();
    msg.mutable_pairing_secret()->set_secret(string(secret.begin(), secret.end()));
    return msg;
}

PairingEncoding::EncodingType preferred_encoding(const OuterMessage& reply) {
    PairingEncoding::EncodingType type = PairingEncoding::ENCODING_TYPE_HEXADECIMAL;
    if (!reply.has_pairing_option()) {
        return type;
    }
    const PairingOption& option = reply.pairing_option();
    if (first_known_type(option.output_encodings(), type) ||
        first_known_type(option.input_encodings(), type)) {
        return type;
    }
    return PairingEncoding::ENCODING_TYPE_HEXADECIMAL;
}

// --- remote ---

RemoteMessage make_remote_configure(const string& package_name,
                                    const string& app_version) {
    RemoteMessage msg;
    auto* configure = msg.mutable_remote_configure();
    configure->set_code1(REMOTE_FEATURES);

    auto* info = configure->mutable_device_info();
    info->set_unknown1(1);
    info->set_unknown2("1");
    info->set_package_name(package_name);
    info->set_app_version(app_version);
    return msg;
}

RemoteMessage make_remote_set_active() {
    RemoteMessage msg;
    msg.mutable_remote_set_active()->set_active(REMOTE_FEATURES);
    return msg;
}

RemoteMessage make_remote_ping_response(int32_t val1) {
    RemoteMessage msg;
    msg.mutable_remote_ping_response()->set_val1(val1);
    return msg;
}

RemoteMessage make_remote_key_inject(int32_t key_code, atv::remote::RemoteDirection direction) {
    RemoteMessage msg;
    auto* key = msg.mutable_remote_key_inject();
    key->set_key_code(key_code);
    key->set_direction(direction);
    return msg;
}
