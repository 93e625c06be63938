#include "atv_crypto.h"
#include "debug_utils.h"
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <openssl/core_names.h>
#include <openssl/bn.h>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <memory>
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace {
    const int  RSA_KEY_BITS       = 2048;
    const long CERT_VALIDITY_SECS = 10L * 365 * 24 * 3600;

    std::string openssl_error_string() {
        unsigned long code = ERR_get_error();
        if (code == 0) {
            return "unknown OpenSSL error";
        }
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        ERR_clear_error();
        return buf;
    }

    std::vector<uint8_t> bn_to_bytes(const BIGNUM* bn) {
        std::vector<uint8_t> out(BN_num_bytes(bn));
        BN_bn2bin(bn, out.data());
        return out;
    }

    using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
    using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;

    PkeyPtr generate_rsa_key() {
        EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
        if (!ctx) {
            throw std::runtime_error("EVP_PKEY_CTX_new_id failed");
        }
        EVP_PKEY* pkey = nullptr;
        if (EVP_PKEY_keygen_init(ctx) <= 0 ||
            EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, RSA_KEY_BITS) <= 0 ||
            EVP_PKEY_keygen(ctx, &pkey) <= 0) {
            EVP_PKEY_CTX_free(ctx);
            throw std::runtime_error("RSA keygen failed: " + openssl_error_string());
        }
        EVP_PKEY_CTX_free(ctx);
        return PkeyPtr(pkey, &EVP_PKEY_free);
    }

    void add_name_entry(X509_NAME* name, const char* field, const char* value) {
        if (!X509_NAME_add_entry_by_txt(name, field, MBSTRING_ASC,
                                        reinterpret_cast<const unsigned char*>(value),
                                        -1, -1, 0)) {
            throw std::runtime_error(std::string("X509_NAME_add_entry_by_txt(") + field + ") failed");
        }
    }

    X509Ptr make_self_signed(EVP_PKEY* pkey) {
        X509Ptr cert(X509_new(), &X509_free);
        if (!cert) {
            throw std::runtime_error("X509_new failed");
        }

        uint8_t serial_bytes[8];
        if (RAND_bytes(serial_bytes, sizeof(serial_bytes)) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        serial_bytes[0] &= 0x7F;   // keep the serial positive
        BIGNUM* serial = BN_bin2bn(serial_bytes, sizeof(serial_bytes), nullptr);
        if (!serial || !BN_to_ASN1_INTEGER(serial, X509_get_serialNumber(cert.get()))) {
            BN_free(serial);
            throw std::runtime_error("cannot set certificate serial");
        }
        BN_free(serial);

        X509_set_version(cert.get(), 2);
        X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
        X509_gmtime_adj(X509_getm_notAfter(cert.get()), CERT_VALIDITY_SECS);
        if (!X509_set_pubkey(cert.get(), pkey)) {
            throw std::runtime_error("X509_set_pubkey failed");
        }

        X509_NAME* name = X509_get_subject_name(cert.get());
        add_name_entry(name, "C",  "US");
        add_name_entry(name, "O",  "shieldpause");
        add_name_entry(name, "CN", "atvremote");
        X509_set_issuer_name(cert.get(), name);

        if (X509_sign(cert.get(), pkey, EVP_sha256()) <= 0) {
            throw std::runtime_error("X509_sign failed: " + openssl_error_string());
        }
        return cert;
    }

    // PEM writers go through a temp file so a crash never leaves half a key.
    void write_pem_key(const std::string& path, EVP_PKEY* pkey) {
        const std::string tmp = path + ".tmp";
        FILE* f = std::fopen(tmp.c_str(), "wb");
        if (!f) {
            throw std::runtime_error("cannot open " + tmp + " for writing");
        }
        int ok = PEM_write_PrivateKey(f, pkey, nullptr, nullptr, 0, nullptr, nullptr);
        std::fclose(f);
        if (!ok) {
            std::remove(tmp.c_str());
            throw std::runtime_error("PEM_write_PrivateKey failed");
        }
        std::error_code ec;
        fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        fs::rename(tmp, path);
    }

    void write_pem_cert(const std::string& path, X509* cert) {
        const std::string tmp = path + ".tmp";
        FILE* f = std::fopen(tmp.c_str(), "wb");
        if (!f) {
            throw std::runtime_error("cannot open " + tmp + " for writing");
        }
        int ok = PEM_write_X509(f, cert);
        std::fclose(f);
        if (!ok) {
            std::remove(tmp.c_str());
            throw std::runtime_error("PEM_write_X509 failed");
        }
        fs::rename(tmp, path);
    }

    bool file_non_empty(const std::string& path) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            return false;
        }
        auto size = fs::file_size(path, ec);
        return !ec && size > 0;
    }
}

std::vector<uint8_t> sha256(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (!EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr)) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    out.resize(len);
    return out;
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (uint8_t b : data) {
        oss << std::setw(2) << (int)b;
    }
    return oss.str();
}

std::vector<uint8_t> hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) throw std::runtime_error("hex_decode: odd length");
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        std::string byte_str = hex.substr(i, 2);
        size_t used = 0;
        unsigned long val = std::stoul(byte_str, &used, 16);
        if (used != 2) throw std::runtime_error("hex_decode: bad digit");
        out.push_back(static_cast<uint8_t>(val));
    }
    return out;
}

std::string base64_encode(const std::string& data) {
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int len = EVP_EncodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), len);
}

bool rsa_parts_from_cert(X509* cert, RsaPublicParts& out) {
    if (!cert) {
        return false;
    }
    EVP_PKEY* pkey = X509_get0_pubkey(cert);
    if (!pkey || EVP_PKEY_base_id(pkey) != EVP_PKEY_RSA) {
        return false;
    }

    BIGNUM* n = nullptr;
    BIGNUM* e = nullptr;
    if (!EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_RSA_N, &n) ||
        !EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_RSA_E, &e)) {
        BN_free(n);
        BN_free(e);
        return false;
    }
    out.modulus  = bn_to_bytes(n);
    out.exponent = bn_to_bytes(e);
    BN_free(n);
    BN_free(e);
    return true;
}

bool rsa_parts_from_cert_file(const std::string& cert_path,
                              RsaPublicParts& out,
                              std::string& err) {
    FILE* f = std::fopen(cert_path.c_str(), "rb");
    if (!f) {
        err = "cannot open " + cert_path;
        return false;
    }
    X509* cert = PEM_read_X509(f, nullptr, nullptr, nullptr);
    std::fclose(f);
    if (!cert) {
        err = "cannot parse certificate " + cert_path + ": " + openssl_error_string();
        return false;
    }
    bool ok = rsa_parts_from_cert(cert, out);
    X509_free(cert);
    if (!ok) {
        err = "certificate " + cert_path + " does not carry an RSA key";
    }
    return ok;
}

std::vector<uint8_t> pairing_secret(const RsaPublicParts& client,
                                    const RsaPublicParts& server,
                                    const std::vector<uint8_t>& pin) {
    if (pin.size() != 3) {
        throw std::runtime_error("pairing_secret: PIN must decode to 3 bytes");
    }
    std::vector<uint8_t> msg;
    msg.insert(msg.end(), client.modulus.begin(),  client.modulus.end());
    msg.insert(msg.end(), client.exponent.begin(), client.exponent.end());
    msg.insert(msg.end(), server.modulus.begin(),  server.modulus.end());
    msg.insert(msg.end(), server.exponent.begin(), server.exponent.end());
    msg.push_back(pin[1]);
    msg.push_back(pin[2]);
    return sha256(msg);
}

bool pin_matches_secret(const std::vector<uint8_t>& secret,
                        const std::vector<uint8_t>& pin) {
    return !secret.empty() && pin.size() == 3 && secret[0] == pin[0];
}

bool identity_files_present(const DeviceIdentity& identity) {
    return file_non_empty(identity.cert_path) && file_non_empty(identity.key_path);
}

bool ensure_identity(const DeviceIdentity& identity,
                     bool& generated,
                     std::string& err) {
    generated = false;
    if (identity_files_present(identity)) {
        DPRINT("identity: using existing " << identity.cert_path);
        return true;
    }

    DPRINT("identity: generating RSA-" << RSA_KEY_BITS << " key and certificate");
    try {
        PkeyPtr pkey = generate_rsa_key();
        X509Ptr cert = make_self_signed(pkey.get());
        write_pem_key(identity.key_path, pkey.get());
        write_pem_cert(identity.cert_path, cert.get());
    } catch (const std::exception& e) {
        err = e.what();
        return false;
    }

    generated = true;
    return true;
}

std::string make_credential_marker(const std::string& host) {
    return base64_encode("paired_" + host);
}
