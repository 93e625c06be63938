#pragma once
#include "remote_link.h"
#include <vector>
#include <string>
#include <cstdint>
#include <openssl/x509.h>

std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);

std::string hex_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> hex_decode(const std::string& hex);

std::string base64_encode(const std::string& data);

// Big-endian unsigned RSA public key components.
struct RsaPublicParts {
    std::vector<uint8_t> modulus;
    std::vector<uint8_t> exponent;
};

bool rsa_parts_from_cert(X509* cert, RsaPublicParts& out);
bool rsa_parts_from_cert_file(const std::string& cert_path,
                              RsaPublicParts& out,
                              std::string& err);

// SHA-256(client_mod || client_exp || server_mod || server_exp || pin[1..2])
// where 'pin' is the 3 bytes decoded from the 6 hex characters.
std::vector<uint8_t> pairing_secret(const RsaPublicParts& client,
                                    const RsaPublicParts& server,
                                    const std::vector<uint8_t>& pin);

// The first PIN byte is a check digit for the secret.
bool pin_matches_secret(const std::vector<uint8_t>& secret,
                        const std::vector<uint8_t>& pin);

// Both files exist and are non-empty.
bool identity_files_present(const DeviceIdentity& identity);

// Generates an RSA-2048 key and self-signed certificate when either file
// is missing. Leaves existing files untouched. 'generated' reports whether
// new files were written.
bool ensure_identity(const DeviceIdentity& identity,
                     bool& generated,
                     std::string& err);

// Opaque "paired with <host>" marker stored in the credential file.
std::string make_credential_marker(const std::string& host);
