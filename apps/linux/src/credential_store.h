#pragma once
#include "env_store.h"
#include "remote_link.h"
#include <string>
#include <optional>

// Keys in the .env file
static const char* const ENV_KEY_HOST = "SHIELD_HOST";
static const char* const ENV_KEY_CERT = "SHIELD_CERT";

static const char* const ENV_FILE_NAME  = ".env";
static const char* const CERT_FILE_NAME = ".shield_cert.pem";
static const char* const KEY_FILE_NAME  = ".shield_key.pem";

// Device host + pairing marker, persisted in <dir>/.env, plus the fixed
// locations of the identity files in the same directory.
class CredentialStore {
public:
    explicit CredentialStore(const std::string& dir);

    bool load();

    std::optional<std::string> host() const;
    std::optional<std::string> credential_marker() const;

    bool save_host(const std::string& host);

    // Overwrites the marker (and host) in one atomic file write.
    bool save_credential(const std::string& host,
                         const std::string& marker);

    // Marker present and both identity files present and non-empty.
    bool has_valid_credential() const;

    DeviceIdentity identity() const;

    const std::string& env_path() const { return m_env.path(); }

private:
    std::string m_dir;
    EnvFile m_env;
};
