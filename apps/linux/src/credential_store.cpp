#include "credential_store.h"
#include "atv_crypto.h"
#include "debug_utils.h"

using namespace std;

static string join_path(const string& dir, const char* name) {
    if (dir.empty()) {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

CredentialStore::CredentialStore(const string& dir)
    : m_dir(dir),
      m_env(join_path(dir, ENV_FILE_NAME)) {
}

bool CredentialStore::load() {
    return m_env.load();
}

optional<string> CredentialStore::host() const {
    auto v = m_env.get(ENV_KEY_HOST);
    if (v && v->empty()) {
        return nullopt;
    }
    return v;
}

optional<string> CredentialStore::credential_marker() const {
    auto v = m_env.get(ENV_KEY_CERT);
    if (v && v->empty()) {
        return nullopt;
    }
    return v;
}

bool CredentialStore::save_host(const string& host) {
    m_env.set(ENV_KEY_HOST, host);
    return m_env.save();
}

bool CredentialStore::save_credential(const string& host,
                                      const string& marker) {
    m_env.set(ENV_KEY_HOST, host);
    m_env.set(ENV_KEY_CERT, marker);
    return m_env.save();
}

bool CredentialStore::has_valid_credential() const {
    if (!credential_marker()) {
        return false;
    }
    if (!identity_files_present(identity())) {
        DPRINT("credentials: marker present but identity files missing, treating as stale");
        return false;
    }
    return true;
}

DeviceIdentity CredentialStore::identity() const {
    DeviceIdentity id;
    id.cert_path = join_path(m_dir, CERT_FILE_NAME);
    id.key_path  = join_path(m_dir, KEY_FILE_NAME);
    return id;
}
