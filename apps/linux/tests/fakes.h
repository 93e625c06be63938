#pragma once
#include "remote_link.h"
#include <deque>
#include <string>
#include <vector>
#include <memory>
#include <stdlib.h>
#include <fstream>
#include <iterator>
#include <filesystem>
#include <stdexcept>

// Pairing link that replays a scripted list of finish_pairing() results.
class FakePairingLink : public PairingLink {
public:
    RemoteError start_result = RemoteError::None;
    std::deque<RemoteError> finish_results;

    bool started = false;
    int  closes  = 0;
    std::vector<std::string> pins;

    RemoteError start_pairing(const DeviceEndpoint& endpoint,
                              const DeviceIdentity&,
                              std::string& detail) override {
        started = true;
        host = endpoint.host;
        if (start_result != RemoteError::None) {
            detail = "scripted start failure";
        }
        return start_result;
    }

    RemoteError finish_pairing(const std::string& pin,
                               std::string& detail) override {
        pins.push_back(pin);
        if (finish_results.empty()) {
            detail = "no scripted result";
            return RemoteError::PairingProtocol;
        }
        RemoteError r = finish_results.front();
        finish_results.pop_front();
        if (r != RemoteError::None) {
            detail = "scripted finish failure";
        }
        return r;
    }

    void close() override { ++closes; }

    std::string host;
};

struct ChannelLog {
    std::vector<uint32_t> keys;
    int closes = 0;
};

class FakeChannel : public RemoteChannel {
public:
    FakeChannel(ChannelLog& log, bool send_ok) : m_log(log), m_send_ok(send_ok) {}

    bool send_key(uint32_t key_code, std::string& detail) override {
        m_log.keys.push_back(key_code);
        if (!m_send_ok) {
            detail = "broken pipe";
        }
        return m_send_ok;
    }

    void close() override { ++m_log.closes; }

private:
    ChannelLog& m_log;
    bool m_send_ok;
};

class FakeConnector : public RemoteConnector {
public:
    RemoteError open_result = RemoteError::None;
    bool send_ok = true;

    int opens = 0;
    std::string last_host;
    ChannelLog log;

    std::unique_ptr<RemoteChannel> open(const DeviceEndpoint& endpoint,
                                        const DeviceIdentity&,
                                        RemoteError& err,
                                        std::string& detail) override {
        ++opens;
        last_host = endpoint.host;
        err = open_result;
        if (open_result != RemoteError::None) {
            detail = "scripted connect failure";
            return nullptr;
        }
        return std::unique_ptr<RemoteChannel>(new FakeChannel(log, send_ok));
    }
};

class ScriptedPrompt : public LinePrompt {
public:
    std::deque<std::string> lines;
    std::vector<std::string> prompts;
    std::vector<std::string> notices;

    bool read_line(const std::string& prompt, std::string& out) override {
        prompts.push_back(prompt);
        if (lines.empty()) {
            return false;
        }
        out = lines.front();
        lines.pop_front();
        return true;
    }

    void notice(const std::string& text) override { notices.push_back(text); }
};

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "shieldpause_test_XXXXXX").string();
        if (!mkdtemp(&tmpl[0])) {
            throw std::runtime_error("mkdtemp failed for " + tmpl);
        }
        m_path = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return m_path; }

    std::string file(const std::string& name) const { return m_path + "/" + name; }

private:
    std::string m_path;
};

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f << content;
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}
