#include "env_store.h"
#include "validators.h"
#include "debug_utils.h"
#include <fstream>
#include <cstdio>

namespace {
    // python-dotenv writes KEY='value'; accept both quote styles.
    inline std::string unquote(const std::string& s) {
        if (s.size() >= 2) {
            char q = s.front();
            if ((q == '\'' || q == '"') && s.back() == q) {
                return s.substr(1, s.size() - 2);
            }
        }
        return s;
    }

    inline std::string strip_export(const std::string& key) {
        const std::string prefix = "export ";
        if (key.compare(0, prefix.size(), prefix) == 0) {
            return trim(key.substr(prefix.size()));
        }
        return key;
    }
}

EnvFile::EnvFile(const std::string& path)
    : m_path(path)
{}

bool EnvFile::load() {
    m_lines.clear();
    m_values.clear();
    std::ifstream in(m_path);
    if (!in.is_open()) {
        // Not an error: missing file is treated as empty config.
        return true;
    }

    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') {
            m_lines.push_back(Line{ std::string(), raw });
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            m_lines.push_back(Line{ std::string(), raw });
            continue;
        }

        std::string key   = strip_export(trim(line.substr(0, eq)));
        std::string value = unquote(trim(line.substr(eq + 1)));
        if (key.empty()) {
            m_lines.push_back(Line{ std::string(), raw });
            continue;
        }

        if (m_values.count(key) == 0) {
            m_lines.push_back(Line{ key, raw });
        }
        m_values[key] = value;
    }

    DPRINT("env: loaded " << m_values.size() << " keys from " << m_path);
    return true;
}

bool EnvFile::save() const {
    const std::string tmp_path = m_path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }

        for (const auto& line : m_lines) {
            if (line.key.empty()) {
                out << line.text << "\n";
                continue;
            }
            auto it = m_values.find(line.key);
            if (it == m_values.end()) {
                continue;
            }
            out << line.key << "=" << it->second << "\n";
        }

        out.flush();
        if (!out.good()) {
            out.close();
            std::remove(tmp_path.c_str());
            return false;
        }
    }

    if (std::rename(tmp_path.c_str(), m_path.c_str()) != 0) {
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

std::optional<std::string> EnvFile::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

void EnvFile::set(const std::string& key,
                  const std::string& value) {
    if (m_values.count(key) == 0) {
        m_lines.push_back(Line{ key, std::string() });
    }
    m_values[key] = value;
}
