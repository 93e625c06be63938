#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>

// dotenv-style KEY=VALUE file. Lines that are not assignments (comments,
// blanks, foreign syntax) are kept verbatim and written back in order.
class EnvFile {
public:
    explicit EnvFile(const std::string& path);

    bool load();

    // Writes to "<path>.tmp" and renames it over the target.
    bool save() const;

    std::optional<std::string> get(const std::string& key) const;

    void set(const std::string& key,
             const std::string& value);

    const std::string& path() const { return m_path; }

private:
    struct Line {
        std::string key;   // empty for verbatim lines
        std::string text;
    };

    std::string m_path;
    std::vector<Line> m_lines;
    std::unordered_map<std::string, std::string> m_values;
};
