// ============= include/simple_toml.hpp =============
/*
 * Minimal TOML reader for the kiosk configuration
 *
 * SUPPORTED:
 * - [section] headers (flat, one level)
 * - key = value, with optional "quoted" strings (\" \\ \n \t escapes)
 * - # comments and blank lines
 *
 * Keys are flattened to "section.key". Typed getters fall back to the
 * supplied default when the key is missing or the value does not parse.
 */

#pragma once
#include <string>
#include <map>
#include <fstream>
#include <algorithm>
#include <cctype>

class SimpleToml {
private:
    std::map<std::string, std::string> values;

    static std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    static std::string strip_comment(const std::string& line) {
        bool in_quotes = false;
        for (size_t i = 0; i < line.size(); i++) {
            if (in_quotes && line[i] == '\\') { i++; continue; }
            if (line[i] == '"') in_quotes = !in_quotes;
            if (line[i] == '#' && !in_quotes) return line.substr(0, i);
        }
        return line;
    }

    // Basic-string escapes: \" \\ \n \t. Unknown escapes are kept as written.
    static std::string unescape(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); i++) {
            if (s[i] != '\\' || i + 1 == s.size()) {
                out += s[i];
                continue;
            }
            char next = s[++i];
            switch (next) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case 'n':  out += '\n'; break;
                case 't':  out += '\t'; break;
                default:   out += '\\'; out += next; break;
            }
        }
        return out;
    }

public:
    // Inverse of unescape, for writers.
    static std::string quote(const std::string& s) {
        std::string out = "\"";
        for (char c : s) {
            switch (c) {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\t': out += "\\t"; break;
                default:   out += c; break;
            }
        }
        out += '"';
        return out;
    }

    bool load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) return false;

        std::string line, section;
        while (std::getline(file, line)) {
            line = trim(strip_comment(line));
            if (line.empty()) continue;

            if (line[0] == '[' && line.back() == ']') {
                section = trim(line.substr(1, line.length() - 2));
                continue;
            }

            auto eq = line.find('=');
            if (eq != std::string::npos) {
                std::string key = trim(line.substr(0, eq));
                std::string val = trim(line.substr(eq + 1));

                if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
                    val = unescape(val.substr(1, val.length() - 2));
                }

                std::string full_key = section.empty() ? key : section + "." + key;
                values[full_key] = val;
            }
        }
        return true;
    }

    bool has(const std::string& key) const {
        return values.find(key) != values.end();
    }

    std::string get(const std::string& key, const std::string& def = "") const {
        auto it = values.find(key);
        return it != values.end() ? it->second : def;
    }

    int get_int(const std::string& key, int def = 0) const {
        if (!has(key)) return def;
        try {
            size_t pos = 0;
            std::string raw = get(key);
            int v = std::stoi(raw, &pos);
            return pos == raw.size() ? v : def;
        }
        catch (const std::exception&) { return def; }
    }

    double get_double(const std::string& key, double def = 0.0) const {
        if (!has(key)) return def;
        try {
            size_t pos = 0;
            std::string raw = get(key);
            double v = std::stod(raw, &pos);
            return pos == raw.size() ? v : def;
        }
        catch (const std::exception&) { return def; }
    }

    bool get_bool(const std::string& key, bool def = false) const {
        std::string v = get(key);
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
        if (v == "false" || v == "0" || v == "no" || v == "off") return false;
        return def;
    }
};
