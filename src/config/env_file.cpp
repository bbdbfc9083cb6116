#include "yxa/env_file.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace yxa {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool valid_key(const std::string& key) {
    if (key.empty()) return false;
    for (char c : key) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '.' && c != '-') {
            return false;
        }
    }
    return true;
}

// Parse the text after '='. Returns false on an unterminated quote.
bool parse_value(const std::string& raw, std::string& out) {
    std::string value = trim(raw);
    out.clear();

    if (!value.empty() && (value[0] == '"' || value[0] == '\'')) {
        char quote = value[0];
        size_t i = 1;
        while (i < value.size()) {
            char c = value[i];
            if (c == quote) {
                // Anything after the closing quote must be blank or a comment
                std::string rest = trim(value.substr(i + 1));
                return rest.empty() || rest[0] == '#';
            }
            if (quote == '"' && c == '\\' && i + 1 < value.size()) {
                char next = value[i + 1];
                switch (next) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    case 'r': out += '\r'; break;
                    case '"': out += '"'; break;
                    case '\\': out += '\\'; break;
                    default: out += '\\'; out += next; break;
                }
                i += 2;
                continue;
            }
            out += c;
            ++i;
        }
        return false;
    }

    // Unquoted: an inline comment starts at " #"
    size_t comment = value.find(" #");
    if (comment != std::string::npos) {
        value = trim(value.substr(0, comment));
    }
    out = value;
    return true;
}

} // namespace

EnvFileParseResult parse_env_file(const std::string& content,
                                  const std::string& source_path) {
    EnvFileParseResult result;
    std::string where = source_path.empty() ? std::string(".env") : source_path;

    std::istringstream in(content);
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::string text = trim(line);
        if (text.empty() || text[0] == '#') {
            continue;
        }

        if (text.compare(0, 7, "export ") == 0) {
            text = trim(text.substr(7));
        }

        size_t eq = text.find('=');
        if (eq == std::string::npos) {
            result.error = where + ":" + std::to_string(line_no) + ": expected KEY=VALUE";
            return result;
        }

        std::string key = trim(text.substr(0, eq));
        if (!valid_key(key)) {
            result.error = where + ":" + std::to_string(line_no) + ": invalid key '" + key + "'";
            return result;
        }

        std::string value;
        if (!parse_value(text.substr(eq + 1), value)) {
            result.error = where + ":" + std::to_string(line_no) + ": unterminated quoted value";
            return result;
        }

        result.values[key] = value;
    }

    result.ok = true;
    return result;
}

EnvFileParseResult read_env_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        EnvFileParseResult result;
        result.error = "failed to open " + path;
        return result;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse_env_file(ss.str(), path);
}

} // namespace yxa
