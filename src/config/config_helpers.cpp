#include <chartdl/config/config_helpers.h>

#include <fstream>

namespace chartdl::config {

namespace {

// Strips a trailing "# comment" that is not inside quotes.
void strip_inline_comment(std::string& v) {
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            break;
        }
    }
    trim(v);
}

} // namespace

std::map<std::string, std::string> read_config_section(const std::filesystem::path& config_path,
                                                       const std::string& section) {
    std::map<std::string, std::string> values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
    }

    const std::string dotted = section + ".";
    std::string line;
    std::string current;

    while (std::getline(file, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            auto end = line.find(']');
            if (end != std::string::npos) {
                current = line.substr(1, end - 1);
                trim(current);
            }
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        strip_inline_comment(v);

        if (current == section) {
            values[k] = unquote(v);
        } else if (current.empty() && k.rfind(dotted, 0) == 0) {
            values[k.substr(dotted.size())] = unquote(v);
        }
    }
    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto values = read_config_section(config_path, section);
    auto it = values.find(key);
    return it == values.end() ? std::string{} : it->second;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "chartdl";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "chartdl";
    }
    return std::filesystem::path(".chartdl");
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("CHARTDL_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace chartdl::config
