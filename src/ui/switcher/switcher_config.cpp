#include "switcher_config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <tabswitch/logger.hpp>

namespace tabswitch
{

// ─── JSON serialization ──────────────────────────────────────────────────────

static std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

static std::string unescape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] != '\\' || i + 1 >= s.size())
        {
            out += s[i];
            continue;
        }
        char next = s[++i];
        switch (next)
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            default:
                out += next;
                break;
        }
    }
    return out;
}

const char* SwitcherConfig::selection_to_string(InitialSelection s)
{
    switch (s)
    {
        case InitialSelection::Previous:
            return "previous";
        case InitialSelection::First:
        default:
            return "first";
    }
}

bool SwitcherConfig::selection_from_string(const std::string& s, InitialSelection& out)
{
    if (s == "first")
    {
        out = InitialSelection::First;
        return true;
    }
    if (s == "previous")
    {
        out = InitialSelection::Previous;
        return true;
    }
    return false;
}

std::string SwitcherConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << CURRENT_VERSION << ",\n";
    os << "  \"placeholder\": \"" << escape_json(placeholder) << "\",\n";
    os << "  \"no_matches\": \"" << escape_json(no_matches) << "\",\n";
    os << "  \"max_detail\": " << max_detail << ",\n";
    os << "  \"initial_selection\": \"" << selection_to_string(initial_selection) << "\",\n";
    os << "  \"confirm_on_modifier_release\": "
       << (confirm_on_modifier_release ? "true" : "false") << ",\n";
    os << "  \"max_results\": " << max_results << "\n";
    os << "}\n";
    return os.str();
}

// Minimal key lookup for our flat format: position just past the ':'.
static std::optional<size_t> find_value(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::nullopt;
    return pos + 1;
}

static std::optional<std::string> read_json_string(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (!pos)
        return std::nullopt;
    size_t start = json.find_first_not_of(" \t\n\r", *pos);
    if (start == std::string::npos || json[start] != '"')
        return std::nullopt;
    size_t end = start + 1;
    while (end < json.size())
    {
        if (json[end] == '\\')
        {
            end += 2;
            continue;
        }
        if (json[end] == '"')
            break;
        ++end;
    }
    if (end >= json.size())
        return std::nullopt;
    return unescape_json(json.substr(start + 1, end - start - 1));
}

static std::optional<bool> read_json_bool(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (!pos)
        return std::nullopt;
    size_t start = json.find_first_not_of(" \t\n\r", *pos);
    if (start == std::string::npos)
        return std::nullopt;
    if (json.compare(start, 4, "true") == 0)
        return true;
    if (json.compare(start, 5, "false") == 0)
        return false;
    return std::nullopt;
}

static std::optional<long> read_json_int(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (!pos)
        return std::nullopt;
    const char* begin = json.c_str() + *pos;
    char*       end   = nullptr;
    long        value = std::strtol(begin, &end, 10);
    if (end == begin)
        return std::nullopt;
    return value;
}

bool SwitcherConfig::deserialize(const std::string& json)
{
    if (json.empty())
        return false;

    if (auto ver = read_json_int(json, "version"); ver && *ver > CURRENT_VERSION)
    {
        TABSWITCH_LOG_WARN(log_category::Config, "unsupported config version {}", *ver);
        return false;
    }

    if (auto s = read_json_string(json, "placeholder"))
        placeholder = *s;
    if (auto s = read_json_string(json, "no_matches"))
        no_matches = *s;
    if (auto n = read_json_int(json, "max_detail"); n && *n >= 0)
        max_detail = static_cast<size_t>(*n);
    if (auto n = read_json_int(json, "max_results"); n && *n >= 0)
        max_results = static_cast<size_t>(*n);
    if (auto b = read_json_bool(json, "confirm_on_modifier_release"))
        confirm_on_modifier_release = *b;
    if (auto s = read_json_string(json, "initial_selection"))
    {
        if (!selection_from_string(*s, initial_selection))
        {
            TABSWITCH_LOG_WARN(log_category::Config, "unknown initial_selection '{}'", *s);
        }
    }
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool SwitcherConfig::save(const std::string& path) const
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            TABSWITCH_LOG_WARN(log_category::Config,
                               "cannot create {}: {}",
                               dir.string(),
                               ec.message());
            return false;
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
        return false;
    f << serialize();
    return f.good();
}

bool SwitcherConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    bool        ok = deserialize(json);
    if (ok)
        TABSWITCH_LOG_INFO(log_category::Config, "loaded switcher config from {}", path);
    return ok;
}

std::string SwitcherConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "switcher.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "tabswitch";
    return (dir / "switcher.json").string();
}

}   // namespace tabswitch
