// src/config/config.cpp
// @brief INI-like configuration loader implementation.
// @invariant Reads sections [render], [output], and [log].
// @ownership Loader does not own external resources beyond file path.

#include "config/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

namespace pixart::config
{

namespace
{
std::string trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return std::string(sv);
}

std::string lower(std::string s)
{
    std::transform(
        s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

void reject(const std::string &section, const std::string &key, const std::string &value)
{
    support::Logger::instance().warn("config: ignoring invalid value '" + value + "' for [" +
                                     section + "] " + key);
}

bool parse_max_length(const std::string &s, std::size_t &out)
{
    std::size_t v = 0;
    const auto *first = s.data();
    const auto *last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc() || ptr != last || v == 0)
    {
        return false;
    }
    out = v;
    return true;
}

bool parse_display_char(const std::string &s, char &out)
{
    if (s.size() != 1 || !std::isprint(static_cast<unsigned char>(s[0])))
    {
        return false;
    }
    out = s[0];
    return true;
}

void apply(const std::string &section, const std::string &key, const std::string &value, Config &out)
{
    if (section == "render")
    {
        if (key == "max_length")
        {
            if (!parse_max_length(value, out.render.maxLength))
                reject(section, key, value);
        }
        else if (key == "mode")
        {
            const std::string mode = lower(value);
            if (mode == "strict")
                out.render.fallback = font::FallbackPolicy::Strict;
            else if (mode == "lossy")
                out.render.fallback = font::FallbackPolicy::Lossy;
            else
                reject(section, key, value);
        }
    }
    else if (section == "output")
    {
        if (key == "ink")
        {
            if (!parse_display_char(value, out.output.ink))
                reject(section, key, value);
        }
        else if (key == "paper")
        {
            if (!parse_display_char(value, out.output.paper))
                reject(section, key, value);
        }
    }
    else if (section == "log")
    {
        if (key == "level")
        {
            if (auto level = support::parseLogLevel(value))
                out.logLevel = *level;
            else
                reject(section, key, value);
        }
    }
    else
    {
        support::Logger::instance().debug("config: skipping key '" + key + "' in section [" +
                                          section + "]");
    }
}

} // namespace

void loadFromString(std::string_view text, Config &out)
{
    std::istringstream in{std::string(text)};
    std::string line;
    std::string section;
    while (std::getline(in, line))
    {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
        {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']')
        {
            section = lower(trim(std::string_view(trimmed).substr(1, trimmed.size() - 2)));
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        std::string key = lower(trim(std::string_view(trimmed).substr(0, eq)));
        std::string value = trim(std::string_view(trimmed).substr(eq + 1));
        apply(section, key, value, out);
    }
}

bool loadFromFile(const std::string &path, Config &out)
{
    std::ifstream in(path);
    if (!in)
    {
        return false;
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    loadFromString(contents.str(), out);
    support::Logger::instance().debug("config: loaded " + path);
    return true;
}

} // namespace pixart::config
