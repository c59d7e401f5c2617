// src/config/config.hpp
// @brief INI-like configuration for rendering, display output and logging.
// @invariant Invalid values leave the corresponding default untouched.
// @ownership Config is a plain value; loaders do not retain the input.
#pragma once

#include "font/Renderer.hpp"
#include "support/log.hpp"

#include <string>
#include <string_view>

namespace pixart::config
{

/// @brief Display characters substituted for set and clear pixels.
struct OutputConfig
{
    char ink = '1';
    char paper = '0';
};

/// @brief Complete tool configuration.
struct Config
{
    font::RenderOptions render{};
    OutputConfig output{};
    support::LogLevel logLevel = support::LogLevel::Info;
};

/// @brief Parse configuration text and apply recognised settings to @p out.
/// @details Sections: [render] max_length, mode; [output] ink, paper;
///          [log] level. Rejected values are reported through the logger.
void loadFromString(std::string_view text, Config &out);

/// @brief Load configuration from @p path into @p out.
/// @return False when the file cannot be opened; true otherwise.
bool loadFromFile(const std::string &path, Config &out);

} // namespace pixart::config
