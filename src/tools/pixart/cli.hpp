//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/pixart/cli.hpp
// Purpose: Command-line parsing and the driver behind the pixart tool.
// Key invariants: Command-line flags override config-file values, which
//                 override built-in defaults.
// Ownership/Lifetime: Options are plain values; the driver borrows streams.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "config/config.hpp"
#include "font/RenderError.hpp"
#include "font/Renderer.hpp"
#include "support/diagnostics.hpp"
#include "support/expected.hpp"
#include "support/log.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace pixart::tools
{

/// @brief Options gathered from argv; unset fields defer to the config file.
struct CliOptions
{
    std::string configPath{};
    std::optional<std::size_t> maxLength{};
    std::optional<font::FallbackPolicy> fallback{};
    std::optional<char> ink{};
    std::optional<char> paper{};
    std::optional<support::LogLevel> logLevel{};
    bool showHelp = false;
    bool showVersion = false;
    /// @brief Positional words; joined with single spaces to form the text.
    std::vector<std::string> words{};
};

/// @brief Parse pixart arguments (argv[0] is the program name).
/// @return Parsed options or a diagnostic naming the malformed argument.
support::Expected<CliOptions, support::Diagnostic> parseArgs(int argc, char **argv);

/// @brief Merge defaults, the optional config file and command-line overrides.
/// @return Effective configuration or a diagnostic when the file is unreadable.
support::Expected<config::Config, support::Diagnostic> resolveConfig(const CliOptions &opts);

/// @brief Join positional words with single spaces.
std::string joinWords(const std::vector<std::string> &words);

/// @brief Print @p art one row per line, mapping '1'/'0' to ink/paper.
void printArt(const font::PixelArt &art, const config::OutputConfig &output, std::ostream &os);

/// @brief Print the message for @p error plus a hint specific to its kind.
void reportRenderError(const font::RenderError &error, std::ostream &err);

/// @brief Run the tool end to end.
/// @return 0 after rendering or reporting a render error; 1 on usage errors.
int runPixart(int argc, char **argv, std::istream &in, std::ostream &out, std::ostream &err);

} // namespace pixart::tools
