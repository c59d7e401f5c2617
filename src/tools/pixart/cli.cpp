//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements argument parsing and the pixart driver.  The driver is the only
// place render errors turn into user-visible text; every error kind gets its
// own message and follow-up note.  Render failures are reported without
// failing the process, while malformed arguments exit with status 1.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Argument parsing, configuration merge and output for pixart.

#include "cli.hpp"

#include "usage.hpp"

#include <cctype>
#include <charconv>
#include <string_view>
#include <system_error>

namespace pixart::tools
{

namespace
{

std::string trimCopy(std::string_view sv)
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

/// @brief Fetch the argument after the option at @p index, advancing @p index.
std::optional<std::string_view> takeValue(int &index, int argc, char **argv)
{
    if (index + 1 >= argc)
    {
        return std::nullopt;
    }
    ++index;
    return std::string_view(argv[index]);
}

std::optional<std::size_t> parseCount(std::string_view text)
{
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value == 0)
    {
        return std::nullopt;
    }
    return value;
}

std::optional<char> parseDisplayChar(std::string_view text)
{
    if (text.size() != 1 || !std::isprint(static_cast<unsigned char>(text[0])))
    {
        return std::nullopt;
    }
    return text[0];
}

support::Diagnostic missingValue(std::string_view option)
{
    return support::makeError("missing value for " + std::string(option));
}

support::Diagnostic badValue(std::string_view option, std::string_view value)
{
    return support::makeError("invalid value '" + std::string(value) + "' for " +
                              std::string(option));
}

} // namespace

support::Expected<CliOptions, support::Diagnostic> parseArgs(int argc, char **argv)
{
    CliOptions opts;
    bool optionsDone = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg(argv[i]);
        if (optionsDone || arg.empty() || arg[0] != '-' || arg == "-")
        {
            opts.words.emplace_back(arg);
            continue;
        }
        if (arg == "--")
        {
            optionsDone = true;
        }
        else if (arg == "-h" || arg == "--help")
        {
            opts.showHelp = true;
        }
        else if (arg == "--version")
        {
            opts.showVersion = true;
        }
        else if (arg == "--lossy")
        {
            opts.fallback = font::FallbackPolicy::Lossy;
        }
        else if (arg == "--strict")
        {
            opts.fallback = font::FallbackPolicy::Strict;
        }
        else if (arg == "--max-length")
        {
            auto value = takeValue(i, argc, argv);
            if (!value)
                return missingValue(arg);
            opts.maxLength = parseCount(*value);
            if (!opts.maxLength)
                return badValue(arg, *value);
        }
        else if (arg == "--config")
        {
            auto value = takeValue(i, argc, argv);
            if (!value)
                return missingValue(arg);
            opts.configPath = std::string(*value);
        }
        else if (arg == "--ink" || arg == "--paper")
        {
            auto value = takeValue(i, argc, argv);
            if (!value)
                return missingValue(arg);
            auto ch = parseDisplayChar(*value);
            if (!ch)
                return badValue(arg, *value);
            (arg == "--ink" ? opts.ink : opts.paper) = *ch;
        }
        else if (arg == "--log-level")
        {
            auto value = takeValue(i, argc, argv);
            if (!value)
                return missingValue(arg);
            opts.logLevel = support::parseLogLevel(*value);
            if (!opts.logLevel)
                return badValue(arg, *value);
        }
        else
        {
            return support::makeError("unknown option " + std::string(arg));
        }
    }
    return opts;
}

support::Expected<config::Config, support::Diagnostic> resolveConfig(const CliOptions &opts)
{
    config::Config cfg;
    if (!opts.configPath.empty() && !config::loadFromFile(opts.configPath, cfg))
    {
        return support::makeError("unable to read config file '" + opts.configPath + "'");
    }
    if (opts.maxLength)
        cfg.render.maxLength = *opts.maxLength;
    if (opts.fallback)
        cfg.render.fallback = *opts.fallback;
    if (opts.ink)
        cfg.output.ink = *opts.ink;
    if (opts.paper)
        cfg.output.paper = *opts.paper;
    if (opts.logLevel)
        cfg.logLevel = *opts.logLevel;
    return cfg;
}

std::string joinWords(const std::vector<std::string> &words)
{
    std::string text;
    for (const std::string &word : words)
    {
        if (!text.empty())
        {
            text.push_back(' ');
        }
        text += word;
    }
    return text;
}

void printArt(const font::PixelArt &art, const config::OutputConfig &output, std::ostream &os)
{
    for (const std::string &row : art)
    {
        for (char bit : row)
        {
            os << (bit == '1' ? output.ink : output.paper);
        }
        os << '\n';
    }
}

void reportRenderError(const font::RenderError &error, std::ostream &err)
{
    support::printDiag(font::toDiagnostic(error), err);
    switch (error.code)
    {
        case font::RenderErrc::CharacterNotFound:
            support::printDiag(support::makeNote("Supported characters: A-Z, a-z, and space"), err);
            support::printDiag(support::makeNote("Use --lossy to draw unsupported characters as blanks"),
                               err);
            break;
        case font::RenderErrc::TextTooLong:
            support::printDiag(support::makeNote("Maximum length is " + std::to_string(error.limit) +
                                                 " characters"),
                               err);
            break;
        case font::RenderErrc::EmptyText:
            support::printDiag(support::makeNote("Enter at least one character"), err);
            break;
    }
}

int runPixart(int argc, char **argv, std::istream &in, std::ostream &out, std::ostream &err)
{
    auto parsed = parseArgs(argc, argv);
    if (!parsed)
    {
        support::printDiag(parsed.error(), err);
        printUsage(err);
        return 1;
    }
    const CliOptions &opts = parsed.value();
    if (opts.showHelp)
    {
        printUsage(out);
        return 0;
    }
    if (opts.showVersion)
    {
        printVersion(out);
        return 0;
    }

    auto resolved = resolveConfig(opts);
    if (!resolved)
    {
        support::printDiag(resolved.error(), err);
        return 1;
    }
    const config::Config &cfg = resolved.value();

    support::Logger &log = support::Logger::instance();
    log.setLevel(cfg.logLevel);

    const bool interactive = opts.words.empty();
    std::string text;
    if (interactive)
    {
        out << "Enter your text input: " << std::flush;
        std::string line;
        if (!std::getline(in, line))
        {
            log.debug("no input line available");
        }
        text = trimCopy(line);
    }
    else
    {
        text = joinWords(opts.words);
    }

    log.debug("rendering " + std::to_string(text.size()) + " bytes (" +
              (cfg.render.fallback == font::FallbackPolicy::Lossy ? "lossy" : "strict") +
              ", max " + std::to_string(cfg.render.maxLength) + ")");

    auto art = font::compose(text, cfg.render);
    if (!art)
    {
        log.debug(std::string("render failed: ") + font::errcName(art.error().code));
        reportRenderError(art.error(), err);
        return 0;
    }

    if (interactive)
    {
        out << "\noutput:\n";
    }
    printArt(art.value(), cfg.output, out);
    return 0;
}

} // namespace pixart::tools
