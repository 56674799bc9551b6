// SPDX-License-Identifier: Apache-2.0
#include "ParserRegistry.hpp"

#include <core/TextUtils.hpp>
#include <stream/AmpParser.hpp>
#include <stream/ClaudeParser.hpp>
#include <stream/CodexParser.hpp>

namespace agentstream
{

auto normalizeName(std::string_view agentCommand) -> std::string
{
    // Accept both separators on every host.
    auto const slash = agentCommand.find_last_of("/\\");
    if (slash != std::string_view::npos)
        agentCommand.remove_prefix(slash + 1);

    auto name = text::toLower(agentCommand);
    if (name.ends_with(".exe"))
        name.resize(name.size() - 4);
    return name;
}

auto parserFor(std::string_view agentCommand) -> std::unique_ptr<Parser>
{
    auto const name = normalizeName(agentCommand);
    if (name == agents::Claude)
        return std::make_unique<ClaudeParser>();
    if (name == agents::Codex)
        return std::make_unique<CodexParser>();
    if (name == agents::Amp)
        return std::make_unique<AmpParser>();
    return nullptr;
}

auto outputFlags(std::string_view agentCommand) -> std::vector<std::string>
{
    auto const name = normalizeName(agentCommand);
    if (name == agents::Claude)
        return { "--output-format", "stream-json", "--verbose" };
    if (name == agents::Amp)
        return { "--stream-json", "--dangerously-allow-all" };
    if (name == agents::Codex)
        return { "--json", "--full-auto" };
    return {};
}

auto textModeFlags(std::string_view agentCommand) -> std::vector<std::string>
{
    auto const name = normalizeName(agentCommand);
    if (name == agents::Claude)
        return { "--output-format", "text" };
    if (name == agents::Codex)
        return { "--full-auto" };
    if (name == agents::Amp)
        return { "--dangerously-allow-all" };
    return {};
}

auto outputCaptureFor(std::string_view agentCommand, std::filesystem::path const& baseDir)
    -> std::optional<OutputCapture>
{
    if (normalizeName(agentCommand) == agents::Codex)
        return OutputCapture { .file = baseDir / "codex_output.txt" };
    return std::nullopt;
}

} // namespace agentstream
