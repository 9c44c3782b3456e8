#include <algorithm>
#include <clocale>
#include <locale>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <anycard/util/log.hpp>

#include <anycard/config.hpp>
#include <anycard/image.hpp>
#include <anycard/json_util.hpp>
#include <anycard/units.hpp>
#include <anycard/version.hpp>

#include <anycard/card/card_request.hpp>
#include <anycard/layout/layout_errors.hpp>
#include <anycard/layout/layout_plan.hpp>

#include <anycard/pdf/backend.hpp>
#include <anycard/pdf/generate.hpp>

using RequestOverrides = std::unordered_map<std::string, std::string>;

struct CommandLineOptions
{
    bool m_HelpDisplayed{ false };
    bool m_VersionDisplayed{ false };
    bool m_InvalidArguments{ false };

    bool m_Deterministic{ false };

    std::optional<std::string> m_RequestFile{ std::nullopt };
    std::optional<std::string> m_RequestJson{ std::nullopt };
    RequestOverrides m_RequestOverrides{};
};

constexpr const char c_HelpStr[]{
    R"(
Command Line Interface for AnyCard

    --help              Display this information.
    --version           Display the version and build time.
    --deterministic     Write a pdf without a creation date.
    --request <file>    Load the card request from this file.
    --request <json>    Load the card request from this json blob.
    --request           Take all following commands and override
                        card request settings with them.

Request Overrides are formatted as follows:
    --<name> <value>    Will override the property <name> with the
                        value <value> as if parsed as json, where
                        <name> can be a nested name and refers to
                        the names seen in card request files.
                        For example:
                            --artwork art/sunflowers.png
                            --message.text "Happy Birthday!"
                            --message.font_tier large
                            --page.format Letter
                            --file_name birthday

Exit codes:
    0                   The card was written.
    1                   The card could not be written.
    2                   The card request failed validation.
)"
};

class OverridesProvider : public JsonProvider
{
  public:
    OverridesProvider(const RequestOverrides& overrides)
        : m_Overrides{ overrides }
    {
    }

    virtual nlohmann::json GetJsonValue(std::string_view path_view) const override
    {
        const std::string path{ path_view };
        if (m_Overrides.contains(path))
        {
            const auto& value{ m_Overrides.at(path) };
            try
            {
                // Try parsing the override as a literal ...
                return nlohmann::json::parse(value);
            }
            catch (const nlohmann::json::parse_error&)
            {
                // ... and keep it as a string if that's not possible.
                return value;
            }
        }

        return nlohmann::json{};
    }

  private:
    const RequestOverrides& m_Overrides;
};

CommandLineOptions ParseCommandLine(int argc, char** raw_argv)
{
    using namespace std::string_view_literals;

    std::span argv{ raw_argv, static_cast<size_t>(argc) };

    CommandLineOptions cli;

    if (std::ranges::contains(argv, "--help"sv))
    {
        fmt::print("{}", c_HelpStr);
        cli.m_HelpDisplayed = true;
        return cli;
    }

    if (std::ranges::contains(argv, "--version"sv))
    {
        fmt::print("AnyCard {} ({})\n", AnyCardVersion(), AnyCardBuildTime());
        cli.m_VersionDisplayed = true;
        return cli;
    }

    size_t i{ 1 };
    for (; i < argv.size(); i++)
    {
        const std::string_view arg{ argv[i] };
        if (arg == "--deterministic")
        {
            cli.m_Deterministic = true;
        }
        else if (arg == "--request")
        {
            if (i + 1 >= argv.size())
            {
                LogError("Missing argument for --request");
                cli.m_InvalidArguments = true;
                return cli;
            }
            else if (std::string_view{ argv[i + 1] }.starts_with("--"))
            {
                // Parse overrides from now on out
                ++i;
                break;
            }
            else
            {
                ++i;
                std::string param{ argv[i] };
                if (fs::exists(param))
                {
                    cli.m_RequestFile = std::move(param);
                }
                else
                {
                    cli.m_RequestJson = std::move(param);
                }
            }
        }
        else
        {
            LogError("Unknown command line option {}", arg);
        }
    }

    for (; i < argv.size(); i += 2)
    {
        const std::string_view arg{ argv[i] };
        if (!arg.starts_with("--") || i + 1 >= argv.size())
        {
            LogError("Error while parsing request overrides. Expected --<name> <value> but got {}", arg);
            cli.m_InvalidArguments = true;
            return cli;
        }

        const std::string_view param{ argv[i + 1] };
        cli.m_RequestOverrides[std::string{ arg.substr(2) }] = param;
    }

    return cli;
}

int main(int argc, char** argv)
{
#ifdef WIN32
    {
        static constexpr char c_LocaleName[]{ ".utf-8" };
        std::setlocale(LC_ALL, c_LocaleName);
        std::locale::global(std::locale(c_LocaleName));
    }
#endif

    Log::RegisterThreadName("MainThread");

    LogFlags log_flags{
        LogFlags::Console |
        LogFlags::File |
        LogFlags::FatalQuit |
        LogFlags::DetailFile |
        LogFlags::DetailLine |
        LogFlags::DetailColumn |
        LogFlags::DetailThread
    };
    Log main_log{ log_flags, Log::c_MainLogName };

    CommandLineOptions cli{ ParseCommandLine(argc, argv) };
    if (cli.m_HelpDisplayed || cli.m_VersionDisplayed)
    {
        return 0;
    }
    else if (cli.m_InvalidArguments)
    {
        return 1;
    }

    g_Cfg = LoadConfig();
    if (cli.m_Deterministic)
    {
        g_Cfg.m_DeterministicPdfOutput = true;
    }

    OverridesProvider overrides_provider{
        cli.m_RequestOverrides
    };

    CardRequest request{ g_Cfg };
    if (cli.m_RequestFile.has_value())
    {
        request.Load(cli.m_RequestFile.value(),
                     &overrides_provider);
    }
    else if (cli.m_RequestJson.has_value())
    {
        if (!request.LoadFromJsonBlob(cli.m_RequestJson.value(),
                                      &overrides_provider))
        {
            LogError("Failed loading card request from json-blob...");
        }
    }
    else if (!cli.m_RequestOverrides.empty())
    {
        LogInfo("Starting from a default card request with overrides...");
        request.LoadFromJson(request.DumpToJson(), &overrides_provider);
    }
    else
    {
        LogInfo("Starting from a default card request...");
    }

    try
    {
        const auto& artwork_path{ request.m_Data.m_ArtworkPath };
        if (artwork_path.empty())
        {
            LogError("No artwork given, pass one with --request --artwork <file>");
            return 1;
        }

        const Image artwork{ Image::Read(artwork_path) };
        if (!artwork.Valid())
        {
            LogError("Failed reading artwork {}", artwork_path.string());
            return 1;
        }

        const auto message{ request.ComputeMessageSpec(g_Cfg) };
        const auto page{ request.ComputePageGeometry(g_Cfg) };
        if (!page.IsLandscape())
        {
            LogWarning("Page of {} x {} is not landscape, its panels will be taller than twice their width",
                       FormatLength(page.m_Width, g_Cfg.m_BaseUnit),
                       FormatLength(page.m_Height, g_Cfg.m_BaseUnit));
        }

        auto document{ CreatePdfDocument(g_Cfg) };
        const auto plan{
            BuildLayoutPlan(page,
                            artwork.Spec(),
                            message,
                            document->GetTextMeasurer(),
                            g_Cfg.m_LayoutOptions),
        };

        if (const auto* text_block{ std::get_if<TextBlock>(&plan.m_Inside.m_Message) };
            text_block != nullptr && text_block->m_Truncated)
        {
            LogWarning("Message does not fit the inside panel, only the first {} lines are printed", text_block->m_Lines.size());
        }

        const auto pdf_path{ GenerateCardPdf(plan, artwork, g_Cfg, *document, request.ComputeOutputPath()) };
        LogInfo("Card written to {}", pdf_path.string());
    }
    catch (const LayoutError& e)
    {
        LogError("Invalid card request: {}", e.what());
        return 2;
    }
    catch (const std::exception& e)
    {
        LogError("Failed generating card: {}", e.what());
        return 1;
    }

    return 0;
}
