#include <anycard/card/card_request.hpp>

#include <array>
#include <fstream>
#include <utility>

#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>
#include <nlohmann/json.hpp>

#include <anycard/json_util.hpp>
#include <anycard/util/log.hpp>
#include <anycard/version.hpp>

inline constexpr std::array c_OverridablePaths{
    "artwork",
    "message.text",
    "message.font_tier",
    "message.margin_inset",
    "page.format",
    "page.orientation",
    "file_name",
};

CardRequest::CardRequest(const Config& config)
{
    m_Data.m_PageFormat = config.GetFirstValidPageFormat();
}

bool CardRequest::Load(const fs::path& json_path, const JsonProvider* overrides)
{
    LogInfo("Loading card request from {}...", json_path.string());

    std::ifstream file{ json_path };
    if (!file)
    {
        LogError("Failed opening card request {}, continuing with defaults", json_path.string());
        LoadFromJson(DumpToJson(), overrides);
        return false;
    }

    try
    {
        return LoadFromJson(nlohmann::json::parse(file), overrides);
    }
    catch (const nlohmann::json::exception& e)
    {
        LogError("Failed parsing card request {}, continuing with defaults: {}", json_path.string(), e.what());
        LoadFromJson(DumpToJson(), overrides);
        return false;
    }
}

bool CardRequest::LoadFromJsonBlob(std::string_view json_blob, const JsonProvider* overrides)
{
    try
    {
        return LoadFromJson(nlohmann::json::parse(json_blob), overrides);
    }
    catch (const nlohmann::json::exception& e)
    {
        LogError("Failed parsing card request json: {}", e.what());
        return false;
    }
}

bool CardRequest::LoadFromJson(nlohmann::json json, const JsonProvider* overrides)
{
    const RequestData previous_data{ m_Data };

    try
    {
        if (overrides != nullptr)
        {
            for (const auto* path : c_OverridablePaths)
            {
                auto value{ overrides->GetJsonValue(path) };
                if (!value.is_null())
                {
                    LogInfo("Overriding {} with {}", path, value.dump());
                    SetJsonValue(json, path, std::move(value));
                }
            }
        }

        if (!json.contains("version") || !json["version"].is_string() || json["version"].get_ref<const std::string&>() != JsonFormatVersion())
        {
            throw std::logic_error{ fmt::format("Card request version not compatible, expected {}", JsonFormatVersion()) };
        }

        if (HasJsonValue(json, "artwork"))
        {
            m_Data.m_ArtworkPath = GetJsonValue(json, "artwork").get<std::string>();
        }

        if (HasJsonValue(json, "message.text"))
        {
            m_Data.m_MessageText = GetJsonValue(json, "message.text").get<std::string>();
        }
        if (HasJsonValue(json, "message.font_tier"))
        {
            m_Data.m_FontTier = GetJsonValue(json, "message.font_tier").get<std::string>();
        }
        if (HasJsonValue(json, "message.margin_inset"))
        {
            const auto& margin_inset{ GetJsonValue(json, "message.margin_inset") };
            if (margin_inset.is_null())
            {
                m_Data.m_MarginInset.reset();
            }
            else
            {
                m_Data.m_MarginInset = margin_inset.get<float>() * 1_mm;
            }
        }

        if (HasJsonValue(json, "page.format"))
        {
            m_Data.m_PageFormat = GetJsonValue(json, "page.format").get<std::string>();
        }
        if (HasJsonValue(json, "page.orientation"))
        {
            const auto& orientation{ GetJsonValue(json, "page.orientation").get_ref<const std::string&>() };
            if (const auto parsed{ magic_enum::enum_cast<PageOrientation>(orientation, magic_enum::case_insensitive) })
            {
                m_Data.m_Orientation = parsed.value();
            }
            else
            {
                LogWarning("Unknown page orientation {}, falling back to Landscape", orientation);
                m_Data.m_Orientation = PageOrientation::Landscape;
            }
        }

        if (HasJsonValue(json, "file_name"))
        {
            m_Data.m_FileName = GetJsonValue(json, "file_name").get<std::string>();
        }
    }
    catch (const std::exception& e)
    {
        LogError("Failed loading card request, continuing with previous settings: {}", e.what());
        m_Data = previous_data;
        return false;
    }

    return true;
}

void CardRequest::Dump(const fs::path& json_path) const
{
    if (std::ofstream file{ json_path })
    {
        LogInfo("Writing card request to {}...", json_path.string());
        file << DumpToJson().dump(4);
    }
    else
    {
        LogError("Failed opening {} for writing", json_path.string());
    }
}

nlohmann::json CardRequest::DumpToJson() const
{
    nlohmann::json json{};
    json["version"] = JsonFormatVersion();
    json["artwork"] = m_Data.m_ArtworkPath.string();

    json["message"] = nlohmann::json{
        { "text", m_Data.m_MessageText },
        { "font_tier", m_Data.m_FontTier },
    };
    if (m_Data.m_MarginInset.has_value())
    {
        json["message"]["margin_inset"] = m_Data.m_MarginInset.value() / 1_mm;
    }

    json["page"] = nlohmann::json{
        { "format", m_Data.m_PageFormat },
        { "orientation", magic_enum::enum_name(m_Data.m_Orientation) },
    };

    json["file_name"] = m_Data.m_FileName.string();
    return json;
}

PageGeometry CardRequest::ComputePageGeometry(const Config& config) const
{
    auto page_size{ config.FindPageFormat(m_Data.m_PageFormat) };
    if (!page_size.has_value())
    {
        const auto fallback_format{ config.GetFirstValidPageFormat() };
        LogWarning("Unknown page format {}, falling back to {}", m_Data.m_PageFormat, fallback_format);
        page_size = config.FindPageFormat(fallback_format);
    }

    auto [width, height]{ page_size.value().pod() };
    if (m_Data.m_Orientation == PageOrientation::Landscape)
    {
        std::swap(width, height);
    }

    return PageGeometry{
        .m_Width{ width },
        .m_Height{ height },
    };
}

MessageSpec CardRequest::ComputeMessageSpec(const Config& config) const
{
    return MessageSpec{
        .m_Text{ m_Data.m_MessageText },
        .m_FontTier{ ParseFontTier(m_Data.m_FontTier) },
        .m_MarginInset{ m_Data.m_MarginInset.value_or(config.m_DefaultMarginInset) },
    };
}

fs::path CardRequest::ComputeOutputPath() const
{
    auto output_path{ m_Data.m_FileName };
    if (output_path.empty())
    {
        output_path = "anycard.pdf"_p;
    }
    else if (output_path.extension() != ".pdf")
    {
        output_path += ".pdf";
    }
    return output_path;
}
