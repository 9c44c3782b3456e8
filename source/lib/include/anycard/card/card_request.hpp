#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include <anycard/config.hpp>
#include <anycard/layout/fold_geometry.hpp>
#include <anycard/layout/message_layout.hpp>
#include <anycard/util.hpp>

class JsonProvider;

// One card job: which artwork, what message and what paper
class CardRequest
{
  public:
    struct RequestData
    {
        fs::path m_ArtworkPath{};

        std::string m_MessageText{};
        std::string m_FontTier{ "medium" };
        std::optional<Length> m_MarginInset{ std::nullopt };

        std::string m_PageFormat{ "A5" };
        PageOrientation m_Orientation{ PageOrientation::Landscape };

        fs::path m_FileName{ "anycard.pdf"_p };
    };
    RequestData m_Data{};

    CardRequest() = default;
    explicit CardRequest(const Config& config);

    // Failures are logged, the request then keeps its defaults
    bool Load(const fs::path& json_path, const JsonProvider* overrides = nullptr);
    bool LoadFromJsonBlob(std::string_view json_blob, const JsonProvider* overrides = nullptr);
    bool LoadFromJson(nlohmann::json json, const JsonProvider* overrides = nullptr);

    void Dump(const fs::path& json_path) const;
    nlohmann::json DumpToJson() const;

    // Unknown formats fall back to the config's default format
    PageGeometry ComputePageGeometry(const Config& config) const;

    // Throws InvalidMessageSpec for unknown font tiers
    MessageSpec ComputeMessageSpec(const Config& config) const;

    fs::path ComputeOutputPath() const;
};
