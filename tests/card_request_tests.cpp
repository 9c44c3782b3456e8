#include <cstdlib>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <nlohmann/json.hpp>

#include <anycard/card/card_request.hpp>
#include <anycard/json_util.hpp>
#include <anycard/layout/layout_errors.hpp>
#include <anycard/util/log.hpp>
#include <anycard/version.hpp>

using Catch::Matchers::WithinAbs;

class MapProvider final : public JsonProvider
{
  public:
    MapProvider(std::map<std::string, nlohmann::json> values)
        : m_Values{ std::move(values) }
    {
    }

    virtual nlohmann::json GetJsonValue(std::string_view path) const override
    {
        const auto it{ m_Values.find(std::string{ path }) };
        return it != m_Values.end() ? it->second : nlohmann::json{};
    }

  private:
    std::map<std::string, nlohmann::json> m_Values;
};

TEST_CASE("Default request dumps a versioned json", "[request_dump_default]")
{
    const CardRequest request{};
    const auto json{ request.DumpToJson() };

    REQUIRE(json["version"].get<std::string>() == JsonFormatVersion());
    REQUIRE(GetJsonValue(json, "message.font_tier") == "medium");
    REQUIRE(GetJsonValue(json, "page.format") == "A5");
    REQUIRE(GetJsonValue(json, "page.orientation") == "Landscape");
    REQUIRE(json["file_name"] == "anycard.pdf");
    REQUIRE_FALSE(HasJsonValue(json, "message.margin_inset"));
}

TEST_CASE("Request survives a json round trip", "[request_json]")
{
    CardRequest request{};
    request.m_Data.m_ArtworkPath = "art/sunflowers.png";
    request.m_Data.m_MessageText = "Happy Birthday!\nLove, Sam";
    request.m_Data.m_FontTier = "large";
    request.m_Data.m_MarginInset = 15_mm;
    request.m_Data.m_PageFormat = "Letter";
    request.m_Data.m_Orientation = PageOrientation::Portrait;
    request.m_Data.m_FileName = "birthday.pdf";

    CardRequest loaded{};
    REQUIRE(loaded.LoadFromJson(request.DumpToJson()));
    REQUIRE(loaded.m_Data.m_ArtworkPath == request.m_Data.m_ArtworkPath);
    REQUIRE(loaded.m_Data.m_MessageText == request.m_Data.m_MessageText);
    REQUIRE(loaded.m_Data.m_FontTier == "large");
    REQUIRE(loaded.m_Data.m_MarginInset.has_value());
    REQUIRE_THAT(loaded.m_Data.m_MarginInset.value() / 1_mm, WithinAbs(15.0, 1e-4));
    REQUIRE(loaded.m_Data.m_PageFormat == "Letter");
    REQUIRE(loaded.m_Data.m_Orientation == PageOrientation::Portrait);
    REQUIRE(loaded.m_Data.m_FileName == "birthday.pdf");
}

TEST_CASE("Request can be written to and read from disk", "[request_file]")
{
    CardRequest request{};
    request.m_Data.m_MessageText = "See you soon";
    request.Dump("request_tests.json");
    REQUIRE(fs::exists("request_tests.json"));

    CardRequest loaded{};
    REQUIRE(loaded.Load("request_tests.json"));
    REQUIRE(loaded.m_Data.m_MessageText == "See you soon");

    std::atexit(
        []()
        {
            fs::remove("request_tests.json");
        });
}

TEST_CASE("Missing request files leave defaults", "[request_file_missing]")
{
    CardRequest request{};
    REQUIRE_FALSE(request.Load("does_not_exist.json"));
    REQUIRE(request.m_Data.m_FontTier == "medium");
}

TEST_CASE("Incompatible request versions are rejected", "[request_version]")
{
    CardRequest request{};
    auto json{ request.DumpToJson() };
    json["version"] = "ACD00000";
    json["message"]["text"] = "never loaded";

    REQUIRE_FALSE(request.LoadFromJson(json));
    REQUIRE(request.m_Data.m_MessageText.empty());

    REQUIRE_FALSE(request.LoadFromJsonBlob("{ not json"));
}

TEST_CASE("Overrides take precedence over the request", "[request_overrides]")
{
    CardRequest base{};
    base.m_Data.m_MessageText = "from file";
    base.m_Data.m_PageFormat = "A5";

    const MapProvider overrides{ {
        { "message.font_tier", "small" },
        { "page.format", "Letter" },
        { "message.margin_inset", 12.5 },
    } };

    CardRequest request{};
    REQUIRE(request.LoadFromJson(base.DumpToJson(), &overrides));
    REQUIRE(request.m_Data.m_MessageText == "from file");
    REQUIRE(request.m_Data.m_FontTier == "small");
    REQUIRE(request.m_Data.m_PageFormat == "Letter");
    REQUIRE_THAT(request.m_Data.m_MarginInset.value() / 1_mm, WithinAbs(12.5, 1e-4));
}

TEST_CASE("Page geometry follows format and orientation", "[request_page_geometry]")
{
    const Config config{};

    CardRequest request{ config };
    request.m_Data.m_PageFormat = "A5";
    {
        const auto page{ request.ComputePageGeometry(config) };
        REQUIRE_THAT(page.m_Width / 1_mm, WithinAbs(210.0, 1e-3));
        REQUIRE_THAT(page.m_Height / 1_mm, WithinAbs(148.0, 1e-3));
    }

    request.m_Data.m_PageFormat = "Letter";
    {
        const auto page{ request.ComputePageGeometry(config) };
        REQUIRE_THAT(page.m_Width / 1_in, WithinAbs(11.0, 1e-4));
        REQUIRE_THAT(page.m_Height / 1_in, WithinAbs(8.5, 1e-4));
    }

    request.m_Data.m_Orientation = PageOrientation::Portrait;
    {
        const auto page{ request.ComputePageGeometry(config) };
        REQUIRE_THAT(page.m_Width / 1_in, WithinAbs(8.5, 1e-4));
        REQUIRE_THAT(page.m_Height / 1_in, WithinAbs(11.0, 1e-4));
    }
}

TEST_CASE("Unknown page formats fall back to the default", "[request_page_fallback]")
{
    Config config{};
    config.m_DefaultPageFormat = "Letter";

    CardRequest request{ config };
    REQUIRE(request.m_Data.m_PageFormat == "Letter");

    request.m_Data.m_PageFormat = "Postcard";
    const auto page{ request.ComputePageGeometry(config) };
    REQUIRE_THAT(page.m_Width / 1_in, WithinAbs(11.0, 1e-4));
    REQUIRE_THAT(page.m_Height / 1_in, WithinAbs(8.5, 1e-4));
}

TEST_CASE("Unknown orientations fall back to landscape with a warning", "[request_orientation_fallback]")
{
    Log log{ LogFlags::DetailLine, Log::c_MainLogName };

    std::vector<std::pair<Log::LogLevel, std::string>> messages;
    log.InstallHook(
        [&](const Log::DetailInformation&, Log::LogLevel level, std::string_view message)
        {
            messages.push_back({ level, std::string{ message } });
        });

    CardRequest request{};
    request.m_Data.m_Orientation = PageOrientation::Portrait;

    nlohmann::json json{ request.DumpToJson() };
    json["page"]["orientation"] = "diagonal";
    REQUIRE(request.LoadFromJsonBlob(json.dump()));
    REQUIRE(request.m_Data.m_Orientation == PageOrientation::Landscape);

    REQUIRE(messages.size() == 1);
    REQUIRE(messages[0].first == Log::LogLevel::Warning);
    REQUIRE(messages[0].second == "Unknown page orientation diagonal, falling back to Landscape");

    messages.clear();
    json["page"]["orientation"] = "PORTRAIT";
    REQUIRE(request.LoadFromJsonBlob(json.dump()));
    REQUIRE(request.m_Data.m_Orientation == PageOrientation::Portrait);
    REQUIRE(messages.empty());
}

TEST_CASE("Message spec resolves tier and inset", "[request_message_spec]")
{
    Config config{};
    config.m_DefaultMarginInset = 18_mm;

    CardRequest request{ config };
    request.m_Data.m_MessageText = "Hi";
    request.m_Data.m_FontTier = "Large";

    {
        const auto message{ request.ComputeMessageSpec(config) };
        REQUIRE(message.m_Text == "Hi");
        REQUIRE(message.m_FontTier == FontTier::Large);
        REQUIRE(message.m_MarginInset == 18_mm);
    }

    request.m_Data.m_MarginInset = 10_mm;
    REQUIRE(request.ComputeMessageSpec(config).m_MarginInset == 10_mm);

    request.m_Data.m_FontTier = "huge";
    REQUIRE_THROWS_AS(request.ComputeMessageSpec(config), InvalidMessageSpec);
}

TEST_CASE("Output path always ends in pdf", "[request_output_path]")
{
    CardRequest request{};
    REQUIRE(request.ComputeOutputPath() == "anycard.pdf");

    request.m_Data.m_FileName = "birthday";
    REQUIRE(request.ComputeOutputPath() == "birthday.pdf");

    request.m_Data.m_FileName = "";
    REQUIRE(request.ComputeOutputPath() == "anycard.pdf");
}
