#pragma once

#include <string_view>

#include <nlohmann/json_fwd.hpp>

// Paths are dot-separated member names, e.g. "message.font_tier"
bool HasJsonValue(const nlohmann::json& root,
                  std::string_view path);
const nlohmann::json& GetJsonValue(const nlohmann::json& root,
                                   std::string_view path);

// Creates intermediate objects as needed
nlohmann::json& SetJsonValue(nlohmann::json& root,
                             std::string_view path,
                             nlohmann::json value);

// Supplies values that take precedence over whatever a request file contains
class JsonProvider
{
  public:
    virtual ~JsonProvider() = default;

    // Returns a null json if there is no value for path
    virtual nlohmann::json GetJsonValue(std::string_view path) const = 0;
};
