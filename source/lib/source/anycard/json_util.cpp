#include <anycard/json_util.hpp>

#include <functional>
#include <ranges>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

static auto SplitPath(std::string_view path)
{
    return path |
           std::views::split('.') |
           std::views::transform(
               [](auto part)
               { return std::string_view(part.data(), part.size()); });
}

static const nlohmann::json* FindJsonValue(const nlohmann::json& root,
                                           std::string_view path)
{
    const nlohmann::json* target_json{ &root };
    for (const auto path_part : SplitPath(path))
    {
        if (!target_json->is_object() || !target_json->contains(path_part))
        {
            return nullptr;
        }
        target_json = &(*target_json)[path_part];
    }
    return target_json;
}

bool HasJsonValue(const nlohmann::json& root,
                  std::string_view path)
{
    return FindJsonValue(root, path) != nullptr;
}

const nlohmann::json& GetJsonValue(const nlohmann::json& root,
                                   std::string_view path)
{
    if (const auto* value{ FindJsonValue(root, path) })
    {
        return *value;
    }

    throw std::logic_error{
        fmt::format("Path {} is not part of json object", path),
    };
}

nlohmann::json& SetJsonValue(nlohmann::json& root,
                             std::string_view path,
                             nlohmann::json value)
{
    std::reference_wrapper target_json{ root };
    for (const auto path_part : SplitPath(path))
    {
        if (target_json.get().is_null())
        {
            target_json.get() = nlohmann::json::object();
        }
        else if (!target_json.get().is_object())
        {
            throw std::logic_error{
                fmt::format("Path {} runs through a json value that is not an object", path),
            };
        }

        target_json = target_json.get()[path_part];
    }

    target_json.get() = std::move(value);
    return target_json.get();
}
