#include <anycard/layout/message_layout.hpp>

#include <cmath>
#include <ranges>
#include <utility>

#include <dla/scalar_math.h>
#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>

#include <anycard/layout/layout_errors.hpp>
#include <anycard/layout/text_measurer.hpp>
#include <anycard/units.hpp>

inline constexpr std::string_view c_WordSeparators{ " \t\r\f\v" };

static std::vector<std::string_view> SplitWords(std::string_view paragraph)
{
    std::vector<std::string_view> words;
    auto pos{ paragraph.find_first_not_of(c_WordSeparators) };
    while (pos != std::string_view::npos)
    {
        const auto end{ paragraph.find_first_of(c_WordSeparators, pos) };
        words.push_back(paragraph.substr(pos, end - pos));
        pos = paragraph.find_first_not_of(c_WordSeparators, end);
    }
    return words;
}

std::optional<FontTier> FontTierFromName(std::string_view name)
{
    return magic_enum::enum_cast<FontTier>(TrimWhitespace(name), magic_enum::case_insensitive);
}

std::string_view FontTierName(FontTier tier)
{
    switch (tier)
    {
    case FontTier::Small:
        return "small";
    case FontTier::Medium:
        return "medium";
    case FontTier::Large:
        return "large";
    }
    std::unreachable();
}

FontTier ParseFontTier(std::string_view name)
{
    if (const auto tier{ FontTierFromName(name) })
    {
        return tier.value();
    }

    throw InvalidMessageSpec{
        fmt::format("Unknown font tier \"{}\", expected one of small, medium or large", name),
    };
}

void ValidateMessageSpec(const MessageSpec& message)
{
    if (!magic_enum::enum_contains(message.m_FontTier))
    {
        throw InvalidMessageSpec{
            fmt::format("Unknown font tier {}", magic_enum::enum_integer(message.m_FontTier)),
        };
    }

    if (message.m_MarginInset < 0_mm)
    {
        throw InvalidMessageSpec{
            fmt::format("Margin inset must not be negative, got {}",
                        FormatLength(message.m_MarginInset, Unit::Millimeter)),
        };
    }
}

Length FontTierSizes::Get(FontTier tier) const
{
    switch (tier)
    {
    case FontTier::Small:
        return m_Small;
    case FontTier::Medium:
        return m_Medium;
    case FontTier::Large:
        return m_Large;
    }
    std::unreachable();
}

Length TextBlock::LineTop(size_t i) const
{
    return m_StartY + m_LineHeight * static_cast<float>(i);
}

std::vector<std::string> WrapText(std::string_view text,
                                  Length max_width,
                                  Length font_size,
                                  const TextMeasurer& measurer)
{
    std::vector<std::string> lines;

    const auto trimmed{ TrimWhitespace(text) };
    if (trimmed.empty())
    {
        return lines;
    }

    size_t paragraph_start{ 0 };
    while (true)
    {
        const auto paragraph_end{ trimmed.find('\n', paragraph_start) };
        const auto paragraph{ trimmed.substr(paragraph_start, paragraph_end - paragraph_start) };

        const auto words{ SplitWords(paragraph) };
        if (words.empty())
        {
            lines.emplace_back();
        }
        else
        {
            std::string current_line{ words.front() };
            for (const auto& word : words | std::views::drop(1))
            {
                auto candidate{ fmt::format("{} {}", current_line, word) };
                if (measurer.MeasureText(candidate, font_size) <= max_width)
                {
                    current_line = std::move(candidate);
                }
                else
                {
                    lines.push_back(std::move(current_line));
                    current_line = std::string{ word };
                }
            }
            lines.push_back(std::move(current_line));
        }

        if (paragraph_end == std::string_view::npos)
        {
            break;
        }
        paragraph_start = paragraph_end + 1;
    }

    return lines;
}

WritingLines LayoutWritingLines(const Rect& panel,
                                Length margin_inset,
                                const MessageLayoutOptions& options)
{
    WritingLines writing_lines{
        .m_Ys{},
        .m_FromX{ panel.Left() + margin_inset },
        .m_ToX{ panel.Right() - margin_inset },
    };

    const auto count{ options.m_WritingLineCount };
    if (count == 0)
    {
        return writing_lines;
    }

    const auto panel_height{ panel.m_Size.y };
    const auto bottom_limit{ panel_height - options.m_TopBottomMargin };
    const auto gaps{ static_cast<float>(count - 1) };

    auto top{ options.m_WritingLinesTop };
    auto spacing{ options.m_WritingLineSpacing };

    const bool fits{
        top >= 0_mm &&
        spacing > 0_mm &&
        top + spacing * gaps <= bottom_limit
    };
    if (!fits)
    {
        if (count > 1 && top >= 0_mm && bottom_limit > top)
        {
            spacing = (bottom_limit - top) / gaps;
        }
        else
        {
            // Margins don't fit either, spread evenly over the whole panel
            spacing = panel_height / static_cast<float>(count + 1);
            top = spacing;
        }
    }

    writing_lines.m_Ys.reserve(count);
    for (uint32_t i = 0; i < count; ++i)
    {
        writing_lines.m_Ys.push_back(panel.Top() + top + spacing * static_cast<float>(i));
    }

    return writing_lines;
}

MessageLayout LayoutMessage(const MessageSpec& message,
                            const Rect& panel,
                            const TextMeasurer& measurer,
                            const MessageLayoutOptions& options)
{
    ValidateMessageSpec(message);

    const auto [panel_width, panel_height]{ panel.m_Size.pod() };
    if (panel_width <= 0_mm || panel_height <= 0_mm)
    {
        throw InvalidGeometry{ "Message panel must have a positive size" };
    }

    const auto inset{ message.m_MarginInset };
    const auto max_width{ panel_width - inset * 2.0f };
    if (max_width <= 0_mm)
    {
        throw InvalidMessageSpec{
            fmt::format("Margin inset of {} leaves no room on a panel {} wide",
                        FormatLength(inset, Unit::Millimeter),
                        FormatLength(panel_width, Unit::Millimeter)),
        };
    }

    if (IsBlank(message.m_Text))
    {
        return LayoutWritingLines(panel, inset, options);
    }

    const auto font_size{ options.m_FontSizes.Get(message.m_FontTier) };
    const auto line_height{ font_size * options.m_LineHeightFactor };
    const auto margin{ options.m_TopBottomMargin };

    auto wrapped_lines{ WrapText(message.m_Text, max_width, font_size, measurer) };

    // Small epsilon so that an exact fit is not lost to float rounding
    const auto available_height{ dla::math::max(panel_height - margin * 2.0f, 0_mm) };
    const auto max_lines{ static_cast<size_t>(std::floor(available_height / line_height + 1e-4f)) };

    // Centered on the full wrapped text, so an overflowing block starts at the top margin
    const auto total_text_height{ line_height * static_cast<float>(wrapped_lines.size()) };

    const bool truncated{ wrapped_lines.size() > max_lines };
    if (truncated)
    {
        wrapped_lines.resize(max_lines);
    }

    TextBlock text_block{
        .m_Lines{},
        .m_StartY{ panel.Top() + dla::math::max(margin, (panel_height - total_text_height) / 2) },
        .m_LineHeight{ line_height },
        .m_FontSize{ font_size },
        .m_Truncated{ truncated },
        .m_EllipsisAnchor{},
    };

    text_block.m_Lines.reserve(wrapped_lines.size());
    for (auto& line : wrapped_lines)
    {
        const auto width{ measurer.MeasureText(line, font_size) };
        const auto x{ panel.Left() + dla::math::max(inset, (panel_width - width) / 2) };
        text_block.m_Lines.push_back(TextLine{
            .m_Text{ std::move(line) },
            .m_X{ x },
            .m_Width{ width },
        });
    }

    if (truncated)
    {
        text_block.m_EllipsisAnchor = Position{
            panel.Left() + panel_width / 2,
            panel.Bottom() - margin / 2,
        };
    }

    return text_block;
}
