#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <anycard/layout/fold_geometry.hpp>
#include <anycard/util.hpp>

class TextMeasurer;

enum class FontTier
{
    Small,
    Medium,
    Large,
};

// Accepts "small", "Medium", "LARGE", ...
std::optional<FontTier> FontTierFromName(std::string_view name);
std::string_view FontTierName(FontTier tier);

// Same as FontTierFromName but throws InvalidMessageSpec on unknown names
FontTier ParseFontTier(std::string_view name);

struct MessageSpec
{
    std::string m_Text;
    FontTier m_FontTier{ FontTier::Medium };
    Length m_MarginInset{ 20_mm };
};

// Throws InvalidMessageSpec on a font tier outside of the enum or a negative inset
void ValidateMessageSpec(const MessageSpec& message);

struct FontTierSizes
{
    Length m_Small{ 11_pts };
    Length m_Medium{ 14_pts };
    Length m_Large{ 18_pts };

    Length Get(FontTier tier) const;

    bool operator==(const FontTierSizes&) const = default;
};

struct MessageLayoutOptions
{
    FontTierSizes m_FontSizes{};
    float m_LineHeightFactor{ 1.4f };
    Length m_TopBottomMargin{ 1_in };

    uint32_t m_WritingLineCount{ 10 };
    Length m_WritingLinesTop{ 1_in };
    Length m_WritingLineSpacing{ 10_mm };

    bool operator==(const MessageLayoutOptions&) const = default;
};

struct TextLine
{
    std::string m_Text;

    // Left edge of the line when centered in the panel
    Length m_X;
    Length m_Width;

    bool operator==(const TextLine&) const = default;
};

struct TextBlock
{
    std::vector<TextLine> m_Lines;
    Length m_StartY;
    Length m_LineHeight;
    Length m_FontSize;

    bool m_Truncated{ false };
    std::optional<Position> m_EllipsisAnchor;

    // Top edge of the i-th line, the renderer places the baseline below it
    Length LineTop(size_t i) const;

    bool operator==(const TextBlock&) const = default;
};

struct WritingLines
{
    std::vector<Length> m_Ys;
    Length m_FromX;
    Length m_ToX;

    bool operator==(const WritingLines&) const = default;
};

using MessageLayout = std::variant<TextBlock, WritingLines>;

// Greedy whitespace wrap, explicit newlines always break and words wider than
// max_width are kept whole on a line of their own
std::vector<std::string> WrapText(std::string_view text,
                                  Length max_width,
                                  Length font_size,
                                  const TextMeasurer& measurer);

WritingLines LayoutWritingLines(const Rect& panel,
                                Length margin_inset,
                                const MessageLayoutOptions& options);

MessageLayout LayoutMessage(const MessageSpec& message,
                            const Rect& panel,
                            const TextMeasurer& measurer,
                            const MessageLayoutOptions& options = {});
