#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <podofo/main/PdfImage.h>
#include <podofo/main/PdfMemDocument.h>
#include <podofo/main/PdfPainter.h>

#include <anycard/layout/text_measurer.hpp>
#include <anycard/pdf/backend.hpp>

class PoDoFoDocument;

class PoDoFoTextMeasurer final : public TextMeasurer
{
  public:
    explicit PoDoFoTextMeasurer(const PoDoFo::PdfFont& font);

    virtual Length MeasureText(std::string_view text, Length font_size) const override;

  private:
    const PoDoFo::PdfFont& m_Font;
};

class PoDoFoPage final : public PdfPage
{
    friend class PoDoFoDocument;

  public:
    virtual ~PoDoFoPage() override = default;

    virtual void DrawSolidLine(LineData data, LineStyle style) override;

    virtual void DrawDashedLine(LineData data, DashedLineStyle style) override;

    virtual void DrawImage(ImageData data) override;

    virtual void DrawText(TextData data) override;

    virtual void Finish() override;

  private:
    PoDoFoPage(PoDoFo::PdfPage* page,
               PoDoFo::PdfPainter* painter,
               PoDoFoDocument* document,
               Length page_height);

    // Converts a page space y coordinate to PDF user space
    double FlipY(Length y) const;

    PoDoFo::PdfPage* m_Page{ nullptr };
    PoDoFo::PdfPainter* m_Painter{ nullptr };
    PoDoFoDocument* m_Document{ nullptr };
    Length m_PageHeight;
};

class PoDoFoDocument final : public PdfDocument
{
  public:
    PoDoFoDocument(const Config& config);
    virtual ~PoDoFoDocument() override = default;

    virtual PoDoFoPage* NextPage(Size page_size) override;

    virtual const TextMeasurer& GetTextMeasurer() override;

    virtual fs::path Write(fs::path path) override;

    PoDoFo::PdfFont& GetFont();
    PoDoFo::PdfImage* MakeImage(const Image& image);

    std::lock_guard<std::mutex> AquireDocumentLock();

  private:
    mutable std::mutex m_Mutex;

    const Config& m_Config;

    PoDoFo::PdfMemDocument m_Document;
    std::vector<std::unique_ptr<PoDoFoPage>> m_Pages;
    std::vector<std::unique_ptr<PoDoFo::PdfPainter>> m_Painters;
    std::vector<std::unique_ptr<PoDoFo::PdfImage>> m_Images;

    std::unique_ptr<PoDoFoTextMeasurer> m_TextMeasurer;
};
