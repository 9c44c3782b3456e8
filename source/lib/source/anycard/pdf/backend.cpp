#include <anycard/pdf/backend.hpp>

#include <anycard/pdf/podofo_backend.hpp>

std::unique_ptr<PdfDocument> CreatePdfDocument(const Config& config)
{
    return std::make_unique<PoDoFoDocument>(config);
}

void PdfPage::DrawCorner(CornerData data, LineStyle style)
{
    const auto [vx, vy]{ data.m_Vertex.pod() };
    const auto [rx, ry]{ data.m_Reach.pod() };

    DrawSolidLine(LineData{ data.m_Vertex, { rx, vy } }, style);
    DrawSolidLine(LineData{ data.m_Vertex, { vx, ry } }, style);
}
