#pragma once

#include <anycard/util.hpp>

class Image;
class PdfDocument;
struct Config;
struct LayoutPlan;

// Draws both pages of the plan into document and writes it to file_path,
// returns the path actually written
fs::path GenerateCardPdf(const LayoutPlan& plan,
                         const Image& artwork,
                         const Config& config,
                         PdfDocument& document,
                         const fs::path& file_path);
