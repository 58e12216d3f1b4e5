#pragma once
#include <memory>
#include <string>
#include <opencv2/core.hpp>
#include "../models/claim_types.h"
#include "../models/stage_result.h"

// An opened PDF. Implementations throw std::exception on page-level failures.
class PdfDocument
{
public:
    virtual ~PdfDocument() = default;
    virtual int pageCount() const = 0;
    virtual std::string pageText(int index) const = 0;
    // 8-bit single channel raster of the page.
    virtual cv::Mat renderPage(int index, int dpi) const = 0;
};

class PdfBackend
{
public:
    virtual ~PdfBackend() = default;
    // nullptr when the bytes cannot be parsed as a PDF.
    virtual std::unique_ptr<PdfDocument> open(const std::string& bytes) const = 0;
};

class OcrEngine
{
public:
    virtual ~OcrEngine() = default;
    virtual bool available() const = 0;
    // Throws std::exception when recognition fails for the image.
    virtual std::string recognize(const cv::Mat& gray) const = 0;
};

struct ExtractorOptions
{
    int meaningful_threshold = 50;
    int ocr_max_pages = 5;
    int ocr_dpi = 300;
};

class DocumentExtractor
{
public:
    DocumentExtractor(std::shared_ptr<const PdfBackend> pdf,
                      std::shared_ptr<const OcrEngine> ocr,
                      ExtractorOptions options = {});

    // Never throws. Degraded when the document is invalid or nothing
    // could be read from it.
    StageResult<ExtractedPolicyText> extract(const std::string& document) const;

    bool ocrAvailable() const { return ocr_ && ocr_->available(); }
    const ExtractorOptions& options() const { return options_; }

    static bool hasPdfHeader(const std::string& document);
    static size_t countAlnum(const std::string& text);
    // NULs dropped, line breaks folded to spaces, outer whitespace trimmed.
    static std::string cleanText(const std::string& raw);

private:
    std::string directText(const PdfDocument& doc) const;
    std::string ocrText(const PdfDocument& doc, int& pages_ok, int& pages_failed) const;

    std::shared_ptr<const PdfBackend> pdf_;
    std::shared_ptr<const OcrEngine> ocr_;
    ExtractorOptions options_;
};
