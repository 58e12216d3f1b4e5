#include "document_extractor.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <crow/logging.h>

DocumentExtractor::DocumentExtractor(std::shared_ptr<const PdfBackend> pdf,
                                     std::shared_ptr<const OcrEngine> ocr,
                                     ExtractorOptions options)
    : pdf_(std::move(pdf)), ocr_(std::move(ocr)), options_(options)
{
}

bool DocumentExtractor::hasPdfHeader(const std::string& document)
{
    return document.size() >= 5 && document.compare(0, 5, "%PDF-") == 0;
}

size_t DocumentExtractor::countAlnum(const std::string& text)
{
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](unsigned char c) {
        return std::isalnum(c) != 0;
    }));
}

std::string DocumentExtractor::cleanText(const std::string& raw)
{
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (c == '\0') continue;
        out.push_back(c == '\r' || c == '\n' ? ' ' : c);
    }
    size_t b = out.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    size_t e = out.find_last_not_of(" \t");
    return out.substr(b, e - b + 1);
}

std::string DocumentExtractor::directText(const PdfDocument& doc) const
{
    std::string text;
    const int pages = doc.pageCount();
    for (int i = 0; i < pages; ++i) {
        try {
            std::string page = cleanText(doc.pageText(i));
            if (page.empty()) continue;
            if (!text.empty()) text.push_back(' ');
            text += page;
        } catch (const std::exception& e) {
            CROW_LOG_WARNING << "[extractor] direct text failed on page " << i << ": " << e.what();
        }
    }
    return text;
}

std::string DocumentExtractor::ocrText(const PdfDocument& doc, int& pages_ok, int& pages_failed) const
{
    std::string text;
    const int pages = std::min(doc.pageCount(), options_.ocr_max_pages);
    for (int i = 0; i < pages; ++i) {
        try {
            cv::Mat raster = doc.renderPage(i, options_.ocr_dpi);
            if (raster.empty()) throw std::runtime_error("empty raster");
            std::string page = cleanText(ocr_->recognize(raster));
            ++pages_ok;
            if (page.empty()) continue;
            if (!text.empty()) text.push_back(' ');
            text += page;
        } catch (const std::exception& e) {
            ++pages_failed;
            CROW_LOG_WARNING << "[extractor] OCR skipped page " << i << ": " << e.what();
        }
    }
    return text;
}

StageResult<ExtractedPolicyText> DocumentExtractor::extract(const std::string& document) const
{
    ExtractedPolicyText out;

    if (document.empty()) {
        return StageResult<ExtractedPolicyText>::ok(out);          // absent is valid
    }
    if (!hasPdfHeader(document)) {
        return StageResult<ExtractedPolicyText>::degraded(out, "policy document is not a PDF");
    }

    auto t0 = std::chrono::high_resolution_clock::now();
    try {
        std::unique_ptr<PdfDocument> doc = pdf_ ? pdf_->open(document) : nullptr;
        if (!doc || doc->pageCount() <= 0) {
            return StageResult<ExtractedPolicyText>::degraded(out, "policy document could not be parsed");
        }

        out.text = directText(*doc);
        out.method = out.text.empty() ? ExtractionMethod::None : ExtractionMethod::Direct;
        out.pages_processed = doc->pageCount();

        const size_t threshold = static_cast<size_t>(std::max(0, options_.meaningful_threshold));
        if (countAlnum(out.text) < threshold) {
            if (!ocrAvailable()) {
                CROW_LOG_WARNING << "[extractor] direct text insufficient and OCR unavailable";
            } else {
                int ok = 0, failed = 0;
                std::string ocr = ocrText(*doc, ok, failed);
                out.pages_processed = ok;
                out.pages_failed = failed;
                if (ok > 0) {
                    out.text = std::move(ocr);
                    out.method = ExtractionMethod::Ocr;
                } else {
                    out.text.clear();
                    out.method = ExtractionMethod::None;
                }
            }
        }
        out.meaningful = countAlnum(out.text) >= threshold;
    } catch (const std::exception& e) {
        CROW_LOG_ERROR << "[extractor] " << e.what();
        return StageResult<ExtractedPolicyText>::degraded(ExtractedPolicyText{},
                                                          std::string("policy extraction failed: ") + e.what());
    }

    auto t1 = std::chrono::high_resolution_clock::now();
    CROW_LOG_DEBUG << "[TIMER] policy extraction (" << toString(out.method) << "): "
                   << std::chrono::duration<double, std::milli>(t1 - t0).count() << " ms";

    if (out.method == ExtractionMethod::None) {
        return StageResult<ExtractedPolicyText>::degraded(std::move(out), "no text could be extracted from the policy document");
    }
    return StageResult<ExtractedPolicyText>::ok(std::move(out));
}
