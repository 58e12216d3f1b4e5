#pragma once
#include <string>
#include "document_extractor.h"

// Tesseract OCR. TessBaseAPI is not thread-safe, so every recognize() call
// gets its own handle; the engine itself only holds configuration.
class TesseractOcrEngine : public OcrEngine
{
public:
    TesseractOcrEngine(std::string tessdata_path, std::string language);

    // Probes once that the language data can be loaded.
    bool available() const override { return available_; }
    std::string recognize(const cv::Mat& gray) const override;

private:
    std::string tessdata_path_;
    std::string language_;
    bool available_ = false;
};
