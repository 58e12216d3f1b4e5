#include "tesseract_engine.h"

#include <memory>
#include <stdexcept>
#include <crow/logging.h>
#include <opencv2/imgproc.hpp>
#include <tesseract/baseapi.h>

namespace {

struct TessDeleter {
    void operator()(tesseract::TessBaseAPI* api) const
    {
        api->End();
        delete api;
    }
};
using TessHandle = std::unique_ptr<tesseract::TessBaseAPI, TessDeleter>;

TessHandle openTesseract(const std::string& datapath, const std::string& language)
{
    TessHandle api(new tesseract::TessBaseAPI());
    const char* path = datapath.empty() ? nullptr : datapath.c_str();
    if (api->Init(path, language.c_str()) != 0) {
        throw std::runtime_error("tesseract init failed for language '" + language + "'");
    }
    api->SetPageSegMode(tesseract::PSM_AUTO);
    return api;
}

} // namespace

TesseractOcrEngine::TesseractOcrEngine(std::string tessdata_path, std::string language)
    : tessdata_path_(std::move(tessdata_path)), language_(std::move(language))
{
    try {
        openTesseract(tessdata_path_, language_);
        available_ = true;
        CROW_LOG_INFO << "[ocr] tesseract ready (lang=" << language_ << ")";
    } catch (const std::exception& e) {
        CROW_LOG_WARNING << "[ocr] disabled: " << e.what();
    }
}

std::string TesseractOcrEngine::recognize(const cv::Mat& gray) const
{
    if (!available_) throw std::runtime_error("tesseract unavailable");
    if (gray.empty()) throw std::runtime_error("empty image");

    cv::Mat img;
    if (gray.channels() == 1) {
        img = gray;
    } else {
        cv::cvtColor(gray, img, gray.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    }
    if (!img.isContinuous()) img = img.clone();

    TessHandle api = openTesseract(tessdata_path_, language_);
    api->SetImage(img.data, img.cols, img.rows, 1, static_cast<int>(img.step));
    if (api->Recognize(nullptr) != 0) throw std::runtime_error("tesseract recognition failed");

    std::unique_ptr<char[]> text(api->GetUTF8Text());
    if (!text) throw std::runtime_error("tesseract returned no text buffer");
    return std::string(text.get());
}
