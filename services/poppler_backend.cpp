#include "poppler_backend.h"

#include <stdexcept>
#include <vector>
#include <crow/logging.h>
#include <opencv2/imgproc.hpp>
#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-global.h>
#include <poppler/cpp/poppler-image.h>
#include <poppler/cpp/poppler-page.h>
#include <poppler/cpp/poppler-page-renderer.h>

namespace {

void popplerDebug(const std::string& msg, void*)
{
    CROW_LOG_DEBUG << "[poppler] " << msg;
}

class PopplerDocument : public PdfDocument
{
public:
    explicit PopplerDocument(std::string bytes) : bytes_(std::move(bytes))
    {
        doc_.reset(poppler::document::load_from_raw_data(bytes_.data(), static_cast<int>(bytes_.size())));
    }

    bool valid() const { return doc_ && !doc_->is_locked(); }

    int pageCount() const override { return doc_->pages(); }

    std::string pageText(int index) const override
    {
        std::unique_ptr<poppler::page> page(doc_->create_page(index));
        if (!page) throw std::runtime_error("cannot open page " + std::to_string(index));
        poppler::byte_array utf8 = page->text().to_utf8();
        return std::string(utf8.begin(), utf8.end());
    }

    cv::Mat renderPage(int index, int dpi) const override
    {
        std::unique_ptr<poppler::page> page(doc_->create_page(index));
        if (!page) throw std::runtime_error("cannot open page " + std::to_string(index));

        poppler::page_renderer renderer;
        renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
        renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
        renderer.set_image_format(poppler::image::format_argb32);

        poppler::image img = renderer.render_page(page.get(), dpi, dpi);
        if (!img.is_valid()) throw std::runtime_error("render failed for page " + std::to_string(index));

        // Wrap poppler's buffer, then copy out through cvtColor before img dies.
        cv::Mat gray;
        switch (img.format()) {
        case poppler::image::format_argb32: {
            cv::Mat bgra(img.height(), img.width(), CV_8UC4,
                         const_cast<char*>(img.const_data()), img.bytes_per_row());
            cv::cvtColor(bgra, gray, cv::COLOR_BGRA2GRAY);
            break;
        }
        case poppler::image::format_rgb24: {
            cv::Mat rgb(img.height(), img.width(), CV_8UC3,
                        const_cast<char*>(img.const_data()), img.bytes_per_row());
            cv::cvtColor(rgb, gray, cv::COLOR_RGB2GRAY);
            break;
        }
        case poppler::image::format_gray8: {
            cv::Mat g(img.height(), img.width(), CV_8UC1,
                      const_cast<char*>(img.const_data()), img.bytes_per_row());
            gray = g.clone();
            break;
        }
        default:
            throw std::runtime_error("unsupported raster format");
        }
        return gray;
    }

private:
    std::string bytes_;                            // must outlive doc_
    std::unique_ptr<poppler::document> doc_;
};

} // namespace

PopplerPdfBackend::PopplerPdfBackend()
{
    poppler::set_debug_error_function(popplerDebug, nullptr);
}

std::unique_ptr<PdfDocument> PopplerPdfBackend::open(const std::string& bytes) const
{
    auto doc = std::make_unique<PopplerDocument>(bytes);
    if (!doc->valid()) {
        CROW_LOG_WARNING << "[poppler] document could not be loaded (corrupt or encrypted)";
        return nullptr;
    }
    return doc;
}
