#pragma once
#include "document_extractor.h"

// poppler-cpp implementation of the PDF seam. Each open() keeps its own
// copy of the bytes, so documents are independent between requests.
class PopplerPdfBackend : public PdfBackend
{
public:
    PopplerPdfBackend();
    std::unique_ptr<PdfDocument> open(const std::string& bytes) const override;
};
