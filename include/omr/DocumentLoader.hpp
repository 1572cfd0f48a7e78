#ifndef OMR_DOCUMENT_LOADER_HPP
#define OMR_DOCUMENT_LOADER_HPP

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace omr {

enum class DocumentKind {
    Auto,
    Pdf,
    Image
};

const char* documentKindName(DocumentKind kind);

// Turns a PDF or a raster image into grayscale pages, in page order.
// Every failure (unreadable, locked, zero pages, empty raster) throws LoadError.
class DocumentLoader {
public:
    explicit DocumentLoader(int dpi = 300);

    std::vector<cv::Mat> loadFile(const std::string& path, DocumentKind kind = DocumentKind::Auto) const;

    // The buffer is consumed and released once the pages are rasterized
    std::vector<cv::Mat> loadBytes(std::vector<unsigned char> bytes, DocumentKind kind = DocumentKind::Auto) const;

    static DocumentKind detectKind(const std::string& path);
    static DocumentKind detectKind(const std::vector<unsigned char>& bytes);

    int getDpi() const { return dpi_; }

private:
    int dpi_;
};

std::vector<cv::Mat> loadDocument(const std::string& path, DocumentKind kind = DocumentKind::Auto, int dpi = 300);
std::vector<cv::Mat> loadDocument(std::vector<unsigned char> bytes, DocumentKind kind = DocumentKind::Auto, int dpi = 300);

} // namespace omr

#endif // OMR_DOCUMENT_LOADER_HPP
