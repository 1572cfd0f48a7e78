#include "omr/DocumentLoader.hpp"
#include "omr/Errors.hpp"
#include "omr/Logger.hpp"
#include "omr/TextUtil.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <utility>

namespace fs = std::filesystem;

namespace omr {

namespace {

const char kPdfMagic[] = "%PDF-";
const size_t kPdfMagicLen = sizeof(kPdfMagic) - 1;

cv::Mat popplerImageToGray(const poppler::image& img) {
    int width = img.width();
    int height = img.height();
    char* data = const_cast<char*>(img.const_data());
    size_t stride = static_cast<size_t>(img.bytes_per_row());

    cv::Mat gray;
    switch (img.format()) {
    case poppler::image::format_argb32:
    case poppler::image::format_rgb24: {
        // both are 4 bytes per pixel, B G R A in memory
        cv::Mat bgra(height, width, CV_8UC4, data, stride);
        cv::cvtColor(bgra, gray, cv::COLOR_BGRA2GRAY);
        break;
    }
    case poppler::image::format_bgr24: {
        cv::Mat bgr(height, width, CV_8UC3, data, stride);
        cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
        break;
    }
    case poppler::image::format_gray8: {
        gray = cv::Mat(height, width, CV_8UC1, data, stride).clone();
        break;
    }
    default:
        throw LoadError("unsupported rendered image format");
    }
    return gray;
}

std::vector<cv::Mat> rasterizePdf(poppler::document* doc, int dpi, const std::string& name) {
    if (!doc) {
        throw LoadError("failed to open PDF " + name);
    }
    if (doc->is_locked()) {
        throw LoadError("PDF is password protected: " + name);
    }

    int pageCount = doc->pages();
    if (pageCount < 1) {
        throw LoadError("PDF has no pages: " + name);
    }

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    std::vector<cv::Mat> pages;
    pages.reserve(pageCount);

    for (int i = 0; i < pageCount; ++i) {
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) {
            throw LoadError("failed to open page " + std::to_string(i + 1) + " of " + name);
        }

        poppler::image rendered = renderer.render_page(page.get(), dpi, dpi);
        if (!rendered.is_valid()) {
            throw LoadError("failed to render page " + std::to_string(i + 1) + " of " + name);
        }

        cv::Mat gray = popplerImageToGray(rendered);
        if (gray.empty()) {
            throw LoadError("page " + std::to_string(i + 1) + " of " + name + " rendered empty");
        }
        pages.push_back(gray);
    }
    return pages;
}

} // namespace

const char* documentKindName(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::Auto:  return "auto";
        case DocumentKind::Pdf:   return "pdf";
        case DocumentKind::Image: return "image";
    }
    return "auto";
}

DocumentLoader::DocumentLoader(int dpi)
    : dpi_(dpi) {}

DocumentKind DocumentLoader::detectKind(const std::vector<unsigned char>& bytes) {
    if (bytes.size() >= kPdfMagicLen &&
        std::memcmp(bytes.data(), kPdfMagic, kPdfMagicLen) == 0) {
        return DocumentKind::Pdf;
    }
    return DocumentKind::Image;
}

DocumentKind DocumentLoader::detectKind(const std::string& path) {
    if (toLower(fs::path(path).extension().string()) == ".pdf") return DocumentKind::Pdf;

    std::ifstream in(path, std::ios::binary);
    char head[kPdfMagicLen] = {};
    if (in.read(head, kPdfMagicLen) && std::memcmp(head, kPdfMagic, kPdfMagicLen) == 0) {
        return DocumentKind::Pdf;
    }
    return DocumentKind::Image;
}

std::vector<cv::Mat> DocumentLoader::loadFile(const std::string& path, DocumentKind kind) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw LoadError("cannot open document " + path);
    }

    if (kind == DocumentKind::Auto) kind = detectKind(path);

    std::vector<cv::Mat> pages;
    if (kind == DocumentKind::Pdf) {
        std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(path));
        pages = rasterizePdf(doc.get(), dpi_, path);
    } else {
        cv::Mat gray = cv::imread(path, cv::IMREAD_GRAYSCALE);
        if (gray.empty()) {
            throw LoadError("cannot decode image " + path);
        }
        pages.push_back(gray);
    }

    logInfo("Loaded " + std::to_string(pages.size()) + " page(s) from " + path
            + " (" + documentKindName(kind) + ")");
    return pages;
}

std::vector<cv::Mat> DocumentLoader::loadBytes(std::vector<unsigned char> bytes, DocumentKind kind) const {
    if (bytes.empty()) {
        throw LoadError("empty document buffer");
    }

    if (kind == DocumentKind::Auto) kind = detectKind(bytes);

    std::vector<cv::Mat> pages;
    if (kind == DocumentKind::Pdf) {
        // poppler reads from the buffer for the whole lifetime of the document
        std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(
            reinterpret_cast<const char*>(bytes.data()), static_cast<int>(bytes.size())));
        pages = rasterizePdf(doc.get(), dpi_, "<buffer>");
    } else {
        cv::Mat gray;
        try {
            gray = cv::imdecode(bytes, cv::IMREAD_GRAYSCALE);
        } catch (const cv::Exception& e) {
            throw LoadError(std::string("cannot decode image buffer: ") + e.what());
        }
        if (gray.empty()) {
            throw LoadError("cannot decode image buffer");
        }
        pages.push_back(gray);
    }

    bytes.clear();
    bytes.shrink_to_fit();

    logInfo("Loaded " + std::to_string(pages.size()) + " page(s) from buffer ("
            + documentKindName(kind) + ")");
    return pages;
}

std::vector<cv::Mat> loadDocument(const std::string& path, DocumentKind kind, int dpi) {
    return DocumentLoader(dpi).loadFile(path, kind);
}

std::vector<cv::Mat> loadDocument(std::vector<unsigned char> bytes, DocumentKind kind, int dpi) {
    return DocumentLoader(dpi).loadBytes(std::move(bytes), kind);
}

} // namespace omr
