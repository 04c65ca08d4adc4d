#ifndef MAINTLOG_TEST_HELPERS_HPP
#define MAINTLOG_TEST_HELPERS_HPP

// Fixture builders shared by the test executables.

#include "../libmaintlog/include/jpeg_codec.hpp"
#include "../libmaintlog/include/report_types.hpp"
#include "../libmaintlog/include/text_utils.hpp"

#include <png.h>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>

#include <algorithm>
#include <csetjmp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace test {

inline maintlog::Timestamp at(const std::string& iso) {
    const auto ts = maintlog::parse_iso8601(iso);
    if (!ts) throw std::invalid_argument("bad timestamp " + iso);
    return *ts;
}

// smooth gradient, compresses well at any size
inline maintlog::Bitmap gradient(const int width, const int height, const int channels = 3) {
    maintlog::Bitmap bmp;
    bmp.allocate(width, height, channels);
    for (int y = 0; y < height; ++y) {
        std::uint8_t* row = bmp.row(y);
        for (int x = 0; x < width; ++x) {
            for (int c = 0; c < channels; ++c) {
                const int v = c == 0 ? x * 255 / std::max(1, width - 1)
                            : c == 1 ? y * 255 / std::max(1, height - 1)
                                     : 128;
                row[x * channels + c] = static_cast<std::uint8_t>(v);
            }
        }
    }
    return bmp;
}

inline std::vector<std::uint8_t> jpeg_bytes(const int width, const int height, const int channels = 3) {
    return maintlog::encode_jpeg(gradient(width, height, channels), 90);
}

inline maintlog::Attachment jpeg_attachment(const int width, const int height, const std::string& name = "photo.jpg") {
    return maintlog::Attachment{jpeg_bytes(width, height), "image/jpeg", name};
}

/**
 * Inserts an Exif APP1 segment carrying an orientation tag right after SOI.
 */
inline std::vector<std::uint8_t> with_exif_orientation(const std::vector<std::uint8_t>& jpeg, const int orientation) {
    const std::vector<std::uint8_t> payload = {
        'E', 'x', 'i', 'f', 0, 0,
        'M', 'M', 0, 42, 0, 0, 0, 8,            // big-endian TIFF header, IFD at 8
        0, 1,                                   // one entry
        0x01, 0x12, 0, 3, 0, 0, 0, 1,           // Orientation, SHORT, count 1
        0, static_cast<std::uint8_t>(orientation), 0, 0,
        0, 0, 0, 0                              // no next IFD
    };
    const size_t length = payload.size() + 2;
    std::vector<std::uint8_t> out(jpeg.begin(), jpeg.begin() + 2);
    out.push_back(0xFF);
    out.push_back(0xE1);
    out.push_back(static_cast<std::uint8_t>(length >> 8));
    out.push_back(static_cast<std::uint8_t>(length & 0xFF));
    out.insert(out.end(), payload.begin(), payload.end());
    out.insert(out.end(), jpeg.begin() + 2, jpeg.end());
    return out;
}

/**
 * Rewrites the frame size in the first SOF0 marker without touching the scan data.
 */
inline std::vector<std::uint8_t> with_declared_size(std::vector<std::uint8_t> jpeg, const int width, const int height) {
    for (size_t i = 2; i + 8 < jpeg.size(); ++i) {
        if (jpeg[i] != 0xFF || jpeg[i + 1] != 0xC0) continue;
        // FF C0, length(2), precision(1), height(2), width(2)
        jpeg[i + 5] = static_cast<std::uint8_t>(height >> 8);
        jpeg[i + 6] = static_cast<std::uint8_t>(height & 0xFF);
        jpeg[i + 7] = static_cast<std::uint8_t>(width >> 8);
        jpeg[i + 8] = static_cast<std::uint8_t>(width & 0xFF);
        return jpeg;
    }
    throw std::runtime_error("no SOF0 marker");
}

namespace detail {
inline void png_append(png_structp png, png_bytep data, png_size_t length) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + length);
}
inline void png_flush(png_structp) {}
} // namespace detail

/**
 * Encodes an RGBA PNG whose left half is opaque red and right half fully
 * transparent.
 */
inline std::vector<std::uint8_t> png_half_transparent(const int width, const int height) {
    std::vector<std::uint8_t> out;
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png_create_info_struct(png);
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        throw std::runtime_error("png encode failed");
    }
    png_set_write_fn(png, &out, detail::png_append, detail::png_flush);
    png_set_IHDR(png, info, static_cast<png_uint_32>(width), static_cast<png_uint_32>(height), 8,
                 PNG_COLOR_TYPE_RGB_ALPHA, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    std::vector<std::uint8_t> row(static_cast<size_t>(width) * 4);
    for (int x = 0; x < width; ++x) {
        const bool opaque = x < width / 2;
        row[x * 4] = opaque ? 255 : 0;
        row[x * 4 + 1] = 0;
        row[x * 4 + 2] = 0;
        row[x * 4 + 3] = opaque ? 255 : 0;
    }
    for (int y = 0; y < height; ++y) {
        png_write_row(png, row.data());
    }
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    return out;
}

inline size_t count_pages(const std::vector<std::uint8_t>& pdf_bytes) {
    QPDF pdf;
    pdf.processMemoryFile("report.pdf", reinterpret_cast<const char*>(pdf_bytes.data()), pdf_bytes.size());
    return QPDFPageDocumentHelper(pdf).getAllPages().size();
}

inline maintlog::LogRecord record(const std::string& id, const std::string& title = "Leaking pipe in room 12") {
    maintlog::LogRecord r;
    r.id = id;
    r.title = title;
    r.category = "Plumbing";
    r.location = "Building B, Room 12";
    r.description = "Water is dripping from the ceiling near the north window. Bucket placed.";
    r.created_at = at("2025-03-13T08:00:00Z");
    r.created_by = "J. Rivera";
    return r;
}

} // namespace test

#endif // MAINTLOG_TEST_HELPERS_HPP
