#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <jpeglib.h>
#include <jerror.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
    bool truncated = false;
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    throw std::runtime_error(err->msg);
}

/**
 * @brief libjpeg message hook: warnings go to the logger, a premature end
 * of data is remembered so the decoder can reject the attachment.
 */
void jpeg_emit_message_log(const j_common_ptr cinfo, const int msg_level) {
    if (msg_level >= 0) return; // trace messages
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    if (cinfo->err->msg_code == JWRN_JPEG_EOF) {
        err->truncated = true;
    }
    char buffer[JMSG_LENGTH_MAX]{};
    (*cinfo->err->format_message)(cinfo, buffer);
    cinfo->err->num_warnings++;
    Logger::log(LogLevel::Warning, std::string("libjpeg: ") + buffer, "libjpeg");
}

void install_error_handlers(JpegErrorMgr& jerr) {
    jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw;
    jerr.pub.emit_message = jpeg_emit_message_log;
}

/**
 * @brief RAII owner of a jpeg_decompress_struct.
 */
struct DecompressGuard {
    jpeg_decompress_struct* cinfo;
    bool created = false;
    ~DecompressGuard() {
        if (created) jpeg_destroy_decompress(cinfo);
    }
};

/**
 * @brief RAII owner of a jpeg_compress_struct.
 */
struct CompressGuard {
    jpeg_compress_struct* cinfo;
    bool created = false;
    ~CompressGuard() {
        if (created) jpeg_destroy_compress(cinfo);
    }
};

/**
 * @brief Frees the buffer allocated by jpeg_mem_dest.
 */
struct MemDestGuard {
    unsigned char*& buffer;
    ~MemDestGuard() { std::free(buffer); }
};

void attach_source(jpeg_decompress_struct& cinfo, const std::span<const std::uint8_t> data) {
    // older libjpeg releases take a non-const pointer; the buffer is never written
    jpeg_mem_src(&cinfo,
                 const_cast<unsigned char*>(data.data()),
                 static_cast<unsigned long>(data.size()));
}

int find_orientation(const jpeg_decompress_struct& cinfo) {
    for (jpeg_saved_marker_ptr m = cinfo.marker_list; m; m = m->next) {
        if (m->marker == JPEG_APP0 + 1 && m->data && m->data_length > 6) {
            const int orientation = maintlog::exif_orientation({m->data, m->data_length});
            if (orientation != 1) return orientation;
        }
    }
    return 1;
}

// Adobe writers store CMYK inverted
void cmyk_row_to_rgb(const JSAMPLE* in, std::uint8_t* out, const JDIMENSION width, const bool inverted) {
    for (JDIMENSION x = 0; x < width; ++x) {
        int c = in[4 * x], m = in[4 * x + 1], y = in[4 * x + 2], k = in[4 * x + 3];
        if (!inverted) {
            c = 255 - c;
            m = 255 - m;
            y = 255 - y;
            k = 255 - k;
        }
        out[3 * x]     = static_cast<std::uint8_t>(c * k / 255);
        out[3 * x + 1] = static_cast<std::uint8_t>(m * k / 255);
        out[3 * x + 2] = static_cast<std::uint8_t>(y * k / 255);
    }
}

std::uint16_t read_u16(const std::uint8_t* p, const bool little) {
    return little ? static_cast<std::uint16_t>(p[0] | (p[1] << 8))
                  : static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

std::uint32_t read_u32(const std::uint8_t* p, const bool little) {
    return little
        ? static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
          (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24)
        : (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
          (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

} // namespace

namespace maintlog {

int exif_orientation(const std::span<const std::uint8_t> app1) noexcept {
    static constexpr std::uint8_t kExifHeader[6] = {'E', 'x', 'i', 'f', 0, 0};
    if (app1.size() < 6 + 8 || std::memcmp(app1.data(), kExifHeader, 6) != 0) return 1;

    const std::span<const std::uint8_t> tiff = app1.subspan(6);
    bool little;
    if (tiff[0] == 'I' && tiff[1] == 'I') little = true;
    else if (tiff[0] == 'M' && tiff[1] == 'M') little = false;
    else return 1;
    if (read_u16(tiff.data() + 2, little) != 42) return 1;

    const std::uint32_t ifd = read_u32(tiff.data() + 4, little);
    if (ifd < 8 || static_cast<size_t>(ifd) + 2 > tiff.size()) return 1;
    const std::uint16_t count = read_u16(tiff.data() + ifd, little);

    for (std::uint16_t i = 0; i < count; ++i) {
        const size_t entry = static_cast<size_t>(ifd) + 2 + static_cast<size_t>(i) * 12;
        if (entry + 12 > tiff.size()) return 1;
        const std::uint8_t* e = tiff.data() + entry;
        if (read_u16(e, little) != 0x0112) continue;
        // SHORT, count 1: value is left-justified in the 4-byte field
        if (read_u16(e + 2, little) != 3) return 1;
        const int value = read_u16(e + 8, little);
        return (value >= 1 && value <= 8) ? value : 1;
    }
    return 1;
}

DecodedImage JpegDecoder::decode(const std::span<const std::uint8_t> data,
                                 const Deadline& deadline,
                                 const size_t max_pixels) const {
    if (data.size() < 4) {
        throw ReportError(ErrorKind::DecodeFailed, "JPEG stream too short");
    }

    jpeg_decompress_struct cinfo{};
    JpegErrorMgr jerr{};
    install_error_handlers(jerr);
    cinfo.err = &jerr.pub;
    DecompressGuard guard{&cinfo};

    DecodedImage result;
    try {
        jpeg_create_decompress(&cinfo);
        guard.created = true;
        attach_source(cinfo, data);
        jpeg_save_markers(&cinfo, JPEG_APP0 + 1, 0xFFFF);

        if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
            throw std::runtime_error("Invalid JPEG header");
        }
        check_pixel_limit(cinfo.image_width, cinfo.image_height, max_pixels);

        const bool cmyk = cinfo.jpeg_color_space == JCS_CMYK || cinfo.jpeg_color_space == JCS_YCCK;
        if (cmyk) {
            cinfo.out_color_space = JCS_CMYK;
        } else if (cinfo.num_components == 1) {
            cinfo.out_color_space = JCS_GRAYSCALE;
        } else {
            cinfo.out_color_space = JCS_RGB;
        }

        Logger::log(LogLevel::Debug,
                    std::string("JPEG ") + (cinfo.progressive_mode ? "progressive" : "baseline") +
                    " " + std::to_string(cinfo.image_width) + "x" + std::to_string(cinfo.image_height),
                    "jpeg_decoder");

        jpeg_start_decompress(&cinfo);

        const int channels = cmyk ? 3 : static_cast<int>(cinfo.output_components);
        result.bitmap.allocate(static_cast<int>(cinfo.output_width),
                               static_cast<int>(cinfo.output_height),
                               channels);

        std::vector<JSAMPLE> cmyk_row;
        if (cmyk) cmyk_row.resize(static_cast<size_t>(cinfo.output_width) * 4);

        while (cinfo.output_scanline < cinfo.output_height) {
            deadline.check();
            const auto y = static_cast<int>(cinfo.output_scanline);
            if (cmyk) {
                JSAMPROW row_ptr = cmyk_row.data();
                jpeg_read_scanlines(&cinfo, &row_ptr, 1);
                cmyk_row_to_rgb(cmyk_row.data(), result.bitmap.row(y), cinfo.output_width,
                                cinfo.saw_Adobe_marker);
            } else {
                JSAMPROW row_ptr = result.bitmap.row(y);
                jpeg_read_scanlines(&cinfo, &row_ptr, 1);
            }
            if (jerr.truncated) {
                throw std::runtime_error("Premature end of JPEG data");
            }
        }

        result.orientation = find_orientation(cinfo);
        jpeg_finish_decompress(&cinfo);
    } catch (const ReportError&) {
        throw;
    } catch (const std::exception& e) {
        throw ReportError(ErrorKind::DecodeFailed, std::string("JPEG decode failed: ") + e.what());
    }
    return result;
}

JpegInfo probe_jpeg(const std::span<const std::uint8_t> data) {
    if (data.size() < 4) {
        throw std::runtime_error("JPEG stream too short");
    }

    jpeg_decompress_struct cinfo{};
    JpegErrorMgr jerr{};
    install_error_handlers(jerr);
    cinfo.err = &jerr.pub;
    DecompressGuard guard{&cinfo};

    jpeg_create_decompress(&cinfo);
    guard.created = true;
    attach_source(cinfo, data);
    if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
        throw std::runtime_error("Invalid JPEG header");
    }
    return JpegInfo{static_cast<int>(cinfo.image_width),
                    static_cast<int>(cinfo.image_height),
                    cinfo.num_components};
}

std::vector<std::uint8_t> encode_jpeg(const Bitmap& bitmap, const int quality, const Deadline& deadline) {
    if (bitmap.channels != 1 && bitmap.channels != 3) {
        throw std::invalid_argument("encode_jpeg expects a gray or RGB bitmap");
    }
    if (bitmap.empty()) {
        throw std::invalid_argument("encode_jpeg: empty bitmap");
    }

    unsigned char* out_buffer = nullptr;
    unsigned long out_size = 0;
    MemDestGuard buffer_guard{out_buffer};

    jpeg_compress_struct cinfo{};
    JpegErrorMgr jerr{};
    install_error_handlers(jerr);
    cinfo.err = &jerr.pub;
    CompressGuard guard{&cinfo};

    try {
        jpeg_create_compress(&cinfo);
        guard.created = true;
        jpeg_mem_dest(&cinfo, &out_buffer, &out_size);

        cinfo.image_width = static_cast<JDIMENSION>(bitmap.width);
        cinfo.image_height = static_cast<JDIMENSION>(bitmap.height);
        cinfo.input_components = bitmap.channels;
        cinfo.in_color_space = bitmap.channels == 1 ? JCS_GRAYSCALE : JCS_RGB;

        jpeg_set_defaults(&cinfo);
        jpeg_set_quality(&cinfo, quality, TRUE);
        cinfo.optimize_coding = TRUE;

        jpeg_start_compress(&cinfo, TRUE);
        while (cinfo.next_scanline < cinfo.image_height) {
            deadline.check();
            JSAMPROW row_ptr = const_cast<JSAMPLE*>(bitmap.row(static_cast<int>(cinfo.next_scanline)));
            jpeg_write_scanlines(&cinfo, &row_ptr, 1);
        }
        jpeg_finish_compress(&cinfo);
    } catch (const ReportError&) {
        throw;
    } catch (const std::exception& e) {
        throw ReportError(ErrorKind::DecodeFailed, std::string("JPEG encode failed: ") + e.what());
    }

    return {out_buffer, out_buffer + out_size};
}

} // namespace maintlog
