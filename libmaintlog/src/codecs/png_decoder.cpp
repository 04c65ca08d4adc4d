#include "../../include/png_decoder.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace maintlog {

    namespace {

        /**
         * @brief libpng error handler that throws a C++ exception.
         * @param msg The error message from libpng.
         */
        void png_error_fn(png_structp, const png_const_charp msg) {
            Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
            throw std::runtime_error(msg);
        }

        /**
         * @brief libpng warning handler.
         * @param msg The warning message from libpng.
         */
        void png_warning_fn(png_structp, const png_const_charp msg) {
            Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
        }

        /**
         * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
         * Ensures png_destroy_read_struct is called even if exceptions occur.
         */
        struct PngRead {
            png_structp png = nullptr;
            png_infop info = nullptr;

            ~PngRead() {
                if (png || info) png_destroy_read_struct(&png, &info, nullptr);
            }
        };

        // in-memory source for png_set_read_fn
        struct MemoryReader {
            std::span<const std::uint8_t> data;
            size_t offset = 0;
        };

        void read_from_memory(const png_structp png, const png_bytep out, const png_size_t length) {
            auto* reader = static_cast<MemoryReader*>(png_get_io_ptr(png));
            if (reader->offset + length > reader->data.size()) {
                png_error(png, "Read past end of PNG data");
            }
            std::memcpy(out, reader->data.data() + reader->offset, length);
            reader->offset += length;
        }

    } // namespace

    DecodedImage PngDecoder::decode(const std::span<const std::uint8_t> data,
                                    const Deadline& deadline,
                                    const size_t max_pixels) const {
        if (data.size() < 8 || png_sig_cmp(data.data(), 0, 8) != 0) {
            throw ReportError(ErrorKind::DecodeFailed, "Not a PNG stream");
        }

        DecodedImage result;
        try {
            PngRead rd;
            rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
            if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
            png_set_error_fn(rd.png, nullptr, png_error_fn, png_warning_fn);

            rd.info = png_create_info_struct(rd.png);
            if (!rd.info) throw std::runtime_error("png_create_info_struct failed");
            if (setjmp(png_jmpbuf(rd.png))) throw std::runtime_error("libpng error");

            MemoryReader reader{data, 0};
            png_set_read_fn(rd.png, &reader, read_from_memory);
            // neither side can exceed the pixel budget on its own
            const auto side_limit = static_cast<png_uint_32>(
                std::min<size_t>(max_pixels, PNG_UINT_31_MAX));
            png_set_user_limits(rd.png, side_limit, side_limit);
            png_read_info(rd.png, rd.info);

            png_uint_32 width = 0, height = 0;
            int bit_depth = 0, color_type = 0, interlace = 0;
            png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type,
                         &interlace, nullptr, nullptr);
            check_pixel_limit(width, height, max_pixels);

            const bool has_trns = png_get_valid(rd.png, rd.info, PNG_INFO_tRNS) != 0;
            const bool gray = color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA;

            if (bit_depth == 16) png_set_strip_16(rd.png);
            if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
            if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
            if (has_trns) png_set_tRNS_to_alpha(rd.png);
            // gray + alpha is delivered as RGBA; plain gray stays one channel
            if (gray && (has_trns || (color_type & PNG_COLOR_MASK_ALPHA))) png_set_gray_to_rgb(rd.png);

            const int passes = png_set_interlace_handling(rd.png);
            png_read_update_info(rd.png, rd.info);

            const int channels = png_get_channels(rd.png, rd.info);
            if (channels != 1 && channels != 3 && channels != 4) {
                throw std::runtime_error("Unexpected PNG channel count " + std::to_string(channels));
            }
            result.bitmap.allocate(static_cast<int>(width), static_cast<int>(height), channels);
            if (png_get_rowbytes(rd.png, rd.info) != result.bitmap.row_bytes()) {
                throw std::runtime_error("Rowbytes mismatch");
            }

            Logger::log(LogLevel::Debug,
                        "PNG " + std::to_string(width) + "x" + std::to_string(height) +
                        " channels=" + std::to_string(channels) +
                        (interlace != PNG_INTERLACE_NONE ? " interlaced" : ""),
                        "png_decoder");

            for (int pass = 0; pass < passes; ++pass) {
                for (png_uint_32 y = 0; y < height; ++y) {
                    deadline.check();
                    png_read_row(rd.png, result.bitmap.row(static_cast<int>(y)), nullptr);
                }
            }
            png_read_end(rd.png, nullptr);
        } catch (const ReportError&) {
            throw;
        } catch (const std::exception& e) {
            throw ReportError(ErrorKind::DecodeFailed, std::string("PNG decode failed: ") + e.what());
        }
        return result;
    }

} // namespace maintlog
