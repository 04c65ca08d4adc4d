#include "test_helpers.hpp"

#include "../libmaintlog/include/decoder_registry.hpp"
#include "../libmaintlog/include/image_normalizer.hpp"
#include "../libmaintlog/include/image_transform.hpp"
#include "../libmaintlog/include/jpeg_codec.hpp"
#include "../libmaintlog/include/mime_detector.hpp"

#include <cassert>
#include <chrono>
#include <stdexcept>
#include <string>
#include <variant>

using namespace maintlog;

namespace {

const NormalizedImage& ok(const Outcome<NormalizedImage>& outcome) {
    assert(std::holds_alternative<NormalizedImage>(outcome));
    return std::get<NormalizedImage>(outcome);
}

ErrorKind failure(const Outcome<NormalizedImage>& outcome) {
    assert(std::holds_alternative<ReportError>(outcome));
    return std::get<ReportError>(outcome).kind();
}

} // namespace

int main() {
    ReportConfig config;
    const DecoderRegistry registry;
    const ImageNormalizer normalizer(config, registry);

    assert(registry.find_by_mime("image/jpeg") != nullptr);
    assert(registry.find_by_mime("image/png") != nullptr);
    assert(registry.find_by_mime("image/webp") != nullptr);
    assert(registry.find_by_mime("image/gif") == nullptr);

    // small image is re-encoded, not resized
    {
        const auto& image = ok(normalizer.normalize(test::jpeg_attachment(320, 240), 3, 1600));
        assert(image.width == 320 && image.height == 240);
        assert(image.components == 3);
        assert(image.source_index == 3);
        const JpegInfo info = probe_jpeg(image.jpeg);
        assert(info.width == 320 && info.height == 240);
    }

    // large photo is fitted to the longest side, aspect preserved
    {
        ReportConfig big = config;
        big.max_attachment_bytes = 64u * 1024u * 1024u;
        big.attachment_timeout = std::chrono::milliseconds(120000);
        const ImageNormalizer relaxed(big, registry);
        const auto& image = ok(relaxed.normalize(test::jpeg_attachment(4000, 3000), 0, 1600));
        assert(image.width == 1600);
        assert(image.height == 1200);
        const JpegInfo info = probe_jpeg(image.jpeg);
        assert(info.width == 1600 && info.height == 1200);
    }

    // EXIF orientation 6 swaps width and height
    {
        Attachment att{test::with_exif_orientation(test::jpeg_bytes(40, 20), 6), "image/jpeg", "rotated.jpg"};
        const auto& image = ok(normalizer.normalize(att, 0, 1600));
        assert(image.width == 20 && image.height == 40);
    }
    {
        std::vector<std::uint8_t> app1 = {'E', 'x', 'i', 'f', 0, 0, 'I', 'I', 42, 0, 8, 0, 0, 0,
                                          1, 0, 0x12, 0x01, 3, 0, 1, 0, 0, 0, 8, 0, 0, 0};
        assert(exif_orientation(app1) == 8);
        app1[24] = 9;
        assert(exif_orientation(app1) == 1);
        assert(exif_orientation(std::vector<std::uint8_t>{'J', 'F', 'I', 'F'}) == 1);
    }

    // PNG alpha is flattened onto white
    {
        Attachment att{test::png_half_transparent(32, 16), "image/png", "mark.png"};
        const auto& image = ok(normalizer.normalize(att, 0, 1600));
        assert(image.components == 3);
        const DecodedImage decoded = JpegDecoder().decode(image.jpeg, Deadline(), config.max_decoded_pixels);
        const std::uint8_t* row = decoded.bitmap.row(8);
        // transparent right edge is white, opaque left edge is red
        const std::uint8_t* right = row + 30 * 3;
        assert(right[0] > 235 && right[1] > 235 && right[2] > 235);
        const std::uint8_t* left = row + 1 * 3;
        assert(left[0] > 200 && left[1] < 60 && left[2] < 60);
    }

    // grayscale stays grayscale
    {
        Attachment att{test::jpeg_bytes(64, 64, 1), "image/jpeg", "gray.jpg"};
        assert(ok(normalizer.normalize(att, 0, 1600)).components == 1);
    }

    // content wins over a wrong but supported declaration
    {
        Attachment att{test::jpeg_bytes(50, 30), "image/png", "misnamed.png"};
        const auto& image = ok(normalizer.normalize(att, 0, 1600));
        assert(image.width == 50 && image.height == 30);
    }

    // "image/jpg" is an alias
    {
        Attachment att{test::jpeg_bytes(16, 16), "image/jpg", "alias.jpg"};
        assert(std::holds_alternative<NormalizedImage>(normalizer.normalize(att, 0, 1600)));
    }

    // size limit comes first
    {
        ReportConfig tight = config;
        tight.max_attachment_bytes = 100;
        const ImageNormalizer limited(tight, registry);
        assert(failure(limited.normalize(test::jpeg_attachment(200, 200), 0, 1600)) ==
               ErrorKind::AttachmentTooLarge);
    }

    // unsupported declarations
    {
        Attachment gif{{'G', 'I', 'F', '8', '9', 'a', 1, 0, 1, 0}, "image/gif", "anim.gif"};
        assert(failure(normalizer.normalize(gif, 0, 1600)) == ErrorKind::UnsupportedFormat);
        Attachment pdf{{'%', 'P', 'D', 'F', '-', '1', '.', '4'}, "application/pdf", "doc.pdf"};
        assert(failure(normalizer.normalize(pdf, 0, 1600)) == ErrorKind::UnsupportedFormat);
    }

    // empty and corrupt data
    {
        Attachment empty{{}, "image/jpeg", "empty.jpg"};
        assert(failure(normalizer.normalize(empty, 0, 1600)) == ErrorKind::DecodeFailed);

        std::vector<std::uint8_t> bytes = test::jpeg_bytes(256, 256);
        bytes.resize(bytes.size() / 2);
        Attachment truncated{bytes, "image/jpeg", "cut.jpg"};
        assert(failure(normalizer.normalize(truncated, 0, 1600)) == ErrorKind::DecodeFailed);

        Attachment noise{{0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n', 1, 2, 3, 4}, "image/png", "noise.png"};
        assert(failure(normalizer.normalize(noise, 0, 1600)) == ErrorKind::DecodeFailed);
    }

    // a tiny file declaring a huge frame is refused before the raster is allocated
    {
        const std::vector<std::uint8_t> bytes = test::with_declared_size(test::jpeg_bytes(16, 16), 30000, 30000);
        assert(bytes.size() < 1024);
        assert(probe_jpeg(bytes).width == 30000);

        ReportConfig quick = config;
        quick.attachment_timeout = std::chrono::milliseconds(50);
        const ImageNormalizer bounded(quick, registry);
        const auto started = std::chrono::steady_clock::now();
        const auto outcome = bounded.normalize(Attachment{bytes, "image/jpeg", "huge.jpg"}, 0, 1600);
        const auto elapsed = std::chrono::steady_clock::now() - started;
        assert(failure(outcome) == ErrorKind::DecodeFailed);
        assert(std::string(std::get<ReportError>(outcome).what()).find("decode limit") != std::string::npos);
        assert(elapsed < std::chrono::seconds(1));

        // the limit is configurable: a 64x64 photo passes at 4096 pixels and fails below
        ReportConfig small = config;
        small.max_decoded_pixels = 4096;
        assert(std::holds_alternative<NormalizedImage>(
            ImageNormalizer(small, registry).normalize(test::jpeg_attachment(64, 64), 0, 1600)));
        small.max_decoded_pixels = 4095;
        assert(failure(ImageNormalizer(small, registry).normalize(test::jpeg_attachment(64, 64), 0, 1600)) ==
               ErrorKind::DecodeFailed);
        assert(failure(ImageNormalizer(small, registry).normalize(
                   Attachment{test::png_half_transparent(80, 80), "image/png", "big.png"}, 0, 1600)) ==
               ErrorKind::DecodeFailed);

        bool rejected = false;
        try {
            check_pixel_limit(65500, 65500, quick.max_decoded_pixels);
        } catch (const ReportError& e) {
            rejected = e.kind() == ErrorKind::DecodeFailed;
        }
        assert(rejected);

        ReportConfig invalid = config;
        invalid.max_decoded_pixels = 0;
        bool invalid_thrown = false;
        try {
            invalid.validate();
        } catch (const std::invalid_argument&) {
            invalid_thrown = true;
        }
        assert(invalid_thrown);
    }

    // an exhausted time budget is a decode failure
    {
        const Deadline expired(std::chrono::milliseconds(0));
        const auto outcome = normalizer.normalize(test::jpeg_attachment(64, 64), 0, 1600, expired);
        assert(failure(outcome) == ErrorKind::DecodeFailed);
        assert(std::string(std::get<ReportError>(outcome).what()) == "timed out");
    }

    // geometry helpers
    {
        assert(fit_within(4000, 3000, 1600) == std::make_pair(1600, 1200));
        assert(fit_within(3000, 4000, 1600) == std::make_pair(1200, 1600));
        assert(fit_within(800, 600, 1600) == std::make_pair(800, 600));
        assert(fit_within(10000, 1, 100) == std::make_pair(100, 1));
    }

    assert(MimeDetector::sniff_signature(test::jpeg_bytes(8, 8)) == "image/jpeg");
    assert(MimeDetector::sniff_signature(test::png_half_transparent(4, 4)) == "image/png");
    assert(MimeDetector::detect(std::span<const std::uint8_t>()) == "application/x-empty");
    return 0;
}
