#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include "../../include/report_config.hpp"
#include <magic.h>
#include <cstring>
#include <memory>

namespace maintlog {

namespace {

struct MagicCloser {
    void operator()(magic_set* m) const { if (m) magic_close(m); }
};

using unique_magic = std::unique_ptr<magic_set, MagicCloser>;

unique_magic open_magic() {
    unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) return {};
    if (magic_load(magic.get(), nullptr) != 0) {
        Logger::log(LogLevel::Debug, std::string("magic_load failed: ") +
                    (magic_error(magic.get()) ? magic_error(magic.get()) : "unknown"), "libmagic");
        return {};
    }
    return magic;
}

std::string finish(std::string mime, const std::span<const std::uint8_t> data) {
    if (mime.empty() || mime == "application/octet-stream") {
        std::string sig = MimeDetector::sniff_signature(data);
        if (!sig.empty()) return sig;
    }
    if (mime.empty()) return "application/octet-stream";
    return canonical_mime(mime);
}

} // namespace

std::string MimeDetector::detect(const std::span<const std::uint8_t> data) {
    if (data.empty()) return "application/x-empty";
    std::string result;
    if (const unique_magic magic = open_magic()) {
        const char* mime = magic_buffer(magic.get(), data.data(), data.size());
        result = mime ? mime : "";
    }
    return finish(std::move(result), data);
}

std::string MimeDetector::sniff_signature(const std::span<const std::uint8_t> data) {
    static constexpr std::uint8_t kPng[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return "image/jpeg";
    }
    if (data.size() >= 8 && std::memcmp(data.data(), kPng, 8) == 0) {
        return "image/png";
    }
    if (data.size() >= 12 && std::memcmp(data.data(), "RIFF", 4) == 0 &&
        std::memcmp(data.data() + 8, "WEBP", 4) == 0) {
        return "image/webp";
    }
    return {};
}

} // namespace maintlog
