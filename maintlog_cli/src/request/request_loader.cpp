#include "request_loader.hpp"
#include "../../../libmaintlog/include/logger.hpp"
#include "../../../libmaintlog/include/mime_detector.hpp"
#include "../../../libmaintlog/include/text_utils.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::string string_field(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    throw ManifestError(std::string("field '") + key + "' must be a string");
}

std::optional<maintlog::Timestamp> timestamp_field(const json& j, const char* key, const std::string& context) {
    const std::string text = string_field(j, key);
    if (text.empty()) return std::nullopt;
    auto ts = maintlog::parse_iso8601(text);
    if (!ts) {
        Logger::log(LogLevel::Warning, context + ": '" + text + "' is not an ISO 8601 timestamp", "manifest");
    }
    return ts;
}

fs::path resolve(const fs::path& base, const std::string& relative) {
    const fs::path p(relative);
    return p.is_absolute() ? p : base / p;
}

maintlog::LogRecord parse_record(const json& j, const fs::path& base, const size_t position) {
    if (!j.is_object()) {
        throw ManifestError("records[" + std::to_string(position) + "] is not an object");
    }

    maintlog::LogRecord record;
    record.id = string_field(j, "id");
    if (record.id.empty()) record.id = "#" + std::to_string(position + 1);
    record.title = string_field(j, "title");
    record.category = string_field(j, "category");
    record.location = string_field(j, "location");
    record.description = string_field(j, "description");
    record.created_by = string_field(j, "createdBy");
    record.created_at = timestamp_field(j, "createdAt", "record " + record.id);

    const auto attachments = j.find("attachments");
    if (attachments == j.end() || attachments->is_null()) return record;
    if (!attachments->is_array()) {
        throw ManifestError("record " + record.id + ": 'attachments' must be an array");
    }

    for (const auto& a : *attachments) {
        std::string path;
        std::string mime;
        if (a.is_string()) {
            path = a.get<std::string>();
        } else if (a.is_object()) {
            path = string_field(a, "path");
            mime = string_field(a, "mime");
        }
        if (path.empty()) {
            Logger::log(LogLevel::Error, "record " + record.id + ": attachment without a path ignored", "manifest");
            continue;
        }
        if (auto attachment = read_attachment(resolve(base, path), mime)) {
            record.attachments.push_back(std::move(*attachment));
        }
    }
    return record;
}

} // namespace

std::optional<maintlog::Attachment> read_attachment(const fs::path& path, const std::string& declared_mime) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        Logger::log(LogLevel::Error, "Cannot open attachment: " + path.string(), "manifest");
        return std::nullopt;
    }

    maintlog::Attachment attachment;
    attachment.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        Logger::log(LogLevel::Error, "Cannot read attachment: " + path.string(), "manifest");
        return std::nullopt;
    }

    attachment.file_name = path.filename().string();
    attachment.mime_type = declared_mime.empty() ? maintlog::MimeDetector::detect(attachment.bytes) : declared_mime;
    Logger::log(LogLevel::Debug, attachment.file_name + " (" + attachment.mime_type + ", " +
                std::to_string(attachment.size()) + " bytes)", "manifest");
    return attachment;
}

maintlog::ReportRequest load_request(const fs::path& manifest) {
    std::ifstream in(manifest);
    if (!in.is_open()) {
        throw ManifestError("cannot open manifest " + manifest.string());
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ManifestError("malformed manifest " + manifest.string() + ": " + e.what());
    }
    if (!j.is_object()) {
        throw ManifestError("manifest root must be an object");
    }

    const fs::path base = manifest.has_parent_path() ? manifest.parent_path() : fs::path(".");
    maintlog::ReportRequest request;

    if (const auto org = j.find("organization"); org != j.end() && !org->is_null()) {
        if (org->is_string()) {
            request.branding.organization = org->get<std::string>();
        } else if (org->is_object()) {
            request.branding.organization = string_field(*org, "name");
            request.branding.department = string_field(*org, "department");
            if (const std::string logo = string_field(*org, "logo"); !logo.empty()) {
                request.branding.logo = read_attachment(resolve(base, logo), string_field(*org, "logoMime"));
            }
        } else {
            throw ManifestError("'organization' must be an object");
        }
    }

    if (const std::string title = string_field(j, "title"); !title.empty()) {
        request.branding.report_title = title;
    }
    if (const auto ts = timestamp_field(j, "generatedAt", "manifest")) {
        request.generated_at = *ts;
    }

    const auto records = j.find("records");
    if (records == j.end() || !records->is_array()) {
        throw ManifestError("manifest has no 'records' array");
    }
    request.records.reserve(records->size());
    for (size_t i = 0; i < records->size(); ++i) {
        request.records.push_back(parse_record((*records)[i], base, i));
    }

    Logger::log(LogLevel::Info, "Loaded " + std::to_string(request.records.size()) + " records from " +
                manifest.string(), "manifest");
    return request;
}
