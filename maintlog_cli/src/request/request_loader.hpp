#ifndef MAINTLOG_REQUEST_LOADER_HPP
#define MAINTLOG_REQUEST_LOADER_HPP

#include "../../../libmaintlog/include/report_types.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

/**
 * @brief Thrown when the manifest itself cannot be used (missing file,
 * malformed JSON, wrong shape). Problems inside single records are left to
 * the report pipeline.
 */
class ManifestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Reads a report manifest and the files it references.
 *
 * Attachment and logo paths are resolved relative to the manifest's
 * directory. A missing "mime" is detected from the file content. Files that
 * cannot be read are logged and left out of the request.
 *
 * @param manifest Path of the JSON manifest.
 * @throws ManifestError on unreadable or malformed manifests.
 */
[[nodiscard]] maintlog::ReportRequest load_request(const std::filesystem::path& manifest);

/**
 * @brief Reads one attachment file.
 * @param path File to read.
 * @param declared_mime MIME type from the manifest; empty to detect it.
 * @return std::nullopt when the file cannot be read (the failure is logged).
 */
[[nodiscard]] std::optional<maintlog::Attachment> read_attachment(const std::filesystem::path& path,
                                                                  const std::string& declared_mime);

#endif // MAINTLOG_REQUEST_LOADER_HPP
