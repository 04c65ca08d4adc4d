#include "test_helpers.hpp"

#include "request/request_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace {

void write_file(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
}

void write_bytes(const fs::path& path, const std::vector<std::uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

bool throws_manifest_error(const fs::path& path) {
    try {
        (void)load_request(path);
    } catch (const ManifestError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    const fs::path dir = fs::temp_directory_path() / "maintlog_request_loader_test";
    fs::remove_all(dir);
    fs::create_directories(dir / "photos");

    write_bytes(dir / "photos" / "leak.jpg", test::jpeg_bytes(64, 48));
    write_bytes(dir / "logo.png", test::png_half_transparent(32, 16));

    const fs::path manifest = dir / "report.json";
    write_file(manifest, R"({
  "organization": {"name": "South Dade Academy", "department": "Facilities", "logo": "logo.png"},
  "title": "Weekly Maintenance Report",
  "generatedAt": "2025-03-14T09:30:00Z",
  "records": [
    {"id": "A", "title": "Leak", "category": "Plumbing", "location": "Room 12",
     "description": "Dripping ceiling.", "createdAt": "2025-03-13T08:00:00Z", "createdBy": "J. Rivera",
     "attachments": [{"path": "photos/leak.jpg", "mime": "image/jpeg"},
                     {"path": "photos/missing.jpg", "mime": "image/jpeg"},
                     "photos/leak.jpg"]},
    {"id": 42, "title": "Flicker", "category": "Electrical", "description": "Hall light.",
     "createdAt": "yesterday"},
    {"title": "No id", "category": "Other", "description": "x", "createdAt": "2025-03-13"}
  ]
})");

    const maintlog::ReportRequest request = load_request(manifest);
    assert(request.branding.organization == "South Dade Academy");
    assert(request.branding.department == "Facilities");
    assert(request.branding.report_title == "Weekly Maintenance Report");
    assert(request.generated_at == test::at("2025-03-14T09:30:00Z"));

    // logo MIME comes from the content
    assert(request.branding.logo.has_value());
    assert(request.branding.logo->mime_type == "image/png");
    assert(request.branding.logo->file_name == "logo.png");

    assert(request.records.size() == 3);
    const auto& a = request.records[0];
    assert(a.id == "A");
    assert(a.created_by == "J. Rivera");
    assert(a.created_at == test::at("2025-03-13T08:00:00Z"));
    // the missing file is skipped, the bare path is detected
    assert(a.attachments.size() == 2);
    assert(a.attachments[0].mime_type == "image/jpeg");
    assert(a.attachments[1].mime_type == "image/jpeg");
    assert(a.attachments[0].bytes == a.attachments[1].bytes);
    assert(a.attachments[0].file_name == "leak.jpg");

    // numeric ids are accepted, bad timestamps are left for validation
    assert(request.records[1].id == "42");
    assert(!request.records[1].created_at.has_value());
    assert(request.records[1].attachments.empty());
    assert(request.records[2].id == "#3");

    // default title when none is given
    write_file(dir / "minimal.json", R"({"organization": "Acme", "records": []})");
    const auto minimal = load_request(dir / "minimal.json");
    assert(minimal.branding.organization == "Acme");
    assert(minimal.branding.report_title == "Maintenance Service Report");
    assert(minimal.records.empty());

    // unusable manifests
    write_file(dir / "broken.json", "{ \"records\": [ ");
    assert(throws_manifest_error(dir / "broken.json"));
    write_file(dir / "norecords.json", R"({"organization": {"name": "Acme"}})");
    assert(throws_manifest_error(dir / "norecords.json"));
    write_file(dir / "array.json", "[]");
    assert(throws_manifest_error(dir / "array.json"));
    write_file(dir / "badtype.json", R"({"records": [{"id": "A", "title": ["x"]}]})");
    assert(throws_manifest_error(dir / "badtype.json"));
    assert(throws_manifest_error(dir / "does_not_exist.json"));

    std::error_code ec;
    fs::remove_all(dir, ec);
    return 0;
}
