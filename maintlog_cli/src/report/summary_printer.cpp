#include "summary_printer.hpp"
#include "../../utils/color.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::string attachment_column(const maintlog::Warning& w) {
    return w.attachment_index ? std::to_string(*w.attachment_index + 1) : "-";
}

std::string record_column(const maintlog::Warning& w) {
    return w.record_id.empty() ? "(report)" : w.record_id;
}

} // namespace

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

void print_console_summary(const maintlog::ReportResult& result,
                           const std::filesystem::path& output_path,
                           const double total_seconds) {
    const bool use_colors = stderr_is_tty();

    if (!result.warnings.empty()) {
        size_t max_record = 8;
        size_t max_kind = 6;
        for (const auto& w : result.warnings) {
            max_record = std::max(max_record, record_column(w).size() + 2);
            max_kind = std::max(max_kind, std::string(maintlog::to_string(w.kind)).size() + 2);
        }
        constexpr int photo_width = 7;

        std::cerr << "\n"
                  << std::left << std::setw(static_cast<int>(max_record)) << "Record"
                  << std::setw(photo_width) << "Photo"
                  << std::setw(static_cast<int>(max_kind)) << "Kind"
                  << "Reason"
                  << "\n";
        for (const auto& w : result.warnings) {
            std::cerr << std::left << std::setw(static_cast<int>(max_record)) << record_column(w)
                      << std::setw(photo_width) << attachment_column(w);
            if (use_colors) std::cerr << YELLOW;
            std::cerr << std::setw(static_cast<int>(max_kind)) << maintlog::to_string(w.kind);
            if (use_colors) std::cerr << RESET;
            std::cerr << w.reason << "\n";
        }
    }

    std::cerr << "\n";
    if (const auto* error = result.error()) {
        if (use_colors) std::cerr << RED;
        std::cerr << "Report not generated: " << maintlog::to_string(error->kind()) << " (" << error->what() << ")";
        if (use_colors) std::cerr << RESET;
        std::cerr << "\n";
    } else {
        if (use_colors) std::cerr << GREEN;
        std::cerr << "Wrote " << output_path.string();
        if (use_colors) std::cerr << RESET;
        std::cerr << " (" << result.record_count << " record" << (result.record_count == 1 ? "" : "s")
                  << ", " << result.page_count << " page" << (result.page_count == 1 ? "" : "s")
                  << ", " << (result.bytes().size() / 1024) << " KB)\n";
    }
    std::cerr << "Warnings: " << result.warnings.size() << "\n";
    std::cerr << "Total time: " << std::fixed << std::setprecision(2) << total_seconds << " s\n";
}

bool export_warnings_csv(const maintlog::ReportResult& result,
                         const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "Record,Photo,Kind,Reason\n";
    for (const auto& w : result.warnings) {
        out << csv_escape(w.record_id) << ","
            << (w.attachment_index ? std::to_string(*w.attachment_index + 1) : "") << ","
            << maintlog::to_string(w.kind) << ","
            << csv_escape(w.reason) << "\n";
    }

    out << "\n\nRecords,Pages,Result\n";
    if (const auto* error = result.error()) {
        out << result.record_count << "," << result.page_count << ","
            << csv_escape(std::string(maintlog::to_string(error->kind())) + ": " + error->what()) << "\n";
    } else {
        out << result.record_count << "," << result.page_count << ",OK\n";
    }
    return static_cast<bool>(out);
}
