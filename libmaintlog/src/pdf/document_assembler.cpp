#include "../../include/document_assembler.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_utils.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <algorithm>
#include <iomanip>
#include <locale>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace maintlog {

namespace {

// helper: custom streambuf to redirect qpdf messages into our logger
struct LoggerStreamBuf final : std::stringbuf {
    LogLevel level;
    std::string module;
    LoggerStreamBuf(const LogLevel lvl, const char* mod) : level(lvl), module(mod) {}
    int sync() override {
        std::string s = str();
        if (!s.empty()) {
            while (!s.empty() && s.back() == '\n') s.pop_back();
            Logger::log(level, s, module);
            str("");
        }
        return 0;
    }
    ~LoggerStreamBuf() override { LoggerStreamBuf::sync(); }
};

/**
 * @brief Accumulates PDF content stream operators in user space.
 */
class ContentWriter {
public:
    ContentWriter() { out_.imbue(std::locale::classic()); }

    void fill_rect(const double x, const double y, const double w, const double h, const Color& c) {
        color(c, "rg");
        num(x); num(y); num(w); num(h);
        out_ << "re f\n";
    }

    void stroke_rect(const double x, const double y, const double w, const double h, const Color& c,
                     const double line_width) {
        color(c, "RG");
        num(line_width);
        out_ << "w ";
        num(x); num(y); num(w); num(h);
        out_ << "re S\n";
    }

    void text(const double x, const double baseline, const Font font, const double size, const Color& c,
              const std::string& encoded) {
        out_ << "BT /" << font_resource_name(font) << ' ';
        num(size);
        out_ << "Tf ";
        color(c, "rg");
        num(x); num(baseline);
        out_ << "Td (" << escape_pdf_string(encoded) << ") Tj ET\n";
    }

    void image(const std::string& name, const double x, const double y, const double w, const double h) {
        out_ << "q ";
        num(w); out_ << "0 0 "; num(h); num(x); num(y);
        out_ << "cm /" << name << " Do Q\n";
    }

    void push_clip(const double x, const double y, const double w, const double h) {
        out_ << "q ";
        num(x); num(y); num(w); num(h);
        out_ << "re W n\n";
    }

    void pop() { out_ << "Q\n"; }

    [[nodiscard]] std::string str() const { return out_.str(); }

private:
    void num(const double v) {
        out_ << std::fixed << std::setprecision(2) << v << ' ';
    }

    void color(const Color& c, const char* op) {
        out_ << std::fixed << std::setprecision(3) << c.r << ' ' << c.g << ' ' << c.b << ' ' << op << ' ';
    }

    std::ostringstream out_;
};

/**
 * @brief Image XObjects of the document, embedded once per distinct image.
 */
class ImageTable {
public:
    explicit ImageTable(QPDF& pdf) : pdf_(pdf) {}

    /**
     * @return Resource name of the XObject, or std::nullopt when the data
     * does not verify as the JPEG it claims to be.
     */
    std::optional<std::string> resolve(const NormalizedImage& image, std::string& failure) {
        if (const auto it = names_.find(&image); it != names_.end()) return it->second;
        if (const auto it = failures_.find(&image); it != failures_.end()) {
            failure = it->second;
            return std::nullopt;
        }

        try {
            const JpegInfo info = probe_jpeg(image.jpeg);
            if (info.width != image.width || info.height != image.height) {
                throw std::runtime_error("dimensions do not match the JPEG header");
            }
            if (info.components != 1 && info.components != 3) {
                throw std::runtime_error("unexpected component count " + std::to_string(info.components));
            }

            QPDFObjectHandle stream = QPDFObjectHandle::newStream(&pdf_);
            QPDFObjectHandle dict = stream.getDict();
            dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
            dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
            dict.replaceKey("/Width", QPDFObjectHandle::newInteger(info.width));
            dict.replaceKey("/Height", QPDFObjectHandle::newInteger(info.height));
            dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName(
                info.components == 1 ? "/DeviceGray" : "/DeviceRGB"));
            dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
            stream.replaceStreamData(
                std::string(reinterpret_cast<const char*>(image.jpeg.data()), image.jpeg.size()),
                QPDFObjectHandle::newName("/DCTDecode"),
                QPDFObjectHandle::newNull());

            std::string name = "Im" + std::to_string(objects_.size() + 1);
            objects_.emplace(name, stream);
            names_.emplace(&image, name);
            return name;
        } catch (const QPDFExc&) {
            throw; // writer-level failure
        } catch (const std::exception& e) {
            failure = e.what();
            failures_.emplace(&image, failure);
            return std::nullopt;
        }
    }

    [[nodiscard]] QPDFObjectHandle object(const std::string& name) const { return objects_.at(name); }

private:
    QPDF& pdf_;
    std::map<const NormalizedImage*, std::string> names_;
    std::map<const NormalizedImage*, std::string> failures_;
    std::map<std::string, QPDFObjectHandle> objects_;
};

struct PageFrame {
    double width;
    double height;
    double margin;
    double content_top;    ///< y of the content area's top edge
    double content_bottom;
    double content_width;
};

void draw_placeholder(ContentWriter& cw, const double x, const double y, const double w, const double h) {
    cw.fill_rect(x, y, w, h, palette::light_gray);
    cw.stroke_rect(x, y, w, h, palette::dark_gray, 0.75);
    const std::string label = encode_win_ansi("Image unavailable");
    const double tw = measure_text(label, Font::Regular, 10);
    cw.text(x + std::max(0.0, (w - tw) / 2.0), y + h / 2.0 - 3.5, Font::Regular, 10, palette::dark_gray, label);
}

} // namespace

Outcome<AssembledDocument> DocumentAssembler::assemble(const std::vector<Page>& pages,
                                                       const Timestamp generated_at) const {
    if (pages.empty()) {
        return ReportError(ErrorKind::AssemblyError, "no pages to assemble");
    }
    const RunningContent empty_running;
    const RunningContent& running = pages.front().running ? *pages.front().running : empty_running;

    const PageGeometry& geo = config_.page;
    const PageFrame frame{geo.width, geo.height, geo.margin,
                          geo.height - geo.margin - geo.header_height,
                          geo.margin + geo.footer_height,
                          geo.content_width()};

    AssembledDocument result;
    try {
        LoggerStreamBuf warn_buf(LogLevel::Warning, "qpdf");
        LoggerStreamBuf err_buf(LogLevel::Error, "qpdf");
        std::ostream warn_os(&warn_buf);
        std::ostream err_os(&err_buf);

        QPDF pdf;
        auto qlogger = QPDFLogger::create();
        qlogger->setOutputStreams(&warn_os, &err_os);
        pdf.setLogger(qlogger);
        pdf.emptyPDF();

        auto make_font = [&](const Font font) {
            QPDFObjectHandle dict = QPDFObjectHandle::newDictionary();
            dict.replaceKey("/Type", QPDFObjectHandle::newName("/Font"));
            dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Type1"));
            dict.replaceKey("/BaseFont", QPDFObjectHandle::newName("/" + std::string(base_font_name(font))));
            dict.replaceKey("/Encoding", QPDFObjectHandle::newName("/WinAnsiEncoding"));
            return pdf.makeIndirectObject(dict);
        };
        QPDFObjectHandle fonts = QPDFObjectHandle::newDictionary();
        fonts.replaceKey("/" + std::string(font_resource_name(Font::Regular)), make_font(Font::Regular));
        fonts.replaceKey("/" + std::string(font_resource_name(Font::Bold)), make_font(Font::Bold));

        ImageTable images(pdf);

        // logo, verified once for all pages
        std::optional<std::string> logo_name;
        if (running.logo) {
            std::string failure;
            logo_name = images.resolve(*running.logo, failure);
            if (!logo_name) {
                result.warnings.push_back(Warning{"", std::nullopt, ErrorKind::DecodeFailed,
                                                  "logo could not be embedded: " + failure});
                Logger::log(LogLevel::Warning, "Logo dropped: " + failure, "document_assembler");
            }
        }

        const std::string organization = encode_win_ansi(running.organization);
        const std::string department = encode_win_ansi(running.department);
        const std::string report_title = encode_win_ansi(running.report_title);
        const std::string footer_left = encode_win_ansi(
            "Generated on " + running.generated_at + " | " + running.organization + " | CONFIDENTIAL");

        QPDFPageDocumentHelper page_helper(pdf);

        for (const Page& page : pages) {
            ContentWriter cw;
            std::map<std::string, bool> used_images;

            // running header
            const double header_top = frame.height - frame.margin;
            double text_x = frame.margin;
            if (logo_name) {
                const double box_h = geo.header_height - 12.0;
                const double scale = std::min({1.0,
                                               box_h / static_cast<double>(running.logo->height),
                                               120.0 / static_cast<double>(running.logo->width)});
                const double lw = running.logo->width * scale;
                const double lh = running.logo->height * scale;
                cw.image(*logo_name, frame.margin, header_top - lh, lw, lh);
                used_images[*logo_name] = true;
                text_x += lw + 10.0;
            }
            const double title_w = measure_text(report_title, Font::Regular, 9);
            const double name_w = frame.margin + frame.content_width - text_x - title_w - 12.0;
            cw.text(text_x, header_top - 18.0, Font::Bold, 13, palette::primary,
                    truncate_to_width(organization, Font::Bold, 13, std::max(40.0, name_w)));
            if (!department.empty()) {
                cw.text(text_x, header_top - 32.0, Font::Regular, 9, palette::dark_gray,
                        truncate_to_width(department, Font::Regular, 9, std::max(40.0, name_w)));
            }
            cw.text(frame.margin + frame.content_width - title_w, header_top - 18.0, Font::Regular, 9,
                    palette::secondary, report_title);
            cw.fill_rect(frame.margin, frame.content_top + 6.0, frame.content_width, 1.5, palette::primary);

            // content
            for (const PlacedBlock& placed : page.blocks) {
                const double block_top = frame.content_top - placed.top;
                const bool clip = placed.block.height > frame.content_top - frame.content_bottom;
                if (clip) {
                    cw.push_clip(frame.margin, frame.content_bottom, frame.content_width,
                                 frame.content_top - frame.content_bottom);
                }
                for (const DrawOp& op : placed.block.ops) {
                    if (const auto* r = std::get_if<FilledRect>(&op)) {
                        cw.fill_rect(frame.margin + r->x, block_top - r->y - r->height, r->width, r->height, r->color);
                    } else if (const auto* s = std::get_if<StrokedRect>(&op)) {
                        cw.stroke_rect(frame.margin + s->x, block_top - s->y - s->height, s->width, s->height,
                                       s->color, s->line_width);
                    } else if (const auto* t = std::get_if<TextRun>(&op)) {
                        cw.text(frame.margin + t->x, block_top - t->baseline, t->font, t->size, t->color, t->text);
                    } else if (const auto* im = std::get_if<ImagePlacement>(&op)) {
                        const double x = frame.margin + im->x;
                        const double y = block_top - im->y - im->height;
                        std::string failure = "missing image data";
                        std::optional<std::string> name;
                        if (im->image) name = images.resolve(*im->image, failure);
                        if (name) {
                            cw.image(*name, x, y, im->width, im->height);
                            used_images[*name] = true;
                        } else {
                            draw_placeholder(cw, x, y, im->width, im->height);
                            result.warnings.push_back(Warning{
                                placed.block.record_id,
                                im->image ? std::optional<size_t>(im->image->source_index) : std::nullopt,
                                ErrorKind::DecodeFailed,
                                "image could not be embedded: " + failure});
                            Logger::log(LogLevel::Warning, "Placeholder for record '" + placed.block.record_id +
                                        "': " + failure, "document_assembler");
                        }
                    }
                }
                if (clip) cw.pop();
            }

            // running footer
            const std::string page_label = "Page " + std::to_string(page.number) + " of " + std::to_string(page.total);
            const double label_w = measure_text(page_label, Font::Regular, 8);
            cw.fill_rect(frame.margin, frame.content_bottom - 6.0, frame.content_width, 0.75, palette::medium_gray);
            cw.text(frame.margin, frame.margin + 8.0, Font::Regular, 8, palette::dark_gray,
                    truncate_to_width(footer_left, Font::Regular, 8, frame.content_width - label_w - 12.0));
            cw.text(frame.margin + frame.content_width - label_w, frame.margin + 8.0, Font::Regular, 8,
                    palette::dark_gray, page_label);

            QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
            for (const auto& [name, used] : used_images) {
                if (used) xobjects.replaceKey("/" + name, images.object(name));
            }
            QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
            resources.replaceKey("/Font", fonts);
            if (!used_images.empty()) resources.replaceKey("/XObject", xobjects);

            QPDFObjectHandle media_box = QPDFObjectHandle::newArray();
            media_box.appendItem(QPDFObjectHandle::newInteger(0));
            media_box.appendItem(QPDFObjectHandle::newInteger(0));
            media_box.appendItem(QPDFObjectHandle::newReal(frame.width, 2));
            media_box.appendItem(QPDFObjectHandle::newReal(frame.height, 2));

            QPDFObjectHandle page_dict = QPDFObjectHandle::newDictionary();
            page_dict.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
            page_dict.replaceKey("/MediaBox", media_box);
            page_dict.replaceKey("/Resources", resources);
            page_dict.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, cw.str()));

            page_helper.addPage(QPDFPageObjectHelper(pdf.makeIndirectObject(page_dict)), false);
        }

        QPDFObjectHandle info = QPDFObjectHandle::newDictionary();
        info.replaceKey("/Title", QPDFObjectHandle::newUnicodeString(running.report_title));
        info.replaceKey("/Author", QPDFObjectHandle::newUnicodeString(running.organization));
        info.replaceKey("/Subject", QPDFObjectHandle::newUnicodeString(running.department));
        info.replaceKey("/Producer", QPDFObjectHandle::newUnicodeString("maintlog"));
        info.replaceKey("/CreationDate", QPDFObjectHandle::newString(format_utc(generated_at, "D:%Y%m%d%H%M%SZ")));
        pdf.getTrailer().replaceKey("/Info", pdf.makeIndirectObject(info));

        QPDFWriter writer(pdf);
        writer.setOutputMemory();
        writer.setCompressStreams(true);
        writer.setDeterministicID(true);
        writer.write();

        const std::shared_ptr<Buffer> buffer = writer.getBufferSharedPointer();
        result.bytes.assign(buffer->getBuffer(), buffer->getBuffer() + buffer->getSize());
        result.page_count = pages.size();
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("PDF assembly failed: ") + e.what(), "document_assembler");
        return ReportError(ErrorKind::AssemblyError, e.what());
    }

    Logger::log(LogLevel::Info, "Assembled " + std::to_string(result.page_count) + " pages, " +
                std::to_string(result.bytes.size()) + " bytes", "document_assembler");
    return result;
}

} // namespace maintlog
