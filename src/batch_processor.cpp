#include "batch_processor.hpp"
#include "logging.hpp"
#include "outline_extractor.hpp"
#include "pdf_utils.hpp"
#include "string_utils.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem/fstream.hpp>

#include <algorithm>
#include <exception>

std::optional<Outline_Document> outline_pdf_file(const std::string& file_path, const std::string& password) {
    std::optional<PDF_Document> pdf_document = parse_pdf_file(file_path, password);
    if (!pdf_document) {
        return std::nullopt;
    }
    return extract_outline(pdf_document.value());
}

bool write_outline_file(const Outline_Document& document, const boost::filesystem::path& output_path) {
    // serialize first, so a failure there leaves no file at all
    std::string json = format_outline_document(document);

    boost::filesystem::path temporary_path = output_path;
    temporary_path += ".tmp";

    {
        boost::filesystem::ofstream out(temporary_path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out) {
            LOG_CHANNEL_ERROR(LOG_CHANNEL_BATCH) << "cannot open " << temporary_path.string() << " for writing";
            return false;
        }
        out << json << '\n';
        out.close();
        if (!out) {
            LOG_CHANNEL_ERROR(LOG_CHANNEL_BATCH) << "cannot write " << temporary_path.string();
            boost::system::error_code ignored;
            boost::filesystem::remove(temporary_path, ignored);
            return false;
        }
    }

    boost::system::error_code ec;
    boost::filesystem::rename(temporary_path, output_path, ec);
    if (ec) {
        LOG_CHANNEL_ERROR(LOG_CHANNEL_BATCH) << "cannot move " << temporary_path.string() << " to "
                                             << output_path.string() << ": " << ec.message();
        boost::system::error_code ignored;
        boost::filesystem::remove(temporary_path, ignored);
        return false;
    }
    return true;
}

Batch_Report process_pdf_directory(const boost::filesystem::path& input_dir,
                                   const boost::filesystem::path& output_dir,
                                   const std::string& password) {
    Batch_Report report;
    boost::system::error_code ec;

    if (!boost::filesystem::is_directory(input_dir, ec)) {
        LOG_CHANNEL_ERROR(LOG_CHANNEL_BATCH) << "Input directory " << input_dir.string() << " does not exist";
        report.failed.emplace_back(input_dir, "input directory does not exist");
        return report;
    }

    boost::filesystem::create_directories(output_dir, ec);
    if (ec) {
        LOG_CHANNEL_ERROR(LOG_CHANNEL_BATCH) << "cannot create output directory " << output_dir.string() << ": " << ec.message();
        report.failed.emplace_back(output_dir, "cannot create output directory: " + ec.message());
        return report;
    }

    std::vector<boost::filesystem::path> pdf_files;
    for (boost::filesystem::directory_iterator it(input_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const boost::filesystem::path& path = it->path();
        if (boost::filesystem::is_regular_file(it->status()) &&
            boost::algorithm::iequals(path.extension().string(), ".pdf")) {
            pdf_files.push_back(path);
        }
    }
    if (ec) {
        LOG_CHANNEL_ERROR(LOG_CHANNEL_BATCH) << "cannot list " << input_dir.string() << ": " << ec.message();
        report.failed.emplace_back(input_dir, "cannot list input directory: " + ec.message());
        return report;
    }

    // directory order is unspecified, keep runs reproducible
    std::sort(pdf_files.begin(), pdf_files.end());

    if (pdf_files.empty()) {
        LOG_CHANNEL_INFO(LOG_CHANNEL_BATCH) << "No PDF files found in " << input_dir.string();
        return report;
    }
    LOG_CHANNEL_INFO(LOG_CHANNEL_BATCH) << "Found " << pdf_files.size() << " PDF files to process";

    for (const boost::filesystem::path& pdf_file : pdf_files) {
        boost::filesystem::path output_path = output_dir / pdf_file.stem();
        output_path += ".json";

        // one broken document must not stop the others
        try {
            LOG_CHANNEL_INFO(LOG_CHANNEL_BATCH) << "Processing " << pdf_file.filename().string();

            std::optional<Outline_Document> outline = outline_pdf_file(pdf_file.string(), password);
            if (!outline) {
                report.failed.emplace_back(pdf_file, "cannot read PDF document");
                continue;
            }
            if (!write_outline_file(outline.value(), output_path)) {
                report.failed.emplace_back(pdf_file, "cannot write " + output_path.string());
                continue;
            }

            report.written.push_back(output_path);
            LOG_CHANNEL_INFO(LOG_CHANNEL_BATCH) << "Generated " << output_path.filename().string();
        } catch (const std::exception& e) {
            LOG_CHANNEL_ERROR(LOG_CHANNEL_BATCH) << "Failed to process " << pdf_file.filename().string() << ": " << e.what();
            report.failed.emplace_back(pdf_file, e.what());
        }
    }

    for (const auto& failure : report.failed) {
        LOG_CHANNEL_WARNING(LOG_CHANNEL_BATCH) << "Skipped " << failure.first.filename().string() << ": " << failure.second;
    }
    return report;
}
