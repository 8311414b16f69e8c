#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/filesystem.hpp>

#include "outline_types.hpp"

struct Batch_Report {
    std::vector<boost::filesystem::path> written;
    // input file and reason
    std::vector<std::pair<boost::filesystem::path, std::string>> failed;
};

// return nullopt if the pdf cant be read
std::optional<Outline_Document> outline_pdf_file(const std::string& file_path, const std::string& password = std::string());

// writes to a temporary sibling and renames it, no partial file is left behind on failure
bool write_outline_file(const Outline_Document& document, const boost::filesystem::path& output_path);

Batch_Report process_pdf_directory(const boost::filesystem::path& input_dir,
                                   const boost::filesystem::path& output_dir,
                                   const std::string& password = std::string());
