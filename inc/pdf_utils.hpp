#pragma once

#include <string>
#include <optional>
#include <vector>

struct PDF_Rect {
    double x0 = 0;
    double y0 = 0;
    double x1 = 0;
    double y1 = 0;

    PDF_Rect() = default;
    PDF_Rect(double left, double top, double right, double bottom);

    double width() const;
    double height() const;
    double area() const;
    bool is_empty() const;

    PDF_Rect& include(const PDF_Rect& other);
    bool intersects(const PDF_Rect& other) const;
};

// One span of text sharing a single font, size and style.
// Coordinates are in points, origin top-left, y grows downward.
struct PDF_Text_Run {
    std::string text;
    PDF_Rect bbox;
    std::string font_name;
    double font_size = 0;
    bool bold = false;
    bool italic = false;
    unsigned int page = 0;  // 1-based
};

struct PDF_Page {
    unsigned int number = 0;  // 1-based
    double width = 0;
    double height = 0;
    std::vector<PDF_Text_Run> runs;
};

struct PDF_Document {
    std::vector<PDF_Page> pages;
};

// return nullopt if cant read pdf document, a page without text is not an error
std::optional<PDF_Document> parse_pdf_file(const std::string& file_path, const std::string& password = std::string());
