#pragma once

#include <string>
#include <utility>
#include <vector>

#include "outline_types.hpp"
#include "string_utils.hpp"

// US letter, in points
const double test_page_width = 612;
const double test_page_height = 792;

// glyphs are approximated as half an em wide
inline double test_text_width(const std::string& text, double font_size) {
    return 0.5 * font_size * static_cast<double>(utf8_length(text));
}

inline PDF_Text_Run make_run(const std::string& text, double x0, double y0, double font_size,
                             bool bold = false, const std::string& font_name = "Helvetica") {
    PDF_Text_Run run;
    run.text = text;
    run.bbox = PDF_Rect(x0, y0, x0 + test_text_width(text, font_size), y0 + font_size);
    run.font_name = bold ? font_name + "-Bold" : font_name;
    run.font_size = font_size;
    run.bold = bold;
    return run;
}

inline PDF_Page make_page(unsigned int number, std::vector<PDF_Text_Run> runs) {
    PDF_Page page;
    page.number = number;
    page.width = test_page_width;
    page.height = test_page_height;
    for (PDF_Text_Run& run : runs) {
        run.page = number;
    }
    page.runs = std::move(runs);
    return page;
}

inline PDF_Line make_line(const std::string& text, unsigned int page, double y0, double font_size,
                          bool bold = false, double x0 = 72) {
    PDF_Text_Run run = make_run(text, x0, y0, font_size, bold);
    run.page = page;

    PDF_Line line;
    line.text = text;
    line.bbox = run.bbox;
    line.dominant_font_size = font_size;
    line.font_name = run.font_name;
    line.bold = bold;
    line.page = page;
    line.page_width = test_page_width;
    line.page_height = test_page_height;
    line.runs.push_back(run);
    return line;
}

inline Heading_Candidate make_candidate(const std::string& text, unsigned int page, double y0, double font_size,
                                        Heading_Level level, double confidence, size_t line_index) {
    Heading_Candidate candidate;
    candidate.line = make_line(text, page, y0, font_size, true);
    candidate.level = level;
    candidate.confidence = confidence;
    candidate.line_index = line_index;
    return candidate;
}

inline Document_Profile make_profile(Document_Archetype archetype, double body_font_size, unsigned int page_count) {
    Document_Profile profile;
    profile.archetype = archetype;
    profile.body_font_size = body_font_size;
    profile.page_count = page_count;
    return profile;
}

// ordinary paragraph lines, one run each, starting at y0 with the given leading
inline void add_body_runs(std::vector<PDF_Text_Run>& runs, double y0, size_t count, double font_size = 10, double leading = 14) {
    static const char* const sentences[] = {
        "The committee reviewed every submission received this year and",
        "agreed that the proposed changes should move forward without",
        "further delay, subject to the conditions listed in the annex",
        "and the availability of funding from the participating members",
    };
    for (size_t i = 0; i < count; ++i) {
        runs.push_back(make_run(sentences[i % 4], 72, y0 + leading * static_cast<double>(i), font_size));
    }
}
