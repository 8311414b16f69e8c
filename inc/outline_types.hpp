#pragma once

#include "pdf_utils.hpp"

#include <string>
#include <vector>

// A logical line rebuilt from one or more text runs of the same page.
struct PDF_Line {
    std::string text;
    PDF_Rect bbox;
    double dominant_font_size = 0;
    std::string font_name;
    bool bold = false;
    bool italic = false;
    unsigned int page = 0;
    double page_width = 0;
    double page_height = 0;
    std::vector<PDF_Text_Run> runs;
};

enum class Document_Archetype {GENERIC, FORM, RFP, FLYER};

struct Document_Profile {
    Document_Archetype archetype = Document_Archetype::GENERIC;
    double body_font_size = 0;
    unsigned int page_count = 0;
};

enum class Heading_Level {TITLE, H1, H2, H3};

struct Heading_Candidate {
    PDF_Line line;
    Heading_Level level = Heading_Level::H1;
    double confidence = 0;
    size_t line_index = 0;  // position in the document's reading-order line sequence
};

struct Outline_Entry {
    std::string text;
    std::string level;
    unsigned int page = 0;
};

struct Outline_Document {
    std::string title;
    std::vector<Outline_Entry> outline;
};

const char* archetype_name(Document_Archetype archetype);

const char* heading_level_name(Heading_Level level);
