#pragma once

#include <string>

// longer numbered lines are list items or body text, not section headings
#ifndef OUTLINE_MAX_NUMBERED_HEADING_CHARS
#define OUTLINE_MAX_NUMBERED_HEADING_CHARS 80
#endif

struct PDF_Numbering_Format {
    enum class PREFIX {NONE, ROMAN_NUMBERING, NUMBER_DOT_NUMBERING, ALPHABET_UPPERCASE_NUMBERING, ARTICLE};

    PREFIX prefix = PREFIX::NONE;
    unsigned long numbering_level = 0;

    bool is_numbered() const { return prefix != PREFIX::NONE && numbering_level > 0; }
};

// recognizes "1.", "1.2.3", "IV.", "B)", "Chapter 3", "Appendix A", ...
PDF_Numbering_Format detect_numbering(const std::string& text);
