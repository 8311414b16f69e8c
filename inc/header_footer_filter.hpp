#pragma once

#include <set>
#include <string>
#include <vector>

#include "outline_types.hpp"

// fraction of the page height at the top and at the bottom treated as running bands
#ifndef OUTLINE_RUNNING_BAND
#define OUTLINE_RUNNING_BAND 0.1
#endif

#ifndef OUTLINE_RUNNING_MIN_PAGES
#define OUTLINE_RUNNING_MIN_PAGES 2
#endif

// Normalized texts that repeat in the header or footer band of most pages.
struct Running_Text_Index {
    std::set<std::string> keys;

    bool contains(const PDF_Line& line) const;
};

// empty string if the line is in neither band
std::string running_text_key(const PDF_Line& line);

Running_Text_Index build_running_text_index(const std::vector<PDF_Line>& lines, unsigned int page_count);

std::vector<Heading_Candidate> filter_running_text(std::vector<Heading_Candidate> candidates, const Running_Text_Index& index);
