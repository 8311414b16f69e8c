#pragma once

#include <string>
#include <vector>

#include "outline_types.hpp"
#include "numbering.hpp"

#ifndef OUTLINE_LINE_HEIGHT_FACTOR
#define OUTLINE_LINE_HEIGHT_FACTOR 1.2
#endif

#ifndef OUTLINE_MAX_HEADING_CHARS
#define OUTLINE_MAX_HEADING_CHARS 160
#endif

// title must start within this fraction of the first page height
#ifndef OUTLINE_TITLE_TOP_FRACTION
#define OUTLINE_TITLE_TOP_FRACTION 0.5
#endif

// a title wraps onto the next line when the gap below it is under this many font sizes
#ifndef OUTLINE_TITLE_WRAP_GAP_RATIO
#define OUTLINE_TITLE_WRAP_GAP_RATIO 1.0
#endif

// Heading thresholds and signal weights for one document archetype.
struct Archetype_Policy {
    double title_ratio;
    double h1_ratio;
    double h1_bold_ratio;
    double h2_bold_ratio;
    double h3_bold_ratio;
    double h3_min_whitespace_above;

    bool numbering_enabled;
    bool numbering_first;               // numbering decides the level before size does
    unsigned long numbering_level_offset;  // 0: depth 1 is H2, 1: depth 1 is H1

    double size_weight;
    double bold_weight;
    double numbering_weight;
    double whitespace_weight;

    bool allow_title;
};

const Archetype_Policy& archetype_policy(Document_Archetype archetype);

struct Line_Features {
    double size_ratio = 1;
    double whitespace_above = 0;
    bool bold = false;
    PDF_Numbering_Format numbering;
    bool eligible = false;  // short enough and wordy enough to be a heading at all
};

Line_Features compute_line_features(const PDF_Line& line, const PDF_Line* previous_line, const Document_Profile& profile);

double heading_confidence(const Line_Features& features, const Archetype_Policy& policy);

// returns false for body text
bool classify_heading_level(const Line_Features& features, const Archetype_Policy& policy, Heading_Level& level);

std::vector<Heading_Candidate> classify_headings(const std::vector<PDF_Line>& lines, const Document_Profile& profile);
