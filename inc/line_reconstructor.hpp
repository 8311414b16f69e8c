#pragma once

#include <vector>

#include "outline_types.hpp"

// runs whose y0 differ by less than this fraction of the line height share a line
#ifndef OUTLINE_SAME_LINE_TOLERANCE
#define OUTLINE_SAME_LINE_TOLERANCE 0.5
#endif

// sub/superscripts: vertical overlap with the line, relative to the smaller height
#ifndef OUTLINE_MIN_VERTICAL_OVERLAP
#define OUTLINE_MIN_VERTICAL_OVERLAP 0.6
#endif

// horizontal gap (in font sizes) above which a space is inserted
#ifndef OUTLINE_WORD_GAP_RATIO
#define OUTLINE_WORD_GAP_RATIO 0.15
#endif

// horizontal gap (in font sizes) above which runs are no longer the same line
#ifndef OUTLINE_MAX_GAP_RATIO
#define OUTLINE_MAX_GAP_RATIO 4.0
#endif

// a run taller than this many font sizes holding line breaks is split
#ifndef OUTLINE_MULTILINE_HEIGHT_RATIO
#define OUTLINE_MULTILINE_HEIGHT_RATIO 1.8
#endif

// a run repeating the previous run's text over at least this fraction of the
// narrower width is an overprint (fake bold, drop shadow) and is dropped
#ifndef OUTLINE_OVERPRINT_OVERLAP_RATIO
#define OUTLINE_OVERPRINT_OVERLAP_RATIO 0.5
#endif

struct Line_Reconstruction_Options {
    double same_line_tolerance = OUTLINE_SAME_LINE_TOLERANCE;
    double word_gap_ratio = OUTLINE_WORD_GAP_RATIO;
    double max_gap_ratio = OUTLINE_MAX_GAP_RATIO;
};

std::vector<PDF_Line> reconstruct_page_lines(const PDF_Page& page,
                                             const Line_Reconstruction_Options& options = Line_Reconstruction_Options());

// all pages, in page order
std::vector<PDF_Line> reconstruct_lines(const PDF_Document& document,
                                        const Line_Reconstruction_Options& options = Line_Reconstruction_Options());
