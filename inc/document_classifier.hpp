#pragma once

#include <vector>

#include "outline_types.hpp"

#ifndef OUTLINE_DEFAULT_BODY_FONT_SIZE
#define OUTLINE_DEFAULT_BODY_FONT_SIZE 12.0
#endif

#ifndef OUTLINE_FORM_SHORT_LINE_CHARS
#define OUTLINE_FORM_SHORT_LINE_CHARS 40
#endif

#ifndef OUTLINE_FORM_MIN_LABEL_LINES
#define OUTLINE_FORM_MIN_LABEL_LINES 4
#endif

#ifndef OUTLINE_FORM_LABEL_RATIO
#define OUTLINE_FORM_LABEL_RATIO 0.3
#endif

#ifndef OUTLINE_FORM_KEYWORD_LABEL_RATIO
#define OUTLINE_FORM_KEYWORD_LABEL_RATIO 0.15
#endif

#ifndef OUTLINE_RFP_MIN_PAGES
#define OUTLINE_RFP_MIN_PAGES 2
#endif

#ifndef OUTLINE_RFP_MIN_NUMBERED_LINES
#define OUTLINE_RFP_MIN_NUMBERED_LINES 3
#endif

#ifndef OUTLINE_RFP_MIN_NUMBERED_PAGES
#define OUTLINE_RFP_MIN_NUMBERED_PAGES 2
#endif

#ifndef OUTLINE_FLYER_MAX_PAGES
#define OUTLINE_FLYER_MAX_PAGES 2
#endif

#ifndef OUTLINE_FLYER_LARGE_RATIO
#define OUTLINE_FLYER_LARGE_RATIO 2.0
#endif

#ifndef OUTLINE_FLYER_MAX_LARGE_LINES
#define OUTLINE_FLYER_MAX_LARGE_LINES 5
#endif

// a two page flyer needs more than one headline, a lone large line there is a report title
#ifndef OUTLINE_FLYER_MULTIPAGE_MIN_LARGE_LINES
#define OUTLINE_FLYER_MULTIPAGE_MIN_LARGE_LINES 2
#endif

#ifndef OUTLINE_FLYER_MAX_COVERAGE
#define OUTLINE_FLYER_MAX_COVERAGE 0.35
#endif

// mode of the line font sizes, rounded to 0.1pt
double compute_body_font_size(const std::vector<PDF_Line>& lines);

bool is_form_label_line(const PDF_Line& line);

Document_Profile classify_document(const std::vector<PDF_Line>& lines, unsigned int page_count);
