#include "document_classifier.hpp"
#include "logging.hpp"
#include "numbering.hpp"
#include "string_utils.hpp"

#include <boost/algorithm/string/case_conv.hpp>

#include <cmath>
#include <iterator>
#include <map>
#include <set>

namespace {

const char* const form_keywords[] = {
    "application form",
    "signature",
    "date of birth",
    "undertake to refund",
    "please fill",
};

const char* const rfp_keywords[] = {
    "request for proposal",
    "rfp",
    "proposals must",
    "terms of reference",
};

size_t count_keywords(const std::string& text, const char* const* begin, const char* const* end) {
    size_t count = 0;
    for (const char* const* keyword = begin; keyword != end; ++keyword) {
        if (text.find(*keyword) != std::string::npos) {
            ++count;
        }
    }
    return count;
}

bool looks_like_form(const std::vector<PDF_Line>& lines, const std::string& lower_text) {
    size_t label_lines = 0;
    for (const PDF_Line& line : lines) {
        if (is_form_label_line(line)) {
            ++label_lines;
        }
    }

    if (label_lines < OUTLINE_FORM_MIN_LABEL_LINES) {
        return false;
    }

    double ratio = static_cast<double>(label_lines) / static_cast<double>(lines.size());
    double required_ratio = OUTLINE_FORM_LABEL_RATIO;
    if (count_keywords(lower_text, std::begin(form_keywords), std::end(form_keywords)) >= 2) {
        required_ratio = OUTLINE_FORM_KEYWORD_LABEL_RATIO;
    }
    return ratio >= required_ratio;
}

bool looks_like_rfp(const std::vector<PDF_Line>& lines, unsigned int page_count, const std::string& lower_text) {
    if (page_count < OUTLINE_RFP_MIN_PAGES) {
        return false;
    }

    size_t numbered_lines = 0;
    std::set<unsigned int> numbered_pages;
    for (const PDF_Line& line : lines) {
        if (detect_numbering(line.text).is_numbered()) {
            ++numbered_lines;
            numbered_pages.insert(line.page);
        }
    }

    if (numbered_lines < OUTLINE_RFP_MIN_NUMBERED_LINES) {
        return false;
    }

    // an explicit proposal vocabulary is enough even when the numbering sits on one page
    return numbered_pages.size() >= OUTLINE_RFP_MIN_NUMBERED_PAGES ||
           count_keywords(lower_text, std::begin(rfp_keywords), std::end(rfp_keywords)) > 0;
}

bool looks_like_flyer(const std::vector<PDF_Line>& lines, unsigned int page_count, double body_font_size) {
    if (page_count > OUTLINE_FLYER_MAX_PAGES || body_font_size <= 0) {
        return false;
    }

    size_t large_lines = 0;
    double text_area = 0;
    std::map<unsigned int, double> page_areas;
    for (const PDF_Line& line : lines) {
        if (line.dominant_font_size / body_font_size >= OUTLINE_FLYER_LARGE_RATIO) {
            ++large_lines;
        }
        text_area += line.bbox.area();
        page_areas[line.page] = line.page_width * line.page_height;
    }

    if (large_lines == 0 || large_lines > OUTLINE_FLYER_MAX_LARGE_LINES) {
        return false;
    }
    if (page_count > 1 && large_lines < OUTLINE_FLYER_MULTIPAGE_MIN_LARGE_LINES) {
        return false;
    }

    double total_page_area = 0;
    for (const auto& entry : page_areas) {
        total_page_area += entry.second;
    }

    double coverage = total_page_area > 0 ? text_area / total_page_area : 0;
    return coverage < OUTLINE_FLYER_MAX_COVERAGE;
}

}

double compute_body_font_size(const std::vector<PDF_Line>& lines) {
    if (lines.empty()) {
        return OUTLINE_DEFAULT_BODY_FONT_SIZE;
    }

    std::map<double, std::pair<size_t, size_t>> histogram;  // size -> (lines, characters)
    for (const PDF_Line& line : lines) {
        double size = std::round(line.dominant_font_size * 10.0) / 10.0;
        std::pair<size_t, size_t>& bucket = histogram[size];
        ++bucket.first;
        bucket.second += utf8_length(line.text);
    }

    // ascending iteration with a strict comparison keeps the smaller size on a full tie
    double body_font_size = 0;
    std::pair<size_t, size_t> best(0, 0);
    for (const auto& entry : histogram) {
        if (entry.second > best) {
            best = entry.second;
            body_font_size = entry.first;
        }
    }

    return body_font_size > 0 ? body_font_size : OUTLINE_DEFAULT_BODY_FONT_SIZE;
}

bool is_form_label_line(const PDF_Line& line) {
    std::string text = trim_copy(line.text);
    if (text.empty() || utf8_length(text) >= OUTLINE_FORM_SHORT_LINE_CHARS) {
        return false;
    }
    return text.back() == ':' ||
           text.find("___") != std::string::npos ||
           text.find("....") != std::string::npos;
}

Document_Profile classify_document(const std::vector<PDF_Line>& lines, unsigned int page_count) {
    Document_Profile profile;
    profile.page_count = page_count;
    profile.body_font_size = compute_body_font_size(lines);

    if (lines.empty()) {
        profile.archetype = Document_Archetype::GENERIC;
        LOG_CHANNEL_DEBUG(LOG_CHANNEL_PROFILE) << "No lines, using generic profile";
        return profile;
    }

    std::string lower_text;
    for (const PDF_Line& line : lines) {
        lower_text += boost::algorithm::to_lower_copy(line.text, std::locale::classic());
        lower_text += ' ';
    }

    if (looks_like_form(lines, lower_text)) {
        profile.archetype = Document_Archetype::FORM;
    } else if (looks_like_rfp(lines, page_count, lower_text)) {
        profile.archetype = Document_Archetype::RFP;
    } else if (looks_like_flyer(lines, page_count, profile.body_font_size)) {
        profile.archetype = Document_Archetype::FLYER;
    } else {
        profile.archetype = Document_Archetype::GENERIC;
    }

    LOG_CHANNEL_DEBUG(LOG_CHANNEL_PROFILE) << "Archetype " << archetype_name(profile.archetype)
                                           << ", body font size " << profile.body_font_size
                                           << ", " << page_count << " pages";
    return profile;
}
