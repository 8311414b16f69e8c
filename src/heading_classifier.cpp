#include "heading_classifier.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <limits>

namespace {

//                                   title  h1   h1b   h2b   h3b   ws    numbering        offset  size  bold  num   ws    title
const Archetype_Policy generic_policy{1.8,  1.5, 1.2,  1.15, 1.0,  0.5,  true,  false,   0,      1.0,  0.5,  0.5,  0.25, true};
const Archetype_Policy form_policy   {2.2,  1.8, 1.5,  1.35, 1.2,  0.8,  false, false,   0,      1.5,  1.0,  0.0,  0.25, true};
const Archetype_Policy rfp_policy    {1.8,  1.5, 1.2,  1.15, 1.0,  0.5,  true,  true,    1,      0.5,  0.5,  1.5,  0.25, true};
const Archetype_Policy flyer_policy  {1.8,  1.6, 1.3,  1.2,  1.05, 0.8,  false, false,   0,      1.5,  1.0,  0.0,  0.25, false};

// numbered lines set smaller than the body are footnotes or fine print
const double min_numbered_size_ratio = 0.95;

Heading_Level level_from_index(unsigned long index) {
    switch (index) {
        case 0:
        case 1:
            return Heading_Level::H1;
        case 2:
            return Heading_Level::H2;
        default:
            return Heading_Level::H3;
    }
}

Heading_Level numbering_heading_level(const PDF_Numbering_Format& numbering, const Archetype_Policy& policy) {
    unsigned long index = numbering.numbering_level + 1;
    index = index > policy.numbering_level_offset ? index - policy.numbering_level_offset : 1;
    return level_from_index(index);
}

bool is_title_line(const PDF_Line& line, const Line_Features& features, const Archetype_Policy& policy) {
    if (!policy.allow_title || !features.eligible || line.page != 1 || features.size_ratio < policy.title_ratio) {
        return false;
    }
    return line.page_height <= 0 || line.bbox.y0 <= OUTLINE_TITLE_TOP_FRACTION * line.page_height;
}

// the line continues a wrapped title: same page, same size, directly below it
bool continues_title(const PDF_Line& title, const PDF_Line& line) {
    if (line.page != title.page || line.dominant_font_size != title.dominant_font_size) {
        return false;
    }
    double gap = line.bbox.y0 - title.bbox.y1;
    return gap >= -0.5 * title.dominant_font_size && gap < OUTLINE_TITLE_WRAP_GAP_RATIO * title.dominant_font_size;
}

}

const Archetype_Policy& archetype_policy(Document_Archetype archetype) {
    switch (archetype) {
        case Document_Archetype::FORM:
            return form_policy;
        case Document_Archetype::RFP:
            return rfp_policy;
        case Document_Archetype::FLYER:
            return flyer_policy;
        case Document_Archetype::GENERIC:
        default:
            return generic_policy;
    }
}

Line_Features compute_line_features(const PDF_Line& line, const PDF_Line* previous_line, const Document_Profile& profile) {
    Line_Features features;
    double body_font_size = profile.body_font_size > 0 ? profile.body_font_size : 1;
    features.size_ratio = line.dominant_font_size / body_font_size;
    features.bold = line.bold;

    if (previous_line && previous_line->page == line.page) {
        double gap = std::max(0.0, line.bbox.y0 - previous_line->bbox.y1);
        features.whitespace_above = gap / (body_font_size * OUTLINE_LINE_HEIGHT_FACTOR);
    } else {
        // first line of a page
        features.whitespace_above = std::numeric_limits<double>::infinity();
    }

    size_t length = utf8_length(line.text);
    features.eligible = length >= 2 && length <= OUTLINE_MAX_HEADING_CHARS && has_letter(line.text);

    if (features.eligible && features.size_ratio >= min_numbered_size_ratio) {
        features.numbering = detect_numbering(line.text);
    }
    return features;
}

double heading_confidence(const Line_Features& features, const Archetype_Policy& policy) {
    double confidence = policy.size_weight * std::min(std::max(features.size_ratio - 1.0, 0.0), 2.0);
    if (features.bold) {
        confidence += policy.bold_weight;
    }
    if (policy.numbering_enabled && features.numbering.is_numbered()) {
        confidence += policy.numbering_weight;
    }
    confidence += policy.whitespace_weight * std::min(features.whitespace_above, 2.0) / 2.0;
    return confidence;
}

bool classify_heading_level(const Line_Features& features, const Archetype_Policy& policy, Heading_Level& level) {
    if (!features.eligible) {
        return false;
    }

    bool numbered = policy.numbering_enabled && features.numbering.is_numbered();
    if (numbered && policy.numbering_first) {
        level = numbering_heading_level(features.numbering, policy);
        return true;
    }

    if (features.size_ratio >= policy.h1_ratio ||
        (features.bold && features.size_ratio >= policy.h1_bold_ratio)) {
        level = Heading_Level::H1;
        return true;
    }

    if (features.bold && features.size_ratio >= policy.h2_bold_ratio) {
        level = Heading_Level::H2;
        return true;
    }

    if (numbered) {
        level = numbering_heading_level(features.numbering, policy);
        return true;
    }

    if (features.bold && features.size_ratio >= policy.h3_bold_ratio &&
        features.whitespace_above >= policy.h3_min_whitespace_above) {
        level = Heading_Level::H3;
        return true;
    }

    return false;
}

std::vector<Heading_Candidate> classify_headings(const std::vector<PDF_Line>& lines, const Document_Profile& profile) {
    const Archetype_Policy& policy = archetype_policy(profile.archetype);

    std::vector<Line_Features> features;
    features.reserve(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        features.push_back(compute_line_features(lines[i], i > 0 ? &lines[i - 1] : nullptr, profile));
    }

    // at most one title: the largest qualifying line of the first page, ties go to the topmost
    size_t title_index = lines.size();
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!is_title_line(lines[i], features[i], policy)) {
            continue;
        }
        if (title_index == lines.size() ||
            lines[i].dominant_font_size > lines[title_index].dominant_font_size ||
            (lines[i].dominant_font_size == lines[title_index].dominant_font_size &&
             lines[i].bbox.y0 < lines[title_index].bbox.y0)) {
            title_index = i;
        }
    }

    // lines the title wrapped onto are folded into it
    size_t title_end = title_index;
    PDF_Line title_line;
    if (title_index < lines.size()) {
        title_line = lines[title_index];
        for (title_end = title_index + 1; title_end < lines.size(); ++title_end) {
            if (!continues_title(lines[title_end - 1], lines[title_end])) {
                break;
            }
            title_line.text = collapse_whitespace(title_line.text + " " + lines[title_end].text);
            title_line.bbox.include(lines[title_end].bbox);
            title_line.runs.insert(title_line.runs.end(), lines[title_end].runs.begin(), lines[title_end].runs.end());
        }
        if (title_end - title_index > 1) {
            LOG_CHANNEL_DEBUG(LOG_CHANNEL_HEADINGS) << "Title spans " << title_end - title_index << " lines: \""
                                                    << title_line.text << "\"";
        }
    }

    std::vector<Heading_Candidate> candidates;
    size_t level_counts[4] = {0, 0, 0, 0};
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > title_index && i < title_end) {
            continue;
        }

        Heading_Level level;
        if (i == title_index) {
            level = Heading_Level::TITLE;
        } else if (!classify_heading_level(features[i], policy, level)) {
            continue;
        }

        Heading_Candidate candidate;
        candidate.line = i == title_index ? title_line : lines[i];
        candidate.level = level;
        candidate.confidence = heading_confidence(features[i], policy);
        candidate.line_index = i;
        candidates.push_back(std::move(candidate));
        ++level_counts[static_cast<size_t>(level)];
    }

    LOG_CHANNEL_DEBUG(LOG_CHANNEL_HEADINGS) << "Candidates: " << level_counts[0] << " title, "
                                            << level_counts[1] << " H1, " << level_counts[2] << " H2, "
                                            << level_counts[3] << " H3 out of " << lines.size() << " lines";
    return candidates;
}
