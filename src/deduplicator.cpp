#include "deduplicator.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>

namespace {

bool are_adjacent(const Heading_Candidate& a, const Heading_Candidate& b) {
    size_t distance = a.line_index > b.line_index ? a.line_index - b.line_index : b.line_index - a.line_index;
    if (distance != 1) {
        // anything in between is body text or another heading
        return false;
    }

    const PDF_Rect& upper = a.line.bbox.y0 <= b.line.bbox.y0 ? a.line.bbox : b.line.bbox;
    const PDF_Rect& lower = a.line.bbox.y0 <= b.line.bbox.y0 ? b.line.bbox : a.line.bbox;
    double taller = std::max(upper.height(), lower.height());
    return lower.y0 - upper.y1 <= OUTLINE_DEDUP_ADJACENT_GAP * taller;
}

bool similar_text(const std::string& a, const std::string& b) {
    std::string normalized_a = normalize_heading_text(a);
    std::string normalized_b = normalize_heading_text(b);
    if (normalized_a.empty() || normalized_b.empty()) {
        return false;
    }
    return normalized_a == normalized_b ||
           boost::algorithm::starts_with(normalized_a, normalized_b) ||
           boost::algorithm::starts_with(normalized_b, normalized_a) ||
           boost::algorithm::ends_with(normalized_a, normalized_b) ||
           boost::algorithm::ends_with(normalized_b, normalized_a);
}

void merge_into(Heading_Candidate& kept, const Heading_Candidate& duplicate) {
    if (duplicate.confidence > kept.confidence) {
        kept = duplicate;
        return;
    }
    if (duplicate.confidence < kept.confidence) {
        return;
    }

    // tie: the larger box covers more of the fragments, it takes the union and the fuller text
    PDF_Rect merged_bbox = kept.line.bbox;
    merged_bbox.include(duplicate.line.bbox);
    std::string merged_text = utf8_length(duplicate.line.text) > utf8_length(kept.line.text) ? duplicate.line.text : kept.line.text;

    if (duplicate.line.bbox.area() > kept.line.bbox.area()) {
        kept = duplicate;
    }
    kept.line.bbox = merged_bbox;
    kept.line.text = merged_text;
}

}

bool are_duplicate_headings(const Heading_Candidate& a, const Heading_Candidate& b) {
    if (a.line.page != b.line.page) {
        return false;
    }
    // position decides first, text only confirms
    if (!a.line.bbox.intersects(b.line.bbox) && !are_adjacent(a, b)) {
        return false;
    }
    return similar_text(a.line.text, b.line.text);
}

std::vector<Heading_Candidate> deduplicate_headings(const std::vector<Heading_Candidate>& candidates) {
    std::vector<Heading_Candidate> kept;
    kept.reserve(candidates.size());

    for (const Heading_Candidate& candidate : candidates) {
        bool merged = false;
        for (auto it = kept.rbegin(); it != kept.rend() && it->line.page == candidate.line.page; ++it) {
            if (are_duplicate_headings(*it, candidate)) {
                merge_into(*it, candidate);
                merged = true;
                break;
            }
        }
        if (!merged) {
            kept.push_back(candidate);
        }
    }

    LOG_CHANNEL_DEBUG(LOG_CHANNEL_DEDUP) << "Collapsed " << candidates.size() - kept.size() << " duplicate headings";
    return kept;
}
