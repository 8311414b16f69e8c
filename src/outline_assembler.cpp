#include "outline_assembler.hpp"
#include "heading_classifier.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>

namespace {

bool reading_order(const Heading_Candidate& a, const Heading_Candidate& b) {
    if (a.line.page != b.line.page) {
        return a.line.page < b.line.page;
    }
    if (a.line.bbox.y0 != b.line.bbox.y0) {
        return a.line.bbox.y0 < b.line.bbox.y0;
    }
    return a.line.bbox.x0 < b.line.bbox.x0;
}

}

Outline_Document assemble_outline(std::vector<Heading_Candidate> candidates, const Document_Profile& profile) {
    Outline_Document document;

    std::stable_sort(candidates.begin(), candidates.end(), reading_order);

    auto title_it = std::find_if(candidates.begin(), candidates.end(), [](const Heading_Candidate& candidate) {
        return candidate.level == Heading_Level::TITLE;
    });

    if (title_it != candidates.end()) {
        document.title = trim_copy(title_it->line.text);
    } else if (archetype_policy(profile.archetype).allow_title) {
        // fall back to the strongest H1 of the first page, it stays in the outline as well
        const Heading_Candidate* best = nullptr;
        for (const Heading_Candidate& candidate : candidates) {
            if (candidate.line.page != 1 || candidate.level != Heading_Level::H1) {
                continue;
            }
            // sorted in reading order, so a strict comparison keeps the topmost on ties
            if (!best || candidate.confidence > best->confidence) {
                best = &candidate;
            }
        }
        if (best) {
            document.title = trim_copy(best->line.text);
        }
    }

    for (const Heading_Candidate& candidate : candidates) {
        if (candidate.level == Heading_Level::TITLE) {
            continue;
        }
        Outline_Entry entry;
        entry.text = trim_copy(candidate.line.text);
        entry.level = heading_level_name(candidate.level);
        entry.page = candidate.line.page;
        document.outline.push_back(std::move(entry));
    }

    LOG_CHANNEL_DEBUG(LOG_CHANNEL_OUTLINE) << "Outline with " << document.outline.size() << " entries, title \""
                                           << document.title << "\"";
    return document;
}
