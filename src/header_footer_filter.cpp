#include "header_footer_filter.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <map>

bool Running_Text_Index::contains(const PDF_Line& line) const {
    if (keys.empty()) {
        return false;
    }
    std::string key = running_text_key(line);
    return !key.empty() && keys.count(key) > 0;
}

std::string running_text_key(const PDF_Line& line) {
    if (line.page_height <= 0) {
        return std::string();
    }

    const char* band = nullptr;
    if (line.bbox.y0 < OUTLINE_RUNNING_BAND * line.page_height) {
        band = "top|";
    } else if (line.bbox.y1 > (1.0 - OUTLINE_RUNNING_BAND) * line.page_height) {
        band = "bottom|";
    } else {
        return std::string();
    }

    std::string text = normalize_running_text(line.text);
    if (text.empty()) {
        return std::string();
    }
    return band + text;
}

Running_Text_Index build_running_text_index(const std::vector<PDF_Line>& lines, unsigned int page_count) {
    Running_Text_Index index;
    if (page_count < OUTLINE_RUNNING_MIN_PAGES) {
        return index;
    }

    std::map<std::string, std::set<unsigned int>> pages_per_key;
    for (const PDF_Line& line : lines) {
        std::string key = running_text_key(line);
        if (!key.empty()) {
            pages_per_key[key].insert(line.page);
        }
    }

    for (const auto& entry : pages_per_key) {
        // strict majority of all pages, blank pages included
        if (entry.second.size() * 2 > page_count) {
            index.keys.insert(entry.first);
            LOG_CHANNEL_DEBUG(LOG_CHANNEL_RUNNING) << "Running text \"" << entry.first << "\" on "
                                                   << entry.second.size() << " of " << page_count << " pages";
        }
    }
    return index;
}

std::vector<Heading_Candidate> filter_running_text(std::vector<Heading_Candidate> candidates, const Running_Text_Index& index) {
    size_t before = candidates.size();
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(), [&index](const Heading_Candidate& candidate) {
        return index.contains(candidate.line);
    }), candidates.end());

    LOG_CHANNEL_DEBUG(LOG_CHANNEL_RUNNING) << "Dropped " << before - candidates.size() << " running header/footer candidates";
    return candidates;
}
