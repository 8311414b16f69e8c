#include "outline_extractor.hpp"
#include "deduplicator.hpp"
#include "document_classifier.hpp"
#include "header_footer_filter.hpp"
#include "heading_classifier.hpp"
#include "logging.hpp"
#include "outline_assembler.hpp"

Outline_Document extract_outline(const PDF_Document& document, const Line_Reconstruction_Options& options) {
    unsigned int page_count = static_cast<unsigned int>(document.pages.size());

    std::vector<PDF_Line> lines = reconstruct_lines(document, options);
    if (lines.empty()) {
        // nothing extractable, image-only pages included
        LOG_CHANNEL_INFO(LOG_CHANNEL_OUTLINE) << "No text on " << page_count << " pages, empty outline";
        return Outline_Document();
    }

    // per-document context, computed once and only read afterwards
    const Document_Profile profile = classify_document(lines, page_count);
    const Running_Text_Index running_text = build_running_text_index(lines, page_count);

    std::vector<Heading_Candidate> candidates = classify_headings(lines, profile);
    candidates = filter_running_text(std::move(candidates), running_text);
    candidates = deduplicate_headings(candidates);

    return assemble_outline(std::move(candidates), profile);
}
