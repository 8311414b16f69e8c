#include "line_reconstructor.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <sstream>

namespace {

struct Line_Band {
    PDF_Rect bbox;
    double reference_y0 = 0;
    double reference_height = 0;
    std::vector<PDF_Text_Run> runs;
};

double round_font_size(double size) {
    return std::round(size * 10.0) / 10.0;
}

// A run covering several text lines (reported with its internal line breaks)
// is split back into one run per line, sharing the run's height evenly.
void split_multiline_run(const PDF_Text_Run& run, std::vector<PDF_Text_Run>& out) {
    bool has_break = run.text.find('\n') != std::string::npos;
    double height = run.bbox.height();
    if (!has_break) {
        out.push_back(run);
        return;
    }

    std::vector<std::string> parts;
    std::istringstream text_stream(run.text);
    std::string part;
    while (std::getline(text_stream, part)) {
        if (!part.empty() && part.back() == '\r') {
            part.pop_back();
        }
        parts.push_back(part);
    }

    if (run.font_size <= 0 || height <= run.font_size * OUTLINE_MULTILINE_HEIGHT_RATIO || parts.size() < 2) {
        // a break inside a single visual line is just whitespace
        PDF_Text_Run joined = run;
        std::replace(joined.text.begin(), joined.text.end(), '\n', ' ');
        std::replace(joined.text.begin(), joined.text.end(), '\r', ' ');
        out.push_back(joined);
        return;
    }

    double step = height / static_cast<double>(parts.size());
    for (size_t i = 0; i < parts.size(); ++i) {
        if (is_blank(parts[i])) {
            continue;
        }
        PDF_Text_Run piece = run;
        piece.text = parts[i];
        piece.bbox.y0 = run.bbox.y0 + step * static_cast<double>(i);
        piece.bbox.y1 = piece.bbox.y0 + step;
        out.push_back(piece);
    }
}

bool belongs_to_band(const Line_Band& band, const PDF_Text_Run& run, const Line_Reconstruction_Options& options) {
    double height = std::max(band.reference_height, run.bbox.height());
    if (std::fabs(run.bbox.y0 - band.reference_y0) < options.same_line_tolerance * height) {
        return true;
    }

    // sub/superscripts start higher or lower but sit inside the line
    double overlap = std::min(band.bbox.y1, run.bbox.y1) - std::max(band.bbox.y0, run.bbox.y0);
    double smaller = std::min(band.reference_height, run.bbox.height());
    return smaller > 0 && overlap >= OUTLINE_MIN_VERTICAL_OVERLAP * smaller;
}

bool is_overprint(const PDF_Text_Run& run, const PDF_Text_Run& previous) {
    double overlap = std::min(run.bbox.x1, previous.bbox.x1) - std::max(run.bbox.x0, previous.bbox.x0);
    double narrower = std::min(run.bbox.width(), previous.bbox.width());
    if (narrower <= 0 || overlap < OUTLINE_OVERPRINT_OVERLAP_RATIO * narrower) {
        return false;
    }
    return normalize_heading_text(run.text) == normalize_heading_text(previous.text);
}

PDF_Line build_line(const std::vector<PDF_Text_Run>& runs, const PDF_Page& page, const Line_Reconstruction_Options& options) {
    PDF_Line line;
    line.page = page.number;
    line.page_width = page.width;
    line.page_height = page.height;
    line.runs = runs;

    std::map<double, size_t> chars_per_size;
    std::map<std::string, size_t> chars_per_font;
    size_t total_chars = 0, bold_chars = 0, italic_chars = 0;

    std::string text;
    const PDF_Text_Run* previous = nullptr;
    for (const PDF_Text_Run& run : runs) {
        if (previous) {
            double gap = run.bbox.x0 - previous->bbox.x1;
            double size = std::max(run.font_size, previous->font_size);
            bool has_space = (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) ||
                             std::isspace(static_cast<unsigned char>(run.text.front()));
            if (!has_space && gap > options.word_gap_ratio * size) {
                text += ' ';
            }
        }
        text += run.text;
        line.bbox.include(run.bbox);

        size_t chars = utf8_length(trim_copy(run.text));
        chars_per_size[round_font_size(run.font_size)] += chars;
        chars_per_font[run.font_name] += chars;
        total_chars += chars;
        if (run.bold) {
            bold_chars += chars;
        }
        if (run.italic) {
            italic_chars += chars;
        }
        previous = &run;
    }

    line.text = collapse_whitespace(text);

    // plurality by character count, ties go to the larger size
    size_t best_chars = 0;
    for (const auto& entry : chars_per_size) {
        if (entry.second >= best_chars) {
            best_chars = entry.second;
            line.dominant_font_size = entry.first;
        }
    }

    best_chars = 0;
    for (const auto& entry : chars_per_font) {
        if (entry.second > best_chars) {
            best_chars = entry.second;
            line.font_name = entry.first;
        }
    }

    line.bold = total_chars > 0 && bold_chars * 2 >= total_chars;
    line.italic = total_chars > 0 && italic_chars * 2 > total_chars;
    return line;
}

}

std::vector<PDF_Line> reconstruct_page_lines(const PDF_Page& page, const Line_Reconstruction_Options& options) {
    std::vector<PDF_Text_Run> runs;
    runs.reserve(page.runs.size());
    for (const PDF_Text_Run& run : page.runs) {
        if (is_blank(run.text)) {
            continue;
        }
        split_multiline_run(run, runs);
    }

    for (PDF_Text_Run& run : runs) {
        run.page = page.number;
    }

    std::stable_sort(runs.begin(), runs.end(), [](const PDF_Text_Run& a, const PDF_Text_Run& b) {
        if (a.bbox.y0 != b.bbox.y0) {
            return a.bbox.y0 < b.bbox.y0;
        }
        return a.bbox.x0 < b.bbox.x0;
    });

    std::vector<Line_Band> bands;
    for (const PDF_Text_Run& run : runs) {
        if (bands.empty() || !belongs_to_band(bands.back(), run, options)) {
            Line_Band band;
            band.bbox = run.bbox;
            band.reference_y0 = run.bbox.y0;
            band.reference_height = run.bbox.height();
            bands.push_back(band);
        } else {
            bands.back().bbox.include(run.bbox);
        }
        bands.back().runs.push_back(run);
    }

    std::vector<PDF_Line> lines;
    for (Line_Band& band : bands) {
        std::stable_sort(band.runs.begin(), band.runs.end(), [](const PDF_Text_Run& a, const PDF_Text_Run& b) {
            return a.bbox.x0 < b.bbox.x0;
        });

        // a wide horizontal gap (column gutter, table cell) ends the line
        std::vector<PDF_Text_Run> current;
        for (const PDF_Text_Run& run : band.runs) {
            if (!current.empty()) {
                const PDF_Text_Run& previous = current.back();
                if (is_overprint(run, previous)) {
                    continue;
                }
                double gap = run.bbox.x0 - previous.bbox.x1;
                if (gap > options.max_gap_ratio * std::max(run.font_size, previous.font_size)) {
                    lines.push_back(build_line(current, page, options));
                    current.clear();
                }
            }
            current.push_back(run);
        }
        if (!current.empty()) {
            lines.push_back(build_line(current, page, options));
        }
    }

    // drop anything that collapsed to nothing
    lines.erase(std::remove_if(lines.begin(), lines.end(), [](const PDF_Line& line) {
        return line.text.empty();
    }), lines.end());

    return lines;
}

std::vector<PDF_Line> reconstruct_lines(const PDF_Document& document, const Line_Reconstruction_Options& options) {
    std::vector<PDF_Line> lines;
    size_t run_count = 0;
    for (size_t i = 0; i < document.pages.size(); ++i) {
        PDF_Page page = document.pages[i];
        if (page.number == 0) {
            page.number = static_cast<unsigned int>(i + 1);
        }
        run_count += page.runs.size();

        std::vector<PDF_Line> page_lines = reconstruct_page_lines(page, options);
        lines.insert(lines.end(), page_lines.begin(), page_lines.end());
    }

    LOG_CHANNEL_DEBUG(LOG_CHANNEL_LINES) << "Reconstructed " << lines.size() << " lines from " << run_count
                                         << " runs on " << document.pages.size() << " pages";
    return lines;
}
