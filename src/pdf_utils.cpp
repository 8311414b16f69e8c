#include "pdf_utils.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <cmath>
#include <cstring>

#include <mupdf/fitz.h>

namespace {

// MuPDF reports failures with longjmp, so every fz_try below only touches plain C
// pointers; the C++ side runs once the MuPDF call has returned.

fz_document* open_document(fz_context* ctx, const char* file_path, const char* password) {
    fz_document* doc = nullptr;
    fz_var(doc);

    fz_try(ctx) {
        doc = fz_open_document(ctx, file_path);
        if (fz_needs_password(ctx, doc) && !fz_authenticate_password(ctx, doc, password)) {
            fz_throw(ctx, FZ_ERROR_GENERIC, "cannot authenticate password");
        }
    } fz_catch(ctx) {
        fz_drop_document(ctx, doc);
        LOG_CHANNEL_ERROR(LOG_CHANNEL_PDF) << "cannot open document " << file_path << ": " << fz_caught_message(ctx);
        return nullptr;
    }
    return doc;
}

// return nullptr if the page cant be loaded or run
fz_stext_page* load_page_text(fz_context* ctx, fz_document* doc, int page_number, fz_rect* mediabox) {
    fz_page* page = nullptr;
    fz_device* dev = nullptr;
    fz_stext_page* text = nullptr;
    fz_var(page);
    fz_var(dev);
    fz_var(text);

    fz_try(ctx) {
        page = fz_load_page(ctx, doc, page_number);
        *mediabox = fz_bound_page(ctx, page);

        fz_stext_options stext_options;
        memset(&stext_options, 0, sizeof(stext_options));
        stext_options.flags = 0;
        text = fz_new_stext_page(ctx, *mediabox);
        dev = fz_new_stext_device(ctx, text, &stext_options);
        fz_run_page(ctx, page, dev, fz_identity, nullptr);
        fz_close_device(ctx, dev);
    } fz_always(ctx) {
        fz_drop_device(ctx, dev);
        fz_drop_page(ctx, page);
    } fz_catch(ctx) {
        fz_drop_stext_page(ctx, text);
        LOG_CHANNEL_ERROR(LOG_CHANNEL_PDF) << "render page " << page_number + 1 << " error: " << fz_caught_message(ctx);
        return nullptr;
    }
    return text;
}

bool is_bold_font(fz_context* ctx, fz_font* font) {
    if (fz_font_is_bold(ctx, font)) {
        return true;
    }
    // many embedded subsets carry no style flags, only a styled name
    const char* name = fz_font_name(ctx, font);
    return name && (boost::algorithm::icontains(name, "bold") ||
                    boost::algorithm::icontains(name, "black") ||
                    boost::algorithm::icontains(name, "heavy"));
}

bool is_italic_font(fz_context* ctx, fz_font* font) {
    if (fz_font_is_italic(ctx, font)) {
        return true;
    }
    const char* name = fz_font_name(ctx, font);
    return name && (boost::algorithm::icontains(name, "italic") ||
                    boost::algorithm::icontains(name, "oblique"));
}

void flush_run(PDF_Text_Run& run, std::vector<PDF_Text_Run>& runs) {
    if (!run.text.empty()) {
        runs.push_back(run);
    }
    run = PDF_Text_Run();
}

// a run is a stretch of characters of one stext line sharing font, size and style
void collect_page_runs(fz_context* ctx, fz_stext_page* text, const fz_rect& mediabox, PDF_Page& pdf_page) {
    for (fz_stext_block* block = text->first_block; block; block = block->next) {
        if (block->type != FZ_STEXT_BLOCK_TEXT) { // only text blocks have lines, image blocks do not have lines
            continue;
        }

        for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
            PDF_Text_Run run;
            fz_font* run_font = nullptr;

            for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                if (run_font && (ch->font != run_font || std::fabs(ch->size - run.font_size) > 0.05)) {
                    flush_run(run, pdf_page.runs);
                    run_font = nullptr;
                }

                if (!run_font) {
                    run_font = ch->font;
                    const char* font_name = fz_font_name(ctx, ch->font);
                    run.font_name = font_name ? font_name : "";
                    run.font_size = ch->size;
                    run.bold = is_bold_font(ctx, ch->font);
                    run.italic = is_italic_font(ctx, ch->font);
                    run.page = pdf_page.number;
                }

                run.text += UnicodeToUTF8(ch->c);

                fz_rect char_box = fz_rect_from_quad(ch->quad);
                run.bbox.include(PDF_Rect(char_box.x0 - mediabox.x0, char_box.y0 - mediabox.y0,
                                          char_box.x1 - mediabox.x0, char_box.y1 - mediabox.y0));
            }

            flush_run(run, pdf_page.runs);
        }
    }
}

}

std::optional<PDF_Document> parse_pdf_file(const std::string& file_path, const std::string& password) {
    PDF_Document pdf_document;
    int page_number, page_count = 0;

    /* Create a context to hold the exception stack and various caches. */
    fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_UNLIMITED);
    if (!ctx) {
        LOG_CHANNEL_ERROR(LOG_CHANNEL_PDF) << "cannot create mupdf context";
        return std::nullopt;
    }

    /* Register the default file types to handle. */
    fz_try(ctx) {
        fz_register_document_handlers(ctx);
    } fz_catch(ctx) {
        LOG_CHANNEL_ERROR(LOG_CHANNEL_PDF) << "cannot register document handlers: " << fz_caught_message(ctx);
        fz_drop_context(ctx);
        return std::nullopt;
    }

    fz_document* doc = open_document(ctx, file_path.c_str(), password.c_str());
    if (!doc) {
        fz_drop_context(ctx);
        return std::nullopt;
    }

    /* Count the number of pages. */
    fz_try(ctx) {
        page_count = fz_count_pages(ctx, doc);
    } fz_catch(ctx) {
        LOG_CHANNEL_ERROR(LOG_CHANNEL_PDF) << "cannot count number of pages: " << fz_caught_message(ctx);
        fz_drop_document(ctx, doc);
        fz_drop_context(ctx);
        return std::nullopt;
    }

    bool failed = false;
    size_t run_count = 0;
    for (page_number = 0; page_number < page_count; ++page_number) {
        fz_rect mediabox = fz_empty_rect;
        fz_stext_page* text = load_page_text(ctx, doc, page_number, &mediabox);
        if (!text) {
            failed = true;
            break;
        }

        PDF_Page pdf_page;
        pdf_page.number = static_cast<unsigned int>(page_number + 1);
        pdf_page.width = mediabox.x1 - mediabox.x0;
        pdf_page.height = mediabox.y1 - mediabox.y0;
        collect_page_runs(ctx, text, mediabox, pdf_page);
        fz_drop_stext_page(ctx, text);

        run_count += pdf_page.runs.size();
        pdf_document.pages.push_back(std::move(pdf_page));
    }

    /* Clean up. */
    fz_drop_document(ctx, doc);
    fz_drop_context(ctx);

    if (failed) {
        return std::nullopt;
    }

    LOG_CHANNEL_DEBUG(LOG_CHANNEL_PDF) << file_path << ": " << page_count << " pages, " << run_count << " text runs";
    return pdf_document;
}
