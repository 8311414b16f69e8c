#include "string_utils.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <cctype>

std::string trim_copy(const std::string& s) {
    return boost::algorithm::trim_copy_if(s, boost::algorithm::is_space(std::locale::classic()));
}

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string UnicodeToUTF8(int code_point) {
    std::string out;
    if (code_point < 0 || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        code_point = 0xFFFD;  // replacement character
    }

    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
    return out;
}

size_t utf8_length(const std::string& s) {
    size_t length = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {  // skip continuation bytes
            ++length;
        }
    }
    return length;
}

std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }
    return out;
}

std::string normalize_heading_text(const std::string& s) {
    std::string stripped;
    stripped.reserve(s.size());
    for (char c : s) {
        unsigned char uc = static_cast<unsigned char>(c);
        // non-ASCII bytes are kept, they belong to letters far more often than to punctuation
        if (uc >= 0x80 || std::isalnum(uc) || std::isspace(uc)) {
            stripped += c;
        }
    }
    return boost::algorithm::to_lower_copy(collapse_whitespace(stripped), std::locale::classic());
}

std::string normalize_running_text(const std::string& s) {
    std::string collapsed = boost::algorithm::to_lower_copy(collapse_whitespace(s), std::locale::classic());
    std::string out;
    out.reserve(collapsed.size());
    bool in_digits = false;
    for (char c : collapsed) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            if (!in_digits) {
                out += '#';
                in_digits = true;
            }
        } else {
            in_digits = false;
            out += c;
        }
    }
    return out;
}

namespace {

// decodes the code point starting at s[pos] and advances pos past it,
// malformed sequences yield -1 and advance by one byte
int next_code_point(const std::string& s, size_t& pos) {
    unsigned char lead = static_cast<unsigned char>(s[pos]);
    size_t length;
    int code_point;
    if (lead < 0x80) {
        ++pos;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        code_point = lead & 0x07;
    } else {
        ++pos;
        return -1;
    }

    if (pos + length > s.size()) {
        ++pos;
        return -1;
    }
    for (size_t i = 1; i < length; ++i) {
        unsigned char c = static_cast<unsigned char>(s[pos + i]);
        if ((c & 0xC0) != 0x80) {
            ++pos;
            return -1;
        }
        code_point = (code_point << 6) | (c & 0x3F);
    }
    pos += length;
    return code_point;
}

// alphabetic blocks; symbols, punctuation, bullets and dingbats fall outside
bool is_letter_code_point(int code_point) {
    static const int letter_ranges[][2] = {
        {0x00C0, 0x00D6}, {0x00D8, 0x00F6}, {0x00F8, 0x02AF},  // Latin-1 letters, Latin Extended, IPA
        {0x0386, 0x0386}, {0x0388, 0x03FF},                    // Greek
        {0x0400, 0x0481}, {0x048A, 0x052F},                    // Cyrillic
        {0x0531, 0x0587},                                      // Armenian
        {0x05D0, 0x05EA},                                      // Hebrew
        {0x0620, 0x064A}, {0x0671, 0x06D3},                    // Arabic
        {0x0900, 0x0DFF},                                      // Indic scripts
        {0x0E01, 0x0E30},                                      // Thai
        {0x10A0, 0x10FF},                                      // Georgian
        {0x1100, 0x11FF},                                      // Hangul Jamo
        {0x1E00, 0x1FFF},                                      // Latin and Greek extended
        {0x3041, 0x3096}, {0x30A1, 0x30FA},                    // Hiragana, Katakana
        {0x3400, 0x4DBF}, {0x4E00, 0x9FFF},                    // CJK ideographs
        {0xAC00, 0xD7A3},                                      // Hangul syllables
        {0xF900, 0xFAFF},                                      // CJK compatibility
        {0xFF21, 0xFF3A}, {0xFF41, 0xFF5A},                    // fullwidth Latin
        {0x20000, 0x2FA1F},                                    // CJK extensions
    };
    for (const auto& range : letter_ranges) {
        if (code_point >= range[0] && code_point <= range[1]) {
            return true;
        }
    }
    return false;
}

}

bool has_letter(const std::string& s) {
    size_t pos = 0;
    while (pos < s.size()) {
        int code_point = next_code_point(s, pos);
        if (code_point < 0) {
            continue;
        }
        if (code_point < 0x80 ? std::isalpha(code_point) != 0 : is_letter_code_point(code_point)) {
            return true;
        }
    }
    return false;
}

nlohmann::ordered_json outline_to_json(const Outline_Document& document) {
    nlohmann::ordered_json json_document;
    json_document["title"] = document.title;
    json_document["outline"] = nlohmann::ordered_json::array();
    for (const Outline_Entry& entry : document.outline) {
        nlohmann::ordered_json json_entry;
        json_entry["text"] = entry.text;
        json_entry["level"] = entry.level;
        json_entry["page"] = entry.page;
        json_document["outline"].push_back(json_entry);
    }
    return json_document;
}

std::string format_outline_document(const Outline_Document& document) {
    return outline_to_json(document).dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}
