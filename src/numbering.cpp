#include "numbering.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace {

// "1.2" and "1.2." both have two components, "3)" has one
unsigned long count_components(std::string number) {
    while (!number.empty() && (number.back() == '.' || number.back() == ')')) {
        number.pop_back();
    }
    return static_cast<unsigned long>(std::count(number.begin(), number.end(), '.')) + 1;
}

bool starts_like_heading_text(const std::string& rest) {
    if (rest.empty()) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(rest.front());
    // non-ASCII lead bytes are accepted, case cannot be checked cheaply there
    return first >= 0x80 || std::isupper(first) || std::isdigit(first);
}

// "J. Smith", "C. S. Lewis": an initial followed by a surname
bool is_initial_and_name(const std::string& separator, const std::string& rest) {
    static const std::regex name_regex("^([A-Z]\\.\\s*)*[A-Z][a-z'\\-]+$");
    return separator == "." && std::regex_match(rest, name_regex);
}

}

PDF_Numbering_Format detect_numbering(const std::string& text) {
    PDF_Numbering_Format format;
    std::string trimmed = trim_copy(text);

    if (trimmed.empty() || utf8_length(trimmed) > OUTLINE_MAX_NUMBERED_HEADING_CHARS) {
        return format;
    }

    // sentences and list fragments end with punctuation, headings do not
    char last = trimmed.back();
    if (last == ',' || last == ';' || last == '.') {
        return format;
    }

    static const std::regex article_regex(
        "^(chapter|section|appendix|annex|part|article|schedule)\\s+([0-9]{1,3}(\\.[0-9]{1,3})*|[ivxlc]{1,6}|[a-z])\\b.*",
        std::regex::icase);
    // a bare "15" or "221" is a date or an address, only "1.2" may omit the closing separator
    static const std::regex number_dot_regex("^([0-9]{1,3}(?:\\.[0-9]{1,3})+\\.?|[0-9]{1,3}[.)])\\s+(\\S.*)$");
    static const std::regex roman_regex("^([IVXLC]{1,6})([.)])\\s+(\\S.*)$");
    static const std::regex alphabet_regex("^([A-Z])([.)])\\s+(\\S.*)$");

    std::smatch match;
    if (std::regex_match(trimmed, match, article_regex)) {
        // "Section 2.1" counts its components, "Appendix A" is a top level section
        std::string number = match[2].str();
        format.prefix = PDF_Numbering_Format::PREFIX::ARTICLE;
        format.numbering_level = std::isdigit(static_cast<unsigned char>(number.front())) ? count_components(number) : 1;
    } else if (std::regex_match(trimmed, match, number_dot_regex)) {
        if (starts_like_heading_text(match[2].str())) {
            format.prefix = PDF_Numbering_Format::PREFIX::NUMBER_DOT_NUMBERING;
            format.numbering_level = count_components(match[1].str());
        }
    } else if (std::regex_match(trimmed, match, roman_regex)) {
        // "C. Smith" is an initial, "IV. Results" is not
        if (match[1].length() > 1 || !is_initial_and_name(match[2].str(), match[3].str())) {
            format.prefix = PDF_Numbering_Format::PREFIX::ROMAN_NUMBERING;
            format.numbering_level = 1;
        }
    } else if (std::regex_match(trimmed, match, alphabet_regex)) {
        if (!is_initial_and_name(match[2].str(), match[3].str())) {
            format.prefix = PDF_Numbering_Format::PREFIX::ALPHABET_UPPERCASE_NUMBERING;
            format.numbering_level = 1;
        }
    }

    return format;
}
