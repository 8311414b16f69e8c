#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "outline_types.hpp"

std::string trim_copy(const std::string& s);

bool is_blank(const std::string& s);

// encode one unicode code point as UTF-8
std::string UnicodeToUTF8(int code_point);

// number of code points in an UTF-8 string
size_t utf8_length(const std::string& s);

std::string collapse_whitespace(const std::string& s);

// case-folded, punctuation stripped, whitespace collapsed
std::string normalize_heading_text(const std::string& s);

// case-folded, whitespace collapsed, every run of digits replaced by '#'
std::string normalize_running_text(const std::string& s);

bool has_letter(const std::string& s);

nlohmann::ordered_json outline_to_json(const Outline_Document& document);

std::string format_outline_document(const Outline_Document& document);
