#include "outline_types.hpp"

#include <algorithm>

PDF_Rect::PDF_Rect(double left, double top, double right, double bottom) :
    x0(left),
    y0(top),
    x1(right),
    y1(bottom) {

}

double PDF_Rect::width() const {
    return x1 - x0;
}

double PDF_Rect::height() const {
    return y1 - y0;
}

double PDF_Rect::area() const {
    return is_empty() ? 0 : width() * height();
}

bool PDF_Rect::is_empty() const {
    return x1 <= x0 || y1 <= y0;
}

PDF_Rect& PDF_Rect::include(const PDF_Rect& other) {
    if (is_empty()) {
        *this = other;
        return *this;
    }
    if (other.is_empty()) {
        return *this;
    }
    x0 = std::min(x0, other.x0);
    y0 = std::min(y0, other.y0);
    x1 = std::max(x1, other.x1);
    y1 = std::max(y1, other.y1);
    return *this;
}

bool PDF_Rect::intersects(const PDF_Rect& other) const {
    return x0 < other.x1 && other.x0 < x1 &&
           y0 < other.y1 && other.y0 < y1;
}

const char* archetype_name(Document_Archetype archetype) {
    switch (archetype) {
        case Document_Archetype::FORM:
            return "form";
        case Document_Archetype::RFP:
            return "rfp";
        case Document_Archetype::FLYER:
            return "flyer";
        case Document_Archetype::GENERIC:
        default:
            return "generic";
    }
}

const char* heading_level_name(Heading_Level level) {
    switch (level) {
        case Heading_Level::TITLE:
            return "TITLE";
        case Heading_Level::H1:
            return "H1";
        case Heading_Level::H2:
            return "H2";
        case Heading_Level::H3:
        default:
            return "H3";
    }
}
