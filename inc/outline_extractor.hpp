#pragma once

#include "outline_types.hpp"
#include "line_reconstructor.hpp"

Outline_Document extract_outline(const PDF_Document& document,
                                 const Line_Reconstruction_Options& options = Line_Reconstruction_Options());
