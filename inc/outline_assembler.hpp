#pragma once

#include <vector>

#include "outline_types.hpp"

Outline_Document assemble_outline(std::vector<Heading_Candidate> candidates, const Document_Profile& profile);
