#pragma once

#include <vector>

#include "outline_types.hpp"

// vertical gap allowed between consecutive lines, relative to the taller line
#ifndef OUTLINE_DEDUP_ADJACENT_GAP
#define OUTLINE_DEDUP_ADJACENT_GAP 0.5
#endif

bool are_duplicate_headings(const Heading_Candidate& a, const Heading_Candidate& b);

std::vector<Heading_Candidate> deduplicate_headings(const std::vector<Heading_Candidate>& candidates);
