#include <catch2/catch.hpp>

#include "heading_classifier.hpp"
#include "test_helpers.hpp"

#include <limits>

namespace {

Line_Features features_of(double size_ratio, bool bold, double whitespace_above = 2,
                          const std::string& text = "Heading") {
    Line_Features features;
    features.size_ratio = size_ratio;
    features.bold = bold;
    features.whitespace_above = whitespace_above;
    features.eligible = true;
    features.numbering = detect_numbering(text);
    return features;
}

bool level_of(const Line_Features& features, Document_Archetype archetype, Heading_Level& level) {
    return classify_heading_level(features, archetype_policy(archetype), level);
}

const Heading_Candidate* find_candidate(const std::vector<Heading_Candidate>& candidates, const std::string& text) {
    for (const Heading_Candidate& candidate : candidates) {
        if (candidate.line.text == text) {
            return &candidate;
        }
    }
    return nullptr;
}

}

TEST_CASE("Archetype policies", "[headings]") {
    REQUIRE(archetype_policy(Document_Archetype::GENERIC).allow_title);
    REQUIRE_FALSE(archetype_policy(Document_Archetype::FLYER).allow_title);
    REQUIRE(archetype_policy(Document_Archetype::RFP).numbering_first);
    REQUIRE_FALSE(archetype_policy(Document_Archetype::FORM).numbering_enabled);
    REQUIRE(archetype_policy(Document_Archetype::FORM).h1_ratio > archetype_policy(Document_Archetype::GENERIC).h1_ratio);
}

TEST_CASE("Line features measure size, spacing and numbering", "[headings]") {
    Document_Profile profile = make_profile(Document_Archetype::GENERIC, 10, 1);
    PDF_Line previous = make_line("Some body text closing a paragraph", 1, 100, 10);
    PDF_Line line = make_line("2.1 Method", 1, 134, 15, true);

    Line_Features features = compute_line_features(line, &previous, profile);
    REQUIRE(features.size_ratio == Approx(1.5));
    REQUIRE(features.bold);
    REQUIRE(features.eligible);
    REQUIRE(features.whitespace_above == Approx(2.0));
    REQUIRE(features.numbering.numbering_level == 2);

    Line_Features first = compute_line_features(line, nullptr, profile);
    REQUIRE(first.whitespace_above == std::numeric_limits<double>::infinity());

    PDF_Line on_next_page = make_line("2.1 Method", 2, 134, 15, true);
    REQUIRE(compute_line_features(on_next_page, &previous, profile).whitespace_above == std::numeric_limits<double>::infinity());

    REQUIRE_FALSE(compute_line_features(make_line("42", 1, 200, 20), &previous, profile).eligible);
    REQUIRE_FALSE(compute_line_features(make_line(std::string(200, 'x'), 1, 200, 20), &previous, profile).eligible);
    REQUIRE_FALSE(compute_line_features(make_line("\xE2\x80\xA2 \xE2\x80\xA2 \xE2\x80\xA2", 1, 200, 20), &previous, profile).eligible);

    // fine print is never treated as a numbered heading
    Line_Features footnote = compute_line_features(make_line("1. Source Data", 1, 700, 7), &previous, profile);
    REQUIRE_FALSE(footnote.numbering.is_numbered());
}

TEST_CASE("Generic documents rank headings by size and weight", "[headings]") {
    Heading_Level level = Heading_Level::TITLE;

    REQUIRE(level_of(features_of(1.6, false), Document_Archetype::GENERIC, level));
    REQUIRE(level == Heading_Level::H1);

    REQUIRE(level_of(features_of(1.25, true), Document_Archetype::GENERIC, level));
    REQUIRE(level == Heading_Level::H1);

    REQUIRE(level_of(features_of(1.18, true), Document_Archetype::GENERIC, level));
    REQUIRE(level == Heading_Level::H2);

    REQUIRE(level_of(features_of(1.05, true, 1.0), Document_Archetype::GENERIC, level));
    REQUIRE(level == Heading_Level::H3);

    REQUIRE_FALSE(level_of(features_of(1.05, true, 0.2), Document_Archetype::GENERIC, level));
    REQUIRE_FALSE(level_of(features_of(1.2, false), Document_Archetype::GENERIC, level));

    Line_Features ineligible = features_of(3.0, true);
    ineligible.eligible = false;
    REQUIRE_FALSE(level_of(ineligible, Document_Archetype::GENERIC, level));
}

TEST_CASE("Generic numbering maps depth to H2 and H3", "[headings]") {
    Heading_Level level = Heading_Level::TITLE;

    REQUIRE(level_of(features_of(1.0, false, 1, "3. Results"), Document_Archetype::GENERIC, level));
    REQUIRE(level == Heading_Level::H2);

    REQUIRE(level_of(features_of(1.0, false, 1, "3.2 Analysis"), Document_Archetype::GENERIC, level));
    REQUIRE(level == Heading_Level::H3);

    REQUIRE(level_of(features_of(1.0, false, 1, "3.2.1 Sampling"), Document_Archetype::GENERIC, level));
    REQUIRE(level == Heading_Level::H3);

    // size still wins for a large numbered line
    REQUIRE(level_of(features_of(1.6, false, 1, "3.2 Analysis"), Document_Archetype::GENERIC, level));
    REQUIRE(level == Heading_Level::H1);
}

TEST_CASE("Dates, addresses and author names stay body text", "[headings]") {
    Document_Profile profile = make_profile(Document_Archetype::GENERIC, 10, 3);
    std::vector<PDF_Line> lines = {
        make_line("15 January 2024", 2, 100, 10),
        make_line("J. Smith", 2, 114, 10),
        make_line("221 Baker Street", 2, 128, 10),
    };
    REQUIRE(classify_headings(lines, profile).empty());
}

TEST_CASE("Proposals follow their numbering before size", "[headings]") {
    Heading_Level level = Heading_Level::TITLE;

    REQUIRE(level_of(features_of(1.0, true, 1, "1. Scope"), Document_Archetype::RFP, level));
    REQUIRE(level == Heading_Level::H1);

    REQUIRE(level_of(features_of(1.6, true, 1, "1.1 Background"), Document_Archetype::RFP, level));
    REQUIRE(level == Heading_Level::H2);

    REQUIRE(level_of(features_of(1.0, false, 1, "1.1.2 Timeline"), Document_Archetype::RFP, level));
    REQUIRE(level == Heading_Level::H3);
}

TEST_CASE("Forms ignore numbering", "[headings]") {
    Heading_Level level = Heading_Level::TITLE;
    REQUIRE_FALSE(level_of(features_of(1.0, false, 1, "1. Applicant Details"), Document_Archetype::FORM, level));
}

TEST_CASE("Confidence grows with every signal", "[headings]") {
    const Archetype_Policy& policy = archetype_policy(Document_Archetype::GENERIC);
    double plain = heading_confidence(features_of(1.5, false, 0), policy);
    double bold = heading_confidence(features_of(1.5, true, 0), policy);
    double spaced = heading_confidence(features_of(1.5, true, 2), policy);
    double numbered = heading_confidence(features_of(1.5, true, 2, "2. Scope"), policy);

    REQUIRE(plain > 0);
    REQUIRE(bold > plain);
    REQUIRE(spaced > bold);
    REQUIRE(numbered > spaced);
}

SCENARIO("At most one title is chosen on the first page") {
    Document_Profile profile = make_profile(Document_Archetype::GENERIC, 12, 3);

    GIVEN("A title followed by a slightly smaller subtitle") {
        std::vector<PDF_Line> lines = {
            make_line("Annual Report 2024", 1, 100, 28),
            make_line("Financial Overview", 1, 140, 24),
            make_line("The year closed with results well ahead of plan", 1, 200, 12),
        };

        WHEN("Classifying the lines") {
            std::vector<Heading_Candidate> candidates = classify_headings(lines, profile);

            THEN("The largest line is the title and the subtitle becomes H1") {
                REQUIRE(candidates.size() == 2);
                REQUIRE(candidates[0].level == Heading_Level::TITLE);
                REQUIRE(candidates[0].line.text == "Annual Report 2024");
                REQUIRE(candidates[1].level == Heading_Level::H1);
                REQUIRE(candidates[1].line_index == 1);
            }
        }
    }

    GIVEN("Two title sized lines of the same size") {
        std::vector<PDF_Line> lines = {
            make_line("Lower Heading", 1, 300, 24),
            make_line("Upper Heading", 1, 100, 24),
        };

        THEN("The topmost one is the title") {
            std::vector<Heading_Candidate> candidates = classify_headings(lines, profile);
            const Heading_Candidate* upper = find_candidate(candidates, "Upper Heading");
            const Heading_Candidate* lower = find_candidate(candidates, "Lower Heading");
            REQUIRE(upper != nullptr);
            REQUIRE(lower != nullptr);
            REQUIRE(upper->level == Heading_Level::TITLE);
            REQUIRE(lower->level == Heading_Level::H1);
        }
    }

    GIVEN("A larger line further down the top half") {
        std::vector<PDF_Line> lines = {
            make_line("Department of Energy", 1, 100, 24),
            make_line("Grid Modernization Plan", 1, 300, 28),
        };

        THEN("Size wins over position") {
            std::vector<Heading_Candidate> candidates = classify_headings(lines, profile);
            REQUIRE(find_candidate(candidates, "Grid Modernization Plan")->level == Heading_Level::TITLE);
            REQUIRE(find_candidate(candidates, "Department of Energy")->level == Heading_Level::H1);
        }
    }

    GIVEN("Large lines outside the top half of page one or on later pages") {
        std::vector<PDF_Line> lines = {
            make_line("Closing Remarks", 1, 600, 28),
            make_line("Second Part", 2, 100, 28),
        };

        THEN("Neither becomes the title") {
            std::vector<Heading_Candidate> candidates = classify_headings(lines, profile);
            REQUIRE(candidates.size() == 2);
            REQUIRE(candidates[0].level == Heading_Level::H1);
            REQUIRE(candidates[1].level == Heading_Level::H1);
        }
    }

    GIVEN("A flyer") {
        Document_Profile flyer = make_profile(Document_Archetype::FLYER, 10, 1);
        std::vector<PDF_Line> lines = {make_line("Welcome", 1, 100, 40)};

        THEN("Its headline stays an H1") {
            std::vector<Heading_Candidate> candidates = classify_headings(lines, flyer);
            REQUIRE(candidates.size() == 1);
            REQUIRE(candidates[0].level == Heading_Level::H1);
        }
    }

    GIVEN("A title wrapped over two lines of the same size") {
        std::vector<PDF_Line> lines = {
            make_line("Request for Proposal to Develop the", 1, 100, 24),
            make_line("Ontario Digital Library Business Plan", 1, 128, 24),
            make_line("Summary", 1, 200, 16, true),
        };

        THEN("Both lines form the title and neither reaches the outline") {
            std::vector<Heading_Candidate> candidates = classify_headings(lines, profile);
            REQUIRE(candidates.size() == 2);
            REQUIRE(candidates[0].level == Heading_Level::TITLE);
            REQUIRE(candidates[0].line.text == "Request for Proposal to Develop the Ontario Digital Library Business Plan");
            REQUIRE(candidates[0].line_index == 0);
            REQUIRE(candidates[0].line.bbox.y1 == Approx(152));
            REQUIRE(candidates[1].line.text == "Summary");
        }
    }

    GIVEN("A same sized line far below the title") {
        std::vector<PDF_Line> lines = {
            make_line("Upper Heading", 1, 100, 24),
            make_line("Lower Heading", 1, 200, 24),
        };

        THEN("It stays a heading of its own") {
            std::vector<Heading_Candidate> candidates = classify_headings(lines, profile);
            REQUIRE(candidates.size() == 2);
            REQUIRE(candidates[0].line.text == "Upper Heading");
            REQUIRE(candidates[0].level == Heading_Level::TITLE);
            REQUIRE(candidates[1].level == Heading_Level::H1);
        }
    }
}
