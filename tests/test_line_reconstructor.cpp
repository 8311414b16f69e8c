#include <catch2/catch.hpp>

#include "line_reconstructor.hpp"
#include "test_helpers.hpp"

SCENARIO("Runs on one baseline become a single line") {
    GIVEN("A word split into two touching runs") {
        PDF_Text_Run first = make_run("Intro", 72, 100, 14, true);
        PDF_Text_Run second = make_run("duction", first.bbox.x1, 100, 14, true);
        PDF_Page page = make_page(1, {first, second});

        WHEN("Reconstructing the page") {
            std::vector<PDF_Line> lines = reconstruct_page_lines(page);

            THEN("The fragments join without a space") {
                REQUIRE(lines.size() == 1);
                REQUIRE(lines[0].text == "Introduction");
                REQUIRE(lines[0].bold);
                REQUIRE(lines[0].dominant_font_size == Approx(14));
                REQUIRE(lines[0].bbox.x0 == Approx(72));
                REQUIRE(lines[0].bbox.x1 == Approx(second.bbox.x1));
                REQUIRE(lines[0].page == 1);
                REQUIRE(lines[0].runs.size() == 2);
            }
        }
    }

    GIVEN("Two words separated by a visible gap, listed right to left") {
        PDF_Text_Run hello = make_run("Hello", 72, 100, 12);
        PDF_Text_Run world = make_run("world", hello.bbox.x1 + 4, 100, 12);
        PDF_Page page = make_page(1, {world, hello});

        THEN("They are ordered left to right with a space between them") {
            std::vector<PDF_Line> lines = reconstruct_page_lines(page);
            REQUIRE(lines.size() == 1);
            REQUIRE(lines[0].text == "Hello world");
        }
    }

    GIVEN("A superscript starting above the baseline") {
        PDF_Text_Run formula = make_run("E=mc", 72, 100, 12);
        PDF_Text_Run exponent = make_run("2", formula.bbox.x1, 97, 7);
        PDF_Page page = make_page(1, {formula, exponent});

        THEN("It stays on the line and does not decide the font size") {
            std::vector<PDF_Line> lines = reconstruct_page_lines(page);
            REQUIRE(lines.size() == 1);
            REQUIRE(lines[0].text == "E=mc2");
            REQUIRE(lines[0].dominant_font_size == Approx(12));
        }
    }

    GIVEN("Two columns sharing a baseline") {
        PDF_Page page = make_page(1, {make_run("Left column", 72, 100, 10), make_run("Right column", 320, 100, 10)});

        THEN("The gutter splits them into separate lines") {
            std::vector<PDF_Line> lines = reconstruct_page_lines(page);
            REQUIRE(lines.size() == 2);
            REQUIRE(lines[0].text == "Left column");
            REQUIRE(lines[1].text == "Right column");
        }
    }
}

SCENARIO("Lines follow reading order") {
    GIVEN("Runs listed bottom to top") {
        PDF_Page page = make_page(1, {
            make_run("Third", 72, 300, 10),
            make_run("First", 72, 100, 10),
            make_run("Second", 72, 200, 10),
        });

        THEN("Lines come out top to bottom") {
            std::vector<PDF_Line> lines = reconstruct_page_lines(page);
            REQUIRE(lines.size() == 3);
            REQUIRE(lines[0].text == "First");
            REQUIRE(lines[1].text == "Second");
            REQUIRE(lines[2].text == "Third");
        }
    }

    GIVEN("A document with two pages") {
        PDF_Document document;
        document.pages.push_back(make_page(1, {make_run("Page one", 72, 500, 10)}));
        document.pages.push_back(make_page(2, {make_run("Page two", 72, 80, 10)}));

        THEN("Page order wins over vertical position") {
            std::vector<PDF_Line> lines = reconstruct_lines(document);
            REQUIRE(lines.size() == 2);
            REQUIRE(lines[0].page == 1);
            REQUIRE(lines[1].page == 2);
            REQUIRE(lines[1].page_height == Approx(test_page_height));
        }
    }
}

TEST_CASE("Whitespace-only runs produce no lines", "[lines]") {
    PDF_Page page = make_page(1, {make_run("   ", 72, 100, 10), make_run("\t", 72, 200, 10)});
    REQUIRE(reconstruct_page_lines(page).empty());
}

TEST_CASE("Dominant font size and weight follow the character plurality", "[lines]") {
    PDF_Text_Run capital = make_run("A", 72, 100, 20, true);
    PDF_Text_Run rest = make_run("nnouncements", capital.bbox.x1, 106, 10);
    PDF_Page page = make_page(1, {capital, rest});

    std::vector<PDF_Line> lines = reconstruct_page_lines(page);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].text == "Announcements");
    REQUIRE(lines[0].dominant_font_size == Approx(10));
    REQUIRE_FALSE(lines[0].bold);
}

TEST_CASE("A run spanning several text lines is split", "[lines]") {
    PDF_Text_Run block = make_run("First line\nSecond line", 72, 100, 12);
    block.bbox.y1 = 130;
    PDF_Page page = make_page(1, {block});

    std::vector<PDF_Line> lines = reconstruct_page_lines(page);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].text == "First line");
    REQUIRE(lines[1].text == "Second line");
    REQUIRE(lines[0].bbox.y0 == Approx(100));
    REQUIRE(lines[1].bbox.y0 == Approx(115));
}

TEST_CASE("A line break inside a single visual line is a space", "[lines]") {
    PDF_Page page = make_page(1, {make_run("Terms of\nReference", 72, 100, 12)});

    std::vector<PDF_Line> lines = reconstruct_page_lines(page);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].text == "Terms of Reference");
}

SCENARIO("Overprinted text is kept once") {
    GIVEN("The same word drawn twice, shifted by half a point") {
        PDF_Page page = make_page(1, {
            make_run("Introduction", 72, 100, 16, true),
            make_run("Introduction", 72.5, 100.5, 16, true),
        });

        THEN("A single copy remains") {
            std::vector<PDF_Line> lines = reconstruct_page_lines(page);
            REQUIRE(lines.size() == 1);
            REQUIRE(lines[0].text == "Introduction");
            REQUIRE(lines[0].runs.size() == 1);
        }
    }

    GIVEN("A repeated syllable set side by side") {
        PDF_Text_Run first = make_run("ha", 72, 100, 12);
        PDF_Text_Run second = make_run("ha", first.bbox.x1, 100, 12);
        PDF_Page page = make_page(1, {first, second});

        THEN("Both copies are kept") {
            std::vector<PDF_Line> lines = reconstruct_page_lines(page);
            REQUIRE(lines.size() == 1);
            REQUIRE(lines[0].text == "haha");
        }
    }

    GIVEN("Different text drawn over the same spot") {
        PDF_Page page = make_page(1, {
            make_run("Draft", 72, 100, 12),
            make_run("Final", 73, 100, 12),
        });

        THEN("Neither run is dropped") {
            std::vector<PDF_Line> lines = reconstruct_page_lines(page);
            REQUIRE(lines.size() == 1);
            REQUIRE(lines[0].runs.size() == 2);
        }
    }
}
