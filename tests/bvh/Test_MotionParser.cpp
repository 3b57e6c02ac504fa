#include <doctest/doctest.h>
#include "mocap/bvh/BvhParser.hpp"
#include "BvhTestData.hpp"

#include <string>

using namespace mocap::bvh;

namespace {

const std::string kHierarchy =
    "HIERARCHY\n"
    "ROOT Hips\n"
    "{\n"
    "  OFFSET 0 0 0\n"
    "  CHANNELS 3 Xposition Yposition Zposition\n"
    "  End Site\n"
    "  {\n"
    "    OFFSET 0 1 0\n"
    "  }\n"
    "}\n";

} // namespace

TEST_CASE("Two-joint document end to end") {
    const auto document = BvhParser::parse(mocap::test::kHipsSpine);
    REQUIRE(document.has_value());

    CHECK(document->nodeCount() == 2);
    CHECK(document->channelCount() == 9);
    CHECK(document->frameCount() == 2);
    CHECK(document->frameTime().count() == doctest::Approx(0.0333333));

    for (const auto &curve : document->curves()) {
        CHECK(curve.size() == 2);
    }

    SUBCASE("Row values land in depth-first channel order") {
        const auto &curves = document->curves();
        CHECK(curves[0][0] == doctest::Approx(1.0));
        CHECK(curves[3][0] == doctest::Approx(10.0));
        CHECK(curves[5][1] == doctest::Approx(31.0));
        CHECK(curves[6][0] == doctest::Approx(4.0));
        CHECK(curves[8][1] == doctest::Approx(9.0));
    }
}

TEST_CASE("Parsing is deterministic") {
    const auto first = BvhParser::parse(mocap::test::kHipsSpine);
    const auto second = BvhParser::parse(mocap::test::kHipsSpine);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->root() == second->root());
    CHECK(first->curves() == second->curves());
    CHECK(*first == *second);
}

TEST_CASE("CRLF and indentation do not change the result") {
    std::string crlf;
    for (char c : mocap::test::kHipsSpine) {
        if (c == '\n') {
            crlf += "\r\n";
        } else {
            crlf += c;
        }
    }
    const auto lf = BvhParser::parse(mocap::test::kHipsSpine);
    const auto windows = BvhParser::parse(crlf);
    REQUIRE(lf.has_value());
    REQUIRE(windows.has_value());
    CHECK(*lf == *windows);
}

TEST_CASE("Motion section errors") {
    SUBCASE("Missing MOTION") {
        const auto document = BvhParser::parse(kHierarchy + "Frames: 1\nFrame Time: 0.1\n1 2 3\n");
        REQUIRE_FALSE(document.has_value());
        CHECK(document.error().kind == ErrorKind::StructuralError);
        CHECK(document.error().line == "Frames: 1");
    }

    SUBCASE("Input ends after the hierarchy") {
        const auto document = BvhParser::parse(kHierarchy);
        REQUIRE_FALSE(document.has_value());
        CHECK(document.error().kind == ErrorKind::StructuralError);
    }

    SUBCASE("Wrong Frames key") {
        const auto document = BvhParser::parse(kHierarchy + "MOTION\nFrameCount: 1\nFrame Time: 0.1\n1 2 3\n");
        REQUIRE_FALSE(document.has_value());
        CHECK(document.error().kind == ErrorKind::StructuralError);
    }

    SUBCASE("Non-numeric frame count") {
        const auto document = BvhParser::parse(kHierarchy + "MOTION\nFrames: many\nFrame Time: 0.1\n1 2 3\n");
        REQUIRE_FALSE(document.has_value());
        CHECK(document.error().kind == ErrorKind::NumericParseError);
    }

    SUBCASE("Negative frame count") {
        const auto document = BvhParser::parse(kHierarchy + "MOTION\nFrames: -1\nFrame Time: 0.1\n");
        REQUIRE_FALSE(document.has_value());
        CHECK(document.error().kind == ErrorKind::NumericParseError);
    }

    SUBCASE("Missing Frame Time") {
        const auto document = BvhParser::parse(kHierarchy + "MOTION\nFrames: 1\n1 2 3\n");
        REQUIRE_FALSE(document.has_value());
        CHECK(document.error().kind == ErrorKind::StructuralError);
    }

    SUBCASE("Non-numeric Frame Time") {
        const auto document = BvhParser::parse(kHierarchy + "MOTION\nFrames: 1\nFrame Time: fast\n1 2 3\n");
        REQUIRE_FALSE(document.has_value());
        CHECK(document.error().kind == ErrorKind::NumericParseError);
    }

    SUBCASE("Row with too few values") {
        const auto document = BvhParser::parse(kHierarchy + "MOTION\nFrames: 2\nFrame Time: 0.1\n1 2 3\n1 2\n");
        REQUIRE_FALSE(document.has_value());
        CHECK(document.error().kind == ErrorKind::FrameDataCountMismatch);
        CHECK(document.error().expected == 3);
        CHECK(document.error().actual == 2);
        CHECK(document.error().line == "1 2");
        CHECK(document.error().lineNumber == 15);
    }

    SUBCASE("Row with too many values") {
        const auto document = BvhParser::parse(kHierarchy + "MOTION\nFrames: 1\nFrame Time: 0.1\n1 2 3 4\n");
        REQUIRE_FALSE(document.has_value());
        CHECK(document.error().kind == ErrorKind::FrameDataCountMismatch);
        CHECK(document.error().actual == 4);
    }

    SUBCASE("Non-numeric sample") {
        const auto document = BvhParser::parse(kHierarchy + "MOTION\nFrames: 1\nFrame Time: 0.1\n1 two 3\n");
        REQUIRE_FALSE(document.has_value());
        CHECK(document.error().kind == ErrorKind::NumericParseError);
    }

    SUBCASE("Fewer rows than declared") {
        const auto document = BvhParser::parse(kHierarchy + "MOTION\nFrames: 1000000000\nFrame Time: 0.1\n1 2 3\n");
        REQUIRE_FALSE(document.has_value());
        CHECK(document.error().kind == ErrorKind::StructuralError);
        CHECK(document.error().expected == 1000000000);
        CHECK(document.error().actual == 1);
    }
}

TEST_CASE("Motion section edge cases") {
    SUBCASE("Zero frames") {
        const auto document = BvhParser::parse(kHierarchy + "MOTION\nFrames: 0\nFrame Time: 0.1\n");
        REQUIRE(document.has_value());
        CHECK(document->frameCount() == 0);
        CHECK(document->channelCount() == 3);
        for (const auto &curve : document->curves()) {
            CHECK(curve.size() == 0);
        }
    }

    SUBCASE("Extra whitespace in rows and headers") {
        const auto document =
            BvhParser::parse(kHierarchy + "MOTION\nFrames:\t1\nFrame Time:   0.25  \n  1.5\t 2.5   3.5  \n");
        REQUIRE(document.has_value());
        CHECK(document->frameTime().count() == doctest::Approx(0.25));
        CHECK(document->curves()[1][0] == doctest::Approx(2.5));
    }

    SUBCASE("Content after the last row is ignored") {
        const auto document = BvhParser::parse(kHierarchy + "MOTION\nFrames: 1\nFrame Time: 0.1\n1 2 3\n\n");
        REQUIRE(document.has_value());
        CHECK(document->frameCount() == 1);
    }

    SUBCASE("Tiny exponents read as zero") {
        const auto document = BvhParser::parse(kHierarchy + "MOTION\nFrames: 1\nFrame Time: 0.1\n1e-50 0 -1e-60\n");
        REQUIRE(document.has_value());
        CHECK(document->curves()[0][0] == 0.0F);
        CHECK(document->curves()[2][0] == 0.0F);
    }
}

TEST_CASE("Misspelled channel fails the whole document") {
    std::string text = mocap::test::kHipsSpine;
    const auto pos = text.find("Xposition");
    REQUIRE(pos != std::string::npos);
    text.replace(pos, 9, "Wposition");

    const auto document = BvhParser::parse(text);
    REQUIRE_FALSE(document.has_value());
    CHECK(document.error().kind == ErrorKind::UnknownChannelName);
    CHECK(document.error().lineNumber == 5);
}

TEST_CASE("ParseError formatting") {
    const auto document = BvhParser::parse(kHierarchy + "MOTION\nFrames: 1\nFrame Time: 0.1\n1 2\n");
    REQUIRE_FALSE(document.has_value());
    const std::string text = document.error().toString();
    CHECK(text.find("FrameDataCountMismatch") == 0);
    CHECK(text.find("line 14") != std::string::npos);
    CHECK(text.find("expected 3, got 2") != std::string::npos);
    CHECK(text.find("'1 2'") != std::string::npos);
}
