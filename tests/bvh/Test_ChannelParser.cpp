#include <doctest/doctest.h>
#include "mocap/bvh/BvhParser.hpp"

using namespace mocap::bvh;

TEST_CASE("Channel names") {
    CHECK(channelKindFromName("Xposition") == ChannelKind::XPosition);
    CHECK(channelKindFromName("Zrotation") == ChannelKind::ZRotation);
    CHECK_FALSE(channelKindFromName("xposition").has_value());
    CHECK_FALSE(channelKindFromName("XPOSITION").has_value());
    CHECK_FALSE(channelKindFromName("Wposition").has_value());

    CHECK(toString(ChannelKind::YRotation) == "Yrotation");
    CHECK(isPosition(ChannelKind::ZPosition));
    CHECK(isRotation(ChannelKind::XRotation));
    CHECK(axisIndex(ChannelKind::YPosition) == 1);
}

TEST_CASE("CHANNELS line parsing") {
    SUBCASE("Declaration order is preserved") {
        const auto channels =
            BvhParser::parseChannels("CHANNELS 6 Xposition Yposition Zposition Zrotation Xrotation Yrotation");
        REQUIRE(channels.has_value());
        REQUIRE(channels->size() == 6);
        CHECK((*channels)[0] == ChannelKind::XPosition);
        CHECK((*channels)[3] == ChannelKind::ZRotation);
        CHECK((*channels)[4] == ChannelKind::XRotation);
        CHECK((*channels)[5] == ChannelKind::YRotation);
    }

    SUBCASE("Leading indentation is accepted") {
        const auto channels = BvhParser::parseChannels("\t\tCHANNELS 3 Zrotation Xrotation Yrotation\r");
        REQUIRE(channels.has_value());
        CHECK(channels->size() == 3);
    }

    SUBCASE("Zero channels") {
        const auto channels = BvhParser::parseChannels("CHANNELS 0");
        REQUIRE(channels.has_value());
        CHECK(channels->empty());
    }

    SUBCASE("Missing keyword") {
        const auto channels = BvhParser::parseChannels("OFFSET 0 0 0");
        REQUIRE_FALSE(channels.has_value());
        CHECK(channels.error().kind == ErrorKind::GrammarError);
    }

    SUBCASE("Fewer names than declared") {
        const auto channels = BvhParser::parseChannels("CHANNELS 3 Xposition Yposition");
        REQUIRE_FALSE(channels.has_value());
        CHECK(channels.error().kind == ErrorKind::ChannelCountMismatch);
        CHECK(channels.error().expected == 3);
        CHECK(channels.error().actual == 2);
    }

    SUBCASE("More names than declared") {
        const auto channels = BvhParser::parseChannels("CHANNELS 1 Xposition Yposition");
        REQUIRE_FALSE(channels.has_value());
        CHECK(channels.error().kind == ErrorKind::ChannelCountMismatch);
    }

    SUBCASE("Misspelled name") {
        const auto channels = BvhParser::parseChannels("CHANNELS 3 Wposition Yposition Zposition");
        REQUIRE_FALSE(channels.has_value());
        CHECK(channels.error().kind == ErrorKind::UnknownChannelName);
        CHECK(channels.error().message.find("Wposition") != std::string::npos);
    }

    SUBCASE("Non-numeric count") {
        const auto channels = BvhParser::parseChannels("CHANNELS three Xposition Yposition Zposition");
        REQUIRE_FALSE(channels.has_value());
        CHECK(channels.error().kind == ErrorKind::NumericParseError);
    }
}
