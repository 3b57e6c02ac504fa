#include <doctest/doctest.h>
#include "mocap/bvh/BvhParser.hpp"
#include "mocap/bvh/PoseSampler.hpp"
#include "BvhTestData.hpp"

#include <cmath>
#include <limits>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

using namespace mocap::bvh;

namespace {

glm::quat eulerZXY(float z, float x, float y) {
    return glm::angleAxis(glm::radians(z), glm::vec3(0, 0, 1)) *
           glm::angleAxis(glm::radians(x), glm::vec3(1, 0, 0)) *
           glm::angleAxis(glm::radians(y), glm::vec3(0, 1, 0));
}

void checkSameRotation(const glm::quat &actual, const glm::quat &expected) {
    // q and -q describe the same rotation
    CHECK(std::abs(glm::dot(actual, expected)) == doctest::Approx(1.0).epsilon(1e-5));
}

} // namespace

TEST_CASE("PoseSampler frame sampling") {
    const auto document = BvhParser::parse(mocap::test::kHipsSpine);
    REQUIRE(document.has_value());
    const PoseSampler sampler(*document);

    SUBCASE("Rest pose uses offsets") {
        const auto pose = sampler.restPose();
        REQUIRE(pose.size() == 2);
        CHECK(pose[0].joint == &document->root());
        CHECK(pose[1].translation.y == doctest::Approx(5.2));
        checkSameRotation(pose[1].rotation, glm::quat(1, 0, 0, 0));
    }

    SUBCASE("Position channels replace the offset") {
        const auto pose = sampler.sampleFrame(0);
        REQUIRE(pose.size() == 2);
        CHECK(pose[0].translation.x == doctest::Approx(1.0));
        CHECK(pose[0].translation.y == doctest::Approx(2.0));
        CHECK(pose[0].translation.z == doctest::Approx(3.0));
        CHECK(pose[1].translation.y == doctest::Approx(5.2));
    }

    SUBCASE("Rotations compose in declaration order") {
        const auto pose = sampler.sampleFrame(0);
        checkSameRotation(pose[0].rotation, eulerZXY(10.0F, 20.0F, 30.0F));
        checkSameRotation(pose[1].rotation, eulerZXY(4.0F, 5.0F, 6.0F));
    }

    SUBCASE("Out-of-range frame returns the rest pose") {
        const auto pose = sampler.sampleFrame(2);
        REQUIRE(pose.size() == 2);
        CHECK(pose[0].translation.x == doctest::Approx(0.0));
    }
}

TEST_CASE("PoseSampler time sampling") {
    const auto document = BvhParser::parse(mocap::test::kHipsSpine);
    REQUIRE(document.has_value());
    const PoseSampler sampler(*document);
    const double frameTime = document->frameTime().count();

    SUBCASE("Halfway between frames") {
        const auto pose = sampler.sampleAtTime(0.5 * frameTime);
        CHECK(pose[0].translation.x == doctest::Approx(1.25));
        CHECK(pose[0].translation.z == doctest::Approx(3.25));
    }

    SUBCASE("Clamped past the end") {
        const auto pose = sampler.sampleAtTime(100.0);
        CHECK(pose[0].translation.x == doctest::Approx(1.5));
    }

    SUBCASE("Clamped before the start") {
        const auto pose = sampler.sampleAtTime(-1.0);
        CHECK(pose[0].translation.x == doctest::Approx(1.0));
    }

    SUBCASE("Looping wraps the last frame into the first") {
        const auto pose = sampler.sampleAtTime(1.5 * frameTime, true);
        CHECK(pose[0].translation.x == doctest::Approx(1.25));

        const auto negative = sampler.sampleAtTime(-0.5 * frameTime, true);
        CHECK(negative[0].translation.x == doctest::Approx(1.25));
    }

    SUBCASE("Non-finite times fall back to the clip ends") {
        const double notANumber = std::numeric_limits<double>::quiet_NaN();
        const double infinity = std::numeric_limits<double>::infinity();

        CHECK(sampler.sampleAtTime(notANumber)[0].translation.x == doctest::Approx(1.0));
        CHECK(sampler.sampleAtTime(notANumber, true)[0].translation.x == doctest::Approx(1.0));
        CHECK(sampler.sampleAtTime(infinity)[0].translation.x == doctest::Approx(1.5));
        CHECK(sampler.sampleAtTime(-infinity)[0].translation.x == doctest::Approx(1.0));
        CHECK(sampler.sampleAtTime(infinity, true)[0].translation.x == doctest::Approx(1.0));
        CHECK(sampler.sampleAtTime(std::numeric_limits<double>::max(), true).size() == 2);
    }

    SUBCASE("Exact frame times match sampleFrame") {
        const auto timed = sampler.sampleAtTime(frameTime);
        const auto framed = sampler.sampleFrame(1);
        CHECK(timed[0].translation.x == doctest::Approx(framed[0].translation.x));
        checkSameRotation(timed[1].rotation, framed[1].rotation);
    }
}

TEST_CASE("PoseSampler on a document without frames") {
    const auto document = BvhParser::parse(
        "HIERARCHY\nROOT Hips\n{\n OFFSET 1 2 3\n CHANNELS 3 Xposition Yposition Zposition\n}\n"
        "MOTION\nFrames: 0\nFrame Time: 0.1\n");
    REQUIRE(document.has_value());
    const PoseSampler sampler(*document);

    const auto pose = sampler.sampleAtTime(0.3, true);
    REQUIRE(pose.size() == 1);
    CHECK(pose[0].translation.x == doctest::Approx(1.0));
    CHECK(pose[0].translation.z == doctest::Approx(3.0));
}
