#pragma once

#include "mocap/bvh/Channel.hpp"
#include "mocap/bvh/Skeleton.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mocap::bvh
{
    using Seconds = std::chrono::duration<double>;

    // Samples of one channel of one joint, one per frame
    class ChannelCurve
    {
    public:
        explicit ChannelCurve(size_t frameCount) : m_keys(frameCount, 0.0F) {}

        void setKey(size_t frame, float value) { m_keys[frame] = value; }

        [[nodiscard]] float key(size_t frame) const { return m_keys[frame]; }
        [[nodiscard]] float operator[](size_t frame) const { return m_keys[frame]; }
        [[nodiscard]] size_t size() const { return m_keys.size(); }
        [[nodiscard]] const std::vector<float>& keys() const { return m_keys; }

        bool operator==(const ChannelCurve&) const = default;

    private:
        std::vector<float> m_keys;
    };

    /**
     * @brief Parsed BVH file: skeleton plus per-channel motion curves.
     *
     * curves() holds one curve per declared channel, ordered by a pre-order walk
     * of the skeleton with each joint's channels kept contiguous and in declaration
     * order. Every curve has frameCount() samples. Immutable once constructed.
     */
    class MotionDocument
    {
    public:
        MotionDocument(Joint root, size_t frameCount, Seconds frameTime);

        [[nodiscard]] const Joint& root() const { return m_root; }
        [[nodiscard]] const std::vector<ChannelCurve>& curves() const { return m_curves; }
        [[nodiscard]] size_t frameCount() const { return m_frameCount; }
        [[nodiscard]] Seconds frameTime() const { return m_frameTime; }
        [[nodiscard]] Seconds duration() const { return m_frameTime * static_cast<double>(m_frameCount); }

        [[nodiscard]] size_t nodeCount() const { return countJoints(m_root); }
        [[nodiscard]] size_t channelCount() const { return m_curves.size(); }

        // "<n>nodes, <c>channels, <f>frames, <s>seconds"
        [[nodiscard]] std::string summary() const;

        [[nodiscard]] const Joint* findJoint(std::string_view name) const;

        // Index into curves() of the joint's first channel
        [[nodiscard]] std::optional<size_t> channelOffset(std::string_view jointName) const;
        [[nodiscard]] std::optional<size_t> channelOffset(const Joint& joint) const;

        [[nodiscard]] std::optional<float> sample(std::string_view jointName, ChannelKind kind, size_t frame) const;

        // All channel values of one frame, in curve order
        [[nodiscard]] std::vector<float> frameRow(size_t frame) const;

        bool operator==(const MotionDocument&) const = default;

    private:
        friend class BvhParser;

        void setFrame(size_t frame, const std::vector<float>& values);

        Joint m_root;
        size_t m_frameCount = 0;
        Seconds m_frameTime{0.0};
        std::vector<ChannelCurve> m_curves;
    };
} // namespace mocap::bvh
