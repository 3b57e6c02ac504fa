#include "mocap/bvh/MotionDocument.hpp"
#include "mocap/core/common.hpp"

#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace mocap::bvh
{
    MotionDocument::MotionDocument(Joint root, size_t frameCount, Seconds frameTime)
        : m_root(std::move(root)), m_frameCount(frameCount), m_frameTime(frameTime)
    {
        m_curves.assign(countChannels(m_root), ChannelCurve(frameCount));
    }

    void MotionDocument::setFrame(size_t frame, const std::vector<float>& values)
    {
        MOCAP_ASSERT(frame < m_frameCount, "frame index out of range");
        MOCAP_ASSERT(values.size() == m_curves.size(), "frame row width does not match channel count");
        for (size_t i = 0; i < m_curves.size(); ++i)
        {
            m_curves[i].setKey(frame, values[i]);
        }
    }

    std::string MotionDocument::summary() const
    {
        return fmt::format("{}nodes, {}channels, {}frames, {:.2f}seconds",
                           nodeCount(), channelCount(), m_frameCount, duration().count());
    }

    const Joint* MotionDocument::findJoint(std::string_view name) const
    {
        return bvh::findJoint(m_root, name);
    }

    std::optional<size_t> MotionDocument::channelOffset(std::string_view jointName) const
    {
        size_t offset = 0;
        for (const Joint& joint : preorder(m_root))
        {
            if (joint.name == jointName)
            {
                return offset;
            }
            offset += joint.channels.size();
        }
        return std::nullopt;
    }

    std::optional<size_t> MotionDocument::channelOffset(const Joint& target) const
    {
        size_t offset = 0;
        for (const Joint& joint : preorder(m_root))
        {
            if (&joint == &target)
            {
                return offset;
            }
            offset += joint.channels.size();
        }
        return std::nullopt;
    }

    std::optional<float> MotionDocument::sample(std::string_view jointName, ChannelKind kind, size_t frame) const
    {
        if (frame >= m_frameCount)
        {
            return std::nullopt;
        }
        const Joint* joint = findJoint(jointName);
        if (joint == nullptr)
        {
            return std::nullopt;
        }
        const auto it = std::find(joint->channels.begin(), joint->channels.end(), kind);
        if (it == joint->channels.end())
        {
            return std::nullopt;
        }
        const auto base = channelOffset(*joint);
        if (!base)
        {
            return std::nullopt;
        }
        const size_t index = *base + util::sz(it - joint->channels.begin());
        return m_curves[index][frame];
    }

    std::vector<float> MotionDocument::frameRow(size_t frame) const
    {
        std::vector<float> row;
        if (frame >= m_frameCount)
        {
            return row;
        }
        row.reserve(m_curves.size());
        for (const auto& curve : m_curves)
        {
            row.push_back(curve[frame]);
        }
        return row;
    }
} // namespace mocap::bvh
