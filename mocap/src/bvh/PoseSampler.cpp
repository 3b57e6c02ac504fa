#include "mocap/bvh/PoseSampler.hpp"
#include "mocap/core/profiler.hpp"

#include <algorithm>
#include <cmath>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace mocap::bvh
{
    namespace
    {
        glm::vec3 axisVector(ChannelKind kind)
        {
            glm::vec3 axis(0.0F);
            axis[axisIndex(kind)] = 1.0F;
            return axis;
        }
    } // namespace

    PoseSampler::PoseSampler(const MotionDocument& document) : m_document(document)
    {
        size_t offset = 0;
        for (const Joint& joint : preorder(document.root()))
        {
            m_joints.push_back(&joint);
            m_channelOffsets.push_back(offset);
            offset += joint.channels.size();
        }
    }

    std::vector<JointPose> PoseSampler::restPose() const
    {
        std::vector<JointPose> pose;
        pose.reserve(m_joints.size());
        for (const Joint* joint : m_joints)
        {
            pose.push_back({joint, joint->offset, glm::quat(1.0F, 0.0F, 0.0F, 0.0F)});
        }
        return pose;
    }

    JointPose PoseSampler::evaluate(size_t jointIndex, size_t frame) const
    {
        const Joint* joint = m_joints[jointIndex];
        const auto& curves = m_document.curves();

        JointPose pose{joint, joint->offset, glm::quat(1.0F, 0.0F, 0.0F, 0.0F)};
        for (size_t c = 0; c < joint->channels.size(); ++c)
        {
            const ChannelKind kind = joint->channels[c];
            const float value = curves[m_channelOffsets[jointIndex] + c][frame];
            if (isPosition(kind))
            {
                pose.translation[axisIndex(kind)] = value;
            }
            else
            {
                pose.rotation = pose.rotation * glm::angleAxis(glm::radians(value), axisVector(kind));
            }
        }
        pose.rotation = glm::normalize(pose.rotation);
        return pose;
    }

    std::vector<JointPose> PoseSampler::sampleFrame(size_t frame) const
    {
        MOCAP_PROFILE_FUNCTION();
        if (frame >= m_document.frameCount())
        {
            return restPose();
        }

        std::vector<JointPose> pose;
        pose.reserve(m_joints.size());
        for (size_t i = 0; i < m_joints.size(); ++i)
        {
            pose.push_back(evaluate(i, frame));
        }
        return pose;
    }

    std::vector<JointPose> PoseSampler::sampleAtTime(double seconds, bool loop) const
    {
        MOCAP_PROFILE_FUNCTION();
        const size_t frameCount = m_document.frameCount();
        const double frameTime = m_document.frameTime().count();
        if (frameCount == 0)
        {
            return restPose();
        }
        if (frameCount == 1 || frameTime <= 0.0)
        {
            return sampleFrame(0);
        }

        double frames = seconds / frameTime;
        if (std::isnan(frames))
        {
            return sampleFrame(0);
        }
        if (std::isinf(frames))
        {
            return sampleFrame(!loop && frames > 0.0 ? frameCount - 1 : 0);
        }
        if (loop)
        {
            frames = std::fmod(frames, static_cast<double>(frameCount));
            if (frames < 0.0)
            {
                frames += static_cast<double>(frameCount);
            }
        }
        else
        {
            frames = std::clamp(frames, 0.0, static_cast<double>(frameCount - 1));
        }

        const auto frame0 = std::min(static_cast<size_t>(std::floor(frames)), frameCount - 1);
        const size_t frame1 = loop ? (frame0 + 1) % frameCount : std::min(frame0 + 1, frameCount - 1);
        const auto factor = static_cast<float>(frames - static_cast<double>(frame0));

        std::vector<JointPose> pose;
        pose.reserve(m_joints.size());
        for (size_t i = 0; i < m_joints.size(); ++i)
        {
            const JointPose a = evaluate(i, frame0);
            if (factor <= 0.0F || frame0 == frame1)
            {
                pose.push_back(a);
                continue;
            }
            const JointPose b = evaluate(i, frame1);
            pose.push_back({a.joint, glm::mix(a.translation, b.translation, factor),
                            glm::normalize(glm::slerp(a.rotation, b.rotation, factor))});
        }
        return pose;
    }
} // namespace mocap::bvh
