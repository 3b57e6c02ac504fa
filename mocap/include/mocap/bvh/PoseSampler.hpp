#pragma once

#include "mocap/bvh/MotionDocument.hpp"

#include <glm/gtc/quaternion.hpp>
#include <glm/vec3.hpp>
#include <vector>

namespace mocap::bvh
{
    // Local transform of one joint, relative to its parent
    struct JointPose
    {
        const Joint* joint = nullptr;
        glm::vec3 translation{0.0F};
        glm::quat rotation{1.0F, 0.0F, 0.0F, 0.0F};
    };

    /**
     * @brief Evaluates joint-local poses from a MotionDocument.
     *
     * Poses come back in pre-order, matching the document's channel layout.
     * Translation starts at the joint OFFSET; position channels replace the
     * matching axis. Rotation channels are in degrees and compose in declaration
     * order, so "Zrotation Xrotation Yrotation" yields Rz * Rx * Ry.
     * The sampler keeps a reference to the document, which must outlive it.
     */
    class PoseSampler
    {
    public:
        explicit PoseSampler(const MotionDocument& document);

        [[nodiscard]] std::vector<JointPose> restPose() const;

        // Out-of-range frames return the rest pose
        [[nodiscard]] std::vector<JointPose> sampleFrame(size_t frame) const;

        // Linear/slerp blend between neighbouring frames. With loop the last frame
        // blends back into the first, otherwise time is clamped to the last frame.
        [[nodiscard]] std::vector<JointPose> sampleAtTime(double seconds, bool loop = false) const;

    private:
        JointPose evaluate(size_t jointIndex, size_t frame) const;

        const MotionDocument& m_document;
        std::vector<const Joint*> m_joints;   // pre-order
        std::vector<size_t> m_channelOffsets; // first curve index per joint
    };
} // namespace mocap::bvh
