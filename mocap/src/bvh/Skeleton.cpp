#include "mocap/bvh/Skeleton.hpp"

namespace mocap::bvh
{
    PreorderIterator& PreorderIterator::operator++()
    {
        if (m_current == nullptr)
        {
            return *this;
        }

        if (!m_current->children.empty())
        {
            m_stack.emplace_back(m_current, 1);
            m_current = &m_current->children.front();
            return *this;
        }

        while (!m_stack.empty())
        {
            auto& [parent, nextChild] = m_stack.back();
            if (nextChild < parent->children.size())
            {
                m_current = &parent->children[nextChild++];
                return *this;
            }
            m_stack.pop_back();
        }

        m_current = nullptr;
        return *this;
    }

    size_t countJoints(const Joint& root)
    {
        size_t count = 0;
        for ([[maybe_unused]] const Joint& joint : preorder(root))
        {
            ++count;
        }
        return count;
    }

    size_t countChannels(const Joint& root)
    {
        size_t count = 0;
        for (const Joint& joint : preorder(root))
        {
            count += joint.channels.size();
        }
        return count;
    }

    const Joint* findJoint(const Joint& root, std::string_view name)
    {
        for (const Joint& joint : preorder(root))
        {
            if (joint.name == name)
            {
                return &joint;
            }
        }
        return nullptr;
    }
} // namespace mocap::bvh
