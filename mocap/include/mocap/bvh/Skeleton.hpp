#pragma once

#include "mocap/bvh/Channel.hpp"

#include <glm/vec3.hpp>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mocap::bvh
{
    // Terminal marker closing a limb. Carries no channels and no name.
    struct EndSite
    {
        glm::vec3 offset{0.0F};

        bool operator==(const EndSite&) const = default;
    };

    struct Joint
    {
        std::string name;
        glm::vec3 offset{0.0F};
        std::vector<ChannelKind> channels; // declaration order
        std::vector<Joint> children;       // owned, declaration order
        std::vector<EndSite> endSites;     // not part of traversal or channel layout

        bool operator==(const Joint&) const = default;
    };

    // What a single block in the HIERARCHY section parses into
    using ParsedNode = std::variant<Joint, EndSite>;

    // Pre-order walk over a joint tree: the node, then each child subtree in order.
    // Uses an explicit stack; the tree must not change while iterating.
    class PreorderIterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Joint;
        using difference_type = std::ptrdiff_t;
        using pointer = const Joint*;
        using reference = const Joint&;

        PreorderIterator() = default;
        explicit PreorderIterator(const Joint* root) : m_current(root) {}

        reference operator*() const { return *m_current; }
        pointer operator->() const { return m_current; }

        PreorderIterator& operator++();
        PreorderIterator operator++(int)
        {
            PreorderIterator tmp = *this;
            ++*this;
            return tmp;
        }

        // Depth of the current node below the root the iteration started at
        [[nodiscard]] size_t depth() const { return m_stack.size(); }

        bool operator==(const PreorderIterator& other) const { return m_current == other.m_current; }

    private:
        const Joint* m_current = nullptr;
        // parent, index of the next child to visit
        std::vector<std::pair<const Joint*, size_t>> m_stack;
    };

    class PreorderRange
    {
    public:
        explicit PreorderRange(const Joint& root) : m_root(&root) {}

        [[nodiscard]] PreorderIterator begin() const { return PreorderIterator(m_root); }
        [[nodiscard]] PreorderIterator end() const { return {}; }

    private:
        const Joint* m_root;
    };

    inline PreorderRange preorder(const Joint& root) { return PreorderRange(root); }

    size_t countJoints(const Joint& root);
    size_t countChannels(const Joint& root);
    const Joint* findJoint(const Joint& root, std::string_view name);
} // namespace mocap::bvh
