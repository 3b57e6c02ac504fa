#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace mocap::bvh
{
    enum class ChannelKind : uint8_t
    {
        XPosition,
        YPosition,
        ZPosition,
        XRotation,
        YRotation,
        ZRotation
    };

    inline constexpr size_t kChannelKindCount = 6;

    // Exact, case-sensitive match against the BVH spellings ("Xposition", ...)
    std::optional<ChannelKind> channelKindFromName(std::string_view name);
    std::string_view toString(ChannelKind kind);

    constexpr bool isPosition(ChannelKind kind)
    {
        return kind == ChannelKind::XPosition || kind == ChannelKind::YPosition ||
               kind == ChannelKind::ZPosition;
    }

    constexpr bool isRotation(ChannelKind kind) { return !isPosition(kind); }

    // 0 for X, 1 for Y, 2 for Z
    constexpr int axisIndex(ChannelKind kind)
    {
        switch (kind)
        {
        case ChannelKind::XPosition:
        case ChannelKind::XRotation:
            return 0;
        case ChannelKind::YPosition:
        case ChannelKind::YRotation:
            return 1;
        case ChannelKind::ZPosition:
        case ChannelKind::ZRotation:
        default:
            return 2;
        }
    }
} // namespace mocap::bvh
