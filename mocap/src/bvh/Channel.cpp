#include "mocap/bvh/Channel.hpp"

#include <array>
#include <utility>

namespace mocap::bvh
{
    namespace
    {
        constexpr std::array<std::pair<std::string_view, ChannelKind>, kChannelKindCount> kChannelNames = {{
            {"Xposition", ChannelKind::XPosition},
            {"Yposition", ChannelKind::YPosition},
            {"Zposition", ChannelKind::ZPosition},
            {"Xrotation", ChannelKind::XRotation},
            {"Yrotation", ChannelKind::YRotation},
            {"Zrotation", ChannelKind::ZRotation},
        }};
    } // namespace

    std::optional<ChannelKind> channelKindFromName(std::string_view name)
    {
        for (const auto& [spelling, kind] : kChannelNames)
        {
            if (spelling == name)
            {
                return kind;
            }
        }
        return std::nullopt;
    }

    std::string_view toString(ChannelKind kind)
    {
        for (const auto& [spelling, k] : kChannelNames)
        {
            if (k == kind)
            {
                return spelling;
            }
        }
        return "Unknown";
    }
} // namespace mocap::bvh
