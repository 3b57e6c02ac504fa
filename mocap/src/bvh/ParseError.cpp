#include "mocap/bvh/ParseError.hpp"

#include <spdlog/fmt/fmt.h>

namespace mocap::bvh
{
    std::string_view toString(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::StructuralError:
            return "StructuralError";
        case ErrorKind::GrammarError:
            return "GrammarError";
        case ErrorKind::ChannelCountMismatch:
            return "ChannelCountMismatch";
        case ErrorKind::UnknownChannelName:
            return "UnknownChannelName";
        case ErrorKind::FrameDataCountMismatch:
            return "FrameDataCountMismatch";
        case ErrorKind::NumericParseError:
            return "NumericParseError";
        case ErrorKind::IoError:
            return "IoError";
        }
        return "Unknown";
    }

    std::string ParseError::toString() const
    {
        std::string out{bvh::toString(kind)};
        if (lineNumber > 0)
        {
            out += fmt::format(" at line {}", lineNumber);
        }
        if (level >= 0)
        {
            out += fmt::format(" (level {})", level);
        }
        out += ": ";
        out += message;
        if (expected && actual)
        {
            out += fmt::format(" (expected {}, got {})", *expected, *actual);
        }
        if (!line.empty())
        {
            out += fmt::format(" '{}'", line);
        }
        return out;
    }
} // namespace mocap::bvh
