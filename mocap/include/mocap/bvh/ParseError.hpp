#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mocap::bvh
{
    enum class ErrorKind
    {
        StructuralError,        // section keyword or brace missing / out of order
        GrammarError,           // wrong token shape or unknown block keyword
        ChannelCountMismatch,   // CHANNELS count disagrees with the names given
        UnknownChannelName,
        FrameDataCountMismatch, // frame row width != total channel count
        NumericParseError,
        IoError                 // file could not be read
    };

    std::string_view toString(ErrorKind kind);

    struct ParseError
    {
        ErrorKind kind = ErrorKind::StructuralError;
        std::string message;
        std::string line;          // offending raw line, if any
        size_t lineNumber = 0;     // 1-based, 0 when not tied to a line
        int level = -1;            // hierarchy nesting level, -1 outside the hierarchy
        std::optional<size_t> expected;
        std::optional<size_t> actual;

        [[nodiscard]] std::string toString() const;
    };
} // namespace mocap::bvh
