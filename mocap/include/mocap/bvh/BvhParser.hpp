#pragma once

#include "mocap/bvh/Channel.hpp"
#include "mocap/bvh/Grammar.hpp"
#include "mocap/bvh/MotionDocument.hpp"
#include "mocap/bvh/ParseError.hpp"
#include "mocap/bvh/Skeleton.hpp"
#include "mocap/core/result.hpp"

#include <glm/vec3.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace mocap::bvh
{
    template <typename T>
    using ParseResult = core::Result<T, ParseError>;

    struct ParseOptions
    {
        // Require "OFFSET x y z" with three numbers; when false the line is skipped
        bool validateOffsets = true;

        // Snapshot of the bvh_* configuration variables
        static ParseOptions fromConfig();
    };

    /**
     * @brief Recursive-descent reader for BVH text.
     *
     * The whole document is parsed in one pass; the first problem aborts the
     * parse and is returned as a ParseError. Nothing is logged here.
     */
    class BvhParser
    {
    public:
        static ParseResult<MotionDocument> parse(std::string_view text, const ParseOptions& options = {});

        // "CHANNELS <n> <name>..." -> channel kinds in declaration order
        static ParseResult<std::vector<ChannelKind>> parseChannels(std::string_view line);

        // Reads "HIERARCHY" and the ROOT block that follows it
        static ParseResult<Joint> parseHierarchy(grammar::LineReader& reader, const ParseOptions& options = {});

        // Reads "MOTION", the frame header and every frame row for the given skeleton
        static ParseResult<MotionDocument> parseMotion(grammar::LineReader& reader, Joint root);

    private:
        static ParseResult<std::vector<ChannelKind>> parseChannels(std::string_view line, size_t lineNumber,
                                                                   int level);
        // nullopt when the line is the closing brace of the parent block
        static ParseResult<std::optional<ParsedNode>> parseNode(grammar::LineReader& reader, int level,
                                                                const ParseOptions& options);
        static ParseResult<glm::vec3> parseOffset(grammar::LineReader& reader, int level,
                                                  const ParseOptions& options);
        static ParseResult<std::string_view> parseHeaderValue(grammar::LineReader& reader, std::string_view key);
    };
} // namespace mocap::bvh
