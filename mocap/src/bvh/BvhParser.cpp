#include "mocap/bvh/BvhParser.hpp"
#include "mocap/core/cvar.hpp"
#include "mocap/core/profiler.hpp"

#include <spdlog/fmt/fmt.h>
#include <string>
#include <utility>

namespace mocap::bvh
{
    AUTO_CVAR_BOOL(bvh_validate_offsets, "Require OFFSET lines to hold exactly three numbers", true,
                   core::CVarFlags::save);

    namespace
    {
        constexpr std::string_view kHierarchy = "HIERARCHY";
        constexpr std::string_view kMotion = "MOTION";
        constexpr std::string_view kRoot = "ROOT";
        constexpr std::string_view kJoint = "JOINT";
        constexpr std::string_view kEnd = "End";
        constexpr std::string_view kSite = "Site";
        constexpr std::string_view kOffset = "OFFSET";
        constexpr std::string_view kChannels = "CHANNELS";
        constexpr std::string_view kFrames = "Frames";
        constexpr std::string_view kFrameTime = "Frame Time";

        core::Unexpected<ParseError> fail(ErrorKind kind, std::string message, std::string_view line,
                                          size_t lineNumber, int level = -1)
        {
            ParseError error;
            error.kind = kind;
            error.message = std::move(message);
            error.line = std::string(line);
            error.lineNumber = lineNumber;
            error.level = level;
            return core::Unexpected<ParseError>(std::move(error));
        }

        core::Unexpected<ParseError> failCount(ErrorKind kind, std::string message, std::string_view line,
                                               size_t lineNumber, int level, size_t expected, size_t actual)
        {
            auto error = fail(kind, std::move(message), line, lineNumber, level);
            error.error().expected = expected;
            error.error().actual = actual;
            return error;
        }

        core::Unexpected<ParseError> failEndOfInput(const grammar::LineReader& reader, std::string_view expecting,
                                                    int level = -1)
        {
            return fail(ErrorKind::StructuralError, fmt::format("unexpected end of input, expected {}", expecting),
                        {}, reader.lineNumber(), level);
        }
    } // namespace

    ParseOptions ParseOptions::fromConfig()
    {
        ParseOptions options;
        options.validateOffsets = bvh_validate_offsets.get();
        return options;
    }

    ParseResult<MotionDocument> BvhParser::parse(std::string_view text, const ParseOptions& options)
    {
        MOCAP_PROFILE_FUNCTION();
        grammar::LineReader reader(text);

        auto root = parseHierarchy(reader, options);
        if (!root)
        {
            return core::Unexpected<ParseError>(std::move(root.error()));
        }
        return parseMotion(reader, std::move(*root));
    }

    ParseResult<std::vector<ChannelKind>> BvhParser::parseChannels(std::string_view line)
    {
        return parseChannels(line, 0, -1);
    }

    ParseResult<std::vector<ChannelKind>> BvhParser::parseChannels(std::string_view line, size_t lineNumber,
                                                                  int level)
    {
        const auto tokens = grammar::tokenize(line);
        if (tokens.empty() || tokens[0] != kChannels)
        {
            return fail(ErrorKind::GrammarError, "CHANNELS is not found", line, lineNumber, level);
        }
        if (tokens.size() < 2)
        {
            return fail(ErrorKind::GrammarError, "CHANNELS line has no channel count", line, lineNumber, level);
        }

        const auto count = grammar::parseInteger(tokens[1]);
        if (!count || *count < 0)
        {
            return fail(ErrorKind::NumericParseError,
                        fmt::format("channel count '{}' is not a non-negative integer", tokens[1]), line,
                        lineNumber, level);
        }
        const auto declared = static_cast<size_t>(*count);
        if (tokens.size() != declared + 2)
        {
            return failCount(ErrorKind::ChannelCountMismatch, "channel count does not match the names given",
                             line, lineNumber, level, declared, tokens.size() - 2);
        }

        std::vector<ChannelKind> channels;
        channels.reserve(declared);
        for (size_t i = 2; i < tokens.size(); ++i)
        {
            const auto kind = channelKindFromName(tokens[i]);
            if (!kind)
            {
                return fail(ErrorKind::UnknownChannelName, fmt::format("unknown channel '{}'", tokens[i]), line,
                            lineNumber, level);
            }
            channels.push_back(*kind);
        }
        return channels;
    }

    ParseResult<Joint> BvhParser::parseHierarchy(grammar::LineReader& reader, const ParseOptions& options)
    {
        const auto first = reader.next();
        if (!first)
        {
            return failEndOfInput(reader, kHierarchy);
        }
        if (!grammar::isKeywordLine(*first, kHierarchy))
        {
            return fail(ErrorKind::StructuralError, "document does not start with HIERARCHY", *first,
                        reader.lineNumber());
        }

        auto node = parseNode(reader, 0, options);
        if (!node)
        {
            return core::Unexpected<ParseError>(std::move(node.error()));
        }
        if (!node->has_value())
        {
            return fail(ErrorKind::StructuralError, "HIERARCHY has no ROOT", "}", reader.lineNumber(), 0);
        }
        // level 0 only ever yields a ROOT joint
        return std::get<Joint>(std::move(**node));
    }

    ParseResult<std::optional<ParsedNode>> BvhParser::parseNode(grammar::LineReader& reader, int level,
                                                                const ParseOptions& options)
    {
        const auto header = reader.next();
        if (!header)
        {
            return failEndOfInput(reader, level == 0 ? "ROOT" : "a block or '}'", level);
        }
        const size_t headerLine = reader.lineNumber();

        const auto tokens = grammar::tokenize(*header);
        if (tokens.size() != 2)
        {
            if (tokens.size() == 1 && tokens[0] == "}")
            {
                return std::optional<ParsedNode>{};
            }
            return failCount(ErrorKind::GrammarError, "block header must have two tokens", *header, headerLine,
                             level, 2, tokens.size());
        }

        ParsedNode node;
        if (tokens[0] == kRoot)
        {
            if (level != 0)
            {
                return fail(ErrorKind::StructuralError, "nested ROOT", *header, headerLine, level);
            }
            node = Joint{.name = std::string(tokens[1])};
        }
        else if (tokens[0] == kJoint)
        {
            if (level == 0)
            {
                return fail(ErrorKind::StructuralError, "expected ROOT, but found JOINT", *header, headerLine,
                            level);
            }
            node = Joint{.name = std::string(tokens[1])};
        }
        else if (tokens[0] == kEnd)
        {
            if (level == 0)
            {
                return fail(ErrorKind::StructuralError, "End Site at level 0", *header, headerLine, level);
            }
            if (tokens[1] != kSite)
            {
                return fail(ErrorKind::GrammarError, "expected 'End Site'", *header, headerLine, level);
            }
            node = EndSite{};
        }
        else
        {
            return fail(ErrorKind::GrammarError, fmt::format("unknown block type '{}'", tokens[0]), *header,
                        headerLine, level);
        }

        const auto brace = reader.next();
        if (!brace)
        {
            return failEndOfInput(reader, "'{'", level);
        }
        if (!grammar::isKeywordLine(*brace, "{"))
        {
            return fail(ErrorKind::GrammarError, "'{' is not found", *brace, reader.lineNumber(), level);
        }

        auto offset = parseOffset(reader, level, options);
        if (!offset)
        {
            return core::Unexpected<ParseError>(std::move(offset.error()));
        }

        if (auto* site = std::get_if<EndSite>(&node))
        {
            site->offset = *offset;

            const auto close = reader.next();
            if (!close)
            {
                return failEndOfInput(reader, "'}'", level);
            }
            if (!grammar::isKeywordLine(*close, "}"))
            {
                return fail(ErrorKind::GrammarError, "End Site block must close after its OFFSET", *close,
                            reader.lineNumber(), level);
            }
            return std::optional<ParsedNode>(std::move(node));
        }

        auto& joint = std::get<Joint>(node);
        joint.offset = *offset;

        const auto channelLine = reader.next();
        if (!channelLine)
        {
            return failEndOfInput(reader, kChannels, level);
        }
        auto channels = parseChannels(*channelLine, reader.lineNumber(), level);
        if (!channels)
        {
            return core::Unexpected<ParseError>(std::move(channels.error()));
        }
        joint.channels = std::move(*channels);

        while (true)
        {
            auto child = parseNode(reader, level + 1, options);
            if (!child)
            {
                return core::Unexpected<ParseError>(std::move(child.error()));
            }
            if (!child->has_value())
            {
                break;
            }

            if (auto* childJoint = std::get_if<Joint>(&**child))
            {
                joint.children.push_back(std::move(*childJoint));
            }
            else
            {
                joint.endSites.push_back(std::get<EndSite>(**child));
            }
        }

        return std::optional<ParsedNode>(std::move(node));
    }

    ParseResult<glm::vec3> BvhParser::parseOffset(grammar::LineReader& reader, int level,
                                                  const ParseOptions& options)
    {
        const auto line = reader.next();
        if (!line)
        {
            return failEndOfInput(reader, kOffset, level);
        }
        if (!options.validateOffsets)
        {
            return glm::vec3(0.0F);
        }

        const auto tokens = grammar::tokenize(*line);
        if (tokens.empty() || tokens[0] != kOffset)
        {
            return fail(ErrorKind::GrammarError, "OFFSET is not found", *line, reader.lineNumber(), level);
        }
        if (tokens.size() != 4)
        {
            return failCount(ErrorKind::GrammarError, "OFFSET needs three values", *line, reader.lineNumber(),
                             level, 3, tokens.size() - 1);
        }

        glm::vec3 offset(0.0F);
        for (int axis = 0; axis < 3; ++axis)
        {
            const auto value = grammar::parseFloat(tokens[static_cast<size_t>(axis) + 1]);
            if (!value)
            {
                return fail(ErrorKind::NumericParseError,
                            fmt::format("OFFSET value '{}' is not a number", tokens[static_cast<size_t>(axis) + 1]),
                            *line, reader.lineNumber(), level);
            }
            offset[axis] = *value;
        }
        return offset;
    }

    ParseResult<std::string_view> BvhParser::parseHeaderValue(grammar::LineReader& reader, std::string_view key)
    {
        const auto line = reader.next();
        if (!line)
        {
            return failEndOfInput(reader, key);
        }
        const size_t colon = line->find(':');
        if (colon == std::string_view::npos || grammar::trim(line->substr(0, colon)) != key)
        {
            return fail(ErrorKind::StructuralError, fmt::format("{} is not found", key), *line,
                        reader.lineNumber());
        }
        return grammar::trim(line->substr(colon + 1));
    }

    ParseResult<MotionDocument> BvhParser::parseMotion(grammar::LineReader& reader, Joint root)
    {
        const auto motion = reader.next();
        if (!motion)
        {
            return failEndOfInput(reader, kMotion);
        }
        if (!grammar::isKeywordLine(*motion, kMotion))
        {
            return fail(ErrorKind::StructuralError, "MOTION is not found", *motion, reader.lineNumber());
        }

        const auto framesText = parseHeaderValue(reader, kFrames);
        if (!framesText)
        {
            return core::Unexpected<ParseError>(framesText.error());
        }
        const auto frames = grammar::parseInteger(*framesText);
        if (!frames || *frames < 0)
        {
            return fail(ErrorKind::NumericParseError,
                        fmt::format("frame count '{}' is not a non-negative integer", *framesText), *framesText,
                        reader.lineNumber());
        }
        const auto frameCount = static_cast<size_t>(*frames);

        const auto frameTimeText = parseHeaderValue(reader, kFrameTime);
        if (!frameTimeText)
        {
            return core::Unexpected<ParseError>(frameTimeText.error());
        }
        const auto frameTime = grammar::parseFloat(*frameTimeText);
        if (!frameTime || *frameTime < 0.0F)
        {
            return fail(ErrorKind::NumericParseError,
                        fmt::format("frame time '{}' is not a non-negative number", *frameTimeText),
                        *frameTimeText, reader.lineNumber());
        }

        // Fail before allocating curves for rows that cannot be there
        const size_t available = reader.remainingLines();
        if (available < frameCount)
        {
            return failCount(ErrorKind::StructuralError, "not enough frame rows", {}, reader.lineNumber(), -1,
                             frameCount, available);
        }

        MotionDocument document(std::move(root), frameCount, Seconds(static_cast<double>(*frameTime)));
        const size_t channelCount = document.channelCount();

        std::vector<float> row;
        row.reserve(channelCount);
        for (size_t frame = 0; frame < frameCount; ++frame)
        {
            const auto line = reader.next();
            if (!line)
            {
                return failCount(ErrorKind::StructuralError, "not enough frame rows", {}, reader.lineNumber(), -1,
                                 frameCount, frame);
            }

            const auto tokens = grammar::tokenize(*line);
            if (tokens.size() != channelCount)
            {
                return failCount(ErrorKind::FrameDataCountMismatch,
                                 fmt::format("frame {} key count does not match channel count", frame), *line,
                                 reader.lineNumber(), -1, channelCount, tokens.size());
            }

            row.clear();
            for (const auto token : tokens)
            {
                const auto value = grammar::parseFloat(token);
                if (!value)
                {
                    return fail(ErrorKind::NumericParseError,
                                fmt::format("frame {} value '{}' is not a number", frame, token), *line,
                                reader.lineNumber());
                }
                row.push_back(*value);
            }
            document.setFrame(frame, row);
        }

        return document;
    }
} // namespace mocap::bvh
