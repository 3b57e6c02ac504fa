#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace mocap::bvh::grammar
{
    // Splits an in-memory buffer into lines. Accepts LF and CRLF endings and
    // skips a leading UTF-8 byte order mark. Returned views alias the buffer.
    class LineReader
    {
    public:
        explicit LineReader(std::string_view text);

        // Next raw line without its terminator, or nullopt at end of input
        std::optional<std::string_view> next();

        // 1-based number of the line last returned by next(), 0 before the first
        [[nodiscard]] size_t lineNumber() const { return m_lineNumber; }
        [[nodiscard]] bool atEnd() const { return m_pos >= m_text.size(); }

        // Lines left to read, without consuming them
        [[nodiscard]] size_t remainingLines() const;

    private:
        std::string_view m_text;
        size_t m_pos = 0;
        size_t m_lineNumber = 0;
    };

    std::string_view trim(std::string_view s);

    // Whitespace-separated tokens, empty tokens discarded
    std::vector<std::string_view> tokenize(std::string_view line);

    // True when the trimmed line is exactly the keyword
    bool isKeywordLine(std::string_view line, std::string_view keyword);

    // Whole-token numeric parsing; nullopt when any character is left unparsed
    std::optional<int64_t> parseInteger(std::string_view token);
    std::optional<float> parseFloat(std::string_view token);
} // namespace mocap::bvh::grammar
