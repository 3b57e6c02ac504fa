#include "mocap/bvh/Grammar.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>

namespace mocap::bvh::grammar
{
    namespace
    {
        constexpr std::string_view kWhitespace = " \t\r\n\f\v";
        constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

        // from_chars rejects an explicit '+' sign
        std::string_view stripPlus(std::string_view token)
        {
            if (token.size() > 1 && token.front() == '+')
            {
                token.remove_prefix(1);
            }
            return token;
        }
    } // namespace

    LineReader::LineReader(std::string_view text) : m_text(text)
    {
        if (m_text.starts_with(kUtf8Bom))
        {
            m_pos = kUtf8Bom.size();
        }
    }

    std::optional<std::string_view> LineReader::next()
    {
        if (atEnd())
        {
            return std::nullopt;
        }

        const size_t end = m_text.find('\n', m_pos);
        std::string_view line;
        if (end == std::string_view::npos)
        {
            line = m_text.substr(m_pos);
            m_pos = m_text.size();
        }
        else
        {
            line = m_text.substr(m_pos, end - m_pos);
            m_pos = end + 1;
        }

        if (!line.empty() && line.back() == '\r')
        {
            line.remove_suffix(1);
        }
        ++m_lineNumber;
        return line;
    }

    size_t LineReader::remainingLines() const
    {
        if (atEnd())
        {
            return 0;
        }
        const std::string_view rest = m_text.substr(m_pos);
        size_t count = static_cast<size_t>(std::count(rest.begin(), rest.end(), '\n'));
        if (rest.back() != '\n')
        {
            ++count;
        }
        return count;
    }

    std::string_view trim(std::string_view s)
    {
        const size_t first = s.find_first_not_of(kWhitespace);
        if (first == std::string_view::npos)
        {
            return {};
        }
        const size_t last = s.find_last_not_of(kWhitespace);
        return s.substr(first, last - first + 1);
    }

    std::vector<std::string_view> tokenize(std::string_view line)
    {
        std::vector<std::string_view> tokens;
        size_t pos = 0;
        while (pos < line.size())
        {
            const size_t start = line.find_first_not_of(kWhitespace, pos);
            if (start == std::string_view::npos)
            {
                break;
            }
            size_t end = line.find_first_of(kWhitespace, start);
            if (end == std::string_view::npos)
            {
                end = line.size();
            }
            tokens.push_back(line.substr(start, end - start));
            pos = end;
        }
        return tokens;
    }

    bool isKeywordLine(std::string_view line, std::string_view keyword)
    {
        return trim(line) == keyword;
    }

    std::optional<int64_t> parseInteger(std::string_view token)
    {
        token = stripPlus(trim(token));
        if (token.empty())
        {
            return std::nullopt;
        }
        int64_t value = 0;
        const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc{} || ptr != token.data() + token.size())
        {
            return std::nullopt;
        }
        return value;
    }

    std::optional<float> parseFloat(std::string_view token)
    {
        token = stripPlus(trim(token));
        if (token.empty())
        {
            return std::nullopt;
        }
        // float underflow is reported as out of range; parse wide and narrow
        double value = 0.0;
        const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc{} || ptr != token.data() + token.size() || !std::isfinite(value) ||
            std::abs(value) > static_cast<double>(std::numeric_limits<float>::max()))
        {
            return std::nullopt;
        }
        return static_cast<float>(value);
    }
} // namespace mocap::bvh::grammar
