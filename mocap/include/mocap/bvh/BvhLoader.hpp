#pragma once

#include "mocap/bvh/BvhParser.hpp"

#include <filesystem>

namespace mocap::bvh
{
    class BvhLoader
    {
    public:
        // Reads the whole file into memory, then parses it. IoError if it cannot be read.
        static ParseResult<MotionDocument> loadFromFile(const std::filesystem::path& path,
                                                        const ParseOptions& options = ParseOptions::fromConfig());
    };
} // namespace mocap::bvh
