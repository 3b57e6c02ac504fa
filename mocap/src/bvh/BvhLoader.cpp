#include "mocap/bvh/BvhLoader.hpp"
#include "mocap/core/MemoryMappedFile.hpp"
#include "mocap/core/logger.hpp"
#include "mocap/core/profiler.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace mocap::bvh
{
    ParseResult<MotionDocument> BvhLoader::loadFromFile(const std::filesystem::path& path,
                                                        const ParseOptions& options)
    {
        MOCAP_PROFILE_FUNCTION();
        const std::string pathName = path.string();
        MOCAP_PROFILE_TAG(pathName.c_str());

        const core::MemoryMappedFile file(path);
        if (!file.opened())
        {
            ParseError error;
            error.kind = ErrorKind::IoError;
            error.message = "failed to open BVH file: " + pathName;
            return core::Unexpected<ParseError>(std::move(error));
        }
        if (!file.isValid())
        {
            ParseError error;
            error.kind = ErrorKind::IoError;
            error.message = "BVH file is empty or unreadable: " + pathName;
            return core::Unexpected<ParseError>(std::move(error));
        }

        core::Logger::trace("Mapped {} bytes from {}", file.text().size(), pathName);

        const auto start = std::chrono::steady_clock::now();
        auto document = BvhParser::parse(file.text(), options);
        if (document)
        {
            const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
            core::Logger::debug("Loaded {} ({}) in {:.2f} ms", path.filename().string(), document->summary(),
                                elapsed.count());
        }
        return document;
    }
} // namespace mocap::bvh
