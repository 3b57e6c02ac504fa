#include <mocap/mocap.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

AUTO_CVAR_STRING(log_level, "Logger verbosity (trace, debug, info, warn, error)", "info",
                 mocap::core::CVarFlags::save);

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitParseFailure = 2;

void printUsage() {
  std::cerr << "usage: bvhinfo <file.bvh> [--joint <name>] [--frame <n>]\n";
}

struct Arguments {
  std::string path;
  std::optional<std::string> joint;
  size_t frame = 0;
};

std::optional<Arguments> parseArguments(int argc, char **argv) {
  Arguments args;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--joint" && i + 1 < argc) {
      args.joint = argv[++i];
    } else if (arg == "--frame" && i + 1 < argc) {
      const auto frame = mocap::bvh::grammar::parseInteger(argv[++i]);
      if (!frame || *frame < 0) {
        return std::nullopt;
      }
      args.frame = static_cast<size_t>(*frame);
    } else if (!arg.starts_with("--") && args.path.empty()) {
      args.path = arg;
    } else {
      return std::nullopt;
    }
  }
  if (args.path.empty()) {
    return std::nullopt;
  }
  return args;
}

void printTree(const mocap::bvh::MotionDocument &document) {
  using namespace mocap::bvh;
  const auto range = preorder(document.root());
  for (auto it = range.begin(); it != range.end(); ++it) {
    const std::string indent(it.depth() * 2, ' ');
    std::string channels;
    for (const ChannelKind kind : it->channels) {
      channels += ' ';
      channels += toString(kind);
    }
    mocap::core::Logger::info("{}{} [{}]{}", indent, it->name, it->channels.size(), channels);
    for (const EndSite &site : it->endSites) {
      mocap::core::Logger::info("{}  End Site ({}, {}, {})", indent, site.offset.x, site.offset.y,
                                site.offset.z);
    }
  }
}

void printJointFrame(const mocap::bvh::MotionDocument &document, const std::string &name, size_t frame) {
  using namespace mocap::bvh;
  const Joint *joint = document.findJoint(name);
  if (joint == nullptr) {
    mocap::core::Logger::warn("No joint named '{}'", name);
    return;
  }
  if (frame >= document.frameCount()) {
    mocap::core::Logger::warn("Frame {} is out of range ({} frames)", frame, document.frameCount());
    return;
  }
  for (const ChannelKind kind : joint->channels) {
    const auto value = document.sample(name, kind, frame);
    if (value) {
      mocap::core::Logger::info("{} frame {} {} = {}", name, frame, toString(kind), *value);
    }
  }

  const PoseSampler sampler(document);
  for (const JointPose &pose : sampler.sampleFrame(frame)) {
    if (pose.joint == joint) {
      mocap::core::Logger::info("{} local translation ({}, {}, {}) rotation ({}, {}, {}, {})", name,
                                pose.translation.x, pose.translation.y, pose.translation.z, pose.rotation.w,
                                pose.rotation.x, pose.rotation.y, pose.rotation.z);
    }
  }
}

} // namespace

int main(int argc, char **argv) {
  mocap::core::Logger::init("[%l] %v");
  const int applied = mocap::core::CVarSystem::loadFromIni("bvhinfo.ini");
  mocap::core::Logger::setLevel(log_level.get());
  if (applied >= 0) {
    mocap::core::Logger::debug("bvhinfo.ini: {} variables applied", applied);
  }

  const auto args = parseArguments(argc, argv);
  if (!args) {
    printUsage();
    mocap::core::Logger::shutdown();
    return kExitUsage;
  }

  const auto document = mocap::bvh::BvhLoader::loadFromFile(args->path);
  if (!document) {
    mocap::core::Logger::error("{}: {}", args->path, document.error().toString());
    mocap::core::Logger::shutdown();
    return kExitParseFailure;
  }

  mocap::core::Logger::info("{}: {}", args->path, document->summary());
  printTree(*document);
  if (args->joint) {
    printJointFrame(*document, *args->joint, args->frame);
  }

  mocap::core::Logger::shutdown();
  return EXIT_SUCCESS;
}
