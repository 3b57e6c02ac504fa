#pragma once

#include "mocap/core/logger.hpp"
#include "mocap/core/cvar.hpp"
#include "mocap/core/result.hpp"

#include "mocap/bvh/BvhLoader.hpp"
#include "mocap/bvh/BvhParser.hpp"
#include "mocap/bvh/Channel.hpp"
#include "mocap/bvh/MotionDocument.hpp"
#include "mocap/bvh/ParseError.hpp"
#include "mocap/bvh/PoseSampler.hpp"
#include "mocap/bvh/Skeleton.hpp"
