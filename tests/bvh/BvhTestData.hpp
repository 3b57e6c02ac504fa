#pragma once

#include <string>

namespace mocap::test {

// Hips (6 channels) -> Spine (3 channels) -> End Site, two frames
inline const std::string kHipsSpine =
    "HIERARCHY\n"
    "ROOT Hips\n"
    "{\n"
    "  OFFSET 0.0 0.0 0.0\n"
    "  CHANNELS 6 Xposition Yposition Zposition Zrotation Xrotation Yrotation\n"
    "  JOINT Spine\n"
    "  {\n"
    "    OFFSET 0.0 5.2 0.0\n"
    "    CHANNELS 3 Zrotation Xrotation Yrotation\n"
    "    End Site\n"
    "    {\n"
    "      OFFSET 0.0 4.0 0.0\n"
    "    }\n"
    "  }\n"
    "}\n"
    "MOTION\n"
    "Frames: 2\n"
    "Frame Time: 0.0333333\n"
    "1.0 2.0 3.0 10.0 20.0 30.0 4.0 5.0 6.0\n"
    "1.5 2.5 3.5 11.0 21.0 31.0 7.0 8.0 9.0\n";

} // namespace mocap::test
