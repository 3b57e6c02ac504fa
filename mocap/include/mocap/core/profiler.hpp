#pragma once

#include <cstring>

#if defined(TRACY_ENABLE)
    #include <tracy/Tracy.hpp>

    // CPU Profiling Macros
    #define MOCAP_PROFILE_FUNCTION() ZoneScoped
    #define MOCAP_PROFILE_SCOPE(name) ZoneScopedN(name)
    #define MOCAP_PROFILE_TAG(str) ZoneText(str, strlen(str))

#else
    // Empty macros when disabled
    #define MOCAP_PROFILE_FUNCTION()
    #define MOCAP_PROFILE_SCOPE(name)
    #define MOCAP_PROFILE_TAG(str)

#endif
