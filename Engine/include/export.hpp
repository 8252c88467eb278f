#pragma once

#if defined(_WIN32)
    #if defined(LOOKALIKE_EXPORT)
        #define LOOKALIKE_API __declspec(dllexport)
    #else
        #define LOOKALIKE_API __declspec(dllimport)
    #endif
#else
    #define LOOKALIKE_API __attribute__((visibility("default")))
#endif
