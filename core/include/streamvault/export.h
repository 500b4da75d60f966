#pragma once

#ifdef _WIN32
    #ifdef STREAMVAULT_EXPORTS
        #define SV_API __declspec(dllexport)
    #else
        #define SV_API __declspec(dllimport)
    #endif
#else
    #define SV_API __attribute__((visibility("default")))
#endif
