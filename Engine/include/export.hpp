#pragma once

#if defined(_WIN32)
    #if defined(CEREBRUM_EXPORT)
        #define CEREBRUM_API __declspec(dllexport)
    #else
        #define CEREBRUM_API __declspec(dllimport)
    #endif
#else
    #define CEREBRUM_API __attribute__((visibility("default")))
#endif
