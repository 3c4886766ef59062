#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_TRANSFORM_STATIC)
    #define NGIN_TRANSFORM_API
  #else
    #if defined(NGIN_TRANSFORM_EXPORTS)
      #define NGIN_TRANSFORM_API __declspec(dllexport)
    #else
      #define NGIN_TRANSFORM_API __declspec(dllimport)
    #endif
  #endif
#else
  #define NGIN_TRANSFORM_API
#endif
