#pragma once

#if defined(_WIN32) || defined(WIN32)
#define EEMATRIX_EXPORT __declspec(dllexport)
#else
#define EEMATRIX_EXPORT __attribute__((visibility("default")))
#endif
#define EEMATRIX_C_API extern "C" EEMATRIX_EXPORT
