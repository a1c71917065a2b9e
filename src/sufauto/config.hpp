#pragma once

#include <terark/config.hpp>

#if defined(_MSC_VER)
#  if defined(SUFAUTO_CREATE_DLL)
#    pragma warning(disable: 4251)
#    define SUFAUTO_DLL_EXPORT __declspec(dllexport)      // creator of dll
#  elif defined(SUFAUTO_USE_DLL)
#    pragma warning(disable: 4251)
#    define SUFAUTO_DLL_EXPORT __declspec(dllimport)      // user of dll
#  else
#    define SUFAUTO_DLL_EXPORT                            // static lib creator or user
#  endif
#else
#  define SUFAUTO_DLL_EXPORT
#endif

#if defined(_DEBUG) || defined(DEBUG) || !defined(NDEBUG)
#  define SUFAUTO_IF_DEBUG(Then, Else) Then
#else
#  define SUFAUTO_IF_DEBUG(Then, Else) Else
#endif

#define SUFAUTO_VERSION_MAJOR 1
#define SUFAUTO_VERSION_MINOR 0
