
#ifndef RANGELOADER_API_HPP
#define RANGELOADER_API_HPP


#ifdef RANGELOADER_STATIC
// As a static library: no symbol import/export.
#  define RANGELOADER_API
#else
 // As a shared library: export symbols on build, import symbols on use.
#  ifdef RANGELOADER_EXPORTS
     // We are building this library
#    ifdef _MSC_VER
#         define RANGELOADER_API __declspec(dllexport)
#    else
#         define RANGELOADER_API __attribute__((__visibility__("default")))
#    endif
#  else
     // We are using this library
#    ifdef _MSC_VER
#         define RANGELOADER_API __declspec(dllimport)
#    else
#         define RANGELOADER_API // Symbol import is implicit on non-msvc compilers.
#    endif
#  endif
#endif

#endif
