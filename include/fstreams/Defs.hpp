#ifndef _FSTREAMS_API_DEFS_H
#define _FSTREAMS_API_DEFS_H

#if (defined _WINDOWS)
#  ifdef FSTREAMS_API_EXPORTS
#    define FSTREAMS_API_DECL __declspec (dllexport)
#  else
#    define FSTREAMS_API_DECL __declspec (dllimport)
#  endif
#else
#  define FSTREAMS_API_DECL __attribute__((visibility("default")))
#endif

#endif
