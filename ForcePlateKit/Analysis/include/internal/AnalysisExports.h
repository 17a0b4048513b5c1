/**
 * @file AnalysisExports.h
 *
 * \brief Definitions for dll exports on Windows.
 */
#ifdef WIN32
#   ifdef Analysis_EXPORTS
#       define Analysis_API __declspec(dllexport)
#   else
#       define Analysis_API  __declspec(dllimport)
#   endif
#else
#   define Analysis_API
#endif // WIN32
