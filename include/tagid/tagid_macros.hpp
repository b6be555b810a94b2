#pragma once

#if defined(__clang__)
#    define TAGID_PRETTY_FUNCTION __PRETTY_FUNCTION__
#    define TAGID_PRETTY_FUNCTION_PREFIX "T = "
#    define TAGID_PRETTY_FUNCTION_SUFFIX "]"
#elif defined(__GNUC__) || defined(__GNUG__)
#    define TAGID_PRETTY_FUNCTION __PRETTY_FUNCTION__
#    define TAGID_PRETTY_FUNCTION_PREFIX "T = "
#    define TAGID_PRETTY_FUNCTION_SUFFIX ";]"
#elif defined(_MSC_VER)
#    define TAGID_PRETTY_FUNCTION __FUNCSIG__
#    define TAGID_PRETTY_FUNCTION_PREFIX "pretty_function<"
#    define TAGID_PRETTY_FUNCTION_SUFFIX ">(void)"
#else
#    define TAGID_PRETTY_FUNCTION ""
#    define TAGID_PRETTY_FUNCTION_PREFIX ""
#    define TAGID_PRETTY_FUNCTION_SUFFIX ""
#endif
