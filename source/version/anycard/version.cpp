#include <anycard/version.hpp>

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

std::string_view AnyCardVersion()
{
#ifdef ANYCARD_VERSION
    return TOSTRING(ANYCARD_VERSION);
#else
    return "<unknown version>";
#endif
}

std::string_view AnyCardBuildTime()
{
#ifdef ANYCARD_NOW
    return TOSTRING(ANYCARD_NOW);
#else
    return "<unknown build time>";
#endif
}
