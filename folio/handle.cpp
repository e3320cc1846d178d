#include "handle.hpp"
#include <cstdlib>

std::string EnvironmentValue(const std::string& name, const std::string& fallback) {
#if defined(_MSC_VER)
    std::string retval(fallback);
    char* temp;
    size_t sz;
    if (_dupenv_s(&temp, &sz, name.c_str()) == 0 && temp) {
        retval = temp;
        free(temp);
    }
    return retval;
#else
    const char* ret = getenv(name.c_str());
    return ret ? std::string(ret) : fallback;
#endif
}
