#include "config.h"

namespace Registrar::Platform {

std::string safe_getenv(const char* var)
{
#ifdef REGISTRAR_PLATFORM_WINDOWS
    char* value = nullptr;
    size_t len = 0;
    if (_dupenv_s(&value, &len, var) == 0 && value != nullptr) {
        std::string result(value);
        free(value);
        return result;
    }
    return "";
#else
    const char* value = std::getenv(var);
    return value ? std::string(value) : "";
#endif
}

} // namespace Registrar::Platform
