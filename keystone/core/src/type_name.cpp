#include <keystone/core/type_name.hpp>
#include <cstdlib>
#include <memory>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

namespace keystone::core {

std::string demangle(const char* mangled) {
    if (!mangled) return {};
#if defined(__GNUC__) || defined(__clang__)
    int status = 0;
    std::unique_ptr<char, void(*)(void*)> result(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status),
        std::free
    );
    if (status == 0 && result) {
        return result.get();
    }
    return mangled;
#else
    // MSVC names are already readable, minus the "class "/"struct " prefix
    std::string name = mangled;
    for (const char* prefix : {"class ", "struct "}) {
        std::string p = prefix;
        if (name.compare(0, p.size(), p) == 0) {
            return name.substr(p.size());
        }
    }
    return name;
#endif
}

std::string short_type_name(const std::string& qualified) {
    // Ignore scopes inside template arguments
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < qualified.size(); ++i) {
        char c = qualified[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (depth == 0 && c == ':' && i + 1 < qualified.size() && qualified[i + 1] == ':') {
            start = i + 2;
            ++i;
        }
    }
    return qualified.substr(start);
}

} // namespace keystone::core
