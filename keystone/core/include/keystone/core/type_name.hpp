#pragma once

#include <string>
#include <typeindex>
#include <typeinfo>

namespace keystone::core {

// Human-readable name of a type ("keystone::di::ServiceContainer")
std::string demangle(const char* mangled);

inline std::string type_name(const std::type_index& type) {
    return demangle(type.name());
}

template<typename T>
std::string type_name() {
    return demangle(typeid(T).name());
}

// Name without namespace qualification ("ServiceContainer")
std::string short_type_name(const std::string& qualified);

} // namespace keystone::core
