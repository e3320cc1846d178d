#pragma once

// sort of using this as a platform file
#include "error.hpp"
#include <memory>
#include <string>
#include <vector>

#define REQUIRE(cond, msg)                                                                                             \
    if (cond)                                                                                                          \
        ;                                                                                                              \
    else                                                                                                               \
        throw Error_(Error_::Kind_::OTHER, std::string(msg))
#define THROW(msg) throw Error_(Error_::Kind_::OTHER, std::string(msg));

// shared, immutable once published
template <class T_> class Handle_ : public std::shared_ptr<const T_> {
public:
    Handle_() : std::shared_ptr<const T_>() {}
    Handle_(const T_* p) : std::shared_ptr<const T_>(p) {}
    Handle_(const std::shared_ptr<const T_>& src) : std::shared_ptr<const T_>(src) {}
};

std::string EnvironmentValue(const std::string& name, const std::string& fallback);
