#pragma once

#include "common/namespace.hpp"

#include <memory>
#include <utility>

BEGIN_NAMESPACE(bamkit)

template<typename T, typename ...Args>
std::unique_ptr<T> make_unique_(Args&&... args) {
    return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
}

END_NAMESPACE(bamkit)
