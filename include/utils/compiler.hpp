#pragma once

#include <sstream>

#include "utils/logger.hpp"

#if defined(__GNUC__) || defined(__clang__)
#define CHRONOID_BUILTIN_UNREACHABLE() __builtin_unreachable()
#elif defined(_MSC_VER)
#define CHRONOID_BUILTIN_UNREACHABLE() __assume(false)
#else
#define CHRONOID_BUILTIN_UNREACHABLE() ((void)0)
#endif

// Фатальная ошибка: сообщение в stderr (и в лог, если он включен), затем std::abort().
// Аргумент может быть цепочкой значений для operator<<: CHRONOID_FATAL("id " << id).
#define CHRONOID_FATAL(message)                                                                    \
    do {                                                                                           \
        std::ostringstream chronoidFatalStream_;                                                   \
        chronoidFatalStream_ << message;                                                           \
        chronoid::utils::Logger::getInstance().fatal(chronoidFatalStream_.str(), __FILE__,         \
                                                     __LINE__);                                    \
        CHRONOID_BUILTIN_UNREACHABLE();                                                            \
    } while (0)

// Макрос для недостижимых веток кода
#define UNREACHABLE(reason) CHRONOID_FATAL("UNREACHABLE code reached: " << reason)
