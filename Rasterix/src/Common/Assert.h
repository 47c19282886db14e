#pragma once

#include "Logger.h"
#include <stdexcept>
#include <string>

namespace Rasterix {

// Both macros log the failing site before throwing so that errors raised
// deep inside a dispatch still show up in the log file.
#define RX_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            const std::string rx_assert_msg = std::string("Assertion failed: ") + (message); \
            LOG_ERROR("{} ({}:{})", rx_assert_msg, __FILE__, __LINE__); \
            throw std::runtime_error(rx_assert_msg); \
        } \
    } while (0)

#define RX_CHECK(condition) \
    do { \
        if (!(condition)) { \
            LOG_ERROR("Check failed: {} ({}:{})", #condition, __FILE__, __LINE__); \
            throw std::runtime_error("Check failed: " #condition); \
        } \
    } while (0)

}
