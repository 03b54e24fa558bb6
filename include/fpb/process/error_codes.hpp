#pragma once

#include "../common/error_framework.hpp"
#include <unordered_map>

namespace fpb {
namespace process {

enum class SupervisorErrorCode {
    PIPE_CREATION_FAILED = 200,
    SPAWN_FAILED = 201,
    
    STREAM_READ_FAILED = 300,
    WAIT_FAILED = 301
};

using SupervisorErrorCodeHelper = common::ErrorRegistry<SupervisorErrorCode>;

}
}

namespace fpb {
namespace common {

template<>
inline const std::unordered_map<process::SupervisorErrorCode, ErrorInfo<process::SupervisorErrorCode>>& 
ErrorRegistry<process::SupervisorErrorCode>::getInfoMap() {
    static const std::unordered_map<process::SupervisorErrorCode, ErrorInfo<process::SupervisorErrorCode>> map = {
        {process::SupervisorErrorCode::PIPE_CREATION_FAILED, {
            process::SupervisorErrorCode::PIPE_CREATION_FAILED,
            "PIPE_CREATION_FAILED",
            "Failed to create pipe"
        }},
        {process::SupervisorErrorCode::SPAWN_FAILED, {
            process::SupervisorErrorCode::SPAWN_FAILED,
            "SPAWN_FAILED",
            "Failed to start wrapped program"
        }},
        {process::SupervisorErrorCode::STREAM_READ_FAILED, {
            process::SupervisorErrorCode::STREAM_READ_FAILED,
            "STREAM_READ_FAILED",
            "Failed to read wrapped program output"
        }},
        {process::SupervisorErrorCode::WAIT_FAILED, {
            process::SupervisorErrorCode::WAIT_FAILED,
            "WAIT_FAILED",
            "Failed to wait for wrapped program"
        }}
    };
    return map;
}

}
}
