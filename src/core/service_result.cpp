#include "core/service_result.hpp"

const char* toString(ResultStatus status) {
    switch (status) {
        case ResultStatus::Ok:    return "ok";
        case ResultStatus::Empty: return "empty";
        case ResultStatus::Error: return "error";
    }
    return "unknown";
}
