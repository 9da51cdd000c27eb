#include "reactor_status.hpp"

const char* toString(ReactorStatus status) {
    switch (status) {
    case ReactorStatus::INACTIVE: return "INACTIVE";
    case ReactorStatus::ACTIVE: return "ACTIVE";
    case ReactorStatus::SHUTTING_DOWN: return "SHUTTING_DOWN";
    case ReactorStatus::SHUT_DOWN: return "SHUT_DOWN";
    }
    return "UNKNOWN";
}
