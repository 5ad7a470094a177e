#include "capture/capture_session.hpp"

std::string_view to_string(StopReason reason) {
    switch (reason) {
        case StopReason::Manual: return "manual";
        case StopReason::BackgroundHidden: return "background-hidden";
        case StopReason::Error: return "error";
    }
    return "unknown";
}
