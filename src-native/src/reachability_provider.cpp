#include "reachability_provider.hpp"

namespace netreach {

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::NONE:     return "none";
        case ConnectionState::WIFI:     return "wifi";
        case ConnectionState::CELLULAR: return "cellular";
    }
    return "none";
}

} // namespace netreach
