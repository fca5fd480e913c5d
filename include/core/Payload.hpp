#ifndef LOOM_PAYLOAD_HPP
#define LOOM_PAYLOAD_HPP

#include <map>
#include <string>

namespace Loom::Core {

    // Opaque user data with its encoding metadata
    struct Payload {
        std::map<std::string, std::string> metadata;
        std::string data;

        bool operator==(const Payload&) const = default;
    };
}

#endif
