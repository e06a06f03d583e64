#pragma once
#include <functional>
#include <string>

namespace Clawweb {
namespace Engine {

// Directed edge from a fetched page to a URL it references.
struct Link {
    std::string src;
    std::string dst;
    std::string type;

    bool operator==(const Link& other) const {
        return src == other.src && dst == other.dst && type == other.type;
    }

    std::string to_string() const {
        return src + " -> " + dst;
    }
};

struct LinkHash {
    size_t operator()(const Link& link) const {
        std::hash<std::string> h;
        size_t                 seed = h(link.src);
        seed ^= h(link.dst) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        seed ^= h(link.type) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

}  // namespace Engine
}  // namespace Clawweb
