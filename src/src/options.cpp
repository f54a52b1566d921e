#include <av/options.h>

#include <stdexcept>

namespace av {

std::string direction_name(Direction direction) {
    switch (direction) {
        case Direction::Request:
            return "request";
        case Direction::Response:
            return "response";
        case Direction::Any:
            return "any";
    }
    return "any";
}

Direction direction_from_name(const std::string& name) {
    if (name == "request") return Direction::Request;
    if (name == "response") return Direction::Response;
    if (name == "any") return Direction::Any;
    throw std::invalid_argument("unknown message direction '" + name + "' (expected request or response)");
}

}  // namespace av
