#include <colex/core/error.hpp>

namespace colex {

auto kind_name(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::Parse:
            return "parse";
        case ErrorKind::Type:
            return "type";
        case ErrorKind::Shape:
            return "shape";
        case ErrorKind::Domain:
            return "domain";
        case ErrorKind::Lookup:
            return "lookup";
    }
    return "unknown";
}

auto Error::format() const -> std::string {
    return fmt::format("{} error: {}", kind_name(kind), message);
}

}  // namespace colex
