#include <colex/runtime/plot.hpp>

namespace colex::runtime {

auto scatter_mode(std::string_view type) -> Result<std::string> {
    if (type == "line" || type == "lines") {
        return std::string("lines");
    }
    if (type == "markers" || type == "points") {
        return std::string("markers");
    }
    if (type == "lines+markers") {
        return std::string(type);
    }
    return make_error(ErrorKind::Domain, "unknown plot type '{}'", type);
}

}  // namespace colex::runtime
