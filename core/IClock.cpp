#include "IClock.hpp"
#include "Model.hpp"

namespace geotrack {

std::string SystemClock::iso8601() const {
    return formatIso8601(now());
}

} // namespace geotrack
