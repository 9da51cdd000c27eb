#include <stdexcept>
#include <string>
#include "reactor_config.hpp"

void ReactorConfig::validate() const {
    if (selectInterval.count() <= 0) {
        throw std::invalid_argument("Select interval must be positive, got " +
                                    std::to_string(selectInterval.count()) + "ms");
    }
}
