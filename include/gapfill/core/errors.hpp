#pragma once

#include <stdexcept>
#include <string>

namespace gapfill::core {

/**
 * @class StoreUnavailable
 * @brief The backing store could not be reached or a statement against it failed.
 *
 * Transient: callers retry the whole operation. Operations never catch it
 * midway, so a failed read never yields a partial result.
 */
class StoreUnavailable : public std::runtime_error {
public:
	explicit StoreUnavailable(const std::string &what) : std::runtime_error(what) {
	}
};

} // namespace gapfill::core
