#pragma once

#include <cstdlib>
#include <string_view>

namespace mangasplit::core {

//! Verbose pipeline diagnostics on stderr. Enabled with MANGASPLIT_DEBUG=1.
inline bool splitDebugEnabled() {
	const char* env = std::getenv("MANGASPLIT_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

} // namespace mangasplit::core
