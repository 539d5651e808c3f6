#pragma once

#include <stdexcept>
#include <string>

namespace mangasplit::core {

//! Raised for images the pipeline cannot interpret (empty, zero area, unsupported pixel format) and for invalid configs.
//! Content that merely cannot be split (blank, cover, ambiguous gutter) is reported through SplitMode instead.
class InvalidInputError : public std::invalid_argument {
public:
	explicit InvalidInputError(const std::string& what) : std::invalid_argument(what) {
	}
};

} // namespace mangasplit::core
