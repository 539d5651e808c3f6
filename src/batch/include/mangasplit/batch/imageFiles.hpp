#pragma once

#include "mangasplit/core/spreadSplitter.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace mangasplit::batch {

//! .png, .jpg, .jpeg and .webp, case-insensitive.
bool isSupportedImage(const std::filesystem::path& path);

//! A supported file yields itself. A directory is walked recursively, skipping excludedDir (typically the output
//! directory). Result is sorted by path.
//! \throws std::filesystem::filesystem_error if the directory cannot be read.
std::vector<std::filesystem::path> collectSupportedImages(const std::filesystem::path& root, const std::filesystem::path& excludedDir = {});

/*! File names the pages of a result are written to, in page order.
 *  CoverTrim -> {stem_cover.ext}. Split and FallbackCenter -> {stem_R.ext, stem_L.ext}. Skip -> {}.
 *  Sources without extension are written as .png.
 */
std::vector<std::string> outputNamesFor(const std::filesystem::path& source, core::SplitMode mode);

} // namespace mangasplit::batch
