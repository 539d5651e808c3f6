#include "mangasplit/batch/imageFiles.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <system_error>

namespace mangasplit::batch {

namespace fs = std::filesystem;

bool isSupportedImage(const fs::path& path) {
	static constexpr std::array<std::string_view, 4> EXTENSIONS = {".png", ".jpg", ".jpeg", ".webp"};

	std::string ext = path.extension().string();
	std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return std::find(EXTENSIONS.begin(), EXTENSIONS.end(), ext) != EXTENSIONS.end();
}

//! True if dir is the same directory as excluded. Missing directories never match.
static bool isExcludedDirectory(const fs::path& dir, const fs::path& excluded) {
	if (excluded.empty()) {
		return false;
	}
	std::error_code ec;
	return fs::equivalent(dir, excluded, ec) && !ec;
}

std::vector<fs::path> collectSupportedImages(const fs::path& root, const fs::path& excludedDir) {
	std::vector<fs::path> images;

	if (fs::is_regular_file(root)) {
		if (isSupportedImage(root)) {
			images.push_back(root);
		}
		return images;
	}

	for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
		if (it->is_directory() && isExcludedDirectory(it->path(), excludedDir)) {
			it.disable_recursion_pending();
			continue;
		}
		if (it->is_regular_file() && isSupportedImage(it->path())) {
			images.push_back(it->path());
		}
	}
	std::sort(images.begin(), images.end());
	return images;
}

std::vector<std::string> outputNamesFor(const fs::path& source, const core::SplitMode mode) {
	const std::string stem   = source.stem().string();
	const std::string suffix = source.has_extension() ? source.extension().string() : ".png";

	switch (mode) {
	case core::SplitMode::Skip:
		return {};
	case core::SplitMode::CoverTrim:
		return {stem + "_cover" + suffix};
	case core::SplitMode::Split:
	case core::SplitMode::FallbackCenter:
		return {stem + "_R" + suffix, stem + "_L" + suffix};
	}
	return {};
}

} // namespace mangasplit::batch
