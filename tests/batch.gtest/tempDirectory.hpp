#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace mangasplit::batch::gtest {

//! Fresh scratch directory per test, named after the test. Removed again on tear down.
class TempDirectoryTest : public ::testing::Test {
protected:
	void SetUp() override {
		const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
		m_root = std::filesystem::temp_directory_path() / (std::string("mangasplit_") + info->test_suite_name() + "_" + info->name());
		std::filesystem::remove_all(m_root);
		std::filesystem::create_directories(m_root);
	}

	void TearDown() override {
		std::error_code ec;
		std::filesystem::remove_all(m_root, ec);
	}

	const std::filesystem::path& root() const {
		return m_root;
	}

	//! Write a text file below the root, creating parent directories.
	std::filesystem::path writeText(const std::filesystem::path& relative, const std::string& content) const {
		const std::filesystem::path path = m_root / relative;
		std::filesystem::create_directories(path.parent_path());
		std::ofstream(path) << content;
		return path;
	}

private:
	std::filesystem::path m_root;
};

} // namespace mangasplit::batch::gtest
