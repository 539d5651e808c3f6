#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "mangasplit/batch/batchRunner.hpp"
#include "mangasplit/batch/cliOptions.hpp"

int main(int argc, char** argv) {
	namespace batch = mangasplit::batch;

	batch::CliArguments args;
	try {
		args = batch::parseArguments(std::vector<std::string>(argv + 1, argv + argc));
	} catch (const std::invalid_argument& e) {
		std::cerr << "[Error] " << e.what() << "\n";
		batch::printUsage(std::cerr, argv[0]);
		return EXIT_FAILURE;
	}

	try {
		args.options.input     = std::filesystem::absolute(args.options.input);
		args.options.outputDir = std::filesystem::absolute(args.options.outputDir);
		args.options.config    = batch::buildConfig(args);

		const batch::BatchOutcome outcome = batch::runBatch(args.options);

		std::cout << "Processed " << outcome.analyzedFiles << " file(s). Report: " << outcome.reportPath.string() << "\n";
		std::cout << "  split: " << outcome.splitPages << " (fallback: " << outcome.fallbackSplits << ")  cover: " << outcome.coverTrims
		          << "  skipped: " << outcome.skippedFiles << "  written: " << outcome.emittedFiles << "\n";
	} catch (const std::exception& e) {
		std::cerr << "[Error] " << e.what() << "\n";
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
