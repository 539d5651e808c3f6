#include <exception>
#include <filesystem>
#include <iostream>

#include <QApplication>

#include <opencv2/imgcodecs.hpp>

#include "analyser.hpp"
#include "mainWindow.hpp"

#include "mangasplit/batch/configFile.hpp"

// Interactive view of the split pipeline.
// Usage: splitTuner <image> [config.json]
// Pick a stage in the combo box to see its intermediate images. The config file takes the same overrides as splitCli.
int main(int argc, char** argv) {
	QApplication application(argc, argv);

	if (argc < 2) {
		std::cerr << "Usage: " << argv[0] << " <image> [config.json]\n";
		return -1;
	}

	const std::filesystem::path inputPath = argv[1];
	const cv::Mat image                   = cv::imread(inputPath.string(), cv::IMREAD_COLOR);
	if (image.empty()) {
		std::cerr << "Failed to load image: " << inputPath << "\n";
	}

	mangasplit::core::SplitConfig config{};
	if (argc > 2) {
		try {
			config = mangasplit::batch::loadConfigOverrides(argv[2]);
		} catch (const std::exception& e) {
			std::cerr << "[Error] " << e.what() << "\n";
			return -1;
		}
	}

	const mangasplit::Analyser analyser(image, config);

	mangasplit::MainWindow window;
	window.resize(1400, 900);
	window.setPipelineStepChangedCallback([&](const mangasplit::PipelineStep step) { window.setImage(analyser.analyse(step)); });
	window.setImage(analyser.analyse(window.selectedPipelineStep()));
	window.setSummary(analyser.summary());
	window.show();

	return application.exec();
}
