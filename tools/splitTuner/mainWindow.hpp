#pragma once

#include "pipelineStep.hpp"

#include <QImage>
#include <QMainWindow>
#include <QWidget>

#include <opencv2/core/mat.hpp>

#include <functional>
#include <string>

class QComboBox;
class QLabel;

namespace mangasplit {

class CvMatrixView : public QWidget {
public:
	explicit CvMatrixView(QWidget* parent = nullptr);
	void setMat(const cv::Mat& mat);

protected:
	void paintEvent(QPaintEvent* event) override;

private:
	static QImage matToQImage(const cv::Mat& mat);

	QImage m_image{};
};


class MainWindow : public QMainWindow {
public:
	explicit MainWindow(QWidget* parent = nullptr);
	~MainWindow() override;

	void setImage(const cv::Mat& image);
	void setSummary(const std::string& text);
	void setPipelineStepChangedCallback(std::function<void(PipelineStep)> callback);
	PipelineStep selectedPipelineStep() const;

private:
	void buildLayout();

private:
	CvMatrixView* m_matrixView{nullptr};
	QComboBox* m_stepCombo{nullptr};
	QLabel* m_summaryLabel{nullptr};
	std::function<void(PipelineStep)> m_stepChangedCallback{};
};

} // namespace mangasplit
