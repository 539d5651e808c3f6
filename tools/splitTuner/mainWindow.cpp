#include "mainWindow.hpp"

#include <QComboBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QVBoxLayout>

#include <opencv2/imgproc.hpp>

#include <cstddef>
#include <utility>

namespace mangasplit {

CvMatrixView::CvMatrixView(QWidget* parent) : QWidget(parent) {
}

void CvMatrixView::setMat(const cv::Mat& mat) {
	m_image = matToQImage(mat);
	update();
}

void CvMatrixView::paintEvent(QPaintEvent* event) {
	QWidget::paintEvent(event);

	QPainter painter(this);
	painter.fillRect(rect(), Qt::darkGray);

	if (m_image.isNull()) {
		return;
	}

	const QImage scaled = m_image.scaled(size(), Qt::KeepAspectRatio, Qt::SmoothTransformation);
	const QPoint topLeft((width() - scaled.width()) / 2, (height() - scaled.height()) / 2);
	painter.drawImage(topLeft, scaled);
}

QImage CvMatrixView::matToQImage(const cv::Mat& mat) {
	if (mat.empty()) {
		return {};
	}

	// Everything the pipeline produces is 8 bit. Other depths are stretched to the full range.
	cv::Mat mat8;
	if (mat.depth() == CV_8U) {
		mat8 = mat;
	} else {
		cv::normalize(mat, mat8, 0.0, 255.0, cv::NORM_MINMAX, CV_8U);
	}

	cv::Mat rgb;
	switch (mat8.channels()) {
	case 1:
		cv::cvtColor(mat8, rgb, cv::COLOR_GRAY2RGB);
		break;
	case 3:
		cv::cvtColor(mat8, rgb, cv::COLOR_BGR2RGB);
		break;
	case 4:
		cv::cvtColor(mat8, rgb, cv::COLOR_BGRA2RGB);
		break;
	default:
		return {};
	}

	// QImage does not own the buffer. Copy before rgb goes out of scope.
	const QImage image(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888);
	return image.copy();
}

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
	setWindowTitle("Split Tuner");
	buildLayout();
}

MainWindow::~MainWindow() = default;

void MainWindow::setImage(const cv::Mat& image) {
	if (m_matrixView != nullptr) {
		m_matrixView->setMat(image);
	}
}

void MainWindow::setSummary(const std::string& text) {
	if (m_summaryLabel != nullptr) {
		m_summaryLabel->setText(QString::fromStdString(text));
	}
}

void MainWindow::setPipelineStepChangedCallback(std::function<void(PipelineStep)> callback) {
	m_stepChangedCallback = std::move(callback);
}

PipelineStep MainWindow::selectedPipelineStep() const {
	if (m_stepCombo == nullptr || m_stepCombo->currentIndex() < 0) {
		return PipelineStep::All;
	}
	return PIPELINE_STEPS[static_cast<std::size_t>(m_stepCombo->currentIndex())];
}

void MainWindow::buildLayout() {
	auto* rootWidget = new QWidget(this);
	auto* rootLayout = new QVBoxLayout(rootWidget);
	auto* stepRow    = new QHBoxLayout();
	auto* stepLabel  = new QLabel("Stage:", rootWidget);

	m_stepCombo = new QComboBox(rootWidget);
	for (const PipelineStep step: PIPELINE_STEPS) {
		const std::string_view label = toLabel(step);
		m_stepCombo->addItem(QString::fromUtf8(label.data(), static_cast<qsizetype>(label.size())));
	}
	m_stepCombo->setCurrentIndex(static_cast<int>(PIPELINE_STEPS.size()) - 1);

	connect(m_stepCombo, &QComboBox::currentIndexChanged, this, [this](int) {
		if (m_stepChangedCallback) {
			m_stepChangedCallback(selectedPipelineStep());
		}
	});

	stepRow->addWidget(stepLabel);
	stepRow->addWidget(m_stepCombo);
	stepRow->addStretch(1);

	m_matrixView   = new CvMatrixView(rootWidget);
	m_summaryLabel = new QLabel(rootWidget);

	rootLayout->addLayout(stepRow);
	rootLayout->addWidget(m_matrixView, 1);
	rootLayout->addWidget(m_summaryLabel);

	setCentralWidget(rootWidget);
}

} // namespace mangasplit
