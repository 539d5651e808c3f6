#pragma once

#include "mangasplit/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>

namespace mangasplit::core {

/*! Separate ink from paper.
 *  Luminance -> 5x5 Gaussian blur -> CLAHE (clip 2.0, 8x8 tiles) -> inverted Otsu -> 5x5 open -> 5x5 close.
 *  The order and the constants are part of the contract. Changing them changes every split decision downstream.
 *
 * \param [in]     image    8 bit image. 1 (gray), 3 (BGR) or 4 (BGRA) channels. Not modified.
 * \param [in,out] debugger Optional debug visualizer for the intermediate images.
 * \return         CV_8UC1 mask of the same size. 255 where ink was found, 0 for paper. May be all zero.
 * \throws         InvalidInputError for empty images or unsupported pixel formats.
 */
cv::Mat buildForegroundMask(const cv::Mat& image, DebugVisualizer* debugger = nullptr);

//! \throws InvalidInputError unless the image is non-empty, 8 bit and has 1, 3 or 4 channels.
void requireSupportedImage(const cv::Mat& image);

//! Convert an 8 bit image to single channel luminance. Gray input is copied.
//! \throws InvalidInputError for empty images or unsupported pixel formats.
cv::Mat toLuminance(const cv::Mat& image);

} // namespace mangasplit::core
