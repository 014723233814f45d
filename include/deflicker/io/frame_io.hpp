#pragma once

#include "deflicker/core/types.hpp"
#include <string>

namespace deflicker::io {

bool is_fits_image_path(const fs::path& path);

// Reads an image file into a Frame. FITS files go through cfitsio (2D plane or
// a NAXIS3 cube of channels); everything else through the OpenCV codecs.
// 16-bit samples are rescaled to the 0..255 range.
Frame read_frame(const fs::path& path, int index);

// PNG/TIFF are written as 8-bit with rounding and saturation; FITS as float.
void write_frame(const fs::path& path, const Frame& frame);

// File extension (with leading dot) for an output.format value.
std::string extension_for_format(const std::string& format);

} // namespace deflicker::io
