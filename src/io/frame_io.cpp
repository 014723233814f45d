#include "deflicker/io/frame_io.hpp"
#include "deflicker/core/errors.hpp"
#include "deflicker/core/utils.hpp"

#include <fitsio.h>
#include <opencv2/opencv.hpp>

#include <cstring>
#include <vector>

namespace deflicker::io {

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

std::string extension_for_format(const std::string& format) {
    const std::string f = core::to_lower(format);
    if (f == "png") return ".png";
    if (f == "tiff") return ".tif";
    if (f == "fits") return ".fits";
    throw ConfigurationError("unsupported output format: " + format);
}

static Frame read_fits_frame(const fs::path& path, int index) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }

    if (naxis < 2) {
        fits_close_file(fptr, &status);
        throw FitsError("FITS file has less than 2 dimensions: " + path.string());
    }

    const long width = naxes[0];
    const long height = naxes[1];
    const long planes = (naxis >= 3 && naxes[2] > 0) ? naxes[2] : 1;
    const long npixels = width * height;

    Frame frame;
    frame.index = index;
    frame.channels.reserve(static_cast<size_t>(planes));

    for (long c = 0; c < planes; ++c) {
        Matrix2Df plane(height, width);
        long fpixel[3] = {1, 1, c + 1};
        fits_read_pix(fptr, TFLOAT, fpixel, npixels, nullptr, plane.data(), nullptr, &status);
        if (status) {
            fits_close_file(fptr, &status);
            throw FitsError("Cannot read FITS pixel data: " + path.string());
        }
        frame.channels.push_back(std::move(plane));
    }

    fits_close_file(fptr, &status);
    return frame;
}

static void write_fits_frame(const fs::path& path, const Frame& frame) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    const int naxis = frame.num_channels() > 1 ? 3 : 2;
    long naxes[3] = {frame.width(), frame.height(), frame.num_channels()};

    fits_create_img(fptr, FLOAT_IMG, naxis, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    int frame_index = frame.index;
    fits_update_key(fptr, TINT, "FRAMEIDX", &frame_index, "sequence index", &status);

    const long npixels = static_cast<long>(frame.width()) * frame.height();
    for (int c = 0; c < frame.num_channels(); ++c) {
        long fpixel[3] = {1, 1, c + 1};
        fits_write_pix(fptr, TFLOAT, fpixel, npixels,
                       const_cast<float*>(frame.channels[c].data()), &status);
        if (status) {
            fits_close_file(fptr, &status);
            throw FitsError("Cannot write FITS pixel data: " + path.string());
        }
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot finalize FITS file: " + path.string());
    }
}

Frame read_frame(const fs::path& path, int index) {
    if (!fs::exists(path)) {
        throw IOError("Frame file not found: " + path.string());
    }
    if (is_fits_image_path(path)) {
        return read_fits_frame(path, index);
    }

    cv::Mat img = cv::imread(path.string(), cv::IMREAD_ANYDEPTH | cv::IMREAD_ANYCOLOR);
    if (img.empty()) {
        throw IOError("Cannot decode image: " + path.string());
    }

    double scale = 1.0;
    switch (img.depth()) {
        case CV_8U: scale = 1.0; break;
        case CV_16U: scale = 1.0 / 257.0; break;
        case CV_32F: scale = 1.0; break;
        default:
            throw IOError("Unsupported sample depth in " + path.string());
    }

    cv::Mat img_f;
    img.convertTo(img_f, CV_32F, scale);

    std::vector<cv::Mat> planes;
    cv::split(img_f, planes);

    Frame frame;
    frame.index = index;
    frame.channels.reserve(planes.size());
    for (const auto& p : planes) {
        Matrix2Df plane(p.rows, p.cols);
        for (int y = 0; y < p.rows; ++y) {
            std::memcpy(plane.data() + static_cast<size_t>(y) * p.cols, p.ptr<float>(y),
                        static_cast<size_t>(p.cols) * sizeof(float));
        }
        frame.channels.push_back(std::move(plane));
    }
    return frame;
}

void write_frame(const fs::path& path, const Frame& frame) {
    if (frame.num_channels() == 0) {
        throw IOError("Refusing to write empty frame: " + path.string());
    }
    if (is_fits_image_path(path)) {
        write_fits_frame(path, frame);
        return;
    }

    std::vector<cv::Mat> planes;
    planes.reserve(frame.channels.size());
    for (const auto& c : frame.channels) {
        cv::Mat view(static_cast<int>(c.rows()), static_cast<int>(c.cols()), CV_32F,
                     const_cast<float*>(c.data()));
        planes.push_back(view);
    }
    cv::Mat merged;
    cv::merge(planes, merged);

    cv::Mat out;
    merged.convertTo(out, CV_8U);

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), out);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot encode " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write image: " + path.string());
    }
}

} // namespace deflicker::io
