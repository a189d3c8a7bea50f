/// @file src/fourier/fourier2d.cpp
/// @brief Row-column 2D FFT on top of Eigen::FFT.

#include "potfield/fourier.hpp"

#include <unsupported/Eigen/FFT>

#include <vector>

namespace potfield::fourier {

namespace {

enum class Sign { Forward, Inverse };

/// Transform every column, then every row, of `grid` in place.
///
/// Eigen::FFT has no working 2D entry point for the kissfft backend, so the
/// separable transform is assembled from 1D passes. Inverse passes are each
/// scaled by 1/n, which yields the overall 1/(rows·cols).
void transform_axes(ComplexGrid& grid, Sign sign) {
    Eigen::FFT<double> fft;

    const Eigen::Index rows = grid.rows();
    const Eigen::Index cols = grid.cols();

    // A length-1 DFT is the identity; kissfft is not asked to plan it.
    std::vector<Complex> src(static_cast<std::size_t>(rows));
    std::vector<Complex> dst(static_cast<std::size_t>(rows));
    for (Eigen::Index c = 0; rows > 1 && c < cols; ++c) {
        for (Eigen::Index r = 0; r < rows; ++r) src[r] = grid(r, c);
        if (sign == Sign::Forward) fft.fwd(dst.data(), src.data(), rows);
        else                       fft.inv(dst.data(), src.data(), rows);
        for (Eigen::Index r = 0; r < rows; ++r) grid(r, c) = dst[r];
    }

    src.resize(static_cast<std::size_t>(cols));
    dst.resize(static_cast<std::size_t>(cols));
    for (Eigen::Index r = 0; cols > 1 && r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) src[c] = grid(r, c);
        if (sign == Sign::Forward) fft.fwd(dst.data(), src.data(), cols);
        else                       fft.inv(dst.data(), src.data(), cols);
        for (Eigen::Index c = 0; c < cols; ++c) grid(r, c) = dst[c];
    }
}

} // anonymous namespace

ComplexGrid Fourier2D::forward(const Grid& data) {
    ComplexGrid spectrum = data.cast<Complex>();
    transform_axes(spectrum, Sign::Forward);
    return spectrum;
}

ComplexGrid Fourier2D::forward(const ComplexGrid& data) {
    ComplexGrid spectrum = data;
    transform_axes(spectrum, Sign::Forward);
    return spectrum;
}

ComplexGrid Fourier2D::inverse(const ComplexGrid& spectrum) {
    ComplexGrid result = spectrum;
    transform_axes(result, Sign::Inverse);
    return result;
}

} // namespace potfield::fourier
