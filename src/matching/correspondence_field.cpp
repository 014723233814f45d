#include "deflicker/matching/correspondence_field.hpp"

#include <algorithm>

namespace deflicker::matching {

CorrespondenceField CorrespondenceField::identity(int rows, int cols) {
    CorrespondenceField f;
    f.offset_x = Matrix2Di::Zero(rows, cols);
    f.offset_y = Matrix2Di::Zero(rows, cols);
    f.cost = Matrix2Df::Zero(rows, cols);
    return f;
}

CorrespondenceField CorrespondenceField::invalid(int rows, int cols) {
    CorrespondenceField f;
    f.offset_x = Matrix2Di::Zero(rows, cols);
    f.offset_y = Matrix2Di::Zero(rows, cols);
    f.cost = Matrix2Df::Constant(rows, cols, kInvalidCost);
    return f;
}

CorrespondenceField upsample_field(const CorrespondenceField& coarse, int rows, int cols) {
    CorrespondenceField fine = CorrespondenceField::invalid(rows, cols);
    if (coarse.rows() == 0 || coarse.cols() == 0) {
        return fine;
    }
    for (int y = 0; y < rows; ++y) {
        const int cy = std::min(y / 2, coarse.rows() - 1);
        for (int x = 0; x < cols; ++x) {
            const int cx = std::min(x / 2, coarse.cols() - 1);
            fine.offset_x(y, x) = 2 * coarse.offset_x(cy, cx);
            fine.offset_y(y, x) = 2 * coarse.offset_y(cy, cx);
        }
    }
    return fine;
}

float mean_cost(const CorrespondenceField& field) {
    double sum = 0.0;
    size_t n = 0;
    for (Eigen::Index i = 0; i < field.cost.size(); ++i) {
        const float c = field.cost.data()[i];
        if (std::isfinite(c)) {
            sum += static_cast<double>(c);
            ++n;
        }
    }
    if (n == 0) return kInvalidCost;
    return static_cast<float>(sum / static_cast<double>(n));
}

int count_valid(const CorrespondenceField& field) {
    int n = 0;
    for (Eigen::Index i = 0; i < field.cost.size(); ++i) {
        if (std::isfinite(field.cost.data()[i])) ++n;
    }
    return n;
}

} // namespace deflicker::matching
