#pragma once

#include "deflicker/core/types.hpp"

#include <cmath>
#include <limits>

namespace deflicker::matching {

constexpr float kInvalidCost = std::numeric_limits<float>::infinity();

// Square footprint centred on (x, y); size is odd.
struct PatchDescriptor {
    int x;
    int y;
    int size;

    int radius() const { return size / 2; }
};

// Dense source -> reference mapping. The match centre of source pixel (x, y)
// is (x + offset_x(y, x), y + offset_y(y, x)); +inf cost marks no match.
struct CorrespondenceField {
    Matrix2Di offset_x;
    Matrix2Di offset_y;
    Matrix2Df cost;

    int rows() const { return static_cast<int>(cost.rows()); }
    int cols() const { return static_cast<int>(cost.cols()); }

    bool is_valid(int y, int x) const { return std::isfinite(cost(y, x)); }

    static CorrespondenceField identity(int rows, int cols);
    static CorrespondenceField invalid(int rows, int cols);
};

// Warm start for the next finer pyramid level: offsets are doubled and costs
// reset to +inf; the caller re-evaluates them.
CorrespondenceField upsample_field(const CorrespondenceField& coarse, int rows, int cols);

// Mean over valid entries, +inf when nothing is valid.
float mean_cost(const CorrespondenceField& field);

int count_valid(const CorrespondenceField& field);

} // namespace deflicker::matching
