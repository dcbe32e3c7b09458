#include "error.hpp"

namespace neighborgrid {

const char* describe(GridErrorKind kind) {
    switch (kind) {
    case GridErrorKind::IndexOutOfBounds:
        return "Index out of bounds";
    case GridErrorKind::RowSizeMismatch:
        return "Row size must match other rows";
    case GridErrorKind::InvalidSize:
        return "Invalid grid size";
    case GridErrorKind::ExcessiveSize:
        return "Resulting grid is too large";
    case GridErrorKind::InvalidDivisionSize:
        return "Divisor is either less than 1 or larger than the grid";
    };
    return "Unknown grid error";
}

GridError::GridError(GridErrorKind kind)
    : std::runtime_error(describe(kind)), m_kind(kind) {}

} //neighborgrid
