#ifndef NEIGHBORGRID_ERROR_HPP
#define NEIGHBORGRID_ERROR_HPP

#include <stdexcept>

namespace neighborgrid {

enum class GridErrorKind {
    IndexOutOfBounds,
    RowSizeMismatch,
    InvalidSize,
    ExcessiveSize,
    InvalidDivisionSize,
};

const char* describe(GridErrorKind kind);

class GridError : public std::runtime_error {
public:
    explicit GridError(GridErrorKind kind);

    GridErrorKind kind() const { return m_kind; }

private:
    GridErrorKind m_kind;
};

} //neighborgrid

#endif
