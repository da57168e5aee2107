#pragma once

#include <stdexcept>
#include <string>

// piece definition rejected at load time
struct InvalidPieceShape : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// excluded (date) cell not usable on the board
struct InvalidExcludedCell : std::out_of_range {
    using std::out_of_range::out_of_range;
};

// the decoder found overlapping placements; this is a bug, not an unsolvable date
struct MalformedSolution : std::logic_error {
    using std::logic_error::logic_error;
};
