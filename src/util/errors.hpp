#pragma once
#include <stdexcept>
#include <string>

namespace gsynth {

// Bad generator input (node counts, grid dimensions, tuning knobs).
// Always raised before any output file is touched.
struct invalid_parameter : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Directory creation, open, write or close failure on an output file.
struct io_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
