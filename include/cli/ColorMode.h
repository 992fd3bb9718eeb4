#pragma once

namespace gsc::cli {

    enum class ColorMode {
        Auto,
        Always,
        Never
    };

} // namespace gsc::cli
