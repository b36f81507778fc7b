#pragma once

typedef struct FT_LibraryRec_* FT_Library;

namespace ycomp::font {

/// Thread-local FreeType library singleton.
/// FT_Library is not thread-safe, so one instance per thread.
/// Returns nullptr if FT_Init_FreeType failed.
FT_Library ftLibrary();

} // namespace ycomp::font
