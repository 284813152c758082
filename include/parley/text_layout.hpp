// Text layout helpers: list formatting, line wrapping and line splitting
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "parley/parley_types.hpp"

namespace parley {

enum class ListMode {
    Rows,           // one item per line
    Inline,         // "a, b or c"
    ColumnsAcross,  // columns, filled left to right
    ColumnsDown,    // columns, filled top to bottom
};

constexpr size_t kDefaultListWidth = 80;

// Accepts "rows", "inline", "columns_across", "columns_down".
PARLEY_API std::optional<ListMode> ListModeFromName(const std::string& name);
PARLEY_API const char* ListModeName(ListMode mode);

// Lay out items according to mode.
// - Inline: option is the final separator (default " or ").
// - Columns*: option is the column count; when absent it is derived from
//   wrap_at (or 80) and the widest item. A non-numeric option throws
//   ParleyError(InvalidConfiguration).
// - Rows: option is ignored.
PARLEY_API std::string List(const std::vector<std::string>& items,
                            ListMode mode = ListMode::Rows,
                            const std::optional<std::string>& option = std::nullopt,
                            std::optional<size_t> wrap_at = std::nullopt);

// Break every line longer than limit at the last space at or before the
// limit, or hard-break at the limit when no space exists. Existing
// newlines are preserved.
PARLEY_API std::string Wrap(const std::string& text, size_t limit);

// Split into physical lines, each keeping its trailing '\n'. The last
// element lacks the newline when text does not end with one.
PARLEY_API std::vector<std::string> SplitLines(const std::string& text);

} // namespace parley
