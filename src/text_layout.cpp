#include "parley/text_layout.hpp"

#include <algorithm>

namespace parley {

namespace {

size_t ParseColumnCount(const std::string& option) {
    size_t pos = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(option, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != option.size() || value == 0) {
        throw ParleyError(ParleyErrc::InvalidConfiguration,
                          "Column count must be a positive integer, got '" + option + "'");
    }
    return static_cast<size_t>(value);
}

std::string JoinRow(const std::vector<std::string>& cells) {
    std::string row;
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i) row += "  ";
        row += cells[i];
    }
    return row + "\n";
}

} // namespace

std::optional<ListMode> ListModeFromName(const std::string& name) {
    if (name == "rows") return ListMode::Rows;
    if (name == "inline") return ListMode::Inline;
    if (name == "columns_across") return ListMode::ColumnsAcross;
    if (name == "columns_down") return ListMode::ColumnsDown;
    return std::nullopt;
}

const char* ListModeName(ListMode mode) {
    switch (mode) {
        case ListMode::Rows: return "rows";
        case ListMode::Inline: return "inline";
        case ListMode::ColumnsAcross: return "columns_across";
        case ListMode::ColumnsDown: return "columns_down";
    }
    return "rows";
}

std::string List(const std::vector<std::string>& items, ListMode mode,
                 const std::optional<std::string>& option,
                 std::optional<size_t> wrap_at) {
    switch (mode) {
        case ListMode::Inline: {
            const std::string last_sep = option.value_or(" or ");
            if (items.empty()) return "";
            if (items.size() == 1) return items.front();
            std::string out;
            for (size_t i = 0; i + 1 < items.size(); ++i) {
                if (i) out += ", ";
                out += items[i];
            }
            return out + last_sep + items.back();
        }
        case ListMode::ColumnsAcross:
        case ListMode::ColumnsDown: {
            if (items.empty()) return "";
            size_t max_len = 0;
            for (const auto& item : items) max_len = std::max(max_len, item.size());

            size_t columns = 0;
            if (option) {
                columns = ParseColumnCount(*option);
            } else {
                size_t limit = wrap_at.value_or(kDefaultListWidth);
                columns = std::max<size_t>(1, (limit + 2) / (max_len + 2));
            }

            std::vector<std::string> padded;
            padded.reserve(items.size());
            for (const auto& item : items) {
                padded.push_back(item + std::string(max_len - item.size(), ' '));
            }
            const size_t row_count = (padded.size() + columns - 1) / columns;

            std::string out;
            if (mode == ListMode::ColumnsAcross) {
                std::vector<std::vector<std::string>> rows(row_count);
                for (size_t i = 0; i < padded.size(); ++i) rows[i / columns].push_back(padded[i]);
                for (const auto& row : rows) out += JoinRow(row);
            } else {
                std::vector<std::vector<std::string>> cols(columns);
                for (size_t i = 0; i < padded.size(); ++i) cols[i / row_count].push_back(padded[i]);
                for (size_t r = 0; r < cols.front().size(); ++r) {
                    std::vector<std::string> row;
                    for (const auto& col : cols) {
                        if (r < col.size()) row.push_back(col[r]);
                    }
                    out += JoinRow(row);
                }
            }
            return out;
        }
        case ListMode::Rows:
            break;
    }

    std::string out;
    for (const auto& item : items) out += item + "\n";
    return out;
}

std::string Wrap(const std::string& text, size_t limit) {
    if (limit == 0) {
        throw ParleyError(ParleyErrc::InvalidConfiguration, "Wrap limit must be positive");
    }
    std::string out;
    out.reserve(text.size() + text.size() / limit);

    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);

        while (line.size() > limit) {
            size_t space = line.rfind(' ', limit);
            if (space != std::string::npos) {
                out += line.substr(0, space);
                out += '\n';
                size_t rest = line.find_first_not_of(" \t", space + 1);
                line = rest == std::string::npos ? std::string() : line.substr(rest);
            } else {
                out += line.substr(0, limit);
                out += '\n';
                line = line.substr(limit);
            }
        }
        out += line;

        if (nl == std::string::npos) break;
        out += '\n';
        start = nl + 1;
    }
    return out;
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return lines;
}

} // namespace parley
