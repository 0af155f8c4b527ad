#include "cuke/gherkin/data_table.hpp"

namespace cuke::gherkin {

auto DataTableView::from(const DataTable& table) -> DataTableView {
    DataTableView view;
    view.raw = table;

    if (table.size() < 2) {
        view.rows = table;
        return view;
    }

    view.headers = table.front();
    view.rows.assign(table.begin() + 1, table.end());
    for (const auto& row : view.rows) {
        std::map<std::string, std::string> entry;
        for (size_t col = 0; col < view.headers.size() && col < row.size(); ++col) {
            entry.emplace(view.headers[col], row[col]);
        }
        view.maps.push_back(std::move(entry));
    }
    return view;
}

auto DataTableView::cell(size_t row, std::string_view header) const -> std::optional<std::string> {
    if (row >= maps.size()) {
        return std::nullopt;
    }
    auto it = maps[row].find(std::string(header));
    if (it == maps[row].end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace cuke::gherkin
