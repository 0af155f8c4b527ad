//! # Data Table View
//!
//! The shape a step implementation sees for a step's data table. With two or
//! more rows the first row is treated as the header:
//!
//! ```text
//! | name  | price |      headers = [name, price]
//! | apple | 1.25  |  ->  rows    = [[apple, 1.25], [pear, 0.90]]
//! | pear  | 0.90  |      maps    = [{name: apple, price: 1.25}, ...]
//! ```
//!
//! A single-row table has no header: `headers` and `maps` stay empty and
//! `rows` holds the raw table.

#ifndef CUKE_GHERKIN_DATA_TABLE_HPP
#define CUKE_GHERKIN_DATA_TABLE_HPP

#include "cuke/gherkin/document.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cuke::gherkin {

struct DataTableView {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    std::vector<std::map<std::string, std::string>> maps;
    DataTable raw;

    [[nodiscard]] static auto from(const DataTable& table) -> DataTableView;

    /// Cell of body row `row` under `header`, if both exist.
    [[nodiscard]] auto cell(size_t row, std::string_view header) const
        -> std::optional<std::string>;
};

} // namespace cuke::gherkin

#endif // CUKE_GHERKIN_DATA_TABLE_HPP
