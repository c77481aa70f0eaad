#include "sheet.h"

#include "common.h"

#include <iostream>

using namespace std::literals;

Sheet::Sheet(Grid grid) {
    size_.rows = static_cast<int>(grid.size());
    size_.cols = grid.empty() ? 0 : static_cast<int>(grid.front().size());

    cells_.reserve(grid.size());
    for(size_t i = 0; i < grid.size(); ++i) {
        auto& row = grid[i];
        if(row.size() != static_cast<size_t>(size_.cols)) {
            throw RaggedGridException("all rows must have the same number of columns: row "s
                                      + std::to_string(i + 1) + " has "s + std::to_string(row.size())
                                      + ", expected "s + std::to_string(size_.cols));
        }
        std::vector<Cell> cells_row;
        cells_row.reserve(row.size());
        for(auto& text : row) {
            cells_row.emplace_back(std::move(text));
        }
        cells_.push_back(std::move(cells_row));
    }
}

Sheet::~Sheet() = default;

Value Sheet::EvaluateCell(Position pos) {
    CheckPosition(pos);
    return cells_[pos.row][pos.col].Evaluate(*this, pos);
}

ValueGrid Sheet::EvaluateAll() {
    ValueGrid result(size_.rows, std::vector<Value>(size_.cols, 0));
    for(int i = 0; i < size_.rows; ++i) {
        for(int j = 0; j < size_.cols; ++j) {
            result[i][j] = EvaluateCell({i, j});
        }
    }
    return result;
}

Size Sheet::GetSize() const {
    return size_;
}

const std::string& Sheet::GetCellText(Position pos) const {
    CheckPosition(pos);
    return cells_[pos.row][pos.col].GetText();
}

template <typename Printer>
void Sheet::PrintCells(std::ostream& output, Printer&& printer) const {
    for(int i = 0; i < size_.rows; ++i) {
        for(int j = 0; j < size_.cols; ++j) {
            if(j > 0) {
                output << '\t';
            }
            printer(Position{i, j});
        }
        output << '\n';
    }
}

void Sheet::PrintValues(std::ostream& output) {
    ValueGrid values = EvaluateAll();
    PrintCells(output, [&output, &values](Position pos) {
        output << values[pos.row][pos.col];
    });
}

void Sheet::PrintTexts(std::ostream& output) const {
    PrintCells(output, [&output, this](Position pos) {
        output << cells_[pos.row][pos.col].GetText();
    });
}

void Sheet::CheckPosition(Position pos) const {
    if(!size_.Contains(pos)) {
        throw InvalidPositionException("position "s + (pos.IsValid() ? pos.ToString() : "(invalid)"s)
                                       + " is outside of the "s + std::to_string(size_.rows) + "x"s
                                       + std::to_string(size_.cols) + " sheet"s);
    }
}

std::unique_ptr<SheetInterface> CreateSheet(Grid grid) {
    return std::make_unique<Sheet>(std::move(grid));
}
