#pragma once

#include "cell.h"
#include "common.h"

#include <vector>

class Sheet : public SheetInterface {
public:
    explicit Sheet(Grid grid);
    ~Sheet();

    Value EvaluateCell(Position pos) override;
    ValueGrid EvaluateAll() override;

    Size GetSize() const override;
    const std::string& GetCellText(Position pos) const override;

    void PrintValues(std::ostream& output) override;
    void PrintTexts(std::ostream& output) const override;

private:
    void CheckPosition(Position pos) const;

    template <typename Printer>
    void PrintCells(std::ostream& output, Printer&& printer) const;

private:
    Size size_;
    std::vector<std::vector<Cell>> cells_;
};
