#pragma once

#include "common.h"

#include <memory>
#include <vector>

// Формула вида "X" или "X op Y", где X и Y - ссылки на ячейки или целые
// числа, а op - сложение или вычитание.
class FormulaInterface {
public:
    virtual ~FormulaInterface() = default;

    // Вычисляет формулу, запрашивая значения ячеек у таблицы.
    // Ссылка за пределы таблицы - InvalidPositionException,
    // нераспознанный операнд - InvalidTokenException.
    virtual Value Evaluate(SheetInterface& sheet) const = 0;

    // Текст формулы без пробелов и без знака '='
    virtual std::string GetExpression() const = 0;

    // Упорядоченный список ячеек, на которые ссылается формула, без повторов
    virtual std::vector<Position> GetReferencedCells() const = 0;
};

// Разбирает текст формулы (без ведущего '=').
// Бросает FormulaException, если формула не имеет вид "X" или "X op Y".
std::unique_ptr<FormulaInterface> ParseFormula(std::string expression);
