#pragma once

#include "common.h"
#include "formula.h"

#include <memory>
#include <string>

class Cell {
public:
    // NotStarted -> InProgress -> Done. Повторный вход в InProgress
    // означает циклическую ссылку.
    enum class State {
        NotStarted,
        InProgress,
        Done,
    };

    explicit Cell(std::string text);

    // Возвращает запомненное значение или вычисляет его.
    // pos нужна только для сообщений об ошибках.
    Value Evaluate(SheetInterface& sheet, Position pos);

    const std::string& GetText() const;
    State GetState() const;

private:
    class Impl;
    class EmptyImpl;
    class NumberImpl;
    class FormulaImpl;

    std::unique_ptr<Impl> MakeImpl(Position pos) const;

    std::string text_;
    State state_ = State::NotStarted;
    Value value_ = 0;
};
