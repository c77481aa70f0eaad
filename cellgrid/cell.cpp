#include "cell.h"

#include <string>

using namespace std::literals;

class Cell::Impl {
public:
    virtual ~Impl() = default;

    virtual Value Compute(SheetInterface& sheet) const = 0;
};

class Cell::EmptyImpl final : public Cell::Impl {
public:
    Value Compute(SheetInterface& /*sheet*/) const override {
        return 0;
    }
};

class Cell::NumberImpl final : public Cell::Impl {
public:
    explicit NumberImpl(Value value)
        : value_(value) {}

    Value Compute(SheetInterface& /*sheet*/) const override {
        return value_;
    }
private:
    const Value value_;
};

class Cell::FormulaImpl final : public Cell::Impl {
public:
    explicit FormulaImpl(std::string expression)
        : formula_(ParseFormula(std::move(expression)))
    {
    }

    Value Compute(SheetInterface& sheet) const override {
        return formula_->Evaluate(sheet);
    }
private:
    std::unique_ptr<FormulaInterface> formula_;
};

Cell::Cell(std::string text)
    : text_(std::move(text)) {}

Value Cell::Evaluate(SheetInterface& sheet, Position pos) {
    if(state_ == State::Done) {
        return value_;
    }
    if(state_ == State::InProgress) {
        throw CircularDependencyException("circular reference detected at "s + pos.ToString());
    }

    state_ = State::InProgress;
    try {
        value_ = MakeImpl(pos)->Compute(sheet);
    }
    catch(...) {
        // ячейка снова доступна для вычисления, ошибка пробрасывается дальше
        state_ = State::NotStarted;
        throw;
    }
    state_ = State::Done;
    return value_;
}

const std::string& Cell::GetText() const {
    return text_;
}

Cell::State Cell::GetState() const {
    return state_;
}

std::unique_ptr<Cell::Impl> Cell::MakeImpl(Position pos) const {
    std::string_view content = Trim(text_);
    if(content.empty()) {
        return std::make_unique<EmptyImpl>();
    }
    if(content.front() == FORMULA_SIGN) {
        return std::make_unique<FormulaImpl>(std::string(Trim(content.substr(1u))));
    }
    if(auto number = ParseInteger(content)) {
        return std::make_unique<NumberImpl>(*number);
    }
    throw InvalidCellValueException("invalid cell value at "s + pos.ToString() + " (row "s
                                    + std::to_string(std::int64_t{pos.row} + 1) + ", column "s
                                    + std::to_string(std::int64_t{pos.col} + 1) + "): \""s + text_ + "\""s);
}
