#include "formula.h"

#include <algorithm>
#include <limits>
#include <optional>
#include <string_view>

using namespace std::literals;

namespace {
bool IsOperator(std::string_view token) {
    return token.size() == 1u && (token.front() == PLUS_SIGN || token.front() == MINUS_SIGN);
}

// Делит выражение по '+' и '-', сохраняя сами операторы.
// Пустые фрагменты отбрасываются.
std::vector<std::string> SplitTokens(std::string_view expression) {
    std::vector<std::string> tokens;
    auto push_fragment = [&tokens](std::string_view fragment) {
        fragment = Trim(fragment);
        if(!fragment.empty()) {
            tokens.emplace_back(fragment);
        }
    };

    size_t start = 0;
    for(size_t i = 0; i < expression.size(); ++i) {
        if(expression[i] == PLUS_SIGN || expression[i] == MINUS_SIGN) {
            push_fragment(expression.substr(start, i - start));
            tokens.emplace_back(1u, expression[i]);
            start = i + 1;
        }
    }
    push_fragment(expression.substr(start));
    return tokens;
}

// Знак на месте операнда приклеивается к следующему за ним числу: "-5", "A1+-5"
std::vector<std::string> FoldSigns(std::vector<std::string> tokens) {
    std::vector<std::string> result;
    result.reserve(tokens.size());
    for(size_t i = 0; i < tokens.size(); ++i) {
        bool operand_expected = result.empty() || IsOperator(result.back());
        if(operand_expected && IsOperator(tokens[i]) && i + 1 < tokens.size()
            && !IsOperator(tokens[i + 1])) {
            std::string literal = tokens[i] + tokens[i + 1];
            if(ParseInteger(literal)) {
                result.push_back(std::move(literal));
                ++i;
                continue;
            }
        }
        result.push_back(std::move(tokens[i]));
    }
    return result;
}

Value Add(Value lhs, Value rhs) {
    if((rhs > 0 && lhs > std::numeric_limits<Value>::max() - rhs)
        || (rhs < 0 && lhs < std::numeric_limits<Value>::min() - rhs)) {
        throw FormulaArithmeticException("integer overflow in "s + std::to_string(lhs) + "+"s
                                         + std::to_string(rhs));
    }
    return lhs + rhs;
}

Value Subtract(Value lhs, Value rhs) {
    if((rhs < 0 && lhs > std::numeric_limits<Value>::max() + rhs)
        || (rhs > 0 && lhs < std::numeric_limits<Value>::min() + rhs)) {
        throw FormulaArithmeticException("integer overflow in "s + std::to_string(lhs) + "-"s
                                         + std::to_string(rhs));
    }
    return lhs - rhs;
}

class Operand {
public:
    explicit Operand(std::string token)
        : text_(std::move(token))
        , is_reference_(IsCellReference(text_))
        , position_(is_reference_ ? Position::FromString(text_) : Position::NONE)
        , literal_(is_reference_ ? std::nullopt : ParseInteger(text_))
    {
    }

    Value Evaluate(SheetInterface& sheet) const {
        if(is_reference_) {
            Size size = sheet.GetSize();
            if(!size.Contains(position_)) {
                throw InvalidPositionException("reference "s + text_ + " is out of range for a sheet of "s
                                               + std::to_string(size.rows) + " rows and "s
                                               + std::to_string(size.cols) + " columns"s);
            }
            return sheet.EvaluateCell(position_);
        }
        if(literal_) {
            return *literal_;
        }
        throw InvalidTokenException("invalid token \""s + text_ + "\": expected a cell reference or an integer"s);
    }

    const std::string& GetText() const {
        return text_;
    }

    std::optional<Position> GetReference() const {
        if(is_reference_ && position_.IsValid()) {
            return position_;
        }
        return std::nullopt;
    }

private:
    std::string text_;
    bool is_reference_ = false;
    Position position_ = Position::NONE;
    std::optional<Value> literal_;
};

class Formula : public FormulaInterface {
public:
    explicit Formula(std::string expression) {
        auto tokens = FoldSigns(SplitTokens(expression));
        if(tokens.size() == 1u) {
            operands_.emplace_back(std::move(tokens[0]));
        }
        else if(tokens.size() == 3u && IsOperator(tokens[1])) {
            operands_.emplace_back(std::move(tokens[0]));
            operation_ = tokens[1].front();
            operands_.emplace_back(std::move(tokens[2]));
        }
        else {
            throw FormulaException("invalid formula \""s + expression
                                   + "\": expected a single operand or two operands joined by '+' or '-'"s);
        }
    }

    Value Evaluate(SheetInterface& sheet) const override {
        Value lhs = operands_.front().Evaluate(sheet);
        if(operands_.size() == 1u) {
            return lhs;
        }
        Value rhs = operands_.back().Evaluate(sheet);
        return operation_ == PLUS_SIGN ? Add(lhs, rhs) : Subtract(lhs, rhs);
    }

    std::string GetExpression() const override {
        std::string result = operands_.front().GetText();
        if(operands_.size() > 1u) {
            result.push_back(operation_);
            result.append(operands_.back().GetText());
        }
        return result;
    }

    std::vector<Position> GetReferencedCells() const override {
        std::vector<Position> cells;
        for(const auto& operand : operands_) {
            if(auto pos = operand.GetReference()) {
                cells.push_back(*pos);
            }
        }
        std::sort(cells.begin(), cells.end());
        cells.erase(std::unique(cells.begin(), cells.end()), cells.end());
        return cells;
    }

private:
    std::vector<Operand> operands_;
    char operation_ = PLUS_SIGN;
};
}  // namespace

std::unique_ptr<FormulaInterface> ParseFormula(std::string expression) {
    return std::make_unique<Formula>(std::move(expression));
}
