#include "common.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iostream>
#include <limits>

using namespace std::literals;

namespace {
// Шесть букв ("ZZZZZZ") ещё помещаются в int, семь уже нет
constexpr size_t MAX_LABEL_LENGTH = 6;

bool IsLatinLetter(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

char ToUpper(char c) {
    return c >= 'a' && c <= 'z' ? static_cast<char>(c - 'a' + 'A') : c;
}

// Номер столбца в int64_t: для Position{0, INT_MAX} номер col + 1 не помещается в int
std::string BuildLabel(std::int64_t index) {
    std::string result;
    while(index > 0) {
        --index;
        result.push_back(static_cast<char>('A' + index % ALPHABET_SIZE));
        index /= ALPHABET_SIZE;
    }
    std::reverse(result.begin(), result.end());
    return result;
}
}  // namespace

const Position Position::NONE = {-1, -1};

int LabelToIndex(std::string_view label) {
    int result = 0;
    for(char c : label) {
        if(!IsLatinLetter(c)) {
            throw InvalidLabelException("invalid character '"s + c + "' in column label \""s
                                        + std::string(label) + "\", only letters A-Z are allowed"s);
        }
        if(result > (std::numeric_limits<int>::max() - ALPHABET_SIZE) / ALPHABET_SIZE) {
            throw InvalidLabelException("column label is too long: "s + std::string(label));
        }
        result = result * ALPHABET_SIZE + (ToUpper(c) - 'A' + 1);
    }
    return result;
}

std::string IndexToLabel(int index) {
    if(index < 0) {
        throw InvalidIndexException("column index must be non-negative, got "s + std::to_string(index));
    }
    return BuildLabel(index);
}

bool IsCellReference(std::string_view str) {
    size_t i = 0;
    while(i < str.size() && IsLatinLetter(str[i])) {
        ++i;
    }
    if(i == 0 || i == str.size()) {
        return false;
    }
    return std::all_of(str.begin() + i, str.end(), IsDigit);
}

std::optional<Value> ParseInteger(std::string_view str) {
    if(!str.empty() && str.front() == PLUS_SIGN) {
        str.remove_prefix(1);
        if(!str.empty() && str.front() == MINUS_SIGN) {
            return std::nullopt;
        }
    }
    if(str.empty()) {
        return std::nullopt;
    }
    Value result = 0;
    const char* end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, result);
    if(ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return result;
}

std::string_view Trim(std::string_view str) {
    auto is_space = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    while(!str.empty() && is_space(str.front())) {
        str.remove_prefix(1);
    }
    while(!str.empty() && is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

bool Position::operator==(const Position rhs) const {
    return row == rhs.row && col == rhs.col;
}

bool Position::operator!=(const Position rhs) const {
    return !(*this == rhs);
}

bool Position::operator<(const Position rhs) const {
    return row < rhs.row || (row == rhs.row && col < rhs.col);
}

bool Position::IsValid() const {
    return row >= 0 && col >= 0;
}

std::string Position::ToString() const {
    if(!IsValid()) {
        return "";
    }
    return BuildLabel(std::int64_t{col} + 1) + std::to_string(std::int64_t{row} + 1);
}

Position Position::FromString(std::string_view str) {
    if(!IsCellReference(str)) {
        return NONE;
    }
    auto digits_begin = std::find_if(str.begin(), str.end(), IsDigit);
    size_t letters_count = static_cast<size_t>(digits_begin - str.begin());
    if(letters_count > MAX_LABEL_LENGTH) {
        return NONE;
    }

    int row = 0;
    const char* end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data() + letters_count, end, row);
    if(ec != std::errc{} || ptr != end || row <= 0) {
        return NONE;
    }
    return {row - 1, LabelToIndex(str.substr(0, letters_count)) - 1};
}

bool Size::operator==(Size rhs) const {
    return rows == rhs.rows && cols == rhs.cols;
}

bool Size::Contains(Position pos) const {
    return pos.row >= 0 && pos.row < rows && pos.col >= 0 && pos.col < cols;
}

std::ostream& operator<<(std::ostream& output, Position pos) {
    return output << "(" << pos.row << ", " << pos.col << ")";
}

std::ostream& operator<<(std::ostream& output, Size size) {
    return output << "(" << size.rows << ", " << size.cols << ")";
}
