#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

inline constexpr char FORMULA_SIGN = '=';
inline constexpr char PLUS_SIGN = '+';
inline constexpr char MINUS_SIGN = '-';
inline constexpr int ALPHABET_SIZE = 26;

// Значение вычисленной ячейки
using Value = std::int64_t;

// Исходная таблица: строки одинаковой длины с текстом ячеек
using Grid = std::vector<std::vector<std::string>>;
using ValueGrid = std::vector<std::vector<Value>>;

// Перевод буквенной метки столбца ("A", "Z", "AA") в номер, начиная с 1.
// Пустая метка даёт 0.
int LabelToIndex(std::string_view label);

// Обратное преобразование. Для 0 возвращает пустую строку.
std::string IndexToLabel(int index);

// Строка вида "буквы цифры", например "A1" или "ab12"
bool IsCellReference(std::string_view str);

// Целое со знаком в десятичной записи. nullopt, если строка не число
// или не помещается в Value.
std::optional<Value> ParseInteger(std::string_view str);

// Отбрасывает пробельные символы по краям
std::string_view Trim(std::string_view str);

// Позиция ячейки. Индексация с нуля.
struct Position {
    int row = 0;
    int col = 0;

    bool operator==(Position rhs) const;
    bool operator!=(Position rhs) const;
    bool operator<(Position rhs) const;

    bool IsValid() const;
    std::string ToString() const;

    static Position FromString(std::string_view str);

    static const Position NONE;
};

struct Size {
    int rows = 0;
    int cols = 0;

    bool operator==(Size rhs) const;
    bool Contains(Position pos) const;
};

std::ostream& operator<<(std::ostream& output, Position pos);
std::ostream& operator<<(std::ostream& output, Size size);

// Строки таблицы разной длины
class RaggedGridException : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Недопустимый символ в метке столбца
class InvalidLabelException : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Отрицательный номер столбца
class InvalidIndexException : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Ссылка за пределы таблицы
class InvalidPositionException : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// Обычная ячейка не является целым числом
class InvalidCellValueException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Формула не разбирается в одну из форм "X" или "X op Y"
class FormulaException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Операнд формулы не ссылка и не число
class InvalidTokenException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Переполнение при сложении или вычитании
class FormulaArithmeticException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CircularDependencyException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SheetInterface {
public:
    virtual ~SheetInterface() = default;

    // Вычисляет значение ячейки, при необходимости рекурсивно вычисляя
    // ячейки, на которые она ссылается.
    virtual Value EvaluateCell(Position pos) = 0;

    // Вычисляет все ячейки в порядке строк и возвращает таблицу значений.
    // Вычисление рекурсивное: глубина стека равна длине самой длинной цепочки
    // ссылок. На стеке 8 МБ цепочка из 20000 ячеек уже не помещается.
    virtual ValueGrid EvaluateAll() = 0;

    virtual Size GetSize() const = 0;

    // Исходный текст ячейки
    virtual const std::string& GetCellText(Position pos) const = 0;

    // Выводит всю таблицу в переданный поток. Столбцы разделяются знаком
    // табуляции. После каждой строки выводится символ перевода строки.
    virtual void PrintValues(std::ostream& output) = 0;
    virtual void PrintTexts(std::ostream& output) const = 0;
};

// Создаёт таблицу из исходного текста ячеек
std::unique_ptr<SheetInterface> CreateSheet(Grid grid);
