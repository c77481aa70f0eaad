#include "cell.h"
#include "common.h"
#include "formula.h"
#include "sheet.h"

#include <gtest/gtest.h>

#include <limits>
#include <sstream>
#include <string>

using namespace std::literals;

inline Position operator"" _pos(const char* str, std::size_t) {
    return Position::FromString(str);
}

namespace {
template <typename Exception>
void ExpectErrorMentions(SheetInterface& sheet, const std::string& text) {
    try {
        sheet.EvaluateAll();
        FAIL() << "exception was not thrown";
    }
    catch (const Exception& e) {
        EXPECT_NE(std::string(e.what()).find(text), std::string::npos) << e.what();
    }
}

Value EvaluateFormula(std::string expression, SheetInterface& sheet) {
    return ParseFormula(std::move(expression))->Evaluate(sheet);
}

ValueGrid Evaluate(Grid grid) {
    return CreateSheet(std::move(grid))->EvaluateAll();
}
}  // namespace

TEST(LabelCodecTest, TestLabelToIndex) {
    EXPECT_EQ(LabelToIndex("A"), 1);
    EXPECT_EQ(LabelToIndex("Z"), 26);
    EXPECT_EQ(LabelToIndex("AA"), 27);
    EXPECT_EQ(LabelToIndex("AB"), 28);
    EXPECT_EQ(LabelToIndex("AZ"), 52);
    EXPECT_EQ(LabelToIndex("BA"), 53);
    EXPECT_EQ(LabelToIndex("ZZ"), 702);
    EXPECT_EQ(LabelToIndex("AAA"), 703);
    EXPECT_EQ(LabelToIndex("XFD"), 16384);
    EXPECT_EQ(LabelToIndex(""), 0);

    // Регистр не важен
    EXPECT_EQ(LabelToIndex("aA"), 27);
    EXPECT_EQ(LabelToIndex("zz"), 702);
}

TEST(LabelCodecTest, TestIndexToLabel) {
    EXPECT_EQ(IndexToLabel(0), "");
    EXPECT_EQ(IndexToLabel(1), "A");
    EXPECT_EQ(IndexToLabel(26), "Z");
    EXPECT_EQ(IndexToLabel(27), "AA");
    EXPECT_EQ(IndexToLabel(52), "AZ");
    EXPECT_EQ(IndexToLabel(53), "BA");
    EXPECT_EQ(IndexToLabel(702), "ZZ");
    EXPECT_EQ(IndexToLabel(703), "AAA");
    EXPECT_EQ(IndexToLabel(std::numeric_limits<int>::max()), "FXSHRXW");
}

TEST(LabelCodecTest, TestRoundTrip) {
    for (int i = 1; i <= 20000; ++i) {
        ASSERT_EQ(LabelToIndex(IndexToLabel(i)), i);
    }
    for (std::string label : {"A", "Q", "Z", "AA", "MZ", "ZZ", "AAA", "XFD", "ZZZZ"}) {
        EXPECT_EQ(IndexToLabel(LabelToIndex(label)), label);
    }
    EXPECT_EQ(IndexToLabel(LabelToIndex("xfd")), "XFD");
}

TEST(LabelCodecTest, TestInvalidInput) {
    EXPECT_THROW(LabelToIndex("A1"), InvalidLabelException);
    EXPECT_THROW(LabelToIndex("A-"), InvalidLabelException);
    EXPECT_THROW(LabelToIndex(" A"), InvalidLabelException);
    EXPECT_THROW(LabelToIndex("ABCDEFGHIJ"), InvalidLabelException);
    EXPECT_THROW(IndexToLabel(-1), InvalidIndexException);
    EXPECT_THROW(IndexToLabel(std::numeric_limits<int>::min()), InvalidIndexException);
}

TEST(PositionTest, TestPositionAndStringConversion) {
    auto testSingle = [](Position pos, std::string_view str) {
        EXPECT_EQ(pos.ToString(), str);
        EXPECT_EQ(Position::FromString(str), pos);
    };

    for (int i = 0; i < 25; ++i) {
        testSingle(Position{i, i}, char('A' + i) + std::to_string(i + 1));
    }

    testSingle(Position{0, 0}, "A1");
    testSingle(Position{0, 1}, "B1");
    testSingle(Position{1, 1}, "B2");
    testSingle(Position{0, 25}, "Z1");
    testSingle(Position{0, 26}, "AA1");
    testSingle(Position{0, 27}, "AB1");
    testSingle(Position{0, 51}, "AZ1");
    testSingle(Position{0, 52}, "BA1");
    testSingle(Position{0, 701}, "ZZ1");
    testSingle(Position{0, 702}, "AAA1");
    testSingle(Position{136, 2}, "C137");

    EXPECT_EQ(Position::FromString("aa12"), (Position{11, 26}));
    EXPECT_EQ(Position::FromString("A007"), (Position{6, 0}));
}

TEST(PositionTest, TestPositionToStringInvalid) {
    EXPECT_EQ((Position{-1, -1}).ToString(), "");
    EXPECT_EQ((Position{-10, 0}).ToString(), "");
    EXPECT_EQ((Position{1, -3}).ToString(), "");
}

TEST(PositionTest, TestPositionToStringLimits) {
    constexpr int max = std::numeric_limits<int>::max();
    EXPECT_EQ((Position{0, max - 1}).ToString(), "FXSHRXW1");
    EXPECT_EQ((Position{0, max}).ToString(), "FXSHRXX1");
    EXPECT_EQ((Position{max, 0}).ToString(), "A2147483648");
}

TEST(PositionTest, TestStringToPositionInvalid) {
    EXPECT_FALSE(Position::FromString("").IsValid());
    EXPECT_FALSE(Position::FromString("A").IsValid());
    EXPECT_FALSE(Position::FromString("1").IsValid());
    EXPECT_FALSE(Position::FromString("A0").IsValid());
    EXPECT_FALSE(Position::FromString("A-1").IsValid());
    EXPECT_FALSE(Position::FromString("A+1").IsValid());
    EXPECT_FALSE(Position::FromString("R2D2").IsValid());
    EXPECT_FALSE(Position::FromString("C3PO").IsValid());
    EXPECT_FALSE(Position::FromString("A 1").IsValid());
    EXPECT_FALSE(Position::FromString("A1234567890123456789").IsValid());
    EXPECT_FALSE(Position::FromString("ABCDEFGHIJKLMNOPQRS8").IsValid());
}

TEST(PositionTest, TestIsCellReference) {
    EXPECT_TRUE(IsCellReference("A1"));
    EXPECT_TRUE(IsCellReference("ab12"));
    EXPECT_TRUE(IsCellReference("A0"));
    EXPECT_FALSE(IsCellReference("A"));
    EXPECT_FALSE(IsCellReference("12"));
    EXPECT_FALSE(IsCellReference("1A"));
    EXPECT_FALSE(IsCellReference("A1B"));
    EXPECT_FALSE(IsCellReference(""));
}

TEST(FormulaTest, TestFormulaArithmetic) {
    Sheet sheet(Grid{});

    EXPECT_EQ(EvaluateFormula("1", sheet), 1);
    EXPECT_EQ(EvaluateFormula("42", sheet), 42);
    EXPECT_EQ(EvaluateFormula("2 + 2", sheet), 4);
    EXPECT_EQ(EvaluateFormula("2-5", sheet), -3);
    EXPECT_EQ(EvaluateFormula("-5", sheet), -5);
    EXPECT_EQ(EvaluateFormula("+7", sheet), 7);
    EXPECT_EQ(EvaluateFormula("5--3", sheet), 8);
    EXPECT_EQ(EvaluateFormula("5 + -3", sheet), 2);
    EXPECT_EQ(EvaluateFormula("-5 - -3", sheet), -2);
}

TEST(FormulaTest, TestFormulaReferences) {
    Sheet sheet(Grid{{"1", "2", ""}});

    EXPECT_EQ(EvaluateFormula("A1", sheet), 1);
    EXPECT_EQ(EvaluateFormula("B1+A1", sheet), 3);
    EXPECT_EQ(EvaluateFormula("A1-B1", sheet), -1);
    EXPECT_EQ(EvaluateFormula("b1+-10", sheet), -8);
    // Пустая ячейка
    EXPECT_EQ(EvaluateFormula("A1+C1", sheet), 1);
    // Ячейка за пределами таблицы
    EXPECT_THROW(EvaluateFormula("A1+D1", sheet), InvalidPositionException);
    EXPECT_THROW(EvaluateFormula("A0", sheet), InvalidPositionException);
}

TEST(FormulaTest, TestFormulaExpressionFormatting) {
    auto reformat = [](std::string expr) {
        return ParseFormula(std::move(expr))->GetExpression();
    };

    EXPECT_EQ(reformat("  1  "), "1");
    EXPECT_EQ(reformat("  -1  "), "-1");
    EXPECT_EQ(reformat("2 + 2"), "2+2");
    EXPECT_EQ(reformat(" A1 -  b2 "), "A1-b2");
    EXPECT_EQ(reformat("5 - - 3"), "5--3");
}

TEST(FormulaTest, TestFormulaReferencedCells) {
    EXPECT_TRUE(ParseFormula("1")->GetReferencedCells().empty());
    EXPECT_TRUE(ParseFormula("X")->GetReferencedCells().empty());

    auto a1 = ParseFormula("A1");
    EXPECT_EQ(a1->GetReferencedCells(), (std::vector{"A1"_pos}));

    auto c3b2 = ParseFormula("C3+B2");
    EXPECT_EQ(c3b2->GetReferencedCells(), (std::vector{"B2"_pos, "C3"_pos}));

    auto twice = ParseFormula("A1 - A1");
    EXPECT_EQ(twice->GetReferencedCells(), (std::vector{"A1"_pos}));
}

TEST(FormulaTest, TestFormulaIncorrect) {
    auto isIncorrect = [](std::string expression) {
        try {
            ParseFormula(std::move(expression));
        } catch (const FormulaException&) {
            return true;
        }
        return false;
    };

    EXPECT_TRUE(isIncorrect(""));
    EXPECT_TRUE(isIncorrect("   "));
    EXPECT_TRUE(isIncorrect("1+"));
    EXPECT_TRUE(isIncorrect("A1+"));
    EXPECT_TRUE(isIncorrect("1+2+3"));
    EXPECT_TRUE(isIncorrect("A1+B1-C1"));
    EXPECT_TRUE(isIncorrect("-A1"));
    EXPECT_TRUE(isIncorrect("+A1+"));

    EXPECT_FALSE(isIncorrect("A1"));
    EXPECT_FALSE(isIncorrect("X"));
    EXPECT_FALSE(isIncorrect("A1+X"));
}

TEST(FormulaTest, TestInvalidToken) {
    Sheet sheet(Grid{{"1"}});
    EXPECT_THROW(EvaluateFormula("A1+X", sheet), InvalidTokenException);
    EXPECT_THROW(EvaluateFormula("1.5", sheet), InvalidTokenException);
    EXPECT_THROW(EvaluateFormula("A1 B1", sheet), InvalidTokenException);
    EXPECT_THROW(EvaluateFormula("+", sheet), InvalidTokenException);
    EXPECT_THROW(EvaluateFormula("A1++", sheet), InvalidTokenException);
}

TEST(FormulaTest, TestOverflow) {
    Sheet sheet(Grid{{"9223372036854775807", "-9223372036854775808"}});
    EXPECT_EQ(EvaluateFormula("A1+B1", sheet), -1);
    EXPECT_THROW(EvaluateFormula("A1+1", sheet), FormulaArithmeticException);
    EXPECT_THROW(EvaluateFormula("B1-1", sheet), FormulaArithmeticException);
    EXPECT_THROW(EvaluateFormula("A1-B1", sheet), FormulaArithmeticException);
    EXPECT_THROW(EvaluateFormula("0-B1", sheet), FormulaArithmeticException);
}

TEST(CellTest, TestStateTransitions) {
    Sheet sheet(Grid{});

    Cell cell(" =1+2 ");
    EXPECT_EQ(cell.GetState(), Cell::State::NotStarted);
    EXPECT_EQ(cell.Evaluate(sheet, "A1"_pos), 3);
    EXPECT_EQ(cell.GetState(), Cell::State::Done);
    EXPECT_EQ(cell.Evaluate(sheet, "A1"_pos), 3);
    EXPECT_EQ(cell.GetText(), " =1+2 ");

    Cell broken("abc");
    EXPECT_THROW(broken.Evaluate(sheet, "B3"_pos), InvalidCellValueException);
    EXPECT_EQ(broken.GetState(), Cell::State::NotStarted);
}

TEST(SheetTest, TestEmpty) {
    auto sheet = CreateSheet({});
    EXPECT_EQ(sheet->GetSize(), (Size{0, 0}));
    EXPECT_TRUE(sheet->EvaluateAll().empty());
}

TEST(SheetTest, TestRaggedGrid) {
    EXPECT_THROW(CreateSheet({{"1", "2"}, {"3"}}), RaggedGridException);
    EXPECT_THROW(CreateSheet({{"1"}, {"2", "3"}}), RaggedGridException);
    EXPECT_THROW(CreateSheet({{}, {""}}), RaggedGridException);
    EXPECT_NO_THROW(CreateSheet({{}, {}}));
}

TEST(SheetTest, TestBasicNumbersAndEmpty) {
    EXPECT_EQ(Evaluate({{"1", "2", ""}, {"", "3", "4"}}), (ValueGrid{{1, 2, 0}, {0, 3, 4}}));
}

TEST(SheetTest, TestEmptyCellsEverywhere) {
    Grid grid(3, std::vector<std::string>(5, ""));
    EXPECT_EQ(Evaluate(grid), ValueGrid(3, std::vector<Value>(5, 0)));
}

TEST(SheetTest, TestLiterals) {
    EXPECT_EQ(Evaluate({{" 5 ", " 10", "-7"}, {"+3", "\t42\n", "0"}}),
              (ValueGrid{{5, 10, -7}, {3, 42, 0}}));
}

TEST(SheetTest, TestSimpleReferences) {
    EXPECT_EQ(Evaluate({{"1", "2", "3"}, {"=A1", "=B1", "=C1"}}), (ValueGrid{{1, 2, 3}, {1, 2, 3}}));
}

TEST(SheetTest, TestFormulaArithmetic) {
    EXPECT_EQ(Evaluate({{"10", "20", ""}, {"=A1+5", "=B1-10", "=A1+B1"}}),
              (ValueGrid{{10, 20, 0}, {15, 10, 30}}));
}

TEST(SheetTest, TestChainedReferences) {
    EXPECT_EQ(Evaluate({{"1", "=A1+1", "=B1+1"}}), (ValueGrid{{1, 2, 3}}));
    // Ссылки вперёд вычисляются рекурсивно
    EXPECT_EQ(Evaluate({{"=B1+1", "=C1+1", "1"}}), (ValueGrid{{3, 2, 1}}));
}

TEST(SheetTest, TestMixedComplexReferences) {
    Grid grid = {
        {"10", "=A1+5", "=B1-3"},
        {"=C1+2", "=A1+B1", "=B2-A2"},
        {"=C1+C2", "=A2+10", "=A1-C2"},
    };
    ValueGrid expected = {
        {10, 15, 12},
        {14, 25, 11},
        {23, 24, -1},
    };
    EXPECT_EQ(Evaluate(grid), expected);
}

TEST(SheetTest, TestNegativeNumbers) {
    EXPECT_EQ(Evaluate({{"-5", "10", "=A1+B1"}, {"=B1-C1", "=A1-15", "=A2+B2"}}),
              (ValueGrid{{-5, 10, 5}, {5, -20, -15}}));
}

TEST(SheetTest, TestSignedLiteralsInFormulas) {
    EXPECT_EQ(Evaluate({{"=-5", "=A1+-5", "=B1--20", "= + 4"}}), (ValueGrid{{-5, -10, 10, 4}}));
}

TEST(SheetTest, TestWhitespaceHandling) {
    EXPECT_EQ(Evaluate({{" 5 ", " 10", " "}, {"= A1 + 5", " =B1 -5 ", "= A1 + B1 "}}),
              (ValueGrid{{5, 10, 0}, {10, 5, 15}}));
}

TEST(SheetTest, TestLargeColumnNames) {
    Grid grid;
    grid.push_back(std::vector<std::string>(30, "1"));
    grid.push_back(std::vector<std::string>(30, ""));
    grid[1][0] = "=AA1+ab1";
    grid[1][29] = "=AD1-A2";

    ValueGrid expected;
    expected.push_back(std::vector<Value>(30, 1));
    expected.push_back(std::vector<Value>(30, 0));
    expected[1][0] = 2;
    expected[1][29] = -1;

    EXPECT_EQ(Evaluate(grid), expected);
}

TEST(SheetTest, TestCircularReferenceDirect) {
    auto sheet = CreateSheet({{"=A1"}});
    ExpectErrorMentions<CircularDependencyException>(*sheet, "A1");
}

TEST(SheetTest, TestCircularReferenceIndirect) {
    auto sheet = CreateSheet({{"=B1", "=A1"}});
    ExpectErrorMentions<CircularDependencyException>(*sheet, "circular reference detected at A1");
}

TEST(SheetTest, TestCircularReferenceLongCycle) {
    auto sheet = CreateSheet({
        {"=B1", "=C1", "=A1"},
        {"", "", ""},
        {"", "", ""},
    });
    EXPECT_THROW(sheet->EvaluateAll(), CircularDependencyException);
}

TEST(SheetTest, TestCircularReferenceReportedAgain) {
    auto sheet = CreateSheet({{"1", "=C1+1", "=B1"}});
    EXPECT_THROW(sheet->EvaluateAll(), CircularDependencyException);
    EXPECT_THROW(sheet->EvaluateAll(), CircularDependencyException);
    EXPECT_EQ(sheet->EvaluateCell("A1"_pos), 1);
}

TEST(SheetTest, TestInvalidReferenceOutOfRange) {
    auto sheet = CreateSheet({{"=A2", "5"}});
    ExpectErrorMentions<InvalidPositionException>(*sheet, "A2");

    EXPECT_THROW(Evaluate({{"=C1"}, {"1"}}), InvalidPositionException);
    EXPECT_THROW(Evaluate({{"=ZZZZZZZ1"}}), InvalidPositionException);
    EXPECT_THROW(Evaluate({{"=A99999999999"}}), InvalidPositionException);
}

TEST(SheetTest, TestInvalidToken) {
    auto sheet = CreateSheet({{"1", "=A1+X"}});
    ExpectErrorMentions<InvalidTokenException>(*sheet, "\"X\"");

    // A1 ссылается на себя раньше, чем дело доходит до X
    EXPECT_THROW(Evaluate({{"=A1+X"}}), CircularDependencyException);
}

TEST(SheetTest, TestInvalidFormula) {
    auto sheet = CreateSheet({{"1", "=A1+1+1"}});
    ExpectErrorMentions<FormulaException>(*sheet, "A1+1+1");
    EXPECT_THROW(Evaluate({{"="}}), FormulaException);
}

TEST(SheetTest, TestInvalidCellValue) {
    auto sheet = CreateSheet({{"1", "2"}, {"3", "abc"}});
    ExpectErrorMentions<InvalidCellValueException>(*sheet, "B2");
    ExpectErrorMentions<InvalidCellValueException>(*sheet, "abc");

    EXPECT_THROW(Evaluate({{"1.5"}}), InvalidCellValueException);
    EXPECT_THROW(Evaluate({{"5 5"}}), InvalidCellValueException);
    EXPECT_THROW(Evaluate({{"99999999999999999999"}}), InvalidCellValueException);
}

TEST(SheetTest, TestFirstErrorInRowMajorOrder) {
    // A1 упирается в цикл раньше, чем строка 2 с некорректным значением
    auto sheet = CreateSheet({{"=B1", "=A1"}, {"abc", ""}});
    EXPECT_THROW(sheet->EvaluateAll(), CircularDependencyException);
}

TEST(SheetTest, TestIdempotence) {
    auto sheet = CreateSheet({{"10", "=A1+5"}, {"=B1-1", ""}});
    auto first = sheet->EvaluateAll();
    auto second = sheet->EvaluateAll();
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, (ValueGrid{{10, 15}, {14, 0}}));
}

TEST(SheetTest, TestEvaluateCell) {
    auto sheet = CreateSheet({{"1", "=A1+1"}, {"=B1+B1", "x"}});
    EXPECT_EQ(sheet->EvaluateCell("A2"_pos), 4);
    EXPECT_EQ(sheet->EvaluateCell("B1"_pos), 2);
    EXPECT_THROW(sheet->EvaluateCell("B2"_pos), InvalidCellValueException);
    EXPECT_THROW(sheet->EvaluateCell("C1"_pos), InvalidPositionException);
    EXPECT_THROW(sheet->EvaluateCell(Position::NONE), InvalidPositionException);

    constexpr int max = std::numeric_limits<int>::max();
    EXPECT_THROW(sheet->EvaluateCell(Position{0, max}), InvalidPositionException);
    EXPECT_THROW(sheet->EvaluateCell(Position{max, 0}), InvalidPositionException);
    EXPECT_THROW(sheet->GetCellText(Position{max, max}), InvalidPositionException);
}

TEST(SheetTest, TestPrint) {
    auto sheet = CreateSheet({{"", "=A2+1"}, {" 4", "=B1-10"}});
    EXPECT_EQ(sheet->GetSize(), (Size{2, 2}));
    EXPECT_EQ(sheet->GetCellText("A2"_pos), " 4");

    std::ostringstream texts;
    sheet->PrintTexts(texts);
    EXPECT_EQ(texts.str(), "\t=A2+1\n 4\t=B1-10\n");

    std::ostringstream values;
    sheet->PrintValues(values);
    EXPECT_EQ(values.str(), "0\t5\n4\t-5\n");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
