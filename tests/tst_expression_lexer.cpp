#include <QtTest>
#include <cmath>

#include "expression_error.hpp"
#include "expression_lexer.hpp"

class TestExpressionLexer : public QObject
{
    Q_OBJECT

private:
    static ExpressionError lexError(const QString& formula)
    {
        try
        {
            ExpressionLexer::tokenize(formula);
        }
        catch (const ExpressionError& error)
        {
            return error;
        }
        return ExpressionError();
    }

private slots:
    void tokenizesFunctionCall();
    void stripsWhitespaceBeforeScanning();
    void classifiesConstants();
    void readsDecimalNumbers();
    void emptyInputYieldsOnlyEnd();
    void lettersAndDigitsSplitIntoSeparateTokens();
    void rejectsBadInput_data();
    void rejectsBadInput();
    void reportsUnknownIdentifier();
};

void TestExpressionLexer::tokenizesFunctionCall()
{
    ExpressionTokenList tokens = ExpressionLexer::tokenize("2*sin(x)");

    QCOMPARE(tokens.size(), 7);
    QCOMPARE(tokens[0].type, ExpressionToken::TOKEN_NUMBER);
    QCOMPARE(tokens[0].numberValue, 2.0);
    QCOMPARE(tokens[1].type, ExpressionToken::TOKEN_OPERATOR);
    QCOMPARE(tokens[1].value, QString("*"));
    QCOMPARE(tokens[2].type, ExpressionToken::TOKEN_FUNCTION);
    QCOMPARE(tokens[2].function, ExpressionToken::FUNC_SIN);
    QCOMPARE(tokens[2].position, 2);
    QCOMPARE(tokens[3].type, ExpressionToken::TOKEN_LEFT_PAREN);
    QCOMPARE(tokens[4].type, ExpressionToken::TOKEN_VARIABLE);
    QCOMPARE(tokens[4].position, 6);
    QCOMPARE(tokens[5].type, ExpressionToken::TOKEN_RIGHT_PAREN);
    QCOMPARE(tokens[6].type, ExpressionToken::TOKEN_END);
}

void TestExpressionLexer::stripsWhitespaceBeforeScanning()
{
    ExpressionTokenList spaced = ExpressionLexer::tokenize("  x ^ 2\t+ 1 ");
    ExpressionTokenList compact = ExpressionLexer::tokenize("x^2+1");

    QCOMPARE(spaced.size(), compact.size());
    for (int i = 0; i < spaced.size(); ++i)
    {
        QCOMPARE(spaced[i].type, compact[i].type);
        QCOMPARE(spaced[i].value, compact[i].value);
        QCOMPARE(spaced[i].position, compact[i].position);
    }
}

void TestExpressionLexer::classifiesConstants()
{
    ExpressionTokenList tokens = ExpressionLexer::tokenize("pi+e");

    QCOMPARE(tokens.size(), 4);
    QCOMPARE(tokens[0].type, ExpressionToken::TOKEN_CONSTANT);
    QCOMPARE(tokens[0].numberValue, M_PI);
    QCOMPARE(tokens[2].type, ExpressionToken::TOKEN_CONSTANT);
    QCOMPARE(tokens[2].numberValue, M_E);
}

void TestExpressionLexer::readsDecimalNumbers()
{
    ExpressionTokenList tokens = ExpressionLexer::tokenize(".5+12.25");

    QCOMPARE(tokens[0].type, ExpressionToken::TOKEN_NUMBER);
    QCOMPARE(tokens[0].numberValue, 0.5);
    QCOMPARE(tokens[2].type, ExpressionToken::TOKEN_NUMBER);
    QCOMPARE(tokens[2].value, QString("12.25"));
    QCOMPARE(tokens[2].numberValue, 12.25);
}

void TestExpressionLexer::emptyInputYieldsOnlyEnd()
{
    ExpressionTokenList tokens = ExpressionLexer::tokenize("   ");

    QCOMPARE(tokens.size(), 1);
    QCOMPARE(tokens[0].type, ExpressionToken::TOKEN_END);
}

void TestExpressionLexer::lettersAndDigitsSplitIntoSeparateTokens()
{
    // The parser, not the lexer, rejects the implied product
    ExpressionTokenList tokens = ExpressionLexer::tokenize("x2");

    QCOMPARE(tokens.size(), 3);
    QCOMPARE(tokens[0].type, ExpressionToken::TOKEN_VARIABLE);
    QCOMPARE(tokens[1].type, ExpressionToken::TOKEN_NUMBER);
}

void TestExpressionLexer::rejectsBadInput_data()
{
    QTest::addColumn<QString>("formula");
    QTest::addColumn<int>("position");

    QTest::newRow("lone dot") << "1+." << 2;
    QTest::newRow("two decimal points") << "1.2.3" << 0;
    QTest::newRow("unexpected character") << "2#3" << 1;
    QTest::newRow("comma") << "sin(x,1)" << 5;
    QTest::newRow("unknown identifier") << "y+1" << 0;
    QTest::newRow("upper case variable") << "2*X" << 2;
    QTest::newRow("function without space") << "sin x" << 0;
}

void TestExpressionLexer::rejectsBadInput()
{
    QFETCH(QString, formula);
    QFETCH(int, position);

    ExpressionError error = lexError(formula);
    QCOMPARE(error.getKind(), ExpressionError::LEX_ERROR);
    QCOMPARE(error.getPosition(), position);
}

void TestExpressionLexer::reportsUnknownIdentifier()
{
    ExpressionError error = lexError("y+1");

    QCOMPARE(error.getKind(), ExpressionError::LEX_ERROR);
    QVERIFY(error.getMessage().contains("Unknown identifier 'y'"));
}

QTEST_APPLESS_MAIN(TestExpressionLexer)
#include "tst_expression_lexer.moc"
