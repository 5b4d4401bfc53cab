#include "expression_lexer.hpp"
#include "expression_error.hpp"
#include <QRegularExpression>
#include <cmath>

/**
 * @brief Tokenize a formula string
 *
 * Scans the whitespace-free formula once, left to right. Every character
 * must belong to a number, an identifier, an operator or a parenthesis;
 * anything else aborts tokenization with a LEX_ERROR.
 *
 * Example:
 *   "2 * sin(x)" -> [NUMBER 2] [OPERATOR *] [FUNCTION sin] [(] [VARIABLE x] [)] [END]
 */
ExpressionTokenList ExpressionLexer::tokenize(const QString& formula)
{
    static const QRegularExpression whitespace("\\s+");

    ExpressionTokenList tokens;
    QString expr = formula;
    expr.remove(whitespace);

    int i = 0;
    while (i < expr.length())
    {
        QChar c = expr[i];

        // Numbers (including decimals like .5)
        if (isAsciiDigit(c) || c == '.')
        {
            tokens.append(readNumber(expr, i));
            continue;
        }

        // Variable, constants and functions
        if (isAsciiLetter(c))
        {
            tokens.append(readIdentifier(expr, i));
            continue;
        }

        ExpressionToken token;
        token.value = c;
        token.position = i;

        if (isOperator(c))
        {
            token.type = ExpressionToken::TOKEN_OPERATOR;
        }
        else if (c == '(')
        {
            token.type = ExpressionToken::TOKEN_LEFT_PAREN;
        }
        else if (c == ')')
        {
            token.type = ExpressionToken::TOKEN_RIGHT_PAREN;
        }
        else
        {
            throw ExpressionError(ExpressionError::LEX_ERROR,
                                  QString("Unexpected character '%1' at position %2").arg(c).arg(i),
                                  i);
        }

        tokens.append(token);
        i++;
    }

    // End marker keeps the parser free of bounds checks
    ExpressionToken endToken;
    endToken.type = ExpressionToken::TOKEN_END;
    endToken.position = expr.length();
    tokens.append(endToken);

    return tokens;
}

ExpressionToken::Function ExpressionLexer::functionForName(const QString& name)
{
    if (name == "sin") return ExpressionToken::FUNC_SIN;
    if (name == "cos") return ExpressionToken::FUNC_COS;
    if (name == "tan") return ExpressionToken::FUNC_TAN;
    if (name == "ln") return ExpressionToken::FUNC_LN;
    if (name == "log") return ExpressionToken::FUNC_LOG;
    if (name == "sqrt") return ExpressionToken::FUNC_SQRT;
    if (name == "abs") return ExpressionToken::FUNC_ABS;
    if (name == "exp") return ExpressionToken::FUNC_EXP;

    return ExpressionToken::FUNC_NONE;
}

// Read a run of digits and decimal points; more than one point is malformed
ExpressionToken ExpressionLexer::readNumber(const QString& expr, int& pos)
{
    int start = pos;
    int dotCount = 0;

    while (pos < expr.length() && (isAsciiDigit(expr[pos]) || expr[pos] == '.'))
    {
        if (expr[pos] == '.')
        {
            dotCount++;
        }
        pos++;
    }

    QString text = expr.mid(start, pos - start);

    if (text == ".")
    {
        throw ExpressionError(ExpressionError::LEX_ERROR,
                              QString("Invalid number format at position %1").arg(start),
                              start);
    }

    if (dotCount > 1)
    {
        throw ExpressionError(ExpressionError::LEX_ERROR,
                              QString("Malformed number '%1' at position %2").arg(text).arg(start),
                              start);
    }

    bool ok = false;
    double value = text.toDouble(&ok);
    if (!ok)
    {
        throw ExpressionError(ExpressionError::LEX_ERROR,
                              QString("Malformed number '%1' at position %2").arg(text).arg(start),
                              start);
    }

    ExpressionToken token;
    token.type = ExpressionToken::TOKEN_NUMBER;
    token.value = text;
    token.position = start;
    token.numberValue = value;
    return token;
}

// Read a run of letters and classify it as variable, function or constant
ExpressionToken ExpressionLexer::readIdentifier(const QString& expr, int& pos)
{
    int start = pos;
    while (pos < expr.length() && isAsciiLetter(expr[pos]))
    {
        pos++;
    }

    ExpressionToken token;
    token.value = expr.mid(start, pos - start);
    token.position = start;

    if (token.value == "x")
    {
        token.type = ExpressionToken::TOKEN_VARIABLE;
        return token;
    }

    ExpressionToken::Function function = functionForName(token.value);
    if (function != ExpressionToken::FUNC_NONE)
    {
        token.type = ExpressionToken::TOKEN_FUNCTION;
        token.function = function;
        return token;
    }

    if (token.value == "pi")
    {
        token.type = ExpressionToken::TOKEN_CONSTANT;
        token.numberValue = M_PI;
        return token;
    }

    if (token.value == "e")
    {
        token.type = ExpressionToken::TOKEN_CONSTANT;
        token.numberValue = M_E;
        return token;
    }

    throw ExpressionError(ExpressionError::LEX_ERROR,
                          QString("Unknown identifier '%1' at position %2").arg(token.value).arg(start),
                          start);
}

bool ExpressionLexer::isAsciiDigit(QChar c)
{
    const ushort u = c.unicode();
    return u >= '0' && u <= '9';
}

bool ExpressionLexer::isAsciiLetter(QChar c)
{
    const ushort u = c.unicode();
    return (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z');
}

bool ExpressionLexer::isOperator(QChar c)
{
    return c == '+' || c == '-' || c == '*' || c == '/' || c == '^';
}
