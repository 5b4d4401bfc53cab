#ifndef EXPRESSION_LEXER_HPP
#define EXPRESSION_LEXER_HPP

#include "expression_token.hpp"
#include <QString>

/**
 * @brief The ExpressionLexer class splits a formula into tokens
 *
 * Handles:
 * - Numbers (digits with at most one decimal point, e.g. 3.14, .5)
 * - The variable x
 * - Constants (pi, e)
 * - Functions (sin, cos, tan, ln, log, sqrt, abs, exp)
 * - Operators (+, -, *, /, ^) and parentheses
 *
 * Whitespace is stripped before scanning, so token positions refer to the
 * stripped text.
 */
class ExpressionLexer
{
public:
    /**
     * @brief Tokenize a formula
     * @param formula The formula text (e.g. "sin(x) + 2*x")
     * @return Token list, always terminated by a TOKEN_END token
     * @throws ExpressionError of kind LEX_ERROR
     */
    static ExpressionTokenList tokenize(const QString& formula);

    /**
     * @brief Look up a built-in function by name
     * @return The function id, or FUNC_NONE if the name is not a built-in
     */
    static ExpressionToken::Function functionForName(const QString& name);

private:
    static ExpressionToken readNumber(const QString& expr, int& pos);
    static ExpressionToken readIdentifier(const QString& expr, int& pos);

    static bool isAsciiDigit(QChar c);
    static bool isAsciiLetter(QChar c);
    static bool isOperator(QChar c);
};

#endif // EXPRESSION_LEXER_HPP
