#ifndef EXPRESSION_TOKEN_HPP
#define EXPRESSION_TOKEN_HPP

#include <QString>
#include <QList>

/**
 * @brief A single lexical unit of a formula
 *
 * Produced by ExpressionLexer in left-to-right order. The token list always
 * ends with a TOKEN_END marker.
 */
struct ExpressionToken
{
    enum Type
    {
        TOKEN_NUMBER,
        TOKEN_VARIABLE,     // Only "x"
        TOKEN_CONSTANT,     // "e" or "pi"
        TOKEN_FUNCTION,
        TOKEN_OPERATOR,     // + - * / ^
        TOKEN_LEFT_PAREN,
        TOKEN_RIGHT_PAREN,
        TOKEN_END
    };

    // Closed set of built-in functions
    enum Function
    {
        FUNC_NONE,
        FUNC_SIN,
        FUNC_COS,
        FUNC_TAN,
        FUNC_LN,
        FUNC_LOG,
        FUNC_SQRT,
        FUNC_ABS,
        FUNC_EXP
    };

    Type type = TOKEN_END;
    QString value;

    //! Offset in the whitespace-stripped formula
    int position = 0;

    //! Numeric value for NUMBER and CONSTANT tokens
    double numberValue = 0.0;

    //! Function id for FUNCTION tokens
    Function function = FUNC_NONE;

    /**
     * @brief Check whether this token can begin a primary expression
     */
    bool startsPrimary() const
    {
        return type == TOKEN_NUMBER || type == TOKEN_VARIABLE ||
               type == TOKEN_CONSTANT || type == TOKEN_FUNCTION ||
               type == TOKEN_LEFT_PAREN;
    }
};

typedef QList<ExpressionToken> ExpressionTokenList;

#endif // EXPRESSION_TOKEN_HPP
