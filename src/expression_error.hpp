#ifndef EXPRESSION_ERROR_HPP
#define EXPRESSION_ERROR_HPP

#include <QString>

/**
 * @brief The ExpressionError class describes why a formula could not be evaluated
 *
 * Thrown by value from the lexer and the recursive-descent routines, and
 * caught again at the public MathExpressionParser boundary.
 */
class ExpressionError
{
public:
    enum Kind
    {
        NONE,
        LEX_ERROR,      // Unexpected character, malformed number, unknown identifier
        PARSE_ERROR,    // Missing parenthesis, unexpected token, trailing input
        DOMAIN_ERROR    // Division by zero, log of non-positive, sqrt of negative
    };

    ExpressionError();
    ExpressionError(Kind kind, const QString& message, int position = -1);

    Kind getKind() const { return kind; }
    QString getMessage() const { return message; }
    int getPosition() const { return position; }

    QString getFormula() const { return formula; }
    void setFormula(const QString& text) { formula = text; }

    bool isError() const { return kind != NONE; }

    /**
     * @brief Full description including the offending formula
     * @return e.g. "Invalid expression: 1/x. Division by zero"
     */
    QString toString() const;

    static QString kindName(Kind kind);

private:
    Kind kind;
    QString message;
    int position;
    QString formula;
};

#endif // EXPRESSION_ERROR_HPP
