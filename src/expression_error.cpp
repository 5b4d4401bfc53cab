#include "expression_error.hpp"

ExpressionError::ExpressionError()
    : kind(NONE),
      position(-1)
{
}

ExpressionError::ExpressionError(Kind kind, const QString& message, int position)
    : kind(kind),
      message(message),
      position(position)
{
}

QString ExpressionError::toString() const
{
    if (kind == NONE)
    {
        return QString();
    }

    return QString("Invalid expression: %1. %2").arg(formula, message);
}

QString ExpressionError::kindName(Kind kind)
{
    switch (kind)
    {
    case NONE:
        return "No error";
    case LEX_ERROR:
        return "Lex error";
    case PARSE_ERROR:
        return "Parse error";
    case DOMAIN_ERROR:
        return "Domain error";
    }

    return "Unknown error";
}
