#include "math_expression_parser.hpp"
#include "expression_lexer.hpp"
#include <cmath>

MathExpressionParser::MathExpressionParser()
    : nestingDepth(0)
{
}

MathExpressionParser::~MathExpressionParser()
{
}

/**
 * @brief Parse a formula into an internal tree structure
 *
 * ExpressionLexer produces the token list, then one recursive descent
 * method per precedence level builds the tree, loosest binding first:
 * parseExpression (+ -), parseTerm (* /), parsePower (^, right to left),
 * parseUnary (prefix + -) and parsePrimary (literals, x, calls, groups).
 *
 * The tree is kept only when the whole formula parses.
 *
 * @param expression The formula string (e.g., "sin(x) / x")
 * @return false on a lexical or syntax error; see getError()
 */
bool MathExpressionParser::parse(const QString& expression)
{
    lastError = ExpressionError();
    rootNode.reset();
    expressionText = expression;
    nestingDepth = 0;

    try
    {
        if (expression.trimmed().isEmpty())
        {
            throw ExpressionError(ExpressionError::PARSE_ERROR, "Empty expression", 0);
        }

        // Tokenize
        ExpressionTokenList tokens = ExpressionLexer::tokenize(expression);

        int pos = 0;
        NodePtr node = parseExpression(tokens, pos);

        // Anything left before END is a stray token
        if (tokens[pos].type != ExpressionToken::TOKEN_END)
        {
            throw ExpressionError(ExpressionError::PARSE_ERROR,
                                  QString("Unexpected token '%1' at position %2")
                                      .arg(tokens[pos].value).arg(tokens[pos].position),
                                  tokens[pos].position);
        }

        rootNode = node;
    }
    catch (ExpressionError& error)
    {
        error.setFormula(expression);
        lastError = error;
        return false;
    }

    return true;
}

bool MathExpressionParser::evaluate(double x, double& result, ExpressionError* error) const
{
    if (!rootNode)
    {
        if (error)
        {
            *error = lastError.isError()
                         ? lastError
                         : ExpressionError(ExpressionError::PARSE_ERROR, "Expression has not been parsed");
            error->setFormula(expressionText);
        }
        return false;
    }

    try
    {
        result = evaluateNode(rootNode, x);
    }
    catch (ExpressionError& failure)
    {
        failure.setFormula(expressionText);
        if (error)
        {
            *error = failure;
        }
        return false;
    }

    return true;
}

bool MathExpressionParser::evaluateFormula(const QString& formula, double x, double& result,
                                           ExpressionError* error)
{
    MathExpressionParser parser;
    if (!parser.parse(formula))
    {
        if (error)
        {
            *error = parser.getLastError();
        }
        return false;
    }

    return parser.evaluate(x, result, error);
}

bool MathExpressionParser::isValidExpression(const QString& formula)
{
    double result = 0.0;
    return evaluateFormula(formula, 1.0, result);
}

// expression := term (('+' | '-') term)*, folded left so "10-4-3" is 3
MathExpressionParser::NodePtr MathExpressionParser::parseExpression(const ExpressionTokenList& tokens, int& pos)
{
    NodePtr left = parseTerm(tokens, pos);

    while (isOperatorToken(tokens[pos], '+') || isOperatorToken(tokens[pos], '-'))
    {
        OperatorType op = isOperatorToken(tokens[pos], '+') ? OP_ADD : OP_SUBTRACT;
        const int position = tokens[pos].position;
        pos++;

        NodePtr right = parseTerm(tokens, pos);
        left = makeBinary(op, left, right, position);
    }

    return left;
}

// term := power (('*' | '/') power)*, also folded left
MathExpressionParser::NodePtr MathExpressionParser::parseTerm(const ExpressionTokenList& tokens, int& pos)
{
    NodePtr left = parsePower(tokens, pos);

    while (isOperatorToken(tokens[pos], '*') || isOperatorToken(tokens[pos], '/'))
    {
        OperatorType op = isOperatorToken(tokens[pos], '*') ? OP_MULTIPLY : OP_DIVIDE;
        const int position = tokens[pos].position;
        pos++;

        NodePtr right = parsePower(tokens, pos);
        left = makeBinary(op, left, right, position);
    }

    return left;
}

/**
 * @brief power := unary ('^' power)?
 *
 * The recursion on the right operand groups "2^3^2" as 2^(3^2) = 512.
 * A sign is consumed by parseUnary first, so "-x^2" squares -x.
 */
MathExpressionParser::NodePtr MathExpressionParser::parsePower(const ExpressionTokenList& tokens, int& pos)
{
    NodePtr left = parseUnary(tokens, pos);

    if (isOperatorToken(tokens[pos], '^'))
    {
        const int position = tokens[pos].position;
        enterNested(tokens[pos]);
        pos++;
        NodePtr right = parsePower(tokens, pos);
        leaveNested();
        return makeBinary(OP_POWER, left, right, position);
    }

    return left;
}

// Parse unary: handles prefix minus and plus
MathExpressionParser::NodePtr MathExpressionParser::parseUnary(const ExpressionTokenList& tokens, int& pos)
{
    if (isOperatorToken(tokens[pos], '-'))
    {
        const int position = tokens[pos].position;
        enterNested(tokens[pos]);
        pos++;
        NodePtr operand = parseUnary(tokens, pos);
        leaveNested();

        QSharedPointer<ExpressionNode> node = QSharedPointer<ExpressionNode>::create();
        node->type = NODE_OPERATOR;
        node->operatorType = OP_NEGATE;
        node->left = operand;
        node->depth = childDepth(operand, position);

        return node;
    }

    if (isOperatorToken(tokens[pos], '+'))
    {
        enterNested(tokens[pos]);
        pos++;
        NodePtr operand = parseUnary(tokens, pos);
        leaveNested();
        return operand;
    }

    return parsePrimary(tokens, pos);
}

// Parse primary and reject a second primary directly after it ("2x", "(1)(2)")
MathExpressionParser::NodePtr MathExpressionParser::parsePrimary(const ExpressionTokenList& tokens, int& pos)
{
    NodePtr node = parsePrimaryValue(tokens, pos);

    if (tokens[pos].startsPrimary())
    {
        throw ExpressionError(ExpressionError::PARSE_ERROR,
                              QString("Implicit multiplication is not supported at position %1 (use '*')")
                                  .arg(tokens[pos].position),
                              tokens[pos].position);
    }

    return node;
}

// Numbers, x, constants, functions, and parentheses
MathExpressionParser::NodePtr MathExpressionParser::parsePrimaryValue(const ExpressionTokenList& tokens, int& pos)
{
    const ExpressionToken& token = tokens[pos];

    // Number or constant
    if (token.type == ExpressionToken::TOKEN_NUMBER ||
        token.type == ExpressionToken::TOKEN_CONSTANT)
    {
        pos++;
        QSharedPointer<ExpressionNode> node = QSharedPointer<ExpressionNode>::create();
        node->type = NODE_NUMBER;
        node->numberValue = token.numberValue;
        return node;
    }

    // Variable
    if (token.type == ExpressionToken::TOKEN_VARIABLE)
    {
        pos++;
        QSharedPointer<ExpressionNode> node = QSharedPointer<ExpressionNode>::create();
        node->type = NODE_VARIABLE;
        return node;
    }

    // Function
    if (token.type == ExpressionToken::TOKEN_FUNCTION)
    {
        enterNested(token);
        pos++;

        // Expect '('
        if (tokens[pos].type != ExpressionToken::TOKEN_LEFT_PAREN)
        {
            throw ExpressionError(ExpressionError::PARSE_ERROR,
                                  QString("Expected '(' after function '%1'").arg(token.value),
                                  tokens[pos].position);
        }
        pos++;

        NodePtr argument = parseExpression(tokens, pos);

        // Expect ')'
        if (tokens[pos].type != ExpressionToken::TOKEN_RIGHT_PAREN)
        {
            throw ExpressionError(ExpressionError::PARSE_ERROR,
                                  "Expected ')' after function argument",
                                  tokens[pos].position);
        }
        pos++;
        leaveNested();

        QSharedPointer<ExpressionNode> node = QSharedPointer<ExpressionNode>::create();
        node->type = NODE_FUNCTION;
        node->functionType = token.function;
        node->argument = argument;
        node->depth = childDepth(argument, token.position);
        return node;
    }

    // Group
    if (token.type == ExpressionToken::TOKEN_LEFT_PAREN)
    {
        enterNested(token);
        pos++;
        NodePtr node = parseExpression(tokens, pos);

        if (tokens[pos].type != ExpressionToken::TOKEN_RIGHT_PAREN)
        {
            throw ExpressionError(ExpressionError::PARSE_ERROR,
                                  "Expected ')' after expression",
                                  tokens[pos].position);
        }
        pos++;
        leaveNested();

        return node;
    }

    if (token.type == ExpressionToken::TOKEN_END)
    {
        throw ExpressionError(ExpressionError::PARSE_ERROR,
                              "Unexpected end of expression",
                              token.position);
    }

    throw ExpressionError(ExpressionError::PARSE_ERROR,
                          QString("Unexpected token '%1' at position %2").arg(token.value).arg(token.position),
                          token.position);
}

/**
 * @brief Evaluate one node of the tree
 *
 * Every intermediate value must be finite; an infinity or NaN anywhere in
 * the tree is reported as a DOMAIN_ERROR rather than propagated.
 *
 * @throws ExpressionError of kind DOMAIN_ERROR
 */
double MathExpressionParser::evaluateNode(const NodePtr& node, double x) const
{
    double result = 0.0;

    switch (node->type)
    {
    case NODE_NUMBER:
        result = node->numberValue;
        break;

    case NODE_VARIABLE:
        result = x;
        break;

    case NODE_OPERATOR:
    {
        double leftVal = evaluateNode(node->left, x);

        if (node->operatorType == OP_NEGATE)
        {
            result = -leftVal;
            break;
        }

        double rightVal = evaluateNode(node->right, x);

        switch (node->operatorType)
        {
        case OP_ADD:
            result = leftVal + rightVal;
            break;

        case OP_SUBTRACT:
            result = leftVal - rightVal;
            break;

        case OP_MULTIPLY:
            result = leftVal * rightVal;
            break;

        case OP_DIVIDE:
            if (rightVal == 0.0)
            {
                throw ExpressionError(ExpressionError::DOMAIN_ERROR, "Division by zero");
            }
            result = leftVal / rightVal;
            break;

        case OP_POWER:
            result = std::pow(leftVal, rightVal);
            break;

        case OP_NEGATE:
            break;
        }
        break;
    }

    case NODE_FUNCTION:
        result = applyFunction(node->functionType, evaluateNode(node->argument, x));
        break;
    }

    if (!std::isfinite(result))
    {
        throw ExpressionError(ExpressionError::DOMAIN_ERROR, "Result is not a finite number");
    }

    return result;
}

double MathExpressionParser::applyFunction(ExpressionToken::Function function, double argument)
{
    switch (function)
    {
    case ExpressionToken::FUNC_SIN:
        return std::sin(argument);

    case ExpressionToken::FUNC_COS:
        return std::cos(argument);

    case ExpressionToken::FUNC_TAN:
        return std::tan(argument);

    case ExpressionToken::FUNC_LN:
        if (argument <= 0.0)
        {
            throw ExpressionError(ExpressionError::DOMAIN_ERROR, "Natural logarithm of non-positive number");
        }
        return std::log(argument);

    case ExpressionToken::FUNC_LOG:
        if (argument <= 0.0)
        {
            throw ExpressionError(ExpressionError::DOMAIN_ERROR, "Logarithm of non-positive number");
        }
        return std::log10(argument);

    case ExpressionToken::FUNC_SQRT:
        if (argument < 0.0)
        {
            throw ExpressionError(ExpressionError::DOMAIN_ERROR, "Square root of negative number");
        }
        return std::sqrt(argument);

    case ExpressionToken::FUNC_ABS:
        return std::fabs(argument);

    case ExpressionToken::FUNC_EXP:
        return std::exp(argument);

    case ExpressionToken::FUNC_NONE:
        break;
    }

    throw ExpressionError(ExpressionError::DOMAIN_ERROR, "Unknown function");
}

bool MathExpressionParser::isOperatorToken(const ExpressionToken& token, char op)
{
    return token.type == ExpressionToken::TOKEN_OPERATOR &&
           token.value.size() == 1 && token.value.at(0) == QLatin1Char(op);
}

MathExpressionParser::NodePtr MathExpressionParser::makeBinary(OperatorType op, const NodePtr& left,
                                                               const NodePtr& right, int position)
{
    QSharedPointer<ExpressionNode> node = QSharedPointer<ExpressionNode>::create();
    node->type = NODE_OPERATOR;
    node->operatorType = op;
    node->left = left;
    node->right = right;
    node->depth = qMax(childDepth(left, position), childDepth(right, position));
    return node;
}

// Evaluation and destruction recurse once per tree level
int MathExpressionParser::childDepth(const NodePtr& child, int position)
{
    const int depth = child->depth + 1;
    if (depth > MAX_TREE_DEPTH)
    {
        throw ExpressionError(ExpressionError::PARSE_ERROR,
                              QString("Expression nested too deeply at position %1").arg(position),
                              position);
    }

    return depth;
}

void MathExpressionParser::enterNested(const ExpressionToken& token)
{
    if (++nestingDepth > MAX_NESTING_DEPTH)
    {
        throw ExpressionError(ExpressionError::PARSE_ERROR,
                              QString("Expression nested too deeply at position %1").arg(token.position),
                              token.position);
    }
}
