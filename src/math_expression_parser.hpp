#ifndef MATH_EXPRESSION_PARSER_HPP
#define MATH_EXPRESSION_PARSER_HPP

#include <QString>
#include <QSharedPointer>
#include "expression_error.hpp"
#include "expression_token.hpp"

/**
 * @brief The MathExpressionParser class parses and evaluates single-variable formulas
 *
 * Supports:
 * - Arithmetic operators: +, -, *, /, ^ (power, right-associative)
 * - Unary + and -
 * - Functions: sin(), cos(), tan(), ln(), log(), sqrt(), abs(), exp()
 * - Constants: pi, e
 * - Parentheses for precedence
 * - The single free variable x
 *
 * Implicit multiplication ("2x") is rejected. Formulas nested deeper than
 * MAX_NESTING_DEPTH, or whose tree is deeper than MAX_TREE_DEPTH, fail to
 * parse instead of exhausting the stack.
 *
 * A parsed expression is immutable: evaluate() is const and may be called
 * concurrently from several threads.
 */
class MathExpressionParser
{
public:
    //! Parentheses, function calls, signs and '^' right operands open a level
    static constexpr int MAX_NESTING_DEPTH = 256;

    //! Longest operator chain from the root to a leaf, e.g. "x+x+...+x"
    static constexpr int MAX_TREE_DEPTH = 1024;

    MathExpressionParser();
    ~MathExpressionParser();

    /**
     * @brief Parse a formula into an internal representation
     * @param expression The formula (e.g., "x^2 + 3*x - 5")
     * @return true if parsing succeeded, false otherwise (check getError())
     */
    bool parse(const QString& expression);

    /**
     * @brief Evaluate the parsed formula for one value of x
     * @param x Value bound to the variable
     * @param result Output parameter for the computed result
     * @param error Optional output for the failure reason
     * @return true if evaluation succeeded, false otherwise
     */
    bool evaluate(double x, double& result, ExpressionError* error = nullptr) const;

    /**
     * @brief Check whether parse() has succeeded
     */
    bool isParsed() const { return !rootNode.isNull(); }

    /**
     * @brief Get the last parse error message
     * @return Full error message including the formula, or empty if no error
     */
    QString getError() const { return lastError.toString(); }

    /**
     * @brief Get the last parse error with its kind and position
     */
    ExpressionError getLastError() const { return lastError; }

    /**
     * @brief Get the formula text passed to parse()
     */
    QString getExpression() const { return expressionText; }

    /**
     * @brief Parse and evaluate a formula in one step
     * @param formula The formula text
     * @param x Value bound to the variable
     * @param result Output parameter for the computed result
     * @param error Optional output for the failure reason
     * @return true if both parsing and evaluation succeeded
     */
    static bool evaluateFormula(const QString& formula, double x, double& result,
                                ExpressionError* error = nullptr);

    /**
     * @brief Check whether a formula can be evaluated at x = 1
     */
    static bool isValidExpression(const QString& formula);

private:
    // Internal expression node types
    enum NodeType
    {
        NODE_NUMBER,
        NODE_VARIABLE,
        NODE_OPERATOR,
        NODE_FUNCTION
    };

    enum OperatorType
    {
        OP_ADD,
        OP_SUBTRACT,
        OP_MULTIPLY,
        OP_DIVIDE,
        OP_POWER,
        OP_NEGATE  // Unary minus
    };

    // Expression tree node
    struct ExpressionNode
    {
        NodeType type = NODE_NUMBER;

        // Height of the subtree rooted here (leaves are 1)
        int depth = 1;

        // Value for NUMBER nodes
        double numberValue = 0.0;

        // Operator type for OPERATOR nodes
        OperatorType operatorType = OP_ADD;

        // Function type for FUNCTION nodes
        ExpressionToken::Function functionType = ExpressionToken::FUNC_NONE;

        // Child nodes
        QSharedPointer<const ExpressionNode> left;
        QSharedPointer<const ExpressionNode> right;
        QSharedPointer<const ExpressionNode> argument;  // For functions
    };

    typedef QSharedPointer<const ExpressionNode> NodePtr;

    // Parsing methods
    NodePtr parseExpression(const ExpressionTokenList& tokens, int& pos);
    NodePtr parseTerm(const ExpressionTokenList& tokens, int& pos);
    NodePtr parsePower(const ExpressionTokenList& tokens, int& pos);
    NodePtr parseUnary(const ExpressionTokenList& tokens, int& pos);
    NodePtr parsePrimary(const ExpressionTokenList& tokens, int& pos);
    NodePtr parsePrimaryValue(const ExpressionTokenList& tokens, int& pos);

    void enterNested(const ExpressionToken& token);
    void leaveNested() { nestingDepth--; }

    // Evaluation method
    double evaluateNode(const NodePtr& node, double x) const;
    static double applyFunction(ExpressionToken::Function function, double argument);

    static bool isOperatorToken(const ExpressionToken& token, char op);
    static NodePtr makeBinary(OperatorType op, const NodePtr& left, const NodePtr& right, int position);
    static int childDepth(const NodePtr& child, int position);

    // Parsed expression tree
    NodePtr rootNode;

    QString expressionText;

    // Recursion depth of the parse in progress
    int nestingDepth;

    // Error handling
    ExpressionError lastError;
};

#endif // MATH_EXPRESSION_PARSER_HPP
