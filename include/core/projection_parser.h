#pragma once

#include <string>
#include "core/projection_tree.h"

namespace prism {
namespace core {

/**
 * @brief Recursive descent parser for field-selection directives
 *
 * Grammar:
 *   projection := field (',' field)*
 *   field      := name | name '(' projection ')'
 *   name       := [A-Za-z_][A-Za-z0-9_]*
 *
 * Whitespace is allowed around names, commas and parentheses. A blank
 * directive yields the empty tree. Any violation throws SyntaxError with the
 * offset into the raw input.
 *
 * Example:
 *   auto tree = ProjectionParser::parse("id,profile(avatar,bio)");
 */
class ProjectionParser {
public:
    static constexpr size_t MAX_NESTING = 128;

    static ProjectionTree parse(const std::string& directive);

private:
    explicit ProjectionParser(const std::string& input) : input_(input) {}

    ProjectionTree parseProjection(size_t nesting);
    void parseField(ProjectionTree::Builder& builder, size_t nesting);
    std::string parseName();

    char peek();
    void consume(char expected);
    void skipWhitespace();
    void expectEnd();

    [[noreturn]] void fail(const std::string& reason) const;

    const std::string& input_;
    size_t pos_ = 0;
};

} // namespace core
} // namespace prism
