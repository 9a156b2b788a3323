#include "core/projection_parser.h"
#include "core/projection_error.h"

#include <algorithm>
#include <cctype>

namespace prism {
namespace core {

namespace {

bool isNameStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isNameContinue(char c) {
    return isNameStart(c) || (c >= '0' && c <= '9');
}

std::string describe(char c) {
    return std::string("'") + c + "'";
}

} // namespace

ProjectionTree ProjectionParser::parse(const std::string& directive) {
    bool blank = std::all_of(directive.begin(), directive.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        return ProjectionTree::empty();
    }

    // Leading whitespace is skipped in place rather than trimmed so that
    // reported offsets index the caller's string.
    ProjectionParser parser(directive);
    parser.skipWhitespace();
    ProjectionTree tree = parser.parseProjection(0);
    parser.expectEnd();
    return tree;
}

ProjectionTree ProjectionParser::parseProjection(size_t nesting) {
    auto builder = ProjectionTree::builder();
    parseField(builder, nesting);

    while (peek() == ',') {
        consume(',');
        skipWhitespace();
        parseField(builder, nesting);
    }

    return builder.build();
}

void ProjectionParser::parseField(ProjectionTree::Builder& builder, size_t nesting) {
    std::string name = parseName();

    if (peek() == '(') {
        if (nesting + 1 > MAX_NESTING) {
            fail("Nesting exceeds " + std::to_string(MAX_NESTING) + " levels");
        }
        consume('(');
        skipWhitespace();
        ProjectionTree subtree = parseProjection(nesting + 1);
        consume(')');
        builder.addChild(name, std::move(subtree));
    } else {
        builder.addLeaf(name);
    }

    skipWhitespace();
}

std::string ProjectionParser::parseName() {
    if (pos_ >= input_.size()) {
        fail("Expected field name but reached end of input");
    }

    char first = input_[pos_];
    if (!isNameStart(first)) {
        fail("Invalid field name start character: " + describe(first));
    }

    size_t start = pos_++;
    while (pos_ < input_.size() && isNameContinue(input_[pos_])) {
        ++pos_;
    }
    return input_.substr(start, pos_ - start);
}

char ProjectionParser::peek() {
    skipWhitespace();
    return pos_ < input_.size() ? input_[pos_] : '\0';
}

void ProjectionParser::consume(char expected) {
    skipWhitespace();
    if (pos_ >= input_.size()) {
        fail("Expected " + describe(expected) + " but reached end of input");
    }
    char actual = input_[pos_];
    if (actual != expected) {
        fail("Expected " + describe(expected) + " but found " + describe(actual));
    }
    ++pos_;
}

void ProjectionParser::skipWhitespace() {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
        ++pos_;
    }
}

void ProjectionParser::expectEnd() {
    skipWhitespace();
    if (pos_ < input_.size()) {
        fail("Unexpected character " + describe(input_[pos_]) + " after valid projection");
    }
}

void ProjectionParser::fail(const std::string& reason) const {
    throw SyntaxError(input_, pos_, reason);
}

} // namespace core
} // namespace prism
