#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// Builds a PostgreSQL array literal, every element quoted: {"a","b"}
inline std::string vec2pgarray(const std::vector<std::string>& vec) {
    std::string out = "{";
    for (size_t i = 0; i < vec.size(); ++i) {
        if (i > 0) out += ",";
        out += "\"";
        for (char c : vec[i]) {
            if (c == '"' || c == '\\') out += "\\";
            out += c;
        }
        out += "\"";
    }
    out += "}";
    return out;
}

// Parses the text output of a one dimensional TEXT[] column.
inline std::vector<std::string> pgarray2vec(const std::string& literal) {
    if (literal.size() < 2 || literal.front() != '{' || literal.back() != '}') {
        throw std::invalid_argument("Not an array literal: " + literal);
    }

    std::vector<std::string> result;
    const size_t end = literal.size() - 1;
    size_t i = 1;
    while (i < end) {
        std::string token;
        if (literal[i] == '"') {
            ++i;
            while (i < end && literal[i] != '"') {
                if (literal[i] == '\\' && i + 1 < end) ++i;
                token += literal[i++];
            }
            ++i;  // closing quote
        } else {
            while (i < end && literal[i] != ',') {
                token += literal[i++];
            }
        }
        result.push_back(token);
        if (i < end && literal[i] == ',') ++i;
    }
    return result;
}
