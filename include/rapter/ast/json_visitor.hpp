// rapter/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Used by `rapc dump-ast` and by tests that compare tree shapes.
//
#pragma once

#include <nlohmann/json.hpp>

#include "rapter/ast/ast.hpp"

namespace rapter
{

/**
 * Serialize an AST node to JSON.
 *
 * Handles every node kind. Type annotations and checked types are rendered
 * in source syntax (`Option<int>`, `*char`).
 *
 * @param node The AST node to serialize (can be any node type)
 * @return JSON representation of the node
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a Program node including all its declarations.
 *
 * @param program The program to serialize
 * @return JSON object with one array per declaration list
 */
[[nodiscard]] nlohmann::json to_json(const Program * program);

}  // namespace rapter
