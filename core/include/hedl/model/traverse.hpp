// hedl/model/traverse.hpp - Visitor-based document traversal
//
// Walks a Document in key order and reports every scalar, object, list and
// row to a DocumentVisitor. Converters implement the hooks they need and
// leave the recursion to traverse().
//
#pragma once

#include <cstddef>
#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

#include "hedl/basic/error.hpp"
#include "hedl/model/document.hpp"

namespace hedl
{

/// Default bound on object and NEST nesting during traversal
constexpr size_t k_default_traverse_depth = 1000;

// ============================================================================
// VisitorContext
// ============================================================================

/**
 * Position of the element being visited.
 *
 * `path` holds the keys (and, below rows, the parent row ids) from the root
 * down to the current element. Views point into the traversed Document.
 */
struct VisitorContext
{
  const Document * document = nullptr;

  /// 0 at the root, +1 per object key, list key or parent row
  size_t depth = 0;

  std::vector<std::string_view> path;

  /// Schema of the enclosing list, nullptr outside lists
  const std::vector<std::string> * schema = nullptr;

  explicit VisitorContext(const Document & doc) : document(&doc) {}

  /// Context one level below, under `key`
  [[nodiscard]] VisitorContext child(std::string_view key) const;

  /// Same position with a list schema
  [[nodiscard]] VisitorContext with_schema(const std::vector<std::string> & columns) const;

  /// Dotted path, "root" at the top level
  [[nodiscard]] std::string path_string() const;
};

// ============================================================================
// DocumentVisitor
// ============================================================================

/**
 * Receives traversal events.
 *
 * Every hook returns a Status; the first failure stops the walk and is
 * returned by traverse(). Only visit_scalar and visit_node are required.
 */
class DocumentVisitor
{
public:
  virtual ~DocumentVisitor() = default;

  virtual Status begin_document(const Document & /*doc*/, const VisitorContext & /*ctx*/)
  {
    return Status::ok();
  }
  virtual Status end_document(const Document & /*doc*/, const VisitorContext & /*ctx*/)
  {
    return Status::ok();
  }

  virtual Status visit_scalar(
    std::string_view key, const Value & value, const VisitorContext & ctx) = 0;

  virtual Status begin_object(std::string_view /*key*/, const VisitorContext & /*ctx*/)
  {
    return Status::ok();
  }
  virtual Status end_object(std::string_view /*key*/, const VisitorContext & /*ctx*/)
  {
    return Status::ok();
  }

  virtual Status begin_list(
    std::string_view /*key*/, const MatrixList & /*list*/, const VisitorContext & /*ctx*/)
  {
    return Status::ok();
  }
  virtual Status end_list(
    std::string_view /*key*/, const MatrixList & /*list*/, const VisitorContext & /*ctx*/)
  {
    return Status::ok();
  }

  /// One row; `schema` is empty for NEST children of an undeclared type
  virtual Status visit_node(
    const Node & node, gsl::span<const std::string> schema, const VisitorContext & ctx) = 0;

  virtual Status begin_node_children(const Node & /*node*/, const VisitorContext & /*ctx*/)
  {
    return Status::ok();
  }
  virtual Status end_node_children(const Node & /*node*/, const VisitorContext & /*ctx*/)
  {
    return Status::ok();
  }
};

/**
 * Walk `doc` depth-first in key order.
 *
 * Nesting deeper than `max_depth` (objects, lists and NEST children) fails
 * with a Security error before the deeper level is entered.
 */
[[nodiscard]] Status traverse(
  const Document & doc, DocumentVisitor & visitor, size_t max_depth = k_default_traverse_depth);

// ============================================================================
// StatsCollector
// ============================================================================

/// Counts elements and records the deepest level reached
class StatsCollector : public DocumentVisitor
{
public:
  size_t scalar_count = 0;
  size_t object_count = 0;
  size_t list_count = 0;
  size_t node_count = 0;
  size_t max_depth = 0;

  Status visit_scalar(std::string_view key, const Value & value, const VisitorContext & ctx) override;
  Status begin_object(std::string_view key, const VisitorContext & ctx) override;
  Status begin_list(
    std::string_view key, const MatrixList & list, const VisitorContext & ctx) override;
  Status visit_node(
    const Node & node, gsl::span<const std::string> schema, const VisitorContext & ctx) override;

private:
  void note_depth(const VisitorContext & ctx);
};

}  // namespace hedl
