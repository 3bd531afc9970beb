// hedl/model/traverse.cpp - Document traversal implementation
//
#include "hedl/model/traverse.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace hedl
{

// ============================================================================
// VisitorContext
// ============================================================================

VisitorContext VisitorContext::child(std::string_view key) const
{
  VisitorContext next = *this;
  next.depth = depth + 1;
  next.path.push_back(key);
  return next;
}

VisitorContext VisitorContext::with_schema(const std::vector<std::string> & columns) const
{
  VisitorContext next = *this;
  next.schema = &columns;
  return next;
}

std::string VisitorContext::path_string() const
{
  if (path.empty()) {
    return "root";
  }
  std::string out;
  for (size_t i = 0; i < path.size(); ++i) {
    if (i > 0) {
      out += '.';
    }
    out.append(path[i].data(), path[i].size());
  }
  return out;
}

// ============================================================================
// Walker
// ============================================================================

namespace
{

class Walker
{
public:
  Walker(DocumentVisitor & visitor, size_t max_depth) : visitor_(visitor), max_depth_(max_depth)
  {
  }

  Status walk_item(std::string_view key, const Item & item, const VisitorContext & ctx)
  {
    switch (item.kind()) {
      case ItemKind::Scalar:
        return visitor_.visit_scalar(key, item.as_scalar(), ctx);
      case ItemKind::Object:
        return walk_object(key, item.as_object(), ctx);
      case ItemKind::List:
        return walk_list(key, item.as_list(), ctx);
    }
    return Status::ok();
  }

private:
  Result<VisitorContext> descend(const VisitorContext & ctx, std::string_view key) const
  {
    if (ctx.depth + 1 > max_depth_) {
      return Result<VisitorContext>::fail(HedlError::security(fmt::format(
        "traversal depth {} exceeds maximum allowed depth {} at '{}'", ctx.depth + 1,
        max_depth_, ctx.child(key).path_string())));
    }
    return Result<VisitorContext>::ok(ctx.child(key));
  }

  Status walk_object(std::string_view key, const Object & object, const VisitorContext & ctx)
  {
    auto inner = descend(ctx, key);
    if (!inner) {
      return Status::fail(inner.error());
    }
    if (auto s = visitor_.begin_object(key, ctx); !s) {
      return s;
    }
    for (const auto & [child_key, child] : object) {
      if (auto s = walk_item(child_key, child, inner.value()); !s) {
        return s;
      }
    }
    return visitor_.end_object(key, ctx);
  }

  Status walk_list(std::string_view key, const MatrixList & list, const VisitorContext & ctx)
  {
    auto nested = descend(ctx, key);
    if (!nested) {
      return Status::fail(nested.error());
    }
    const VisitorContext inner = nested.value().with_schema(list.schema);
    if (auto s = visitor_.begin_list(key, list, ctx); !s) {
      return s;
    }
    for (const Node & node : list.rows) {
      if (auto s = walk_node(node, list.schema, inner); !s) {
        return s;
      }
    }
    return visitor_.end_list(key, list, ctx);
  }

  Status walk_node(
    const Node & node, gsl::span<const std::string> schema, const VisitorContext & ctx)
  {
    if (auto s = visitor_.visit_node(node, schema, ctx); !s) {
      return s;
    }
    if (node.children.empty()) {
      return Status::ok();
    }

    auto inner = descend(ctx, node.id);
    if (!inner) {
      return Status::fail(inner.error());
    }
    if (auto s = visitor_.begin_node_children(node, ctx); !s) {
      return s;
    }
    for (const auto & [child_type, children] : node.children) {
      VisitorContext child_ctx = inner.value();
      child_ctx.schema = ctx.document->get_schema(child_type);
      const gsl::span<const std::string> child_schema =
        child_ctx.schema != nullptr ? gsl::span<const std::string>(*child_ctx.schema)
                                    : gsl::span<const std::string>();
      for (const Node & child : children) {
        if (auto s = walk_node(child, child_schema, child_ctx); !s) {
          return s;
        }
      }
    }
    return visitor_.end_node_children(node, ctx);
  }

  DocumentVisitor & visitor_;
  size_t max_depth_;
};

}  // namespace

Status traverse(const Document & doc, DocumentVisitor & visitor, size_t max_depth)
{
  const VisitorContext ctx(doc);
  if (auto s = visitor.begin_document(doc, ctx); !s) {
    return s;
  }

  Walker walker(visitor, max_depth);
  for (const auto & [key, item] : doc.root) {
    if (auto s = walker.walk_item(key, item, ctx); !s) {
      return s;
    }
  }
  return visitor.end_document(doc, ctx);
}

// ============================================================================
// StatsCollector
// ============================================================================

void StatsCollector::note_depth(const VisitorContext & ctx)
{
  max_depth = std::max(max_depth, ctx.depth);
}

Status StatsCollector::visit_scalar(
  std::string_view /*key*/, const Value & /*value*/, const VisitorContext & ctx)
{
  ++scalar_count;
  note_depth(ctx);
  return Status::ok();
}

Status StatsCollector::begin_object(std::string_view /*key*/, const VisitorContext & ctx)
{
  ++object_count;
  note_depth(ctx);
  return Status::ok();
}

Status StatsCollector::begin_list(
  std::string_view /*key*/, const MatrixList & /*list*/, const VisitorContext & ctx)
{
  ++list_count;
  note_depth(ctx);
  return Status::ok();
}

Status StatsCollector::visit_node(
  const Node & /*node*/, gsl::span<const std::string> /*schema*/, const VisitorContext & ctx)
{
  ++node_count;
  note_depth(ctx);
  return Status::ok();
}

}  // namespace hedl
