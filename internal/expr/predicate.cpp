#include "internal/expr/predicate.hpp"

#include <cstdio>

namespace opentimeline::expr {

namespace {

// Binding strength, used to decide where parentheses are required.
int Precedence(const Predicate& p) {
  if (std::holds_alternative<Predicate::Or>(p.node)) return 0;
  if (std::holds_alternative<Predicate::And>(p.node)) return 1;
  if (std::holds_alternative<Predicate::Not>(p.node)) return 2;
  return 3;
}

std::string Quote(const std::string& value) {
  std::string out = "\"";
  for (const char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  out += '"';
  return out;
}

void Render(const Predicate& p, std::string& out);

void RenderChild(const Predicate& child, int parent_precedence, std::string& out) {
  if (Precedence(child) < parent_precedence) {
    out += '(';
    Render(child, out);
    out += ')';
  } else {
    Render(child, out);
  }
}

void RenderJoined(const std::vector<Predicate>& children, const char* op, int precedence, std::string& out) {
  for (std::size_t i = 0; i < children.size(); ++i) {
    if (i) out += op;
    RenderChild(children[i], precedence, out);
  }
}

void Render(const Predicate& p, std::string& out) {
  if (const auto* eq = std::get_if<TagEquals>(&p.node)) {
    out += eq->name + " = " + Quote(eq->value);
  } else if (const auto* ne = std::get_if<TagNotEquals>(&p.node)) {
    out += ne->name + " != " + Quote(ne->value);
  } else if (const auto* ex = std::get_if<TagExists>(&p.node)) {
    out += ex->name + " exists";
  } else if (const auto* nex = std::get_if<TagNotExists>(&p.node)) {
    out += nex->name + " not exists";
  } else if (const auto* anon = std::get_if<AnonymousValue>(&p.node)) {
    out += Quote(anon->value);
  } else if (const auto* a = std::get_if<Predicate::And>(&p.node)) {
    RenderJoined(a->children, " AND ", 1, out);
  } else if (const auto* o = std::get_if<Predicate::Or>(&p.node)) {
    RenderJoined(o->children, " OR ", 0, out);
  } else if (const auto* n = std::get_if<Predicate::Not>(&p.node)) {
    out += "NOT ";
    RenderChild(n->children.front(), 2, out);
  }
}

} // namespace

std::string ToString(const Predicate& predicate) {
  std::string out;
  Render(predicate, out);
  return out;
}

} // namespace opentimeline::expr
